#pragma once

/// @file context_codec.hpp
/// @brief Flat JSON encoding of SecurityContext for sealing.

#include "ssg/foundation/service_result.hpp"
#include "ssg/service/auth_types.hpp"

#include <string>
#include <string_view>

namespace ssg::service {

/// Encode @p ctx as a flat JSON object. last_activity is epoch milliseconds.
[[nodiscard]] std::string encodeContext(const SecurityContext& ctx);

/// Decode a blob produced by encodeContext(). Any structural problem or
/// missing field yields IntegrityError.
[[nodiscard]] foundation::ServiceResult<SecurityContext> decodeContext(std::string_view json);

}  // namespace ssg::service
