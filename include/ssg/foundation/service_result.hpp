#pragma once

/// @file service_result.hpp
/// @brief ServiceResult<T> type alias for gateway error handling.

#include "ssg/core/result.hpp"
#include "ssg/foundation/service_error.hpp"

namespace ssg::foundation {

/// Result type specialized with ServiceError.
///
/// Example:
/// @code
///   ServiceResult<uint32_t> parseClearance(int raw) {
///       if (raw < 0) {
///           return ServiceResult<uint32_t>::err(
///               ServiceError(ErrorCode::InvalidArgument, "negative clearance"));
///       }
///       return ServiceResult<uint32_t>::ok(static_cast<uint32_t>(raw));
///   }
/// @endcode
template <typename T>
using ServiceResult = ssg::Result<T, ServiceError>;

}  // namespace ssg::foundation
