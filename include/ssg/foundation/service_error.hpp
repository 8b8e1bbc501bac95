#pragma once

/// @file service_error.hpp
/// @brief Error type used with Result<T, ServiceError>.

#include <any>
#include <string>
#include <string_view>
#include <utility>

#include "ssg/foundation/error_code.hpp"

namespace ssg::foundation {

/// Error carrying a code, a human-readable message, and optional
/// type-erased context (e.g. a retry-after hint for rate-limit denials).
class ServiceError {
public:
    ServiceError() = default;

    explicit ServiceError(ErrorCode code)
        : code_(code) {}

    ServiceError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    ServiceError(ErrorCode code, std::string message, std::any context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /// The subsystem that produced this error.
    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    /// Access typed context data (returns nullptr if type mismatch or empty).
    template <typename T>
    [[nodiscard]] const T* context() const noexcept {
        return std::any_cast<T>(&context_);
    }

    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

    /// True for collaborator failures, the only errors that escape the
    /// orchestrator as faults.
    [[nodiscard]] bool isSystemError() const noexcept {
        return errorSubsystem(code_) == "Collaborator";
    }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    std::any context_;
};

} // namespace ssg::foundation
