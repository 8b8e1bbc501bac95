#pragma once

/// @file service_logger.hpp
/// @brief ServiceLogger wrapping kcenon logger interfaces for structured
/// gateway logging.
///
/// Provides category-based filtering, structured logging with context,
/// and per-category runtime log level control.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "ssg/foundation/service_result.hpp"

namespace ssg::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level internally.
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Gateway log categories.
enum class LogCategory : uint8_t {
    Core      = 0, ///< Startup, shutdown, executor
    RateLimit = 1, ///< Attempt counting and denials
    Crypto    = 2, ///< Password hashing, session sealing
    Mfa       = 3, ///< Second-factor challenges and verification
    Session   = 4, ///< Login / logout / access-check state machine
    Audit     = 5, ///< Audit sink and automated responses
    Config    = 6  ///< Configuration loading
};

inline constexpr std::size_t kLogCategoryCount = 7;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "RateLimit", "Crypto", "Mfa", "Session", "Audit", "Config"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Structured context attached to log entries.
///
/// Never put passwords, MFA codes or key material in here.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.userId = "u-42";
///   ctx.ipAddress = "203.0.113.7";
///   ctx.extra["risk"] = "80";
///   logger.logWithContext(LogLevel::Warning, LogCategory::Audit,
///                         "rate limit exceeded", ctx);
/// @endcode
struct LogContext {
    std::optional<std::string> userId;
    std::optional<std::string> ipAddress;
    std::optional<std::string> traceId;
    std::unordered_map<std::string, std::string> extra;
};

/// Gateway logger wrapping kcenon's logger registry.
///
/// Uses PIMPL to hide kcenon implementation details from the public API.
///
/// Default log levels per category:
/// | Category  | Default Level |
/// |-----------|---------------|
/// | Core      | Info          |
/// | RateLimit | Info          |
/// | Crypto    | Warning       |
/// | Mfa       | Info          |
/// | Session   | Info          |
/// | Audit     | Info          |
/// | Config    | Info          |
class ServiceLogger {
public:
    ServiceLogger();
    ~ServiceLogger();

    ServiceLogger(const ServiceLogger&) = delete;
    ServiceLogger& operator=(const ServiceLogger&) = delete;
    ServiceLogger(ServiceLogger&&) noexcept;
    ServiceLogger& operator=(ServiceLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with structured context appended as {key=val, ...}.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush all buffered log messages.
    ServiceResult<void> flush();

    /// Process-wide instance used by the SSG_LOG macros.
    static ServiceLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace ssg::foundation

// ---------------------------------------------------------------------------
// Convenience macros (outside the namespace: macros are global)
// ---------------------------------------------------------------------------

/// SSG_MIN_LOG_LEVEL can be defined before including this header to
/// eliminate logging calls below the threshold at compile time.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off

#ifndef SSG_MIN_LOG_LEVEL
    #define SSG_MIN_LOG_LEVEL 0
#endif

#define SSG_LOG(level, cat, msg)                                                     \
    do {                                                                             \
        _Pragma("GCC diagnostic push")                                               \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                          \
        if (static_cast<int>(level) >= SSG_MIN_LOG_LEVEL &&                          \
            ::ssg::foundation::ServiceLogger::instance().isEnabled((level), (cat)))  \
        {                                                                            \
            ::ssg::foundation::ServiceLogger::instance().log((level), (cat), (msg)); \
        }                                                                            \
        _Pragma("GCC diagnostic pop")                                                \
    } while (0)

#define SSG_LOG_DEBUG(cat, msg) \
    SSG_LOG(::ssg::foundation::LogLevel::Debug, (cat), (msg))

#define SSG_LOG_INFO(cat, msg) \
    SSG_LOG(::ssg::foundation::LogLevel::Info, (cat), (msg))

#define SSG_LOG_WARN(cat, msg) \
    SSG_LOG(::ssg::foundation::LogLevel::Warning, (cat), (msg))

#define SSG_LOG_ERROR(cat, msg) \
    SSG_LOG(::ssg::foundation::LogLevel::Error, (cat), (msg))

/// Log with a LogContext; evaluates @p ctx only when the level is enabled.
#define SSG_LOG_CTX(level, cat, msg, ctx)                                            \
    do {                                                                             \
        if (::ssg::foundation::ServiceLogger::instance().isEnabled((level), (cat))) { \
            ::ssg::foundation::ServiceLogger::instance().logWithContext(              \
                (level), (cat), (msg), (ctx));                                       \
        }                                                                            \
    } while (0)
