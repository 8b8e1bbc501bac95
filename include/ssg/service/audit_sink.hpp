#pragma once

/// @file audit_sink.hpp
/// @brief Append-only audit sink interface and in-memory implementation.

#include "ssg/foundation/service_result.hpp"
#include "ssg/service/auth_types.hpp"

#include <cstddef>
#include <mutex>
#include <vector>

namespace ssg::service {

/// Append-only ingestion of audit events and login attempts.
///
/// Implementations must be thread-safe.
class IAuditSink {
public:
    virtual ~IAuditSink() = default;

    [[nodiscard]] virtual foundation::ServiceResult<void> append(const AuditEvent& event) = 0;

    [[nodiscard]] virtual foundation::ServiceResult<void> appendLoginAttempt(
        const LoginAttempt& attempt) = 0;
};

/// Thread-safe in-memory audit sink for testing and development.
class InMemoryAuditSink : public IAuditSink {
public:
    [[nodiscard]] foundation::ServiceResult<void> append(const AuditEvent& event) override;

    [[nodiscard]] foundation::ServiceResult<void> appendLoginAttempt(
        const LoginAttempt& attempt) override;

    /// Snapshot of all events in arrival order.
    [[nodiscard]] std::vector<AuditEvent> events() const;

    [[nodiscard]] std::vector<AuditEvent> eventsOfType(AuditEventType type) const;

    [[nodiscard]] std::vector<LoginAttempt> loginAttempts() const;

    void clear();

private:
    mutable std::mutex mutex_;
    std::vector<AuditEvent> events_;
    std::vector<LoginAttempt> attempts_;
};

}  // namespace ssg::service
