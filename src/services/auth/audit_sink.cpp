/// @file audit_sink.cpp
/// @brief InMemoryAuditSink implementation.

#include "ssg/service/audit_sink.hpp"

namespace ssg::service {

using foundation::ServiceResult;

ServiceResult<void> InMemoryAuditSink::append(const AuditEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.push_back(event);
    return ServiceResult<void>::ok();
}

ServiceResult<void> InMemoryAuditSink::appendLoginAttempt(const LoginAttempt& attempt) {
    std::lock_guard<std::mutex> lock(mutex_);
    attempts_.push_back(attempt);
    return ServiceResult<void>::ok();
}

std::vector<AuditEvent> InMemoryAuditSink::events() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_;
}

std::vector<AuditEvent> InMemoryAuditSink::eventsOfType(AuditEventType type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<AuditEvent> out;
    for (const auto& event : events_) {
        if (event.eventType == type) {
            out.push_back(event);
        }
    }
    return out;
}

std::vector<LoginAttempt> InMemoryAuditSink::loginAttempts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return attempts_;
}

void InMemoryAuditSink::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.clear();
    attempts_.clear();
}

}  // namespace ssg::service
