/// @file audit_logger.cpp
/// @brief AuditLogger implementation.

#include "ssg/service/audit_logger.hpp"

#include "ssg/foundation/service_logger.hpp"
#include "ssg/foundation/task_executor.hpp"
#include "ssg/service/audit_sink.hpp"
#include "ssg/service/ip_blocklist.hpp"

#include <algorithm>

namespace ssg::service {

using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using foundation::ServiceResult;

AuditLogger::AuditLogger(AuditPolicy policy,
                         std::shared_ptr<IAuditSink> sink,
                         std::shared_ptr<IpBlocklist> blocklist,
                         std::shared_ptr<foundation::TaskExecutor> executor)
    : policy_(policy),
      sink_(std::move(sink)),
      blocklist_(std::move(blocklist)),
      executor_(std::move(executor)) {}

int AuditLogger::clampRisk(int score) noexcept {
    return std::clamp(score, risk::kMin, risk::kMax);
}

ServiceResult<void> AuditLogger::record(AuditEvent event) {
    event.riskScore = clampRisk(event.riskScore);
    if (event.timestamp == TimePoint{}) {
        event.timestamp = std::chrono::system_clock::now();
    }

    // -- Automated responses ---
    if (event.riskScore >= policy_.autoBlockRiskThreshold && !event.ipAddress.empty() &&
        blocklist_) {
        blocklist_->block(event.ipAddress, event.timestamp + policy_.autoBlockDuration);
        event.automatedResponse = std::string(kResponseIpBlocked);
        SSG_LOG_WARN(LogCategory::Audit, "auto-blocked " + event.ipAddress +
                                             " after high-risk " +
                                             std::string(toString(event.eventType)));
    } else if (event.riskScore >= policy_.responseRiskThreshold) {
        event.automatedResponse = std::string(kResponseSecurityAlert);
    }

    auto level = event.riskScore >= policy_.responseRiskThreshold ? LogLevel::Warning
                                                                  : LogLevel::Info;
    LogContext ctx;
    ctx.ipAddress = event.ipAddress;
    ctx.extra["subject"] = event.subject;
    ctx.extra["risk"] = std::to_string(event.riskScore);
    if (event.automatedResponse) {
        ctx.extra["response"] = *event.automatedResponse;
    }
    SSG_LOG_CTX(level, LogCategory::Audit, toString(event.eventType), ctx);

    if (!sink_) {
        return ServiceResult<void>::ok();
    }
    auto sink = sink_;
    auto result = executor_->callWithTimeout<void>(
        "audit_sink.append",
        [sink, event = std::move(event)] { return sink->append(event); },
        policy_.sinkTimeout);
    if (result.hasError()) {
        SSG_LOG_ERROR(LogCategory::Audit,
                      "audit sink rejected event: " + std::string(result.error().message()));
    }
    return result;
}

ServiceResult<void> AuditLogger::recordLoginAttempt(LoginAttempt attempt) {
    if (!sink_) {
        return ServiceResult<void>::ok();
    }
    auto sink = sink_;
    auto result = executor_->callWithTimeout<void>(
        "audit_sink.append_login_attempt",
        [sink, attempt = std::move(attempt)] { return sink->appendLoginAttempt(attempt); },
        policy_.sinkTimeout);
    if (result.hasError()) {
        SSG_LOG_ERROR(LogCategory::Audit,
                      "audit sink rejected login attempt: " +
                          std::string(result.error().message()));
    }
    return result;
}

}  // namespace ssg::service
