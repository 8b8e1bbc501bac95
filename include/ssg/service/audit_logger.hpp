#pragma once

/// @file audit_logger.hpp
/// @brief Risk-scored audit recording with automated security responses.
///
/// Every event is clamped to the [0, 100] risk range, written to the
/// service log and forwarded to the audit sink under the collaborator
/// deadline. High-risk events are annotated, and the highest ones put the
/// source IP on the block list.

#include "ssg/foundation/service_result.hpp"
#include "ssg/service/auth_types.hpp"

#include <chrono>
#include <memory>
#include <string_view>

namespace ssg::foundation {
class TaskExecutor;
}

namespace ssg::service {

class IAuditSink;
class IpBlocklist;

/// Thresholds for automated responses.
struct AuditPolicy {
    int responseRiskThreshold = 80;
    int autoBlockRiskThreshold = 90;
    std::chrono::seconds autoBlockDuration{24 * 60 * 60};
    std::chrono::milliseconds sinkTimeout{2000};
};

/// Annotation values written to AuditEvent::automatedResponse.
inline constexpr std::string_view kResponseSecurityAlert = "security_alert";
inline constexpr std::string_view kResponseIpBlocked = "ip_blocked";

class AuditLogger {
public:
    AuditLogger(AuditPolicy policy,
                std::shared_ptr<IAuditSink> sink,
                std::shared_ptr<IpBlocklist> blocklist,
                std::shared_ptr<foundation::TaskExecutor> executor);

    /// Clamp, annotate and forward @p event. Automated responses are applied
    /// before the sink is called, so they take effect even if the sink fails.
    /// Returns the sink outcome.
    [[nodiscard]] foundation::ServiceResult<void> record(AuditEvent event);

    [[nodiscard]] foundation::ServiceResult<void> recordLoginAttempt(LoginAttempt attempt);

    [[nodiscard]] static int clampRisk(int score) noexcept;

    [[nodiscard]] const AuditPolicy& policy() const noexcept { return policy_; }

private:
    AuditPolicy policy_;
    std::shared_ptr<IAuditSink> sink_;
    std::shared_ptr<IpBlocklist> blocklist_;
    std::shared_ptr<foundation::TaskExecutor> executor_;
};

}  // namespace ssg::service
