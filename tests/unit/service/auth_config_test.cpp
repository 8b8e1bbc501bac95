#include <gtest/gtest.h>

#include <cstdlib>
#include <string>

#include "ssg/foundation/config_manager.hpp"
#include "ssg/foundation/error_code.hpp"
#include "ssg/service/auth_config.hpp"
#include "ssg/service/session_orchestrator.hpp"

using namespace ssg::service;
using namespace std::chrono_literals;
using ssg::foundation::ConfigManager;
using ssg::foundation::ErrorCode;

namespace {

constexpr const char* kKeyHex =
    "000102030405060708090a0b0c0d0e0f101112131415161718191a1b1c1d1e1f";

}  // namespace

class AuthConfigTest : public ::testing::Test {
protected:
    void SetUp() override { unsetenv("SSG_SESSION_KEY"); }
    void TearDown() override { unsetenv("SSG_SESSION_KEY"); }

    ssg::foundation::ServiceResult<AuthConfig> parse(const std::string& yaml) {
        ConfigManager config;
        auto loaded = config.loadFromString(yaml);
        EXPECT_TRUE(loaded.hasValue());
        return authConfigFromConfig(config);
    }
};

TEST_F(AuthConfigTest, EmptyConfigYieldsDefaults) {
    auto result = parse("");
    ASSERT_TRUE(result.hasValue());
    const auto& cfg = result.value();

    EXPECT_EQ(cfg.rateLimitMaxAttempts, 5u);
    EXPECT_EQ(cfg.rateLimitWindow, 15min);
    EXPECT_EQ(cfg.pbkdf2Iterations, 100000u);
    EXPECT_EQ(cfg.auditThreads, 2u);
    EXPECT_EQ(cfg.collaboratorMaxQueued, 64u);
    EXPECT_EQ(cfg.totpStep, 30s);
    EXPECT_EQ(cfg.totpSkewSteps, 1u);
    EXPECT_EQ(cfg.sessionLifetime, 8h);
    EXPECT_EQ(cfg.sessionCookieName, "security_session");
    EXPECT_TRUE(cfg.sessionKeyHex.empty());
    EXPECT_EQ(cfg.collaboratorTimeout, 2000ms);
    EXPECT_EQ(cfg.autoBlockDuration, 24h);
}

TEST_F(AuthConfigTest, OverridesApply) {
    auto result = parse(R"(
rate_limit:
  max_attempts: 3
  window_seconds: 60
mfa:
  challenge_ttl_seconds: 120
session:
  cookie_name: gw
  lifetime_seconds: 3600
  encryption_key: "000102030405060708090a0b0c0d0e0f101112131415161718191a1b1c1d1e1f"
collaborators:
  timeout_ms: 250
  threads: 8
  audit_threads: 3
  max_queued: 16
)");
    ASSERT_TRUE(result.hasValue());
    const auto& cfg = result.value();
    EXPECT_EQ(cfg.rateLimitMaxAttempts, 3u);
    EXPECT_EQ(cfg.rateLimitWindow, 60s);
    EXPECT_EQ(cfg.mfaChallengeTtl, 120s);
    EXPECT_EQ(cfg.sessionCookieName, "gw");
    EXPECT_EQ(cfg.sessionLifetime, 1h);
    EXPECT_EQ(cfg.sessionKeyHex, kKeyHex);
    EXPECT_EQ(cfg.collaboratorTimeout, 250ms);
    EXPECT_EQ(cfg.collaboratorThreads, 8u);
    EXPECT_EQ(cfg.auditThreads, 3u);
    EXPECT_EQ(cfg.collaboratorMaxQueued, 16u);
}

TEST_F(AuthConfigTest, EnvironmentKeyOverridesFile) {
    setenv("SSG_SESSION_KEY", kKeyHex, 1);
    auto result = parse("session:\n  encryption_key: \"abcd\"\n");
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value().sessionKeyHex, kKeyHex);
}

TEST_F(AuthConfigTest, RejectsWeakIterations) {
    auto result = parse("password:\n  pbkdf2_iterations: 1000\n");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigInvalidValue);
}

TEST_F(AuthConfigTest, RejectsNonPositiveDurations) {
    EXPECT_TRUE(parse("rate_limit:\n  window_seconds: 0\n").hasError());
    EXPECT_TRUE(parse("mfa:\n  totp_step_seconds: 0\n").hasError());
    EXPECT_TRUE(parse("session:\n  lifetime_seconds: -5\n").hasError());
    EXPECT_TRUE(parse("response:\n  auto_block_seconds: 0\n").hasError());
    EXPECT_TRUE(parse("collaborators:\n  timeout_ms: -1\n").hasError());
}

TEST_F(AuthConfigTest, RejectsOutOfRangeRiskThreshold) {
    auto result = parse("response:\n  risk_threshold: 150\n");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigInvalidValue);
}

TEST_F(AuthConfigTest, MfaThresholdCannotBeMoved) {
    auto raised = parse("mfa:\n  clearance_threshold: 5\n");
    ASSERT_TRUE(raised.hasError());
    EXPECT_EQ(raised.error().code(), ErrorCode::ConfigInvalidValue);

    auto lowered = parse("mfa:\n  clearance_threshold: 1\n");
    ASSERT_TRUE(lowered.hasError());
    EXPECT_EQ(lowered.error().code(), ErrorCode::ConfigInvalidValue);

    EXPECT_TRUE(parse("mfa:\n  clearance_threshold: 2\n").hasValue());
}

TEST_F(AuthConfigTest, CollaboratorCallsMustHaveADeadline) {
    auto zero = parse("collaborators:\n  timeout_ms: 0\n");
    ASSERT_TRUE(zero.hasError());
    EXPECT_EQ(zero.error().code(), ErrorCode::ConfigInvalidValue);
}

TEST_F(AuthConfigTest, RejectsEmptyPools) {
    EXPECT_TRUE(parse("collaborators:\n  threads: 0\n").hasError());
    EXPECT_TRUE(parse("collaborators:\n  audit_threads: 0\n").hasError());
    EXPECT_TRUE(parse("collaborators:\n  max_queued: 0\n").hasError());
}

TEST_F(AuthConfigTest, RejectsZeroAttempts) {
    EXPECT_TRUE(parse("rate_limit:\n  max_attempts: 0\n").hasError());
}

TEST_F(AuthConfigTest, WrongTypeIsReportedNotIgnored) {
    auto result = parse("rate_limit:\n  max_attempts: five\n");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigTypeMismatch);
}

// ---------------------------------------------------------------------------
// Session key loading
// ---------------------------------------------------------------------------

TEST_F(AuthConfigTest, ConfiguredKeyIsUsed) {
    AuthConfig cfg;
    cfg.sessionKeyHex = kKeyHex;
    EXPECT_TRUE(loadSessionKey(cfg).hasValue());
}

TEST_F(AuthConfigTest, MalformedKeyIsRejected) {
    AuthConfig cfg;
    cfg.sessionKeyHex = "not-a-key";
    auto key = loadSessionKey(cfg);
    ASSERT_TRUE(key.hasError());
    EXPECT_EQ(key.error().code(), ErrorCode::InvalidKey);
}

TEST_F(AuthConfigTest, MissingKeyIsGenerated) {
    AuthConfig cfg;
    EXPECT_TRUE(loadSessionKey(cfg).hasValue());
}
