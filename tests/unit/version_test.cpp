#include <gtest/gtest.h>

#include <chrono>
#include <string>

#include "ssg/core/result.hpp"
#include "ssg/foundation/error_code.hpp"
#include "ssg/foundation/service_error.hpp"
#include "ssg/foundation/service_result.hpp"
#include "ssg/version.hpp"

using namespace ssg::foundation;

TEST(VersionTest, MajorMinorPatch) {
    EXPECT_EQ(ssg::Version::major, 0);
    EXPECT_EQ(ssg::Version::minor, 3);
    EXPECT_EQ(ssg::Version::patch, 0);
}

TEST(VersionTest, VersionString) {
    EXPECT_STREQ(ssg::Version::string, "0.3.0");
}

// ---------------------------------------------------------------------------
// Result<T, E>
// ---------------------------------------------------------------------------

TEST(ResultTest, OkValue) {
    auto result = ServiceResult<int>::ok(42);
    EXPECT_TRUE(result.hasValue());
    EXPECT_FALSE(result.hasError());
    EXPECT_EQ(result.value(), 42);
}

TEST(ResultTest, ErrorValue) {
    auto result = ServiceResult<int>::err(ServiceError(ErrorCode::NotFound, "missing"));
    EXPECT_FALSE(result.hasValue());
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::NotFound);
    EXPECT_EQ(result.error().message(), "missing");
}

TEST(ResultTest, ValueOr) {
    auto ok = ServiceResult<int>::ok(10);
    auto err = ServiceResult<int>::err(ServiceError(ErrorCode::Unknown));
    EXPECT_EQ(ok.valueOr(0), 10);
    EXPECT_EQ(err.valueOr(0), 0);
}

TEST(ResultTest, BoolConversion) {
    auto ok = ServiceResult<std::string>::ok("x");
    auto err = ServiceResult<std::string>::err(ServiceError(ErrorCode::Unknown));
    EXPECT_TRUE(static_cast<bool>(ok));
    EXPECT_FALSE(static_cast<bool>(err));
}

TEST(ResultTest, SameTypeForValueAndError) {
    auto err = ssg::Result<std::string, std::string>::err("boom");
    EXPECT_TRUE(err.hasError());
    EXPECT_EQ(err.error(), "boom");
}

TEST(ResultVoidTest, Ok) {
    auto result = ServiceResult<void>::ok();
    EXPECT_TRUE(result.hasValue());
    EXPECT_FALSE(result.hasError());
}

TEST(ResultVoidTest, Error) {
    auto result = ServiceResult<void>::err(ServiceError(ErrorCode::Timeout, "late"));
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::Timeout);
}

// ---------------------------------------------------------------------------
// ErrorCode / ServiceError
// ---------------------------------------------------------------------------

TEST(ErrorCodeTest, SubsystemLookup) {
    EXPECT_EQ(errorSubsystem(ErrorCode::Success), "General");
    EXPECT_EQ(errorSubsystem(ErrorCode::Timeout), "Collaborator");
    EXPECT_EQ(errorSubsystem(ErrorCode::IntegrityError), "Auth");
    EXPECT_EQ(errorSubsystem(ErrorCode::ConfigKeyNotFound), "Config");
    EXPECT_EQ(errorSubsystem(ErrorCode::TaskScheduleFailed), "Task");
    EXPECT_EQ(errorSubsystem(ErrorCode::LoggerFlushFailed), "Logger");
    EXPECT_EQ(errorSubsystem(ErrorCode::InvalidKey), "Crypto");
    EXPECT_EQ(errorSubsystem(static_cast<ErrorCode>(0xFF00)), "Unknown");
}

TEST(ServiceErrorTest, OnlyCollaboratorErrorsAreSystemErrors) {
    EXPECT_TRUE(ServiceError(ErrorCode::SystemError).isSystemError());
    EXPECT_TRUE(ServiceError(ErrorCode::Timeout).isSystemError());
    EXPECT_TRUE(ServiceError(ErrorCode::CollaboratorUnavailable).isSystemError());
    EXPECT_FALSE(ServiceError(ErrorCode::CredentialRejected).isSystemError());
    EXPECT_FALSE(ServiceError(ErrorCode::IntegrityError).isSystemError());
}

TEST(ServiceErrorTest, TypedContext) {
    ServiceError err(ErrorCode::RateLimitExceeded, "slow down", std::chrono::seconds{42});
    ASSERT_TRUE(err.hasContext());
    ASSERT_NE(err.context<std::chrono::seconds>(), nullptr);
    EXPECT_EQ(err.context<std::chrono::seconds>()->count(), 42);
    EXPECT_EQ(err.context<int>(), nullptr);
}

TEST(ServiceErrorTest, DefaultHasNoContext) {
    ServiceError err;
    EXPECT_EQ(err.code(), ErrorCode::Unknown);
    EXPECT_FALSE(err.hasContext());
}
