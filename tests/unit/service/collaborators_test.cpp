#include <gtest/gtest.h>

#include <chrono>
#include <string>

#include "ssg/foundation/error_code.hpp"
#include "ssg/service/audit_sink.hpp"
#include "ssg/service/identity_provider.hpp"
#include "ssg/service/ip_blocklist.hpp"
#include "ssg/service/profile_store.hpp"
#include "ssg/service/session_transport.hpp"

using namespace ssg::service;
using namespace std::chrono_literals;
using ssg::foundation::ErrorCode;
using ssg::foundation::kGenericAuthFailure;

namespace {

TimePoint at(int64_t unixSeconds) {
    return TimePoint(std::chrono::seconds{unixSeconds});
}

SecurityProfile makeProfile(std::string userId, std::string email) {
    SecurityProfile profile;
    profile.userId = std::move(userId);
    profile.email = std::move(email);
    return profile;
}

}  // namespace

// ===========================================================================
// InMemoryIdentityProvider
// ===========================================================================

TEST(IdentityProviderTest, RegisterAndSignIn) {
    InMemoryIdentityProvider provider;
    auto userId = provider.registerUser("alice@example.com", "hunter2");
    ASSERT_TRUE(userId.hasValue());

    auto identity = provider.signInWithPassword("alice@example.com", "hunter2");
    ASSERT_TRUE(identity.hasValue());
    EXPECT_EQ(identity.value().userId, userId.value());
    EXPECT_EQ(identity.value().email, "alice@example.com");
    EXPECT_TRUE(provider.hasActiveSession(userId.value()));
    EXPECT_EQ(provider.signInCalls(), 1u);
}

TEST(IdentityProviderTest, DuplicateRegistrationRejected) {
    InMemoryIdentityProvider provider;
    ASSERT_TRUE(provider.registerUser("alice@example.com", "a").hasValue());
    auto again = provider.registerUser("alice@example.com", "b");
    ASSERT_TRUE(again.hasError());
    EXPECT_EQ(again.error().code(), ErrorCode::AlreadyExists);
}

TEST(IdentityProviderTest, EmptyRegistrationRejected) {
    InMemoryIdentityProvider provider;
    auto result = provider.registerUser("", "pw");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ValidationError);
}

TEST(IdentityProviderTest, WrongPasswordAndUnknownEmailLookAlike) {
    InMemoryIdentityProvider provider;
    ASSERT_TRUE(provider.registerUser("alice@example.com", "hunter2").hasValue());

    auto wrong = provider.signInWithPassword("alice@example.com", "nope");
    auto unknown = provider.signInWithPassword("mallory@example.com", "hunter2");
    ASSERT_TRUE(wrong.hasError());
    ASSERT_TRUE(unknown.hasError());
    EXPECT_EQ(wrong.error().code(), ErrorCode::CredentialRejected);
    EXPECT_EQ(unknown.error().code(), ErrorCode::CredentialRejected);
    EXPECT_EQ(wrong.error().message(), unknown.error().message());
    EXPECT_EQ(wrong.error().message(), kGenericAuthFailure);
    EXPECT_EQ(provider.signInCalls(), 2u);
}

TEST(IdentityProviderTest, SignOutEndsSession) {
    InMemoryIdentityProvider provider;
    auto userId = provider.registerUser("alice@example.com", "hunter2");
    ASSERT_TRUE(userId.hasValue());
    ASSERT_TRUE(provider.signInWithPassword("alice@example.com", "hunter2").hasValue());

    ASSERT_TRUE(provider.signOut(userId.value()).hasValue());
    EXPECT_FALSE(provider.hasActiveSession(userId.value()));
}

// ===========================================================================
// InMemoryProfileStore
// ===========================================================================

TEST(ProfileStoreTest, CreateAndFind) {
    InMemoryProfileStore store;
    ASSERT_TRUE(store.create(makeProfile("user-1", "alice@example.com")).hasValue());

    auto byId = store.find("user-1");
    ASSERT_TRUE(byId.hasValue());
    ASSERT_TRUE(byId.value().has_value());
    EXPECT_EQ(byId.value()->email, "alice@example.com");
    EXPECT_EQ(byId.value()->securityClearance, 1u);

    auto byEmail = store.findByEmail("alice@example.com");
    ASSERT_TRUE(byEmail.hasValue());
    ASSERT_TRUE(byEmail.value().has_value());
    EXPECT_EQ(byEmail.value()->userId, "user-1");
}

TEST(ProfileStoreTest, MissingProfileIsEmptyNotError) {
    InMemoryProfileStore store;
    auto result = store.find("nobody");
    ASSERT_TRUE(result.hasValue());
    EXPECT_FALSE(result.value().has_value());
}

TEST(ProfileStoreTest, CreateValidatesInput) {
    InMemoryProfileStore store;
    EXPECT_EQ(store.create(makeProfile("", "x@example.com")).error().code(),
              ErrorCode::InvalidArgument);

    auto tooHigh = makeProfile("user-1", "x@example.com");
    tooHigh.securityClearance = 6;
    EXPECT_EQ(store.create(tooHigh).error().code(), ErrorCode::InvalidArgument);

    ASSERT_TRUE(store.create(makeProfile("user-1", "x@example.com")).hasValue());
    EXPECT_EQ(store.create(makeProfile("user-1", "y@example.com")).error().code(),
              ErrorCode::AlreadyExists);
    EXPECT_EQ(store.size(), 1u);
}

TEST(ProfileStoreTest, FailedLoginsLockAtThreshold) {
    InMemoryProfileStore store;
    ASSERT_TRUE(store.create(makeProfile("user-1", "alice@example.com")).hasValue());

    for (int i = 0; i < 4; ++i) {
        ASSERT_TRUE(store.recordFailedLogin("alice@example.com", 5).hasValue());
    }
    EXPECT_FALSE(store.find("user-1").value()->accountLocked);

    ASSERT_TRUE(store.recordFailedLogin("alice@example.com", 5).hasValue());
    auto profile = store.find("user-1").value();
    EXPECT_EQ(profile->failedLoginAttempts, 5u);
    EXPECT_TRUE(profile->accountLocked);
}

TEST(ProfileStoreTest, FailedLoginForUnknownEmailIsIgnored) {
    InMemoryProfileStore store;
    EXPECT_TRUE(store.recordFailedLogin("ghost@example.com", 5).hasValue());
    EXPECT_EQ(store.size(), 0u);
}

TEST(ProfileStoreTest, SuccessfulLoginClearsFailures) {
    InMemoryProfileStore store;
    ASSERT_TRUE(store.create(makeProfile("user-1", "alice@example.com")).hasValue());
    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(store.recordFailedLogin("alice@example.com", 5).hasValue());
    }

    ASSERT_TRUE(store.recordSuccessfulLogin("user-1", at(1000)).hasValue());
    auto profile = store.find("user-1").value();
    EXPECT_EQ(profile->failedLoginAttempts, 0u);
    EXPECT_FALSE(profile->accountLocked);
    EXPECT_EQ(profile->lastLogin, at(1000));

    EXPECT_EQ(store.recordSuccessfulLogin("nobody", at(1000)).error().code(),
              ErrorCode::NotFound);
}

TEST(ProfileStoreTest, EnrollMfaAndSetClearance) {
    InMemoryProfileStore store;
    ASSERT_TRUE(store.create(makeProfile("user-1", "alice@example.com")).hasValue());

    ASSERT_TRUE(store.enrollMfa("user-1", "JBSWY3DPEHPK3PXP").hasValue());
    ASSERT_TRUE(store.setClearance("user-1", 4).hasValue());

    auto profile = store.find("user-1").value();
    EXPECT_EQ(profile->mfaSecret, std::string("JBSWY3DPEHPK3PXP"));
    EXPECT_EQ(profile->securityClearance, 4u);

    EXPECT_EQ(store.setClearance("user-1", 0).error().code(), ErrorCode::InvalidArgument);
    EXPECT_EQ(store.enrollMfa("nobody", "X").error().code(), ErrorCode::NotFound);
}

// ===========================================================================
// InMemoryAuditSink
// ===========================================================================

TEST(AuditSinkTest, FiltersByType) {
    InMemoryAuditSink sink;
    AuditEvent failed;
    failed.eventType = AuditEventType::FailedLogin;
    AuditEvent success;
    success.eventType = AuditEventType::SuccessfulLogin;

    ASSERT_TRUE(sink.append(failed).hasValue());
    ASSERT_TRUE(sink.append(success).hasValue());
    ASSERT_TRUE(sink.append(failed).hasValue());

    EXPECT_EQ(sink.events().size(), 3u);
    EXPECT_EQ(sink.eventsOfType(AuditEventType::FailedLogin).size(), 2u);
    EXPECT_EQ(sink.eventsOfType(AuditEventType::Logout).size(), 0u);

    sink.clear();
    EXPECT_TRUE(sink.events().empty());
}

// ===========================================================================
// Session transport
// ===========================================================================

TEST(SessionTransportTest, SetCookieHeaderDefaults) {
    CookieOptions options;
    EXPECT_EQ(formatSetCookie("ssg_session", "tok", options),
              "ssg_session=tok; Max-Age=28800; Path=/; HttpOnly; Secure; SameSite=Strict");
}

TEST(SessionTransportTest, SetCookieHeaderHonoursOptions) {
    CookieOptions options;
    options.httpOnly = false;
    options.secure = false;
    options.sameSite = SameSite::Lax;
    options.maxAge = 60s;
    EXPECT_EQ(formatSetCookie("c", "v", options), "c=v; Max-Age=60; Path=/; SameSite=Lax");
}

TEST(SessionTransportTest, InMemoryTransportStoresAndRemoves) {
    InMemorySessionTransport transport;
    EXPECT_FALSE(transport.get("ssg_session").has_value());

    transport.set("ssg_session", "tok", CookieOptions{});
    EXPECT_EQ(transport.get("ssg_session"), std::string("tok"));
    ASSERT_TRUE(transport.options("ssg_session").has_value());
    EXPECT_TRUE(transport.options("ssg_session")->httpOnly);
    EXPECT_TRUE(transport.setCookieHeader("ssg_session").has_value());

    transport.remove("ssg_session");
    EXPECT_FALSE(transport.get("ssg_session").has_value());
    transport.remove("ssg_session");
}

// ===========================================================================
// IpBlocklist
// ===========================================================================

TEST(IpBlocklistTest, BlockExpires) {
    IpBlocklist blocklist;
    blocklist.block("10.0.0.1", at(2000));

    EXPECT_TRUE(blocklist.isBlocked("10.0.0.1", at(1000)));
    EXPECT_FALSE(blocklist.isBlocked("10.0.0.1", at(2001)));
    EXPECT_FALSE(blocklist.isBlocked("10.0.0.2", at(1000)));
}

TEST(IpBlocklistTest, LaterExpiryWins) {
    IpBlocklist blocklist;
    blocklist.block("10.0.0.1", at(5000));
    blocklist.block("10.0.0.1", at(2000));
    EXPECT_EQ(blocklist.blockedUntil("10.0.0.1", at(1000)), at(5000));
}

TEST(IpBlocklistTest, UnblockAndCleanup) {
    IpBlocklist blocklist;
    blocklist.block("10.0.0.1", at(2000));
    blocklist.block("10.0.0.2", at(9000));
    blocklist.block("10.0.0.3", at(9000));

    blocklist.unblock("10.0.0.3");
    EXPECT_EQ(blocklist.size(), 2u);

    EXPECT_EQ(blocklist.cleanup(at(3000)), 1u);
    EXPECT_EQ(blocklist.size(), 1u);
    EXPECT_TRUE(blocklist.isBlocked("10.0.0.2", at(3000)));
}
