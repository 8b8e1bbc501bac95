#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "ssg/service/password_hasher.hpp"

using namespace ssg::service;

// ---------------------------------------------------------------------------
// PasswordHasher
// ---------------------------------------------------------------------------

TEST(PasswordHasherTest, EncodedFormatIsSaltColonDerived) {
    PasswordHasher hasher;
    auto hashed = hasher.hash("correct horse battery staple");
    ASSERT_TRUE(hashed.hasValue());

    EXPECT_EQ(hashed.value().salt.size(), PasswordHasher::kSaltLength);
    EXPECT_EQ(hashed.value().derived.size(), PasswordHasher::kDerivedLength);

    auto encoded = hashed.value().encoded();
    auto sep = encoded.find(':');
    ASSERT_NE(sep, std::string::npos);
    EXPECT_EQ(sep, PasswordHasher::kSaltLength * 2);
    EXPECT_EQ(encoded.size() - sep - 1, PasswordHasher::kDerivedLength * 2);
}

TEST(PasswordHasherTest, FreshSaltPerHash) {
    PasswordHasher hasher;
    auto a = hasher.hash("same password");
    auto b = hasher.hash("same password");
    ASSERT_TRUE(a.hasValue());
    ASSERT_TRUE(b.hasValue());
    EXPECT_NE(a.value().salt, b.value().salt);
    EXPECT_NE(a.value().encoded(), b.value().encoded());
}

TEST(PasswordHasherTest, FixedSaltIsDeterministic) {
    PasswordHasher hasher;
    std::vector<uint8_t> salt(PasswordHasher::kSaltLength, 0x5A);
    auto a = hasher.hash("secret", salt);
    auto b = hasher.hash("secret", salt);
    ASSERT_TRUE(a.hasValue());
    ASSERT_TRUE(b.hasValue());
    EXPECT_EQ(a.value().encoded(), b.value().encoded());
}

TEST(PasswordHasherTest, VerifyAcceptsCorrectPassword) {
    PasswordHasher hasher;
    auto hashed = hasher.hash("s3cret!");
    ASSERT_TRUE(hashed.hasValue());
    EXPECT_TRUE(hasher.verify("s3cret!", hashed.value().encoded()));
}

TEST(PasswordHasherTest, VerifyRejectsWrongPassword) {
    PasswordHasher hasher;
    auto hashed = hasher.hash("s3cret!");
    ASSERT_TRUE(hashed.hasValue());
    EXPECT_FALSE(hasher.verify("s3cret?", hashed.value().encoded()));
    EXPECT_FALSE(hasher.verify("", hashed.value().encoded()));
}

TEST(PasswordHasherTest, VerifyRejectsMalformedStoredValue) {
    PasswordHasher hasher;
    EXPECT_FALSE(hasher.verify("pw", ""));
    EXPECT_FALSE(hasher.verify("pw", "no-separator"));
    EXPECT_FALSE(hasher.verify("pw", "zz:zz"));
    EXPECT_FALSE(hasher.verify("pw", ":abcd"));

    // Derived part of the wrong length
    std::string shortDerived = std::string(32, 'a') + ":" + std::string(32, 'b');
    EXPECT_FALSE(hasher.verify("pw", shortDerived));
}

TEST(PasswordHasherTest, DifferentIterationCountsDoNotVerify) {
    PasswordHasher low;
    PasswordHasher high(PasswordHasher::kMinIterations + 1);
    auto hashed = low.hash("pw");
    ASSERT_TRUE(hashed.hasValue());
    EXPECT_FALSE(high.verify("pw", hashed.value().encoded()));
}

TEST(PasswordHasherTest, IterationsClampedToMinimum) {
    PasswordHasher hasher(1000);
    EXPECT_EQ(hasher.iterations(), PasswordHasher::kMinIterations);

    PasswordHasher stronger(250000);
    EXPECT_EQ(stronger.iterations(), 250000u);
}
