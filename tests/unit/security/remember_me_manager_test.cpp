#include <gtest/gtest.h>

#include <chrono>
#include <string>

#include "warden/security/remember_me_manager.hpp"

using namespace warden::security;

namespace {

RememberMeConfig config(std::string keyId = "k1", std::string cipherKey = "remember-me-key") {
    RememberMeConfig c;
    c.cipherKey = std::move(cipherKey);
    c.keyId = std::move(keyId);
    c.maxAge = std::chrono::seconds(3600);
    return c;
}

class RememberMeManagerTest : public ::testing::Test {
protected:
    TimePoint now_ = TimePoint{} + std::chrono::seconds(1'700'000'000);
    TimeSource clock_ = [this] { return now_; };
};

} // namespace

TEST_F(RememberMeManagerTest, IssuedTokenResolvesToPrincipal) {
    RememberMeManager manager(config(), clock_);
    auto token = manager.issue("alice");
    ASSERT_TRUE(token.hasValue());
    EXPECT_EQ(token.value().find("alice"), std::string::npos);

    auto principal = manager.resolve(token.value());
    ASSERT_TRUE(principal.has_value());
    EXPECT_EQ(*principal, "alice");
}

TEST_F(RememberMeManagerTest, TokensAreNotDeterministic) {
    RememberMeManager manager(config(), clock_);
    auto a = manager.issue("alice");
    auto b = manager.issue("alice");
    ASSERT_TRUE(a.hasValue());
    ASSERT_TRUE(b.hasValue());
    EXPECT_NE(a.value(), b.value());
}

TEST_F(RememberMeManagerTest, ExpiresAfterMaxAge) {
    RememberMeManager manager(config(), clock_);
    auto token = manager.issue("alice");
    ASSERT_TRUE(token.hasValue());

    now_ += std::chrono::seconds(3600);
    EXPECT_TRUE(manager.resolve(token.value()).has_value());

    now_ += std::chrono::seconds(1);
    EXPECT_FALSE(manager.resolve(token.value()).has_value());
}

TEST_F(RememberMeManagerTest, TokenFromTheFutureIsRejected) {
    RememberMeManager manager(config(), clock_);
    now_ += std::chrono::hours(1);
    auto token = manager.issue("alice");
    ASSERT_TRUE(token.hasValue());

    now_ -= std::chrono::hours(1);
    EXPECT_FALSE(manager.resolve(token.value()).has_value());
}

TEST_F(RememberMeManagerTest, TamperedTokenIsRejected) {
    RememberMeManager manager(config(), clock_);
    auto token = manager.issue("alice");
    ASSERT_TRUE(token.hasValue());

    std::string tampered = token.value();
    char& inside = tampered[tampered.find('.') + 5];
    inside = inside == 'A' ? 'B' : 'A';
    EXPECT_FALSE(manager.resolve(tampered).has_value());

    EXPECT_FALSE(manager.resolve("").has_value());
    EXPECT_FALSE(manager.resolve("no-dot-here").has_value());
    EXPECT_FALSE(manager.resolve("azE.!!!").has_value());
}

TEST_F(RememberMeManagerTest, RotatedKeyInvalidatesOldTokens) {
    RememberMeManager before(config("k1", "first key"), clock_);
    auto token = before.issue("alice");
    ASSERT_TRUE(token.hasValue());

    RememberMeManager rotatedId(config("k2", "first key"), clock_);
    EXPECT_FALSE(rotatedId.resolve(token.value()).has_value());

    RememberMeManager rotatedKey(config("k1", "second key"), clock_);
    EXPECT_FALSE(rotatedKey.resolve(token.value()).has_value());
}
