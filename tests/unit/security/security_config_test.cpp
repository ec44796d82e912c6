#include <gtest/gtest.h>

#include <string>

#include "warden/foundation/config_manager.hpp"
#include "warden/security/security_config.hpp"

using namespace warden::security;
using warden::foundation::ConfigManager;
using warden::foundation::ErrorCode;
using warden::foundation::SecurityResult;

namespace {

constexpr const char* kMinimal = R"(
authc:
  preferred_algorithm: scrypt
  hash_algorithms:
    scrypt: {}
web_registry:
  signed_cookie_secret: cookie-secret
)";

constexpr const char* kFull = R"(
authc:
  account_lock_threshold: 3
  account_lock_window: 600
  preferred_algorithm: pbkdf2_sha256_peppered
  hash_algorithms:
    scrypt:
      default_cost: 16
      min_cost: 15
      max_cost: 18
      block_size: 8
      parallelism: 2
    pbkdf2_sha256_peppered:
      default_rounds: 200000
      pepper: pepper
      salt_size: 24
  totp:
    mfa_dispatcher: sms
    default_tag: v2
    digits: 8
    period: 60
    secrets:
      v1: old-key
      v2: new-key
remember_me:
  default_cipher_key: cipher
  key_id: k7
  max_age: 86400
session:
  absolute_timeout: 7200
  idle_timeout: 600
  validation:
    scheduler_enabled: true
    time_interval: 120
cache:
  backend: ~
  ttl:
    session_absolute_ttl: 900
realms:
  - name: ldap
    account_store: ldap
  - name: local
    account_store: memory
web_registry:
  signed_cookie_secret: cookie-secret
security_manager:
  worker_threads: 8
  operation_timeout_ms: 2500
  store_retry:
    max_attempts: 5
    initial_backoff_ms: 10
)";

SecurityResult<SecurityConfig> load(const std::string& yaml) {
    ConfigManager config;
    auto loaded = config.loadFromString(yaml);
    EXPECT_TRUE(loaded.hasValue());
    return loadSecurityConfig(config);
}

std::string withMinimal(const std::string& extra) {
    return std::string(kMinimal) + extra;
}

} // namespace

TEST(SecurityConfigTest, MinimalConfigUsesDefaults) {
    auto result = load(kMinimal);
    ASSERT_TRUE(result.hasValue()) << result.error().message();
    const auto& config = result.value();

    EXPECT_TRUE(std::holds_alternative<LockoutDisabled>(config.authc.lockout));
    ASSERT_EQ(config.authc.algorithms.size(), 1u);
    const auto& scrypt = config.authc.algorithms[0];
    EXPECT_EQ(scrypt.scheme, HashScheme::Scrypt);
    EXPECT_EQ(scrypt.bounds.min, 14u);
    EXPECT_EQ(scrypt.bounds.defaultValue, 15u);
    EXPECT_EQ(scrypt.bounds.max, 20u);
    EXPECT_FALSE(config.authc.totp.has_value());
    EXPECT_FALSE(config.rememberMe.has_value());

    EXPECT_EQ(config.session.absoluteTimeout.count(), 1800);
    EXPECT_EQ(config.session.idleTimeout.count(), 300);
    EXPECT_FALSE(config.session.validationSchedulerEnabled);
    ASSERT_TRUE(config.cache.backend.has_value());
    EXPECT_EQ(*config.cache.backend, "memory");

    ASSERT_EQ(config.realms.size(), 1u);
    EXPECT_EQ(config.realms[0].name, "default");
    EXPECT_EQ(config.realms[0].accountStore, "memory");
    EXPECT_EQ(config.workerThreads, 4u);
    EXPECT_EQ(config.storeRetry.maxAttempts, 3u);
}

TEST(SecurityConfigTest, FullConfigIsRead) {
    auto result = load(kFull);
    ASSERT_TRUE(result.hasValue()) << result.error().message();
    const auto& config = result.value();

    const auto* lockout = std::get_if<LockoutEnabled>(&config.authc.lockout);
    ASSERT_NE(lockout, nullptr);
    EXPECT_EQ(lockout->threshold, 3u);
    EXPECT_EQ(lockout->failureWindow, std::chrono::seconds(600));
    EXPECT_EQ(config.authc.preferredAlgorithm, "pbkdf2_sha256_peppered");
    ASSERT_EQ(config.authc.algorithms.size(), 2u);

    ASSERT_TRUE(config.authc.totp.has_value());
    EXPECT_EQ(config.authc.totp->dispatcher, "sms");
    EXPECT_EQ(config.authc.totp->defaultTag, "v2");
    EXPECT_EQ(config.authc.totp->digits, 8u);
    EXPECT_EQ(config.authc.totp->period, 60u);
    EXPECT_EQ(config.authc.totp->secrets.size(), 2u);

    ASSERT_TRUE(config.rememberMe.has_value());
    EXPECT_EQ(config.rememberMe->keyId, "k7");
    EXPECT_EQ(config.rememberMe->maxAge.count(), 86400);

    EXPECT_EQ(config.session.absoluteTimeout.count(), 7200);
    EXPECT_TRUE(config.session.validationSchedulerEnabled);
    EXPECT_EQ(config.session.validationInterval.count(), 120);

    EXPECT_FALSE(config.cache.backend.has_value());
    EXPECT_EQ(config.cache.ttl.sessionAbsoluteTtl.count(), 900);

    ASSERT_EQ(config.realms.size(), 2u);
    EXPECT_EQ(config.realms[0].name, "ldap");
    EXPECT_EQ(config.realms[1].accountStore, "memory");

    EXPECT_EQ(config.workerThreads, 8u);
    EXPECT_EQ(config.operationTimeout.count(), 2500);
    EXPECT_EQ(config.storeRetry.maxAttempts, 5u);
    EXPECT_EQ(config.storeRetry.initialBackoff.count(), 10);
}

TEST(SecurityConfigTest, NullThresholdDisablesLockout) {
    auto result = load(R"(
authc:
  account_lock_threshold: ~
  preferred_algorithm: pbkdf2_sha256
  hash_algorithms:
    pbkdf2_sha256: {}
web_registry:
  signed_cookie_secret: s
)");
    ASSERT_TRUE(result.hasValue()) << result.error().message();
    EXPECT_TRUE(std::holds_alternative<LockoutDisabled>(result.value().authc.lockout));
}

TEST(SecurityConfigTest, InvalidSettingsAreConfigurationErrors) {
    const char* invalid[] = {
        // zero threshold
        R"(
authc:
  account_lock_threshold: 0
  preferred_algorithm: scrypt
  hash_algorithms:
    scrypt: {}
web_registry:
  signed_cookie_secret: s
)",
        // non-positive failure window
        R"(
authc:
  account_lock_threshold: 3
  account_lock_window: 0
  preferred_algorithm: scrypt
  hash_algorithms:
    scrypt: {}
web_registry:
  signed_cookie_secret: s
)",
        // preferred algorithm not configured
        R"(
authc:
  preferred_algorithm: scrypt
  hash_algorithms:
    pbkdf2_sha256: {}
web_registry:
  signed_cookie_secret: s
)",
        // unknown algorithm
        R"(
authc:
  preferred_algorithm: md5
  hash_algorithms:
    md5: {}
web_registry:
  signed_cookie_secret: s
)",
        // min above default
        R"(
authc:
  preferred_algorithm: pbkdf2_sha256
  hash_algorithms:
    pbkdf2_sha256:
      min_rounds: 500000
web_registry:
  signed_cookie_secret: s
)",
        // peppered without pepper
        R"(
authc:
  preferred_algorithm: pbkdf2_sha256_peppered
  hash_algorithms:
    pbkdf2_sha256_peppered: {}
web_registry:
  signed_cookie_secret: s
)",
        // missing cookie secret
        R"(
authc:
  preferred_algorithm: scrypt
  hash_algorithms:
    scrypt: {}
)",
    };

    for (const char* yaml : invalid) {
        auto result = load(yaml);
        ASSERT_TRUE(result.hasError()) << yaml;
        EXPECT_EQ(result.code(), ErrorCode::ConfigurationError) << yaml;
    }
}

TEST(SecurityConfigTest, TotpDefaultTagNeedsSecret) {
    auto result = load(R"(
authc:
  preferred_algorithm: scrypt
  hash_algorithms:
    scrypt: {}
  totp:
    mfa_dispatcher: memory
    default_tag: v2
    secrets:
      v1: key
web_registry:
  signed_cookie_secret: s
)");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.code(), ErrorCode::ConfigurationError);
}

TEST(SecurityConfigTest, SessionCacheTtlMayNotExceedAbsoluteTimeout) {
    auto result = load(withMinimal(R"(
session:
  absolute_timeout: 600
cache:
  ttl:
    session_absolute_ttl: 1800
)"));
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.code(), ErrorCode::ConfigurationError);
}

TEST(SecurityConfigTest, DuplicateRealmNamesAreRejected) {
    auto result = load(withMinimal(R"(
realms:
  - name: local
    account_store: memory
  - name: local
    account_store: memory
)"));
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.code(), ErrorCode::ConfigurationError);
}

TEST(SecurityConfigTest, ValidateRejectsZeroWorkers) {
    auto result = load(kMinimal);
    ASSERT_TRUE(result.hasValue());
    auto config = result.value();
    config.workerThreads = 0;
    EXPECT_EQ(validateSecurityConfig(config).code(), ErrorCode::ConfigurationError);
}

TEST(SecurityConfigTest, SchemeNames) {
    EXPECT_EQ(schemeForAlgorithm("scrypt"), HashScheme::Scrypt);
    EXPECT_EQ(schemeForAlgorithm("pbkdf2_sha256"), HashScheme::Pbkdf2Sha256);
    EXPECT_EQ(schemeForAlgorithm("pbkdf2_sha256_peppered"), HashScheme::Pbkdf2Sha256Peppered);
    EXPECT_FALSE(schemeForAlgorithm("bcrypt").has_value());
}
