#pragma once

/// @file security_config.hpp
/// @brief Immutable SecurityConfig and its loader from ConfigManager.

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "warden/foundation/config_manager.hpp"
#include "warden/foundation/security_result.hpp"
#include "warden/security/security_types.hpp"

namespace warden::security {

// -- Lockout policy -----------------------------------------------------------

/// `authc.account_lock_threshold: null`; no state is kept.
struct LockoutDisabled {};

struct LockoutEnabled {
    uint32_t threshold = 0;
    /// Failures older than this are forgotten unless the account is locked.
    std::chrono::seconds failureWindow{900};
};

using LockoutPolicy = std::variant<LockoutDisabled, LockoutEnabled>;

// -- Section structs ------------------------------------------------------------

struct TotpConfig {
    std::string dispatcher;                    ///< Delivery channel component name.
    std::string defaultTag;
    uint32_t digits = 6;
    uint32_t period = 30;
    std::map<std::string, std::string> secrets; ///< tag -> application sealing key
};

struct AuthcConfig {
    LockoutPolicy lockout = LockoutDisabled{};
    std::string preferredAlgorithm;
    std::vector<HashAlgorithmSpec> algorithms;
    std::optional<TotpConfig> totp; ///< nullopt when mfa_dispatcher is null
};

struct RememberMeConfig {
    std::string cipherKey;
    std::string keyId = "default";
    std::chrono::seconds maxAge{1209600};
};

struct SessionConfig {
    std::chrono::seconds absoluteTimeout{1800};
    std::chrono::seconds idleTimeout{300};
    bool validationSchedulerEnabled = false;
    std::chrono::seconds validationInterval{3600};
    std::string store = "memory";
};

struct CacheTtlConfig {
    std::chrono::seconds absoluteTtl{3600};
    std::chrono::seconds credentialsTtl{300};
    std::chrono::seconds authzInfoTtl{1800};
    std::chrono::seconds sessionAbsoluteTtl{1800};
};

struct CacheConfig {
    std::optional<std::string> backend = std::string("memory"); ///< nullopt disables caching
    CacheTtlConfig ttl;
};

struct RealmConfig {
    std::string name;
    std::string accountStore;
};

struct StoreRetryConfig {
    uint32_t maxAttempts = 3;
    std::chrono::milliseconds initialBackoff{50};
};

/// Complete, validated configuration of a SecurityManager.
///
/// Built once at startup and passed to constructors; components never look
/// configuration up on their own.
struct SecurityConfig {
    AuthcConfig authc;
    std::optional<RememberMeConfig> rememberMe;
    SessionConfig session;
    CacheConfig cache;
    std::vector<RealmConfig> realms;
    std::string signedCookieSecret;
    std::size_t workerThreads = 4;
    std::chrono::milliseconds operationTimeout{0}; ///< 0 waits indefinitely
    StoreRetryConfig storeRetry;
};

/// Map an algorithm id to its scheme ("scrypt", "pbkdf2_sha256",
/// "pbkdf2_sha256_peppered").
std::optional<HashScheme> schemeForAlgorithm(std::string_view algorithmId);

/// Check algorithm bounds, salt sizes, peppers and the preferred id.
foundation::SecurityResult<void> validateHashAlgorithms(
    const std::vector<HashAlgorithmSpec>& algorithms, std::string_view preferredAlgorithm);

/// Check cross-field invariants; every violation is a ConfigurationError.
foundation::SecurityResult<void> validateSecurityConfig(const SecurityConfig& config);

/// Build and validate a SecurityConfig from a loaded ConfigManager.
foundation::SecurityResult<SecurityConfig> loadSecurityConfig(
    const foundation::ConfigManager& config);

} // namespace warden::security
