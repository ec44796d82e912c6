/// @file security_config.cpp
/// @brief SecurityConfig loader and validation.

#include "warden/security/security_config.hpp"

#include <set>
#include <utility>

namespace warden::security {

using foundation::ConfigManager;
using foundation::ErrorCode;
using foundation::SecurityResult;

namespace {

constexpr uint32_t kDefaultPbkdf2Rounds = 110000;
constexpr uint32_t kMinPbkdf2Rounds = 1000;
constexpr uint32_t kMaxPbkdf2Rounds = 1000000;

constexpr uint32_t kDefaultScryptCost = 15;
constexpr uint32_t kMinScryptCost = 14;
constexpr uint32_t kMaxScryptCost = 20;
constexpr uint32_t kScryptCostCeiling = 30;

/// Sequential reader that remembers the first failure.
///
/// Lets the loader read a long list of keys without a check after each one;
/// any lookup after a failure returns the fallback untouched.
class SectionReader {
public:
    explicit SectionReader(const ConfigManager& config) : config_(config) {}

    template <typename T>
    T read(const std::string& key, T fallback) {
        if (error_) {
            return fallback;
        }
        auto result = config_.getOr<T>(key, fallback);
        if (!result) {
            error_ = std::string(result.error().message());
            return fallback;
        }
        return std::move(result).value();
    }

    template <typename T>
    T require(const std::string& key) {
        if (error_) {
            return T{};
        }
        auto result = config_.get<T>(key);
        if (!result) {
            error_ = "missing required setting '" + key + "'";
            return T{};
        }
        return std::move(result).value();
    }

    std::chrono::seconds seconds(const std::string& key, std::chrono::seconds fallback) {
        return std::chrono::seconds(read<int64_t>(key, fallback.count()));
    }

    /// Absent and explicit null both count as "not set".
    [[nodiscard]] bool isSet(const std::string& key) const {
        return config_.hasKey(key) && !config_.isNull(key);
    }

    [[nodiscard]] const ConfigManager& config() const noexcept { return config_; }

    [[nodiscard]] bool failed() const noexcept { return error_.has_value(); }

    SecurityResult<SecurityConfig> error() const {
        return SecurityResult<SecurityConfig>::err(ErrorCode::ConfigurationError, *error_);
    }

    void fail(std::string message) {
        if (!error_) {
            error_ = std::move(message);
        }
    }

private:
    const ConfigManager& config_;
    std::optional<std::string> error_;
};

SecurityResult<void> configError(std::string message) {
    return SecurityResult<void>::err(ErrorCode::ConfigurationError, std::move(message));
}

void readHashAlgorithms(SectionReader& reader, AuthcConfig& authc) {
    const std::string base = "authc.hash_algorithms";
    for (const auto& id : reader.config().childKeys(base)) {
        auto scheme = schemeForAlgorithm(id);
        if (!scheme) {
            reader.fail("unknown hash algorithm '" + id + "'");
            return;
        }

        const std::string prefix = base + "." + id + ".";
        HashAlgorithmSpec spec;
        spec.id = id;
        spec.scheme = *scheme;
        if (*scheme == HashScheme::Scrypt) {
            spec.bounds.defaultValue = reader.read<uint32_t>(prefix + "default_cost", kDefaultScryptCost);
            spec.bounds.min = reader.read<uint32_t>(prefix + "min_cost", kMinScryptCost);
            spec.bounds.max = reader.read<uint32_t>(prefix + "max_cost", kMaxScryptCost);
            spec.blockSize = reader.read<uint32_t>(prefix + "block_size", 8);
            spec.parallelism = reader.read<uint32_t>(prefix + "parallelism", 1);
        } else {
            spec.bounds.defaultValue = reader.read<uint32_t>(prefix + "default_rounds", kDefaultPbkdf2Rounds);
            spec.bounds.min = reader.read<uint32_t>(prefix + "min_rounds", kMinPbkdf2Rounds);
            spec.bounds.max = reader.read<uint32_t>(prefix + "max_rounds", kMaxPbkdf2Rounds);
            spec.blockSize = 0;
            spec.parallelism = 0;
        }
        spec.saltSize = reader.read<std::size_t>(prefix + "salt_size", 16);
        if (reader.isSet(prefix + "pepper")) {
            spec.pepper = reader.read<std::string>(prefix + "pepper", "");
        }
        authc.algorithms.push_back(std::move(spec));
    }
}

void readTotp(SectionReader& reader, AuthcConfig& authc) {
    if (!reader.isSet("authc.totp.mfa_dispatcher")) {
        return;
    }
    TotpConfig totp;
    totp.dispatcher = reader.require<std::string>("authc.totp.mfa_dispatcher");
    totp.defaultTag = reader.require<std::string>("authc.totp.default_tag");
    totp.digits = reader.read<uint32_t>("authc.totp.digits", 6);
    totp.period = reader.read<uint32_t>("authc.totp.period", 30);
    for (const auto& tag : reader.config().childKeys("authc.totp.secrets")) {
        totp.secrets[tag] = reader.require<std::string>("authc.totp.secrets." + tag);
    }
    authc.totp = std::move(totp);
}

void readRealms(SectionReader& reader, std::vector<RealmConfig>& realms) {
    if (!reader.config().hasKey("realms")) {
        realms.push_back({"default", "memory"});
        return;
    }
    auto node = reader.config().node("realms");
    if (!node || !node.value().IsSequence()) {
        reader.fail("'realms' must be a list of {name, account_store}");
        return;
    }
    for (const auto& entry : node.value()) {
        if (!entry.IsMap() || !entry["name"] || !entry["account_store"]) {
            reader.fail("each realm needs 'name' and 'account_store'");
            return;
        }
        try {
            realms.push_back({entry["name"].as<std::string>(),
                              entry["account_store"].as<std::string>()});
        } catch (const YAML::BadConversion&) {
            reader.fail("realm entries must be strings");
            return;
        }
    }
}

SecurityResult<void> validateAlgorithm(const HashAlgorithmSpec& spec) {
    const auto& b = spec.bounds;
    if (b.min == 0 || b.min > b.defaultValue || b.defaultValue > b.max) {
        return configError("hash algorithm '" + spec.id +
                           "' violates min <= default <= max (" + std::to_string(b.min) + ", " +
                           std::to_string(b.defaultValue) + ", " + std::to_string(b.max) + ")");
    }
    if (spec.saltSize == 0) {
        return configError("hash algorithm '" + spec.id + "' needs a non-zero salt_size");
    }
    if (spec.scheme == HashScheme::Scrypt) {
        if (b.max > kScryptCostCeiling) {
            return configError("scrypt cost above " + std::to_string(kScryptCostCeiling));
        }
        if (spec.blockSize == 0 || spec.parallelism == 0) {
            return configError("scrypt block_size and parallelism must be positive");
        }
    }
    if (spec.scheme == HashScheme::Pbkdf2Sha256Peppered &&
        (!spec.pepper || spec.pepper->empty())) {
        return configError("hash algorithm '" + spec.id + "' requires a pepper");
    }
    return SecurityResult<void>::ok();
}

} // namespace

std::optional<HashScheme> schemeForAlgorithm(std::string_view algorithmId) {
    if (algorithmId == "scrypt") {
        return HashScheme::Scrypt;
    }
    if (algorithmId == "pbkdf2_sha256") {
        return HashScheme::Pbkdf2Sha256;
    }
    if (algorithmId == "pbkdf2_sha256_peppered") {
        return HashScheme::Pbkdf2Sha256Peppered;
    }
    return std::nullopt;
}

SecurityResult<void> validateHashAlgorithms(const std::vector<HashAlgorithmSpec>& algorithms,
                                            std::string_view preferredAlgorithm) {
    if (algorithms.empty()) {
        return configError("no hash algorithms configured");
    }
    std::set<std::string, std::less<>> ids;
    for (const auto& spec : algorithms) {
        auto scheme = schemeForAlgorithm(spec.id);
        if (!scheme || *scheme != spec.scheme) {
            return configError("algorithm id '" + spec.id + "' does not match its scheme");
        }
        if (!ids.insert(spec.id).second) {
            return configError("duplicate hash algorithm '" + spec.id + "'");
        }
        auto checked = validateAlgorithm(spec);
        if (!checked) {
            return checked;
        }
    }
    if (ids.find(preferredAlgorithm) == ids.end()) {
        return configError("preferred algorithm '" + std::string(preferredAlgorithm) +
                           "' is not configured");
    }
    return SecurityResult<void>::ok();
}

SecurityResult<void> validateSecurityConfig(const SecurityConfig& config) {
    // -- authc ----------------------------------------------------------------
    auto algorithms = validateHashAlgorithms(config.authc.algorithms,
                                             config.authc.preferredAlgorithm);
    if (!algorithms) {
        return algorithms;
    }
    if (const auto* enabled = std::get_if<LockoutEnabled>(&config.authc.lockout)) {
        if (enabled->threshold == 0) {
            return configError("account_lock_threshold must be positive or null");
        }
        if (enabled->failureWindow.count() <= 0) {
            return configError("account_lock_window must be positive");
        }
    }
    if (config.authc.totp) {
        const auto& totp = *config.authc.totp;
        if (totp.dispatcher.empty()) {
            return configError("totp.mfa_dispatcher must name a delivery channel");
        }
        if (totp.digits < 6 || totp.digits > 8) {
            return configError("totp.digits must be between 6 and 8");
        }
        if (totp.period == 0) {
            return configError("totp.period must be positive");
        }
        auto it = totp.secrets.find(totp.defaultTag);
        if (it == totp.secrets.end()) {
            return configError("totp.default_tag '" + totp.defaultTag + "' has no secret");
        }
        for (const auto& [tag, key] : totp.secrets) {
            if (key.empty()) {
                return configError("totp secret '" + tag + "' is empty");
            }
        }
    }

    // -- remember-me ----------------------------------------------------------
    if (config.rememberMe) {
        if (config.rememberMe->cipherKey.empty() || config.rememberMe->keyId.empty()) {
            return configError("remember_me needs a cipher key and key id");
        }
        if (config.rememberMe->maxAge.count() <= 0) {
            return configError("remember_me.max_age must be positive");
        }
    }

    // -- session --------------------------------------------------------------
    const auto& session = config.session;
    if (session.absoluteTimeout.count() <= 0 || session.idleTimeout.count() <= 0) {
        return configError("session timeouts must be positive");
    }
    if (session.validationSchedulerEnabled && session.validationInterval.count() <= 0) {
        return configError("session.validation.time_interval must be positive");
    }

    // -- cache ----------------------------------------------------------------
    const auto& ttl = config.cache.ttl;
    if (ttl.absoluteTtl.count() <= 0 || ttl.credentialsTtl.count() <= 0 ||
        ttl.authzInfoTtl.count() <= 0 || ttl.sessionAbsoluteTtl.count() <= 0) {
        return configError("cache TTLs must be positive");
    }
    if (ttl.sessionAbsoluteTtl > session.absoluteTimeout) {
        return configError("cache.ttl.session_absolute_ttl exceeds session.absolute_timeout");
    }

    // -- realms ---------------------------------------------------------------
    if (config.realms.empty()) {
        return configError("at least one realm is required");
    }
    std::set<std::string> realmNames;
    for (const auto& realm : config.realms) {
        if (realm.name.empty() || realm.accountStore.empty()) {
            return configError("realm name and account_store must be non-empty");
        }
        if (!realmNames.insert(realm.name).second) {
            return configError("duplicate realm '" + realm.name + "'");
        }
    }

    // -- misc -----------------------------------------------------------------
    if (config.signedCookieSecret.empty()) {
        return configError("web_registry.signed_cookie_secret is required");
    }
    if (config.workerThreads == 0) {
        return configError("security_manager.worker_threads must be positive");
    }
    if (config.operationTimeout.count() < 0) {
        return configError("security_manager.operation_timeout_ms must not be negative");
    }
    if (config.storeRetry.maxAttempts == 0) {
        return configError("store_retry.max_attempts must be at least 1");
    }
    return SecurityResult<void>::ok();
}

SecurityResult<SecurityConfig> loadSecurityConfig(const ConfigManager& config) {
    SectionReader reader(config);
    SecurityConfig out;

    // -- authc ----------------------------------------------------------------
    if (reader.isSet("authc.account_lock_threshold")) {
        LockoutEnabled lockout;
        lockout.threshold = reader.read<uint32_t>("authc.account_lock_threshold", 0);
        lockout.failureWindow = reader.seconds("authc.account_lock_window", lockout.failureWindow);
        out.authc.lockout = lockout;
    }
    out.authc.preferredAlgorithm = reader.require<std::string>("authc.preferred_algorithm");
    readHashAlgorithms(reader, out.authc);
    readTotp(reader, out.authc);

    // -- remember-me ----------------------------------------------------------
    if (reader.isSet("remember_me.default_cipher_key")) {
        RememberMeConfig rememberMe;
        rememberMe.cipherKey = reader.read<std::string>("remember_me.default_cipher_key", "");
        rememberMe.keyId = reader.read<std::string>("remember_me.key_id", rememberMe.keyId);
        rememberMe.maxAge = reader.seconds("remember_me.max_age", rememberMe.maxAge);
        out.rememberMe = std::move(rememberMe);
    }

    // -- session --------------------------------------------------------------
    out.session.absoluteTimeout =
        reader.seconds("session.absolute_timeout", out.session.absoluteTimeout);
    out.session.idleTimeout = reader.seconds("session.idle_timeout", out.session.idleTimeout);
    out.session.validationSchedulerEnabled =
        reader.read<bool>("session.validation.scheduler_enabled", false);
    out.session.validationInterval =
        reader.seconds("session.validation.time_interval", out.session.validationInterval);
    out.session.store = reader.read<std::string>("session.store", out.session.store);

    // -- cache ----------------------------------------------------------------
    if (config.isNull("cache.backend")) {
        out.cache.backend.reset();
    } else {
        out.cache.backend = reader.read<std::string>("cache.backend", "memory");
    }
    auto& ttl = out.cache.ttl;
    ttl.absoluteTtl = reader.seconds("cache.ttl.absolute_ttl", ttl.absoluteTtl);
    ttl.credentialsTtl = reader.seconds("cache.ttl.credentials_ttl", ttl.credentialsTtl);
    ttl.authzInfoTtl = reader.seconds("cache.ttl.authz_info_ttl", ttl.authzInfoTtl);
    ttl.sessionAbsoluteTtl =
        reader.seconds("cache.ttl.session_absolute_ttl", ttl.sessionAbsoluteTtl);

    // -- realms / cookies / manager -------------------------------------------
    readRealms(reader, out.realms);
    out.signedCookieSecret = reader.require<std::string>("web_registry.signed_cookie_secret");
    out.workerThreads = reader.read<std::size_t>("security_manager.worker_threads", 4);
    out.operationTimeout = std::chrono::milliseconds(
        reader.read<int64_t>("security_manager.operation_timeout_ms", 0));
    out.storeRetry.maxAttempts =
        reader.read<uint32_t>("security_manager.store_retry.max_attempts", 3);
    out.storeRetry.initialBackoff = std::chrono::milliseconds(
        reader.read<int64_t>("security_manager.store_retry.initial_backoff_ms", 50));

    if (reader.failed()) {
        return reader.error();
    }

    auto valid = validateSecurityConfig(out);
    if (!valid) {
        return SecurityResult<SecurityConfig>::err(valid.error());
    }
    return SecurityResult<SecurityConfig>::ok(std::move(out));
}

} // namespace warden::security
