/// @file security_manager.cpp
/// @brief SecurityManager implementation.

#include "warden/security/security_manager.hpp"

#include "warden/foundation/security_logger.hpp"
#include "warden/security/security_events.hpp"

namespace warden::security {

using foundation::ComponentRegistry;
using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using foundation::SecurityError;
using foundation::SecurityResult;

namespace {

std::string_view causeName(ErrorCode cause) {
    switch (cause) {
        case ErrorCode::InvalidCredentials: return "invalid_credentials";
        case ErrorCode::UnknownAccount:     return "unknown_account";
        case ErrorCode::AccountLocked:      return "account_locked";
        case ErrorCode::StoreUnavailable:   return "store_unavailable";
        case ErrorCode::VerificationError:  return "verification_error";
        case ErrorCode::MfaRequired:        return "mfa_required";
        case ErrorCode::ExpiredChallenge:   return "expired_challenge";
        case ErrorCode::InvalidChallenge:   return "invalid_challenge";
        case ErrorCode::ChallengeReplayed:  return "challenge_replayed";
        case ErrorCode::MfaNotEnrolled:     return "mfa_not_enrolled";
        case ErrorCode::Timeout:            return "timeout";
        default:                            return "other";
    }
}

} // namespace

void registerInMemoryComponents(ComponentRegistry& components) {
    if (!components.has<IAccountStore>("memory")) {
        components.add<IAccountStore>("memory", std::make_shared<InMemoryAccountStore>());
    }
    if (!components.has<ICacheBackend>("memory")) {
        components.add<ICacheBackend>("memory", std::make_shared<InMemoryCacheBackend>());
    }
    if (!components.has<ISessionStore>("memory")) {
        components.add<ISessionStore>("memory", std::make_shared<InMemorySessionStore>());
    }
    if (!components.has<IMfaDeliveryChannel>("memory")) {
        components.add<IMfaDeliveryChannel>("memory", std::make_shared<InMemoryDeliveryChannel>());
    }
}

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

SecurityResult<std::unique_ptr<SecurityManager>> SecurityManager::create(
    SecurityConfig config, const ComponentRegistry& components, TimeSource clock) {
    using ManagerResult = SecurityResult<std::unique_ptr<SecurityManager>>;

    auto valid = validateSecurityConfig(config);
    if (!valid) {
        return ManagerResult::err(valid.error());
    }

    Components parts;

    auto hashes = HashAlgorithmRegistry::create(config.authc.algorithms,
                                                config.authc.preferredAlgorithm);
    if (!hashes) {
        return ManagerResult::err(hashes.error());
    }
    parts.hashes = std::make_shared<const HashAlgorithmRegistry>(std::move(hashes).value());

    std::shared_ptr<ICacheBackend> backend;
    if (config.cache.backend) {
        auto resolved = components.resolve<ICacheBackend>(*config.cache.backend);
        if (!resolved) {
            return ManagerResult::err(resolved.error());
        }
        backend = std::move(resolved).value();
    }
    parts.cache = std::make_shared<CacheHandler>(std::move(backend), config.cache.ttl);

    for (const auto& realmConfig : config.realms) {
        auto store = components.resolve<IAccountStore>(realmConfig.accountStore);
        if (!store) {
            return ManagerResult::err(ErrorCode::ConfigurationError,
                                      "realm '" + realmConfig.name + "': " +
                                          std::string(store.error().message()));
        }
        if (!parts.totpSecretStore) {
            // TOTP secrets live beside the credentials of the first realm.
            parts.totpSecretStore = store.value();
        }
        parts.realms.push_back(std::make_shared<AccountStoreRealm>(
            realmConfig.name, std::move(store).value(), parts.hashes, parts.cache,
            config.storeRetry));
    }

    auto sessionStore = components.resolve<ISessionStore>(config.session.store);
    if (!sessionStore) {
        return ManagerResult::err(sessionStore.error());
    }
    parts.sessionStore = std::move(sessionStore).value();

    if (config.authc.totp) {
        auto channel = components.resolve<IMfaDeliveryChannel>(config.authc.totp->dispatcher);
        if (!channel) {
            return ManagerResult::err(channel.error());
        }
        parts.mfaChannel = std::move(channel).value();
    }

    return ManagerResult::ok(std::make_unique<SecurityManager>(
        Passkey{}, std::move(config), std::move(parts), std::move(clock)));
}

SecurityManager::SecurityManager(Passkey, SecurityConfig config, Components components,
                                 TimeSource clock)
    : config_(std::move(config)),
      clock_(std::move(clock)),
      hashes_(std::move(components.hashes)),
      cache_(std::move(components.cache)),
      chain_(std::move(components.realms)),
      lockout_(config_.authc.lockout, clock_),
      cookieSigner_(config_.signedCookieSecret) {
    cache_->subscribe(bus_);
    subscribeAudit();

    mfa_ = std::make_unique<MfaChallengeDispatcher>(config_.authc.totp,
                                                    std::move(components.totpSecretStore),
                                                    std::move(components.mfaChannel), clock_);
    sessions_ = std::make_unique<SessionManager>(config_.session,
                                                 std::move(components.sessionStore), cache_,
                                                 &bus_, clock_);
    if (config_.rememberMe) {
        rememberMe_.emplace(*config_.rememberMe, clock_);
    }
    pool_ = std::make_unique<foundation::WorkerPool>(config_.workerThreads);

    if (config_.session.validationSchedulerEnabled) {
        sessions_->startValidation();
    }

    LogContext ctx;
    ctx.extra["realms"] = std::to_string(chain_.realms().size());
    ctx.extra["preferred_algorithm"] = hashes_->preferredAlgorithm();
    ctx.extra["mfa"] = mfa_->active() ? "on" : "off";
    ctx.extra["cache"] = cache_->enabled() ? "on" : "off";
    WARDEN_LOG_CTX(LogLevel::Info, LogCategory::Core, "security manager ready", ctx);
}

SecurityManager::~SecurityManager() {
    pool_->shutdown();
    sessions_->stopValidation();
    for (auto id : auditSubscriptions_) {
        bus_.Unsubscribe(id);
    }
}

void SecurityManager::subscribeAudit() {
    auditSubscriptions_.push_back(bus_.Subscribe<AccountLocked>([](const AccountLocked& e) {
        LogContext ctx;
        ctx.principal = e.principal;
        ctx.extra["failed_count"] = std::to_string(e.failedCount);
        WARDEN_LOG_CTX(LogLevel::Warning, LogCategory::Audit, "account locked", ctx);
    }));
    auditSubscriptions_.push_back(
        bus_.Subscribe<AuthenticationFailed>([](const AuthenticationFailed& e) {
            LogContext ctx;
            ctx.principal = e.principal;
            ctx.extra["cause"] = std::string(causeName(e.cause));
            WARDEN_LOG_CTX(LogLevel::Info, LogCategory::Audit, "authentication failed", ctx);
        }));
}

// ---------------------------------------------------------------------------
// Authentication
// ---------------------------------------------------------------------------

SecurityError SecurityManager::rejectLogin(const Principal& principal,
                                           AuthenticationFailure failure,
                                           std::optional<FailureOutcome> counted) {
    if (counted && counted->newlyLocked) {
        bus_.Publish(AccountLocked{principal, counted->failedCount});
    }
    bus_.Publish(AuthenticationFailed{principal, failure.cause});
    return RealmChain::authenticationError(std::move(failure));
}

SecurityResult<void> SecurityManager::verifySecondFactor(const UsernamePasswordToken& token,
                                                         LockoutAttempt& attempt) {
    auto required = mfa_->requiresChallenge(token.username);
    if (!required) {
        AuthenticationFailure failure{required.code(), std::nullopt};
        return SecurityResult<void>::err(rejectLogin(token.username, std::move(failure)));
    }
    if (!required.value()) {
        return SecurityResult<void>::ok();
    }

    if (!token.totpCode) {
        // First step of a two-step login: deliver a code, ask for it back.
        auto challenge = mfa_->issueChallenge(token.username);
        AuthenticationFailure failure{ErrorCode::MfaRequired, std::nullopt};
        if (challenge) {
            failure.challenge = challenge.value();
        } else {
            failure.cause = challenge.code();
        }
        return SecurityResult<void>::err(rejectLogin(token.username, std::move(failure)));
    }

    auto checked = mfa_->checkCode(token.username, *token.totpCode);
    if (!checked) {
        AuthenticationFailure failure{checked.code(), std::nullopt};
        if (checked.code() == ErrorCode::StoreUnavailable) {
            return SecurityResult<void>::err(rejectLogin(token.username, std::move(failure)));
        }
        return SecurityResult<void>::err(
            rejectLogin(token.username, std::move(failure), attempt.fail()));
    }
    return SecurityResult<void>::ok();
}

SecurityResult<Principal> SecurityManager::verifyCredentials(const UsernamePasswordToken& token) {
    // Reserve before the slow check so concurrent guesses cannot all be
    // evaluated past the threshold.
    if (!lockout_.tryBeginAttempt(token.username)) {
        AuthenticationFailure failure{ErrorCode::AccountLocked, std::nullopt};
        return SecurityResult<Principal>::err(rejectLogin(token.username, std::move(failure)));
    }
    LockoutAttempt attempt(lockout_, token.username);

    auto authenticated = chain_.authenticate(token);
    if (!authenticated) {
        AuthenticationFailure failure;
        if (const auto* ctx = authenticated.error().context<AuthenticationFailure>()) {
            failure = *ctx;
        }
        if (failure.cause == ErrorCode::StoreUnavailable) {
            return SecurityResult<Principal>::err(rejectLogin(token.username, std::move(failure)));
        }
        return SecurityResult<Principal>::err(
            rejectLogin(token.username, std::move(failure), attempt.fail()));
    }

    auto secondFactor = verifySecondFactor(token, attempt);
    if (!secondFactor) {
        return SecurityResult<Principal>::err(secondFactor.error());
    }

    // Reset only once every factor passed, so second-factor guessing
    // keeps counting towards the threshold.
    if (!attempt.succeed()) {
        AuthenticationFailure failure{ErrorCode::AccountLocked, std::nullopt};
        return SecurityResult<Principal>::err(rejectLogin(token.username, std::move(failure)));
    }
    return authenticated;
}

SecurityResult<LoginResult> SecurityManager::openSession(const Principal& principal,
                                                         bool issueRememberMe) {
    bus_.Publish(AuthenticationSucceeded{principal});

    auto session = sessions_->create(principal);
    if (!session) {
        return SecurityResult<LoginResult>::err(session.error());
    }
    chain_.warmAuthorization(principal);

    LoginResult result;
    result.session = std::move(session).value();
    if (issueRememberMe && rememberMe_) {
        auto token = rememberMe_->issue(principal);
        if (token) {
            result.rememberMeToken = std::move(token).value();
        } else {
            WARDEN_LOG_WARN(LogCategory::Session,
                            "remember-me token not issued: " + std::string(token.error().message()));
        }
    }

    LogContext ctx;
    ctx.principal = principal;
    ctx.sessionId = result.session.sessionId;
    WARDEN_LOG_CTX(LogLevel::Info, LogCategory::Authc, "login succeeded", ctx);
    return SecurityResult<LoginResult>::ok(std::move(result));
}

SecurityResult<LoginResult> SecurityManager::login(const UsernamePasswordToken& token) {
    auto verified = pool_->invoke<Principal>(
        [this, token]() { return verifyCredentials(token); }, config_.operationTimeout,
        foundation::JobPriority::High);
    if (!verified) {
        if (verified.code() == ErrorCode::Timeout) {
            LogContext ctx;
            ctx.principal = token.username;
            WARDEN_LOG_CTX(LogLevel::Warning, LogCategory::Authc, "login timed out", ctx);
        }
        return SecurityResult<LoginResult>::err(verified.error());
    }
    return openSession(verified.value(), token.rememberMe);
}

SecurityResult<void> SecurityManager::logout(const std::string& sessionId) {
    return sessions_->invalidate(sessionId);
}

SecurityResult<std::string> SecurityManager::remember(const std::string& sessionId) {
    if (!rememberMe_) {
        return SecurityResult<std::string>::err(ErrorCode::ConfigurationError,
                                                "remember-me is not configured");
    }
    auto session = sessions_->touch(sessionId);
    if (!session) {
        return SecurityResult<std::string>::err(session.error());
    }
    return rememberMe_->issue(session.value().principal);
}

SecurityResult<std::optional<Session>> SecurityManager::loginViaRememberMeToken(
    std::string_view token) {
    using OptionalSession = SecurityResult<std::optional<Session>>;
    if (!rememberMe_) {
        return OptionalSession::ok(std::nullopt);
    }
    auto principal = rememberMe_->resolve(token);
    if (!principal) {
        return OptionalSession::ok(std::nullopt);
    }
    if (lockout_.isLocked(*principal)) {
        bus_.Publish(AuthenticationFailed{*principal, ErrorCode::AccountLocked});
        return OptionalSession::ok(std::nullopt);
    }

    auto opened = openSession(*principal, false);
    if (!opened) {
        return OptionalSession::err(opened.error());
    }
    return OptionalSession::ok(std::move(opened).value().session);
}

// ---------------------------------------------------------------------------
// Authorization
// ---------------------------------------------------------------------------

SecurityResult<bool> SecurityManager::isPermitted(const std::string& sessionId,
                                                  std::string_view permission) {
    auto session = sessions_->touch(sessionId);
    if (!session) {
        return SecurityResult<bool>::err(session.error());
    }
    return chain_.isPermitted(session.value().principal, permission);
}

SecurityResult<bool> SecurityManager::isPermittedAll(const std::string& sessionId,
                                                     const std::vector<std::string>& permissions) {
    auto session = sessions_->touch(sessionId);
    if (!session) {
        return SecurityResult<bool>::err(session.error());
    }
    return chain_.isPermittedAll(session.value().principal, permissions);
}

SecurityResult<bool> SecurityManager::hasRole(const std::string& sessionId,
                                              std::string_view role) {
    auto session = sessions_->touch(sessionId);
    if (!session) {
        return SecurityResult<bool>::err(session.error());
    }
    return chain_.hasRole(session.value().principal, role);
}

SecurityResult<bool> SecurityManager::hasAllRoles(const std::string& sessionId,
                                                  const std::vector<std::string>& roles) {
    auto session = sessions_->touch(sessionId);
    if (!session) {
        return SecurityResult<bool>::err(session.error());
    }
    return chain_.hasAllRoles(session.value().principal, roles);
}

SecurityResult<void> SecurityManager::checkPermission(const std::string& sessionId,
                                                      std::string_view permission) {
    auto session = sessions_->touch(sessionId);
    if (!session) {
        return SecurityResult<void>::err(session.error());
    }
    return chain_.checkPermission(session.value().principal, permission);
}

SecurityResult<void> SecurityManager::checkRole(const std::string& sessionId,
                                                std::string_view role) {
    auto session = sessions_->touch(sessionId);
    if (!session) {
        return SecurityResult<void>::err(session.error());
    }
    return chain_.checkRole(session.value().principal, role);
}

// ---------------------------------------------------------------------------
// Administration
// ---------------------------------------------------------------------------

SecurityResult<TotpEnrollment> SecurityManager::enrollTotp(const Principal& principal) {
    if (!mfa_->active()) {
        return SecurityResult<TotpEnrollment>::err(ErrorCode::ConfigurationError,
                                                   "mfa dispatcher is not configured");
    }
    return mfa_->enroll(principal);
}

bool SecurityManager::unlockAccount(const Principal& principal) {
    return lockout_.unlock(principal);
}

std::size_t SecurityManager::revokeSessions(const Principal& principal) {
    return sessions_->invalidateAllFor(principal);
}

void SecurityManager::notifyAccountChanged(const Principal& principal) {
    bus_.Publish(AccountChanged{principal});
}

// ---------------------------------------------------------------------------
// Cookies and validation
// ---------------------------------------------------------------------------

std::string SecurityManager::signSessionCookie(const std::string& sessionId) const {
    return cookieSigner_.sign(sessionId);
}

SecurityResult<Session> SecurityManager::resolveSessionCookie(std::string_view cookie) {
    auto sessionId = cookieSigner_.verify(cookie);
    if (!sessionId) {
        return SecurityResult<Session>::err(sessionId.error());
    }
    return sessions_->touch(sessionId.value());
}

void SecurityManager::startSessionValidation() {
    sessions_->startValidation();
}

void SecurityManager::stopSessionValidation() {
    sessions_->stopValidation();
}

} // namespace warden::security
