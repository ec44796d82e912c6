#pragma once

/// @file security_manager.hpp
/// @brief SecurityManager facade composing realms, lockout, MFA, cache and
///        sessions.

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "warden/foundation/component_registry.hpp"
#include "warden/foundation/event_bus.hpp"
#include "warden/foundation/security_result.hpp"
#include "warden/foundation/worker_pool.hpp"
#include "warden/security/account_lockout_tracker.hpp"
#include "warden/security/cache_handler.hpp"
#include "warden/security/hash_algorithm_registry.hpp"
#include "warden/security/mfa_challenge_dispatcher.hpp"
#include "warden/security/realm_chain.hpp"
#include "warden/security/remember_me_manager.hpp"
#include "warden/security/security_config.hpp"
#include "warden/security/session_cookie_signer.hpp"
#include "warden/security/session_manager.hpp"

namespace warden::security {

/// Register the in-memory account store, cache backend, session store and
/// MFA delivery channel under the name "memory", unless a component of that
/// type is already registered there.
void registerInMemoryComponents(foundation::ComponentRegistry& components);

/// Entry point for login, logout, authorization and remember-me.
///
/// One instance is shared by all request threads. Credential verification
/// (lockout check, realm authentication, failure accounting, second factor)
/// runs on an internal WorkerPool and is bounded by
/// `security_manager.operation_timeout_ms`; a caller that times out gets
/// ErrorCode::Timeout while lockout counters already updated by the job
/// stay updated.
///
/// Every authentication failure reaches the caller as the same
/// AuthenticationFailed error. The internal cause (bad password, unknown
/// account, locked account, missing or wrong second factor) is written to
/// the Audit log and carried as AuthenticationFailure context.
///
/// Example:
/// @code
///   foundation::ComponentRegistry components;
///   registerInMemoryComponents(components);
///   auto manager = SecurityManager::create(config, components);
///
///   auto login = manager.value()->login({"alice", "s3cret"});
///   if (!login) { /* generic "authentication failed" */ }
///   auto id = login.value().session.sessionId;
///   bool canRead = manager.value()->isPermitted(id, "docs:read").valueOr(false);
/// @endcode
class SecurityManager {
public:
    /// Resolve the configured components from @p components and wire them.
    /// @return ConfigurationError when a named component is missing or the
    ///         hash algorithm configuration is invalid.
    static foundation::SecurityResult<std::unique_ptr<SecurityManager>> create(
        SecurityConfig config, const foundation::ComponentRegistry& components,
        TimeSource clock = systemTimeSource());

private:
    struct Components;
    struct Passkey {
        explicit Passkey() = default;
    };

public:
    /// Use create().
    SecurityManager(Passkey, SecurityConfig config, Components components, TimeSource clock);
    ~SecurityManager();

    SecurityManager(const SecurityManager&) = delete;
    SecurityManager& operator=(const SecurityManager&) = delete;

    // -- Authentication -------------------------------------------------------

    /// Authenticate @p token and open a session. A remember-me token is
    /// issued when requested and remember-me is configured.
    foundation::SecurityResult<LoginResult> login(const UsernamePasswordToken& token);

    /// @return SessionNotFound when the session is unknown.
    foundation::SecurityResult<void> logout(const std::string& sessionId);

    /// Issue a remember-me token for the principal of a live session.
    foundation::SecurityResult<std::string> remember(const std::string& sessionId);

    /// Open a session from a remember-me token. Invalid, expired or foreign
    /// tokens and locked accounts yield nullopt, never an error.
    foundation::SecurityResult<std::optional<Session>> loginViaRememberMeToken(
        std::string_view token);

    // -- Authorization (each call touches the session) --------------------------

    foundation::SecurityResult<bool> isPermitted(const std::string& sessionId,
                                                 std::string_view permission);

    foundation::SecurityResult<bool> isPermittedAll(const std::string& sessionId,
                                                    const std::vector<std::string>& permissions);

    foundation::SecurityResult<bool> hasRole(const std::string& sessionId, std::string_view role);

    foundation::SecurityResult<bool> hasAllRoles(const std::string& sessionId,
                                                 const std::vector<std::string>& roles);

    /// PermissionDenied unless permitted.
    foundation::SecurityResult<void> checkPermission(const std::string& sessionId,
                                                     std::string_view permission);

    /// RoleDenied unless the role is held.
    foundation::SecurityResult<void> checkRole(const std::string& sessionId,
                                               std::string_view role);

    // -- Administration ---------------------------------------------------------

    foundation::SecurityResult<TotpEnrollment> enrollTotp(const Principal& principal);

    /// @return true when the principal had lockout state.
    bool unlockAccount(const Principal& principal);

    /// Invalidate every session of @p principal. @return Number removed.
    std::size_t revokeSessions(const Principal& principal);

    /// Announce that credentials, roles or permissions of @p principal
    /// changed in a store; cached copies are dropped.
    void notifyAccountChanged(const Principal& principal);

    // -- Cookies ----------------------------------------------------------------

    [[nodiscard]] std::string signSessionCookie(const std::string& sessionId) const;

    /// Verify a signed cookie and touch its session.
    foundation::SecurityResult<Session> resolveSessionCookie(std::string_view cookie);

    // -- Session validation -----------------------------------------------------

    void startSessionValidation();
    void stopSessionValidation();

    // -- Accessors --------------------------------------------------------------

    [[nodiscard]] const SecurityConfig& config() const noexcept { return config_; }
    [[nodiscard]] foundation::EventBus& events() noexcept { return bus_; }
    [[nodiscard]] SessionManager& sessions() noexcept { return *sessions_; }
    [[nodiscard]] const AccountLockoutTracker& lockout() const noexcept { return lockout_; }
    [[nodiscard]] CacheHandler& cache() noexcept { return *cache_; }

private:
    struct Components {
        std::shared_ptr<const HashAlgorithmRegistry> hashes;
        std::shared_ptr<CacheHandler> cache;
        std::vector<std::shared_ptr<Realm>> realms;
        std::shared_ptr<ISessionStore> sessionStore;
        std::shared_ptr<IAccountStore> totpSecretStore;
        std::shared_ptr<IMfaDeliveryChannel> mfaChannel;
    };

    /// Lockout reservation, realm chain, failure accounting and second
    /// factor. Runs on the worker pool.
    foundation::SecurityResult<Principal> verifyCredentials(const UsernamePasswordToken& token);

    /// Second-factor step for an authenticated principal. Wrong codes are
    /// counted against @p attempt.
    foundation::SecurityResult<void> verifySecondFactor(const UsernamePasswordToken& token,
                                                        LockoutAttempt& attempt);

    /// Publish events and build the generic error. @p counted is the
    /// lockout outcome when the attempt was counted as a failure.
    foundation::SecurityError rejectLogin(const Principal& principal,
                                          AuthenticationFailure failure,
                                          std::optional<FailureOutcome> counted = std::nullopt);

    /// Session, authz warm-up and remember-me after a successful check.
    foundation::SecurityResult<LoginResult> openSession(const Principal& principal,
                                                        bool issueRememberMe);

    void subscribeAudit();

    SecurityConfig config_;
    TimeSource clock_;
    foundation::EventBus bus_;

    std::shared_ptr<const HashAlgorithmRegistry> hashes_;
    std::shared_ptr<CacheHandler> cache_;
    RealmChain chain_;
    AccountLockoutTracker lockout_;
    std::unique_ptr<MfaChallengeDispatcher> mfa_;
    std::unique_ptr<SessionManager> sessions_;
    std::optional<RememberMeManager> rememberMe_;
    SessionCookieSigner cookieSigner_;
    std::vector<foundation::SubscriptionId> auditSubscriptions_;

    // Declared last: destroyed first, so no job outlives the members it uses.
    std::unique_ptr<foundation::WorkerPool> pool_;
};

} // namespace warden::security
