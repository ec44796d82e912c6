#pragma once

/// @file realm.hpp
/// @brief Realms bind one account store to authentication and
///        authorization verifiers.

#include <memory>
#include <string>
#include <string_view>
#include <thread>

#include "warden/foundation/security_result.hpp"
#include "warden/security/account_store.hpp"
#include "warden/security/authz_verifiers.hpp"
#include "warden/security/cache_handler.hpp"
#include "warden/security/hash_algorithm_registry.hpp"
#include "warden/security/permission.hpp"
#include "warden/security/security_config.hpp"
#include "warden/security/security_types.hpp"

namespace warden::security {

/// Source of identities and grants.
///
/// authenticate() reports its internal cause as the error code:
/// InvalidCredentials, StoreUnavailable or UnknownAccount. RealmChain folds
/// these into one generic AuthenticationFailed before anything reaches a
/// caller.
class Realm {
public:
    virtual ~Realm() = default;

    [[nodiscard]] virtual const std::string& name() const noexcept = 0;

    virtual foundation::SecurityResult<Principal> authenticate(
        const UsernamePasswordToken& token) = 0;

    virtual foundation::SecurityResult<bool> isPermitted(const Principal& principal,
                                                         const WildcardPermission& permission) = 0;

    virtual foundation::SecurityResult<bool> hasRole(const Principal& principal,
                                                     std::string_view role) = 0;

    /// Roles and permissions, fetched through the cache. Unknown principals
    /// yield empty info.
    virtual foundation::SecurityResult<IndexedAuthorizationInfo> authorizationInfo(
        const Principal& principal) = 0;
};

/// Password-verifying realm backed by an IAccountStore.
///
/// Credential and authorization lookups go through the CacheHandler and
/// retry StoreUnavailable with exponential backoff. A successful login
/// whose stored hash needsUpgrade() is re-hashed under the preferred
/// algorithm and written back.
class AccountStoreRealm : public Realm {
public:
    AccountStoreRealm(std::string name,
                      std::shared_ptr<IAccountStore> store,
                      std::shared_ptr<const HashAlgorithmRegistry> registry,
                      std::shared_ptr<CacheHandler> cache,
                      StoreRetryConfig retry = {},
                      std::shared_ptr<const IPermissionVerifier> permissionVerifier =
                          std::make_shared<IndexedPermissionVerifier>(),
                      std::shared_ptr<const IRoleVerifier> roleVerifier =
                          std::make_shared<SimpleRoleVerifier>());

    [[nodiscard]] const std::string& name() const noexcept override { return name_; }

    foundation::SecurityResult<Principal> authenticate(const UsernamePasswordToken& token) override;

    foundation::SecurityResult<bool> isPermitted(const Principal& principal,
                                                 const WildcardPermission& permission) override;

    foundation::SecurityResult<bool> hasRole(const Principal& principal,
                                             std::string_view role) override;

    foundation::SecurityResult<IndexedAuthorizationInfo> authorizationInfo(
        const Principal& principal) override;

    [[nodiscard]] const std::shared_ptr<IAccountStore>& store() const noexcept { return store_; }

private:
    /// Re-hash @p plain under the preferred algorithm and persist it.
    /// Failures are logged; the login that triggered it still succeeds.
    void upgradeCredential(const CredentialRecord& current, std::string_view plain);

    std::string name_;
    std::shared_ptr<IAccountStore> store_;
    std::shared_ptr<const HashAlgorithmRegistry> registry_;
    std::shared_ptr<CacheHandler> cache_;
    StoreRetryConfig retry_;
    std::shared_ptr<const IPermissionVerifier> permissionVerifier_;
    std::shared_ptr<const IRoleVerifier> roleVerifier_;
};

/// Run @p op, retrying StoreUnavailable up to retry.maxAttempts times with
/// doubling backoff. Other errors return immediately.
template <typename Op>
auto retryStoreCall(const StoreRetryConfig& retry, Op&& op) -> decltype(op()) {
    auto backoff = retry.initialBackoff;
    const uint32_t attempts = retry.maxAttempts == 0 ? 1u : retry.maxAttempts;
    for (uint32_t attempt = 1;; ++attempt) {
        auto result = op();
        if (result || result.code() != foundation::ErrorCode::StoreUnavailable ||
            attempt >= attempts) {
            return result;
        }
        std::this_thread::sleep_for(backoff);
        backoff *= 2;
    }
}

} // namespace warden::security
