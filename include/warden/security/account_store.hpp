#pragma once

/// @file account_store.hpp
/// @brief Account store interface and in-memory implementation.
///
/// Abstracts credential, role/permission and TOTP-secret storage so realms
/// work with any backend (SQL, LDAP, in-memory).

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <unordered_map>

#include "warden/foundation/security_result.hpp"
#include "warden/security/security_types.hpp"

namespace warden::security {

/// Abstract account store.
///
/// Failures are reported as StoreUnavailable (transient, retried by the
/// realm) or RecordNotFound (terminal). Implementations must be thread-safe.
class IAccountStore {
public:
    virtual ~IAccountStore() = default;

    [[nodiscard]] virtual foundation::SecurityResult<CredentialRecord> findCredential(
        const Principal& principal) const = 0;

    [[nodiscard]] virtual foundation::SecurityResult<AuthorizationRecord> findRolesPermissions(
        const Principal& principal) const = 0;

    /// Replace the stored credential of record.principal.
    virtual foundation::SecurityResult<void> updateCredential(const CredentialRecord& record) = 0;

    /// Current TOTP secret, or nullopt when the account has no second factor.
    [[nodiscard]] virtual foundation::SecurityResult<std::optional<TotpSecret>> findTotpSecret(
        const Principal& principal) const = 0;

    /// Store @p secret as the principal's single current secret.
    virtual foundation::SecurityResult<void> saveTotpSecret(const TotpSecret& secret) = 0;
};

/// Thread-safe in-memory account store for tests and development.
///
/// setAvailable(false) simulates an outage: every call then fails with
/// StoreUnavailable.
class InMemoryAccountStore : public IAccountStore {
public:
    [[nodiscard]] foundation::SecurityResult<CredentialRecord> findCredential(
        const Principal& principal) const override;

    [[nodiscard]] foundation::SecurityResult<AuthorizationRecord> findRolesPermissions(
        const Principal& principal) const override;

    foundation::SecurityResult<void> updateCredential(const CredentialRecord& record) override;

    [[nodiscard]] foundation::SecurityResult<std::optional<TotpSecret>> findTotpSecret(
        const Principal& principal) const override;

    foundation::SecurityResult<void> saveTotpSecret(const TotpSecret& secret) override;

    /// Create or replace an account.
    void addAccount(CredentialRecord credential, AuthorizationRecord authz = {});

    void setRolesPermissions(AuthorizationRecord authz);

    void setAvailable(bool available) noexcept;

    /// Number of findCredential() calls served, outages included.
    [[nodiscard]] uint64_t credentialLookups() const noexcept;

    /// Number of findRolesPermissions() calls served, outages included.
    [[nodiscard]] uint64_t authorizationLookups() const noexcept;

private:
    struct Account {
        CredentialRecord credential;
        AuthorizationRecord authz;
        std::optional<TotpSecret> totp;
    };

    foundation::SecurityResult<void> checkAvailable() const;

    mutable std::mutex mutex_;
    std::unordered_map<Principal, Account> accounts_;
    std::atomic<bool> available_{true};
    mutable std::atomic<uint64_t> credentialLookups_{0};
    mutable std::atomic<uint64_t> authorizationLookups_{0};
};

} // namespace warden::security
