/// @file account_store.cpp
/// @brief InMemoryAccountStore implementation.

#include "warden/security/account_store.hpp"

namespace warden::security {

using foundation::ErrorCode;
using foundation::SecurityResult;

SecurityResult<void> InMemoryAccountStore::checkAvailable() const {
    if (!available_.load(std::memory_order_acquire)) {
        return SecurityResult<void>::err(ErrorCode::StoreUnavailable, "account store unavailable");
    }
    return SecurityResult<void>::ok();
}

SecurityResult<CredentialRecord> InMemoryAccountStore::findCredential(
    const Principal& principal) const {
    credentialLookups_.fetch_add(1, std::memory_order_relaxed);
    auto available = checkAvailable();
    if (!available) {
        return SecurityResult<CredentialRecord>::err(available.error());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = accounts_.find(principal);
    if (it == accounts_.end()) {
        return SecurityResult<CredentialRecord>::err(ErrorCode::RecordNotFound,
                                                     "no credential for principal");
    }
    return SecurityResult<CredentialRecord>::ok(it->second.credential);
}

SecurityResult<AuthorizationRecord> InMemoryAccountStore::findRolesPermissions(
    const Principal& principal) const {
    authorizationLookups_.fetch_add(1, std::memory_order_relaxed);
    auto available = checkAvailable();
    if (!available) {
        return SecurityResult<AuthorizationRecord>::err(available.error());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = accounts_.find(principal);
    if (it == accounts_.end()) {
        return SecurityResult<AuthorizationRecord>::err(ErrorCode::RecordNotFound,
                                                        "no authorization info for principal");
    }
    return SecurityResult<AuthorizationRecord>::ok(it->second.authz);
}

SecurityResult<void> InMemoryAccountStore::updateCredential(const CredentialRecord& record) {
    auto available = checkAvailable();
    if (!available) {
        return available;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = accounts_.find(record.principal);
    if (it == accounts_.end()) {
        return SecurityResult<void>::err(ErrorCode::RecordNotFound, "no such account");
    }
    it->second.credential = record;
    return SecurityResult<void>::ok();
}

SecurityResult<std::optional<TotpSecret>> InMemoryAccountStore::findTotpSecret(
    const Principal& principal) const {
    auto available = checkAvailable();
    if (!available) {
        return SecurityResult<std::optional<TotpSecret>>::err(available.error());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = accounts_.find(principal);
    if (it == accounts_.end()) {
        return SecurityResult<std::optional<TotpSecret>>::err(ErrorCode::RecordNotFound,
                                                              "no such account");
    }
    return SecurityResult<std::optional<TotpSecret>>::ok(it->second.totp);
}

SecurityResult<void> InMemoryAccountStore::saveTotpSecret(const TotpSecret& secret) {
    auto available = checkAvailable();
    if (!available) {
        return available;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = accounts_.find(secret.principal);
    if (it == accounts_.end()) {
        return SecurityResult<void>::err(ErrorCode::RecordNotFound, "no such account");
    }
    it->second.totp = secret;
    return SecurityResult<void>::ok();
}

void InMemoryAccountStore::addAccount(CredentialRecord credential, AuthorizationRecord authz) {
    std::lock_guard<std::mutex> lock(mutex_);
    authz.principal = credential.principal;
    auto principal = credential.principal;
    accounts_[principal] = Account{std::move(credential), std::move(authz), std::nullopt};
}

void InMemoryAccountStore::setRolesPermissions(AuthorizationRecord authz) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = accounts_.find(authz.principal);
    if (it != accounts_.end()) {
        it->second.authz = std::move(authz);
    }
}

void InMemoryAccountStore::setAvailable(bool available) noexcept {
    available_.store(available, std::memory_order_release);
}

uint64_t InMemoryAccountStore::credentialLookups() const noexcept {
    return credentialLookups_.load(std::memory_order_relaxed);
}

uint64_t InMemoryAccountStore::authorizationLookups() const noexcept {
    return authorizationLookups_.load(std::memory_order_relaxed);
}

} // namespace warden::security
