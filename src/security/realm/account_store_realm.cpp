/// @file account_store_realm.cpp
/// @brief AccountStoreRealm implementation.

#include "warden/security/realm.hpp"

#include "warden/foundation/security_logger.hpp"

namespace warden::security {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using foundation::SecurityResult;

AccountStoreRealm::AccountStoreRealm(std::string name,
                                     std::shared_ptr<IAccountStore> store,
                                     std::shared_ptr<const HashAlgorithmRegistry> registry,
                                     std::shared_ptr<CacheHandler> cache,
                                     StoreRetryConfig retry,
                                     std::shared_ptr<const IPermissionVerifier> permissionVerifier,
                                     std::shared_ptr<const IRoleVerifier> roleVerifier)
    : name_(std::move(name)),
      store_(std::move(store)),
      registry_(std::move(registry)),
      cache_(std::move(cache)),
      retry_(retry),
      permissionVerifier_(std::move(permissionVerifier)),
      roleVerifier_(std::move(roleVerifier)) {}

// ---------------------------------------------------------------------------
// Authentication
// ---------------------------------------------------------------------------

SecurityResult<Principal> AccountStoreRealm::authenticate(const UsernamePasswordToken& token) {
    const auto& principal = token.username;
    LogContext ctx;
    ctx.principal = principal;
    ctx.realm = name_;

    auto credential = cache_->getOrCompute<CredentialRecord>(
        CacheHandler::credentialKey(principal, name_), TtlClass::Credentials,
        [&] { return retryStoreCall(retry_, [&] { return store_->findCredential(principal); }); });

    if (!credential) {
        if (credential.code() == ErrorCode::RecordNotFound) {
            return SecurityResult<Principal>::err(ErrorCode::UnknownAccount, "unknown account");
        }
        WARDEN_LOG_CTX(LogLevel::Warning, LogCategory::Authc,
                       "credential lookup failed: " + std::string(credential.error().message()),
                       ctx);
        return SecurityResult<Principal>::err(ErrorCode::StoreUnavailable,
                                              "account store unavailable");
    }

    auto verified = registry_->verify(token.password, credential.value());
    if (!verified) {
        // Unknown algorithm ids and crypto failures count as a bad credential.
        WARDEN_LOG_CTX(LogLevel::Error, LogCategory::Authc,
                       "credential verification error: " +
                           std::string(verified.error().message()),
                       ctx);
        return SecurityResult<Principal>::err(ErrorCode::InvalidCredentials, "invalid credentials");
    }
    if (!verified.value()) {
        return SecurityResult<Principal>::err(ErrorCode::InvalidCredentials, "invalid credentials");
    }

    if (registry_->needsUpgrade(credential.value())) {
        upgradeCredential(credential.value(), token.password);
    }
    return SecurityResult<Principal>::ok(credential.value().principal);
}

void AccountStoreRealm::upgradeCredential(const CredentialRecord& current, std::string_view plain) {
    LogContext ctx;
    ctx.principal = current.principal;
    ctx.realm = name_;
    ctx.extra["from"] = current.algorithmId;
    ctx.extra["to"] = registry_->preferredAlgorithm();

    auto upgraded = registry_->hashPreferred(plain);
    if (!upgraded) {
        WARDEN_LOG_CTX(LogLevel::Error, LogCategory::Crypto, "credential re-hash failed", ctx);
        return;
    }
    auto record = std::move(upgraded).value();
    record.principal = current.principal;

    auto saved = retryStoreCall(retry_, [&] { return store_->updateCredential(record); });
    cache_->invalidate(CacheHandler::credentialKey(current.principal, name_));
    if (!saved) {
        WARDEN_LOG_CTX(LogLevel::Warning, LogCategory::Authc,
                       "credential upgrade not persisted: " + std::string(saved.error().message()),
                       ctx);
        return;
    }
    WARDEN_LOG_CTX(LogLevel::Info, LogCategory::Audit, "credential migrated", ctx);
}

// ---------------------------------------------------------------------------
// Authorization
// ---------------------------------------------------------------------------

SecurityResult<IndexedAuthorizationInfo> AccountStoreRealm::authorizationInfo(
    const Principal& principal) {
    auto record = cache_->getOrCompute<AuthorizationRecord>(
        CacheHandler::authzKey(principal, name_), TtlClass::AuthzInfo,
        [&] {
            return retryStoreCall(retry_, [&] { return store_->findRolesPermissions(principal); });
        });

    if (!record) {
        if (record.code() == ErrorCode::RecordNotFound) {
            return SecurityResult<IndexedAuthorizationInfo>::ok(IndexedAuthorizationInfo{});
        }
        return SecurityResult<IndexedAuthorizationInfo>::err(record.error());
    }
    return SecurityResult<IndexedAuthorizationInfo>::ok(IndexedAuthorizationInfo(record.value()));
}

SecurityResult<bool> AccountStoreRealm::isPermitted(const Principal& principal,
                                                    const WildcardPermission& permission) {
    auto info = authorizationInfo(principal);
    if (!info) {
        return SecurityResult<bool>::err(info.error());
    }
    return SecurityResult<bool>::ok(permissionVerifier_->isPermitted(info.value(), permission));
}

SecurityResult<bool> AccountStoreRealm::hasRole(const Principal& principal, std::string_view role) {
    auto info = authorizationInfo(principal);
    if (!info) {
        return SecurityResult<bool>::err(info.error());
    }
    return SecurityResult<bool>::ok(roleVerifier_->hasRole(info.value(), role));
}

} // namespace warden::security
