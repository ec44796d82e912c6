/// @file realm_chain.cpp
/// @brief RealmChain implementation.

#include "warden/security/realm_chain.hpp"

#include "warden/foundation/security_logger.hpp"

namespace warden::security {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::SecurityError;
using foundation::SecurityResult;

namespace {

constexpr const char* kGenericAuthcMessage = "authentication failed";

/// Higher is more specific.
int causeRank(ErrorCode cause) {
    switch (cause) {
        case ErrorCode::InvalidCredentials: return 3;
        case ErrorCode::StoreUnavailable:   return 2;
        case ErrorCode::UnknownAccount:     return 1;
        default:                            return 0;
    }
}

} // namespace

RealmChain::RealmChain(std::vector<std::shared_ptr<Realm>> realms)
    : realms_(std::move(realms)) {}

SecurityError RealmChain::authenticationError(AuthenticationFailure failure) {
    return SecurityError(ErrorCode::AuthenticationFailed, kGenericAuthcMessage, std::move(failure));
}

// ---------------------------------------------------------------------------
// Authentication
// ---------------------------------------------------------------------------

SecurityResult<Principal> RealmChain::authenticate(const UsernamePasswordToken& token) {
    auto cause = ErrorCode::UnknownAccount;
    for (const auto& realm : realms_) {
        auto result = realm->authenticate(token);
        if (result) {
            return result;
        }
        if (causeRank(result.code()) > causeRank(cause)) {
            cause = result.code();
        }
    }
    return SecurityResult<Principal>::err(authenticationError({cause, std::nullopt}));
}

// ---------------------------------------------------------------------------
// Authorization
// ---------------------------------------------------------------------------

template <typename Check>
SecurityResult<bool> RealmChain::anyRealm(Check&& check) {
    std::optional<SecurityError> firstError;
    for (const auto& realm : realms_) {
        auto granted = check(*realm);
        if (granted && granted.value()) {
            return SecurityResult<bool>::ok(true);
        }
        if (!granted && !firstError) {
            firstError = granted.error();
        }
    }
    if (firstError) {
        WARDEN_LOG_WARN(LogCategory::Authz,
                        "authorization incomplete: " + std::string(firstError->message()));
        return SecurityResult<bool>::err(*firstError);
    }
    return SecurityResult<bool>::ok(false);
}

SecurityResult<bool> RealmChain::isPermitted(const Principal& principal,
                                             std::string_view permission) {
    auto parsed = WildcardPermission::parse(permission);
    if (!parsed) {
        return SecurityResult<bool>::err(parsed.error());
    }
    return anyRealm([&](Realm& realm) { return realm.isPermitted(principal, parsed.value()); });
}

SecurityResult<bool> RealmChain::isPermittedAll(const Principal& principal,
                                                const std::vector<std::string>& permissions) {
    for (const auto& permission : permissions) {
        auto granted = isPermitted(principal, permission);
        if (!granted || !granted.value()) {
            return granted;
        }
    }
    return SecurityResult<bool>::ok(true);
}

SecurityResult<bool> RealmChain::hasRole(const Principal& principal, std::string_view role) {
    return anyRealm([&](Realm& realm) { return realm.hasRole(principal, role); });
}

SecurityResult<bool> RealmChain::hasAllRoles(const Principal& principal,
                                             const std::vector<std::string>& roles) {
    for (const auto& role : roles) {
        auto granted = hasRole(principal, role);
        if (!granted || !granted.value()) {
            return granted;
        }
    }
    return SecurityResult<bool>::ok(true);
}

SecurityResult<void> RealmChain::checkPermission(const Principal& principal,
                                                 std::string_view permission) {
    auto granted = isPermitted(principal, permission);
    if (!granted) {
        return SecurityResult<void>::err(granted.error());
    }
    if (!granted.value()) {
        return SecurityResult<void>::err(ErrorCode::PermissionDenied,
                                         "permission denied: " + std::string(permission));
    }
    return SecurityResult<void>::ok();
}

SecurityResult<void> RealmChain::checkRole(const Principal& principal, std::string_view role) {
    auto granted = hasRole(principal, role);
    if (!granted) {
        return SecurityResult<void>::err(granted.error());
    }
    if (!granted.value()) {
        return SecurityResult<void>::err(ErrorCode::RoleDenied,
                                         "role required: " + std::string(role));
    }
    return SecurityResult<void>::ok();
}

void RealmChain::warmAuthorization(const Principal& principal) {
    for (const auto& realm : realms_) {
        auto info = realm->authorizationInfo(principal);
        if (!info) {
            WARDEN_LOG_WARN(LogCategory::Cache, "authorization warm-up skipped for realm " +
                                                    realm->name() + ": " +
                                                    std::string(info.error().message()));
        }
    }
}

} // namespace warden::security
