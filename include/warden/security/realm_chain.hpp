#pragma once

/// @file realm_chain.hpp
/// @brief Ordered realm chain: first-success authentication, any-realm
///        authorization.

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "warden/foundation/security_result.hpp"
#include "warden/security/realm.hpp"

namespace warden::security {

/// Internal reason attached (as SecurityError context) to the generic
/// AuthenticationFailed error. For audit logging only.
struct AuthenticationFailure {
    foundation::ErrorCode cause = foundation::ErrorCode::AuthenticationFailed;
    std::optional<ChallengeRef> challenge; ///< Set when a second factor was requested.
};

/// Authenticates against realms in configured order and authorizes when
/// any realm grants.
///
/// When every realm fails, the error is AuthenticationFailed with a fixed
/// message; the most specific cause (InvalidCredentials > StoreUnavailable
/// > UnknownAccount) travels as AuthenticationFailure context and no realm
/// name is revealed.
class RealmChain {
public:
    explicit RealmChain(std::vector<std::shared_ptr<Realm>> realms);

    foundation::SecurityResult<Principal> authenticate(const UsernamePasswordToken& token);

    /// Grants if any realm grants. Store errors only surface when no realm
    /// grants.
    foundation::SecurityResult<bool> isPermitted(const Principal& principal,
                                                 std::string_view permission);

    foundation::SecurityResult<bool> isPermittedAll(const Principal& principal,
                                                    const std::vector<std::string>& permissions);

    foundation::SecurityResult<bool> hasRole(const Principal& principal, std::string_view role);

    foundation::SecurityResult<bool> hasAllRoles(const Principal& principal,
                                                 const std::vector<std::string>& roles);

    /// PermissionDenied unless permitted.
    foundation::SecurityResult<void> checkPermission(const Principal& principal,
                                                     std::string_view permission);

    /// RoleDenied unless the role is held.
    foundation::SecurityResult<void> checkRole(const Principal& principal, std::string_view role);

    /// Load authorization info in every realm (cache warm-up).
    void warmAuthorization(const Principal& principal);

    [[nodiscard]] const std::vector<std::shared_ptr<Realm>>& realms() const noexcept {
        return realms_;
    }

    /// Generic caller-visible authentication error carrying @p failure.
    static foundation::SecurityError authenticationError(AuthenticationFailure failure);

private:
    template <typename Check>
    foundation::SecurityResult<bool> anyRealm(Check&& check);

    std::vector<std::shared_ptr<Realm>> realms_;
};

} // namespace warden::security
