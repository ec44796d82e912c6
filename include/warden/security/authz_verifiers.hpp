#pragma once

/// @file authz_verifiers.hpp
/// @brief Permission and role verifiers used by realms.

#include <string_view>

#include "warden/security/permission.hpp"

namespace warden::security {

class IPermissionVerifier {
public:
    virtual ~IPermissionVerifier() = default;

    [[nodiscard]] virtual bool isPermitted(const IndexedAuthorizationInfo& info,
                                           const WildcardPermission& permission) const = 0;
};

class IRoleVerifier {
public:
    virtual ~IRoleVerifier() = default;

    [[nodiscard]] virtual bool hasRole(const IndexedAuthorizationInfo& info,
                                       std::string_view role) const = 0;
};

/// Wildcard-implication check against the domain index.
class IndexedPermissionVerifier : public IPermissionVerifier {
public:
    [[nodiscard]] bool isPermitted(const IndexedAuthorizationInfo& info,
                                   const WildcardPermission& permission) const override {
        return info.isPermitted(permission);
    }
};

/// Exact role-name membership.
class SimpleRoleVerifier : public IRoleVerifier {
public:
    [[nodiscard]] bool hasRole(const IndexedAuthorizationInfo& info,
                               std::string_view role) const override {
        return info.hasRole(role);
    }
};

} // namespace warden::security
