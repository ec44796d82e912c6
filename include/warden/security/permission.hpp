#pragma once

/// @file permission.hpp
/// @brief Wildcard permissions (`domain:action:target`) and per-principal
///        authorization info indexed by domain.

#include <map>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "warden/foundation/security_result.hpp"
#include "warden/security/security_types.hpp"

namespace warden::security {

/// Permission in `domain:action:target` form.
///
/// Each part may be a comma list (`document:read,write`). A part equal to
/// `*`, or a missing trailing part, implies everything at that level.
/// Matching is case-insensitive.
///
/// Example:
/// @code
///   auto granted = WildcardPermission::parse("document:read,write:*");
///   auto wanted  = WildcardPermission::parse("document:read:report-7");
///   bool ok = granted.value().implies(wanted.value()); // true
/// @endcode
class WildcardPermission {
public:
    static constexpr std::string_view kWildcard = "*";

    /// @return InvalidPermission for empty strings or empty parts.
    static foundation::SecurityResult<WildcardPermission> parse(std::string_view text);

    /// True when holding this permission grants @p other.
    [[nodiscard]] bool implies(const WildcardPermission& other) const;

    /// Values of the first part, or {"*"}.
    [[nodiscard]] const std::set<std::string>& domain() const;

    [[nodiscard]] bool isWildcardDomain() const;

    [[nodiscard]] const std::string& text() const noexcept { return text_; }

private:
    explicit WildcardPermission(std::string text, std::vector<std::set<std::string>> parts);

    std::string text_;
    std::vector<std::set<std::string>> parts_;
};

/// Roles and parsed permissions of one principal from one realm.
///
/// Permissions are indexed by domain so a check only scans the permissions
/// of the requested domain plus the wildcard-domain ones.
class IndexedAuthorizationInfo {
public:
    IndexedAuthorizationInfo() = default;

    /// Parse @p record; unparsable permission strings are skipped and logged.
    explicit IndexedAuthorizationInfo(const AuthorizationRecord& record);

    [[nodiscard]] bool isPermitted(const WildcardPermission& permission) const;

    [[nodiscard]] bool hasRole(std::string_view role) const;

    [[nodiscard]] const std::set<std::string, std::less<>>& roles() const noexcept { return roles_; }

    [[nodiscard]] std::size_t permissionCount() const noexcept;

private:
    std::set<std::string, std::less<>> roles_;
    std::map<std::string, std::vector<WildcardPermission>> byDomain_;
};

} // namespace warden::security
