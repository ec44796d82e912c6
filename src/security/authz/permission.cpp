/// @file permission.cpp
/// @brief WildcardPermission parsing and IndexedAuthorizationInfo.

#include "warden/security/permission.hpp"

#include "warden/foundation/security_logger.hpp"

#include <algorithm>
#include <cctype>

namespace warden::security {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::SecurityResult;

namespace {

std::string lower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string trim(std::string_view text) {
    auto begin = text.find_first_not_of(" \t");
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(" \t");
    return std::string(text.substr(begin, end - begin + 1));
}

bool hasWildcard(const std::set<std::string>& part) {
    return part.count(std::string(WildcardPermission::kWildcard)) > 0;
}

const std::set<std::string>& wildcardPart() {
    static const std::set<std::string> part{std::string(WildcardPermission::kWildcard)};
    return part;
}

} // namespace

// ---------------------------------------------------------------------------
// WildcardPermission
// ---------------------------------------------------------------------------

WildcardPermission::WildcardPermission(std::string text, std::vector<std::set<std::string>> parts)
    : text_(std::move(text)), parts_(std::move(parts)) {}

SecurityResult<WildcardPermission> WildcardPermission::parse(std::string_view text) {
    auto normalized = lower(trim(text));
    if (normalized.empty()) {
        return SecurityResult<WildcardPermission>::err(ErrorCode::InvalidPermission,
                                                       "empty permission");
    }

    std::vector<std::set<std::string>> parts;
    std::size_t start = 0;
    while (true) {
        auto colon = normalized.find(':', start);
        auto piece = std::string_view(normalized).substr(start, colon - start);

        std::set<std::string> values;
        std::size_t valueStart = 0;
        while (true) {
            auto comma = piece.find(',', valueStart);
            auto value = trim(piece.substr(valueStart, comma - valueStart));
            if (value.empty()) {
                return SecurityResult<WildcardPermission>::err(
                    ErrorCode::InvalidPermission,
                    "empty part in permission '" + std::string(text) + "'");
            }
            values.insert(std::move(value));
            if (comma == std::string_view::npos) {
                break;
            }
            valueStart = comma + 1;
        }
        parts.push_back(std::move(values));

        if (colon == std::string::npos) {
            break;
        }
        start = colon + 1;
    }
    return SecurityResult<WildcardPermission>::ok(
        WildcardPermission(std::move(normalized), std::move(parts)));
}

bool WildcardPermission::implies(const WildcardPermission& other) const {
    for (std::size_t i = 0; i < other.parts_.size(); ++i) {
        if (i >= parts_.size()) {
            return true; // missing trailing part implies everything below
        }
        const auto& mine = parts_[i];
        if (hasWildcard(mine)) {
            continue;
        }
        const auto& theirs = other.parts_[i];
        if (!std::includes(mine.begin(), mine.end(), theirs.begin(), theirs.end())) {
            return false;
        }
    }
    // Any extra parts of ours must be wildcards to imply a shorter permission.
    for (std::size_t i = other.parts_.size(); i < parts_.size(); ++i) {
        if (!hasWildcard(parts_[i])) {
            return false;
        }
    }
    return true;
}

const std::set<std::string>& WildcardPermission::domain() const {
    return parts_.empty() ? wildcardPart() : parts_.front();
}

bool WildcardPermission::isWildcardDomain() const {
    return hasWildcard(domain());
}

// ---------------------------------------------------------------------------
// IndexedAuthorizationInfo
// ---------------------------------------------------------------------------

IndexedAuthorizationInfo::IndexedAuthorizationInfo(const AuthorizationRecord& record)
    : roles_(record.roles.begin(), record.roles.end()) {
    for (const auto& text : record.permissions) {
        auto permission = WildcardPermission::parse(text);
        if (!permission) {
            WARDEN_LOG_WARN(LogCategory::Authz, "skipping invalid permission '" + text + "'");
            continue;
        }
        for (const auto& domain : permission.value().domain()) {
            byDomain_[domain].push_back(permission.value());
        }
    }
}

bool IndexedAuthorizationInfo::isPermitted(const WildcardPermission& permission) const {
    auto anyImplies = [&](const std::string& domain) {
        auto it = byDomain_.find(domain);
        if (it == byDomain_.end()) {
            return false;
        }
        return std::any_of(it->second.begin(), it->second.end(),
                           [&](const WildcardPermission& held) { return held.implies(permission); });
    };

    if (anyImplies(std::string(WildcardPermission::kWildcard))) {
        return true;
    }
    if (permission.isWildcardDomain()) {
        // Only a wildcard-domain grant can imply a wildcard-domain request.
        return false;
    }
    // A held permission must cover every requested domain, so checking the
    // index of any one requested domain suffices.
    return anyImplies(*permission.domain().begin());
}

bool IndexedAuthorizationInfo::hasRole(std::string_view role) const {
    return roles_.find(role) != roles_.end();
}

std::size_t IndexedAuthorizationInfo::permissionCount() const noexcept {
    std::size_t count = 0;
    for (const auto& [_, permissions] : byDomain_) {
        count += permissions.size();
    }
    return count;
}

} // namespace warden::security
