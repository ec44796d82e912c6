#pragma once

/// @file remember_me_manager.hpp
/// @brief Encrypted remember-me tokens.

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "warden/foundation/security_result.hpp"
#include "warden/security/security_config.hpp"
#include "warden/security/security_types.hpp"

namespace warden::security {

/// Issues and resolves remember-me tokens.
///
/// A token is `base64url(keyId) "." base64url(AES-256-GCM(payload))` where
/// the key is SHA-256 of the configured cipher key, the key id is bound as
/// associated data and the payload holds the issue time and the principal.
/// Tokens older than maxAge, sealed under another key id or tampered with
/// resolve to nothing.
class RememberMeManager {
public:
    explicit RememberMeManager(RememberMeConfig config, TimeSource clock = systemTimeSource());

    foundation::SecurityResult<std::string> issue(const Principal& principal) const;

    [[nodiscard]] std::optional<Principal> resolve(std::string_view token) const;

    [[nodiscard]] const std::string& keyId() const noexcept { return config_.keyId; }

private:
    RememberMeConfig config_;
    std::array<uint8_t, 32> key_;
    TimeSource clock_;
};

} // namespace warden::security
