#pragma once

/// @file session_cookie_signer.hpp
/// @brief HMAC-SHA256 signing of session cookies.

#include <string>
#include <string_view>

#include "warden/foundation/security_result.hpp"

namespace warden::security {

/// Signs session ids as `<id>.<base64url(HMAC-SHA256(secret, id))>`.
///
/// Example:
/// @code
///   SessionCookieSigner signer(config.signedCookieSecret);
///   auto cookie = signer.sign(session.sessionId);
///   auto id = signer.verify(cookie);  // InvalidSessionCookie on tampering
/// @endcode
class SessionCookieSigner {
public:
    explicit SessionCookieSigner(std::string secret);

    [[nodiscard]] std::string sign(std::string_view sessionId) const;

    /// @return The session id, or InvalidSessionCookie.
    [[nodiscard]] foundation::SecurityResult<std::string> verify(std::string_view cookie) const;

private:
    std::string secret_;
};

} // namespace warden::security
