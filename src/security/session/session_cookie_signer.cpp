/// @file session_cookie_signer.cpp
/// @brief SessionCookieSigner implementation.

#include "warden/security/session_cookie_signer.hpp"

#include "warden/foundation/security_logger.hpp"

#include "../crypto/crypto_utils.hpp"

namespace warden::security {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::SecurityResult;

SessionCookieSigner::SessionCookieSigner(std::string secret)
    : secret_(std::move(secret)) {}

std::string SessionCookieSigner::sign(std::string_view sessionId) const {
    auto mac = detail::hmacSha256(secret_, sessionId);
    std::string cookie(sessionId);
    cookie += '.';
    cookie += detail::base64UrlEncode(mac);
    return cookie;
}

SecurityResult<std::string> SessionCookieSigner::verify(std::string_view cookie) const {
    auto dot = cookie.rfind('.');
    if (dot == std::string_view::npos || dot == 0 || dot + 1 == cookie.size()) {
        return SecurityResult<std::string>::err(ErrorCode::InvalidSessionCookie,
                                                "malformed session cookie");
    }

    auto sessionId = cookie.substr(0, dot);
    auto expected = detail::base64UrlEncode(detail::hmacSha256(secret_, sessionId));
    if (!detail::constantTimeEqual(expected, cookie.substr(dot + 1))) {
        WARDEN_LOG_WARN(LogCategory::Session, "session cookie signature mismatch");
        return SecurityResult<std::string>::err(ErrorCode::InvalidSessionCookie,
                                                "invalid session cookie");
    }
    return SecurityResult<std::string>::ok(std::string(sessionId));
}

} // namespace warden::security
