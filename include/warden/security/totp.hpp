#pragma once

/// @file totp.hpp
/// @brief RFC 6238 time-based one-time codes (HMAC-SHA1).

#include <cstdint>
#include <string>
#include <vector>

#include "warden/security/security_types.hpp"

namespace warden::security::totp {

/// Time step containing @p at for a @p period second window.
[[nodiscard]] uint64_t timeStep(TimePoint at, uint32_t period);

/// Zero-padded @p digits code for @p step (RFC 4226 dynamic truncation).
/// Empty on HMAC failure.
[[nodiscard]] std::string generateCode(const std::vector<uint8_t>& secret, uint64_t step,
                                       uint32_t digits);

} // namespace warden::security::totp
