/// @file totp.cpp
/// @brief RFC 6238 time-based one-time codes.

#include "warden/security/totp.hpp"

#include "../crypto/crypto_utils.hpp"

#include <array>

namespace warden::security::totp {

uint64_t timeStep(TimePoint at, uint32_t period) {
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(at.time_since_epoch()).count();
    if (seconds < 0 || period == 0) {
        return 0;
    }
    return static_cast<uint64_t>(seconds) / period;
}

std::string generateCode(const std::vector<uint8_t>& secret, uint64_t step, uint32_t digits) {
    std::array<uint8_t, 8> counter{};
    for (int i = 7; i >= 0; --i) {
        counter[static_cast<std::size_t>(i)] = static_cast<uint8_t>(step & 0xFF);
        step >>= 8;
    }

    auto mac = detail::hmacSha1(secret, counter.data(), counter.size());
    if (mac.size() < 20) {
        return {};
    }

    const auto offset = static_cast<std::size_t>(mac.back() & 0x0F);
    const uint32_t binary = (static_cast<uint32_t>(mac[offset] & 0x7F) << 24) |
                            (static_cast<uint32_t>(mac[offset + 1]) << 16) |
                            (static_cast<uint32_t>(mac[offset + 2]) << 8) |
                            static_cast<uint32_t>(mac[offset + 3]);

    uint32_t modulus = 1;
    for (uint32_t i = 0; i < digits; ++i) {
        modulus *= 10;
    }

    auto code = std::to_string(binary % modulus);
    if (code.size() < digits) {
        code.insert(0, digits - code.size(), '0');
    }
    return code;
}

} // namespace warden::security::totp
