/// @file remember_me_manager.cpp
/// @brief RememberMeManager implementation.

#include "warden/security/remember_me_manager.hpp"

#include "warden/foundation/security_logger.hpp"

#include "../crypto/crypto_utils.hpp"

namespace warden::security {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::SecurityResult;

namespace {

constexpr std::size_t kIssuedAtSize = 8;

int64_t toEpochSeconds(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

} // namespace

RememberMeManager::RememberMeManager(RememberMeConfig config, TimeSource clock)
    : config_(std::move(config)),
      key_(detail::sha256(config_.cipherKey)),
      clock_(std::move(clock)) {}

SecurityResult<std::string> RememberMeManager::issue(const Principal& principal) const {
    // payload: issuedAt (int64 little-endian seconds) || principal
    detail::Bytes payload(kIssuedAtSize);
    auto issuedAt = static_cast<uint64_t>(toEpochSeconds(clock_()));
    for (std::size_t i = 0; i < kIssuedAtSize; ++i) {
        payload[i] = static_cast<uint8_t>(issuedAt >> (8 * i));
    }
    payload.insert(payload.end(), principal.begin(), principal.end());

    auto sealed = detail::aesGcmSeal(key_, payload, config_.keyId);
    if (sealed.empty()) {
        return SecurityResult<std::string>::err(ErrorCode::CryptoFailure,
                                                "remember-me token sealing failed");
    }
    return SecurityResult<std::string>::ok(detail::base64UrlEncode(config_.keyId) + "." +
                                           detail::base64UrlEncode(sealed));
}

std::optional<Principal> RememberMeManager::resolve(std::string_view token) const {
    auto dot = token.find('.');
    if (dot == std::string_view::npos) {
        return std::nullopt;
    }

    auto keyId = detail::base64UrlDecode(token.substr(0, dot));
    auto sealed = detail::base64UrlDecode(token.substr(dot + 1));
    if (!keyId || !sealed) {
        return std::nullopt;
    }
    std::string keyIdText(keyId->begin(), keyId->end());
    if (keyIdText != config_.keyId) {
        WARDEN_LOG_DEBUG(LogCategory::Session, "remember-me token under retired key id");
        return std::nullopt;
    }

    auto payload = detail::aesGcmOpen(key_, *sealed, config_.keyId);
    if (!payload || payload->size() <= kIssuedAtSize) {
        WARDEN_LOG_WARN(LogCategory::Session, "remember-me token failed authentication");
        return std::nullopt;
    }

    uint64_t issuedAt = 0;
    for (std::size_t i = 0; i < kIssuedAtSize; ++i) {
        issuedAt |= uint64_t{(*payload)[i]} << (8 * i);
    }
    auto age = toEpochSeconds(clock_()) - static_cast<int64_t>(issuedAt);
    if (age < 0 || age > config_.maxAge.count()) {
        return std::nullopt;
    }
    return Principal(payload->begin() + kIssuedAtSize, payload->end());
}

} // namespace warden::security
