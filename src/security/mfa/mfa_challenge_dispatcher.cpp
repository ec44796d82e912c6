/// @file mfa_challenge_dispatcher.cpp
/// @brief MfaChallengeDispatcher implementation.

#include "warden/security/mfa_challenge_dispatcher.hpp"

#include "warden/foundation/security_logger.hpp"
#include "warden/security/totp.hpp"

#include "../crypto/crypto_utils.hpp"

#include <algorithm>

namespace warden::security {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using foundation::SecurityResult;

namespace {

std::string sealingAad(const Principal& principal, const std::string& tag) {
    return principal + ":" + tag;
}

} // namespace

// ---------------------------------------------------------------------------
// InMemoryDeliveryChannel
// ---------------------------------------------------------------------------

SecurityResult<void> InMemoryDeliveryChannel::deliver(const ChallengeRef& challenge,
                                                      std::string_view code) {
    std::lock_guard<std::mutex> lock(mutex_);
    codes_[challenge.principal] = std::string(code);
    return SecurityResult<void>::ok();
}

std::optional<std::string> InMemoryDeliveryChannel::lastCode(const Principal& principal) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = codes_.find(principal);
    if (it == codes_.end()) {
        return std::nullopt;
    }
    return it->second;
}

// ---------------------------------------------------------------------------
// MfaChallengeDispatcher
// ---------------------------------------------------------------------------

MfaChallengeDispatcher::MfaChallengeDispatcher(std::optional<TotpConfig> config,
                                               std::shared_ptr<IAccountStore> secretStore,
                                               std::shared_ptr<IMfaDeliveryChannel> channel,
                                               TimeSource clock)
    : config_(std::move(config)),
      secretStore_(std::move(secretStore)),
      channel_(std::move(channel)),
      clock_(std::move(clock)) {}

SecurityResult<bool> MfaChallengeDispatcher::requiresChallenge(const Principal& principal) const {
    if (!active()) {
        return SecurityResult<bool>::ok(false);
    }
    auto secret = loadSecret(principal);
    if (!secret) {
        if (secret.code() == ErrorCode::MfaNotEnrolled) {
            return SecurityResult<bool>::ok(false);
        }
        return SecurityResult<bool>::err(secret.error());
    }
    return SecurityResult<bool>::ok(true);
}

SecurityResult<TotpSecret> MfaChallengeDispatcher::loadSecret(const Principal& principal) const {
    auto secret = secretStore_->findTotpSecret(principal);
    if (!secret) {
        // Accounts of later realms have no entry in the secret store.
        if (secret.code() == ErrorCode::RecordNotFound) {
            return SecurityResult<TotpSecret>::err(ErrorCode::MfaNotEnrolled,
                                                   "no second factor enrolled");
        }
        return SecurityResult<TotpSecret>::err(secret.error());
    }
    if (!secret.value()) {
        return SecurityResult<TotpSecret>::err(ErrorCode::MfaNotEnrolled,
                                               "no second factor enrolled");
    }
    return SecurityResult<TotpSecret>::ok(*secret.value());
}

SecurityResult<std::vector<uint8_t>> MfaChallengeDispatcher::unseal(const TotpSecret& secret,
                                                                    const std::string& tag) const {
    auto keyIt = config_->secrets.find(tag);
    if (keyIt == config_->secrets.end()) {
        return SecurityResult<std::vector<uint8_t>>::err(
            ErrorCode::ConfigurationError, "no application key for tag '" + tag + "'");
    }
    auto key = detail::sha256(keyIt->second);
    auto plain = detail::aesGcmOpen(key, secret.sealedSecret, sealingAad(secret.principal, tag));
    if (!plain) {
        WARDEN_LOG_WARN(LogCategory::Crypto, "TOTP secret failed to unseal under tag " + tag);
        return SecurityResult<std::vector<uint8_t>>::err(ErrorCode::DecryptionFailed,
                                                         "TOTP secret could not be unsealed");
    }
    return SecurityResult<std::vector<uint8_t>>::ok(std::move(*plain));
}

SecurityResult<std::optional<ChallengeRef>> MfaChallengeDispatcher::issueChallenge(
    const Principal& principal) {
    using Result = SecurityResult<std::optional<ChallengeRef>>;
    if (!active()) {
        return Result::ok(std::nullopt);
    }

    auto secret = loadSecret(principal);
    if (!secret) {
        if (secret.code() == ErrorCode::MfaNotEnrolled) {
            return Result::ok(std::nullopt);
        }
        return Result::err(secret.error());
    }
    auto plain = unseal(secret.value(), secret.value().tag);
    if (!plain) {
        return Result::err(plain.error());
    }

    ChallengeRef challenge;
    challenge.principal = principal;
    challenge.timeStep = totp::timeStep(clock_(), secret.value().period);
    challenge.channel = config_->dispatcher;

    auto code = totp::generateCode(plain.value(), challenge.timeStep, secret.value().digits);
    if (code.empty()) {
        return Result::err(ErrorCode::CryptoFailure, "TOTP generation failed");
    }
    if (channel_) {
        auto delivered = channel_->deliver(challenge, code);
        if (!delivered) {
            return Result::err(delivered.error());
        }
    }

    LogContext ctx;
    ctx.principal = principal;
    ctx.extra["channel"] = challenge.channel;
    WARDEN_LOG_CTX(LogLevel::Info, LogCategory::Mfa, "challenge issued", ctx);
    return Result::ok(challenge);
}

SecurityResult<void> MfaChallengeDispatcher::checkCode(const Principal& principal,
                                                       std::string_view code,
                                                       std::optional<std::string> tag) {
    if (!active()) {
        return SecurityResult<void>::ok();
    }

    auto secret = loadSecret(principal);
    if (!secret) {
        return SecurityResult<void>::err(secret.error());
    }
    const auto& stored = secret.value();
    const auto& useTag = tag ? *tag : stored.tag;
    if (useTag != stored.tag) {
        return SecurityResult<void>::err(ErrorCode::MfaNotEnrolled,
                                         "no secret under the requested tag");
    }

    const bool wellFormed = code.size() == stored.digits &&
        std::all_of(code.begin(), code.end(), [](char c) { return c >= '0' && c <= '9'; });
    if (!wellFormed) {
        return SecurityResult<void>::err(ErrorCode::InvalidChallenge, "invalid code");
    }

    auto plain = unseal(stored, useTag);
    if (!plain) {
        return SecurityResult<void>::err(plain.error());
    }

    const auto now = totp::timeStep(clock_(), stored.period);
    auto matches = [&](uint64_t step) {
        auto expected = totp::generateCode(plain.value(), step, stored.digits);
        return !expected.empty() && detail::constantTimeEqual(expected, code);
    };

    // Evaluate the whole tolerance window so timing does not reveal which
    // step matched.
    std::optional<uint64_t> accepted;
    for (uint64_t step = now == 0 ? 0 : now - 1; step <= now + 1; ++step) {
        if (matches(step) && !accepted) {
            accepted = step;
        }
    }

    LogContext ctx;
    ctx.principal = principal;
    if (accepted) {
        std::lock_guard<std::mutex> lock(replayMutex_);
        auto [it, inserted] = lastAcceptedStep_.try_emplace(principal, *accepted);
        if (!inserted) {
            if (*accepted <= it->second) {
                WARDEN_LOG_CTX(LogLevel::Warning, LogCategory::Audit, "TOTP code replayed", ctx);
                return SecurityResult<void>::err(ErrorCode::ChallengeReplayed, "code already used");
            }
            it->second = *accepted;
        }
        return SecurityResult<void>::ok();
    }

    for (uint64_t distance = 2; distance <= kLookAroundSteps; ++distance) {
        bool hit = matches(now + distance);
        if (now >= distance) {
            hit = matches(now - distance) || hit;
        }
        if (hit) {
            WARDEN_LOG_CTX(LogLevel::Info, LogCategory::Mfa, "expired TOTP code", ctx);
            return SecurityResult<void>::err(ErrorCode::ExpiredChallenge, "code expired");
        }
    }
    return SecurityResult<void>::err(ErrorCode::InvalidChallenge, "invalid code");
}

bool MfaChallengeDispatcher::verifyCode(const Principal& principal, std::string_view code,
                                        std::optional<std::string> tag) {
    return checkCode(principal, code, std::move(tag)).hasValue();
}

SecurityResult<TotpEnrollment> MfaChallengeDispatcher::enroll(const Principal& principal) {
    if (!active()) {
        return SecurityResult<TotpEnrollment>::err(ErrorCode::ConfigurationError,
                                                   "MFA is not configured");
    }

    auto plain = detail::randomBytes(kSecretSize);
    if (plain.empty()) {
        return SecurityResult<TotpEnrollment>::err(ErrorCode::CryptoFailure,
                                                   "random secret generation failed");
    }

    const auto& tag = config_->defaultTag;
    auto key = detail::sha256(config_->secrets.at(tag));

    TotpSecret secret;
    secret.principal = principal;
    secret.tag = tag;
    secret.digits = config_->digits;
    secret.period = config_->period;
    secret.sealedSecret = detail::aesGcmSeal(key, plain, sealingAad(principal, tag));
    if (secret.sealedSecret.empty()) {
        return SecurityResult<TotpEnrollment>::err(ErrorCode::CryptoFailure,
                                                   "sealing TOTP secret failed");
    }

    auto saved = secretStore_->saveTotpSecret(secret);
    if (!saved) {
        return SecurityResult<TotpEnrollment>::err(saved.error());
    }
    {
        std::lock_guard<std::mutex> lock(replayMutex_);
        lastAcceptedStep_.erase(principal);
    }

    TotpEnrollment enrollment;
    enrollment.tag = tag;
    enrollment.base32Secret = detail::base32Encode(plain);
    enrollment.provisioningUri = "otpauth://totp/warden:" + principal +
        "?secret=" + enrollment.base32Secret + "&issuer=warden&digits=" +
        std::to_string(secret.digits) + "&period=" + std::to_string(secret.period);

    LogContext ctx;
    ctx.principal = principal;
    ctx.extra["tag"] = tag;
    WARDEN_LOG_CTX(LogLevel::Info, LogCategory::Audit, "second factor enrolled", ctx);
    return SecurityResult<TotpEnrollment>::ok(std::move(enrollment));
}

} // namespace warden::security
