#pragma once

/// @file mfa_challenge_dispatcher.hpp
/// @brief TOTP second-factor challenges with tag-scoped sealed secrets.

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "warden/foundation/security_result.hpp"
#include "warden/security/account_store.hpp"
#include "warden/security/security_config.hpp"
#include "warden/security/security_types.hpp"

namespace warden::security {

/// Out-of-band delivery of a generated code (SMS gateway, mailer, push).
class IMfaDeliveryChannel {
public:
    virtual ~IMfaDeliveryChannel() = default;

    virtual foundation::SecurityResult<void> deliver(const ChallengeRef& challenge,
                                                     std::string_view code) = 0;
};

/// Delivery channel that keeps the last code per principal in memory.
class InMemoryDeliveryChannel : public IMfaDeliveryChannel {
public:
    foundation::SecurityResult<void> deliver(const ChallengeRef& challenge,
                                             std::string_view code) override;

    [[nodiscard]] std::optional<std::string> lastCode(const Principal& principal) const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<Principal, std::string> codes_;
};

/// Issues and verifies TOTP challenges.
///
/// Inactive (a pass-through) when no TotpConfig is given. Codes from the
/// current and the adjacent time steps are accepted; codes from further
/// steps inside the look-around window fail with ExpiredChallenge, others
/// with InvalidChallenge. A step accepted once is never accepted again for
/// the same principal.
///
/// Per-user secrets are sealed with AES-256-GCM under the application key
/// named by their tag, so rotating `default_tag` leaves existing
/// enrollments usable.
class MfaChallengeDispatcher {
public:
    /// Steps on either side of "now" that classify a code as expired.
    static constexpr uint64_t kLookAroundSteps = 10;

    /// Size of generated per-user secrets in bytes.
    static constexpr std::size_t kSecretSize = 20;

    MfaChallengeDispatcher(std::optional<TotpConfig> config,
                           std::shared_ptr<IAccountStore> secretStore,
                           std::shared_ptr<IMfaDeliveryChannel> channel,
                           TimeSource clock = systemTimeSource());

    [[nodiscard]] bool active() const noexcept { return config_.has_value(); }

    /// True when MFA is active and @p principal has an enrolled secret.
    [[nodiscard]] foundation::SecurityResult<bool> requiresChallenge(
        const Principal& principal) const;

    /// Deliver the current code through the channel.
    /// @return nullopt when inactive or when the principal is not enrolled.
    foundation::SecurityResult<std::optional<ChallengeRef>> issueChallenge(
        const Principal& principal);

    /// Check @p code; Success, ExpiredChallenge, InvalidChallenge,
    /// ChallengeReplayed or MfaNotEnrolled. Always succeeds when inactive.
    foundation::SecurityResult<void> checkCode(const Principal& principal, std::string_view code,
                                               std::optional<std::string> tag = std::nullopt);

    /// Boolean form of checkCode().
    bool verifyCode(const Principal& principal, std::string_view code,
                    std::optional<std::string> tag = std::nullopt);

    /// Create and store a new secret under `default_tag`, replacing any
    /// previous one. The plain secret is returned once for the user's
    /// authenticator app.
    foundation::SecurityResult<TotpEnrollment> enroll(const Principal& principal);

private:
    foundation::SecurityResult<std::vector<uint8_t>> unseal(const TotpSecret& secret,
                                                            const std::string& tag) const;

    foundation::SecurityResult<TotpSecret> loadSecret(const Principal& principal) const;

    std::optional<TotpConfig> config_;
    std::shared_ptr<IAccountStore> secretStore_;
    std::shared_ptr<IMfaDeliveryChannel> channel_;
    TimeSource clock_;

    std::mutex replayMutex_;
    std::unordered_map<Principal, uint64_t> lastAcceptedStep_;
};

} // namespace warden::security
