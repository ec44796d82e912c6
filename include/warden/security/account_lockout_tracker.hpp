#pragma once

/// @file account_lockout_tracker.hpp
/// @brief Threshold-based account lockout keyed by principal.

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>

#include "warden/security/security_config.hpp"
#include "warden/security/security_types.hpp"

namespace warden::security {

/// Outcome of recording one failed attempt.
struct FailureOutcome {
    uint32_t failedCount = 0;
    bool locked = false;      ///< Principal is locked after this attempt.
    bool newlyLocked = false; ///< This attempt reached the threshold.
};

/// Counts consecutive failures per principal and locks at the threshold.
///
/// `OPEN -> (failedCount >= threshold) -> LOCKED -> (success | unlock) -> OPEN`.
/// Each read-modify-write runs under one mutex, so concurrent failures are
/// never undercounted. With LockoutDisabled no state is kept at all.
///
/// Verification is slow, so callers reserve an attempt with
/// tryBeginAttempt() before verifying and settle it with settleFailure(),
/// settleSuccess() or releaseAttempt() (LockoutAttempt does this scoped).
/// Reservations count towards the threshold: at most
/// `threshold - failedCount` attempts are evaluated concurrently, and a
/// settled success never clears a lock set while it was in flight.
///
/// Open entries whose first failure is older than the failure window are
/// forgotten; locked entries stay until success or unlock.
///
/// Example:
/// @code
///   AccountLockoutTracker tracker(LockoutEnabled{3});
///   if (!tracker.tryBeginAttempt("alice")) { /* reject as locked */ }
///   LockoutAttempt attempt(tracker, "alice");
///   if (!verify()) {
///       attempt.fail();
///   } else if (!attempt.succeed()) { /* locked meanwhile */ }
/// @endcode
class AccountLockoutTracker {
public:
    explicit AccountLockoutTracker(LockoutPolicy policy, TimeSource clock = systemTimeSource());

    /// Reserve one attempt for @p principal.
    /// @return false when the principal is locked or the open reservations
    ///         could already reach the threshold.
    [[nodiscard]] bool tryBeginAttempt(const Principal& principal);

    /// Count a failure not covered by a reservation.
    FailureOutcome recordFailure(const Principal& principal);

    /// Clear the failure history and any lock of @p principal.
    void recordSuccess(const Principal& principal);

    /// Settle a reservation as a failure.
    FailureOutcome settleFailure(const Principal& principal);

    /// Settle a reservation as a success and clear the failure history.
    /// @return false when the principal was locked while the attempt was in
    ///         flight; the lock is kept.
    [[nodiscard]] bool settleSuccess(const Principal& principal);

    /// Settle a reservation whose attempt produced no verdict (store outage,
    /// second-factor prompt).
    void releaseAttempt(const Principal& principal);

    [[nodiscard]] bool isLocked(const Principal& principal) const;

    /// Administrative unlock. @return true when state existed.
    bool unlock(const Principal& principal);

    [[nodiscard]] std::optional<LockoutState> state(const Principal& principal) const;

    /// Drop open entries outside the failure window. @return entries removed.
    std::size_t prune();

    /// Number of principals with state.
    [[nodiscard]] std::size_t trackedCount() const;

    [[nodiscard]] bool enabled() const noexcept;

    /// Threshold, or 0 when disabled.
    [[nodiscard]] uint32_t threshold() const noexcept;

private:
    using StateMap = std::unordered_map<Principal, LockoutState>;

    FailureOutcome countFailure(const Principal& principal, bool settlesReservation);

    /// Entry for @p principal, created when absent; caller holds mutex_.
    LockoutState& entryLocked(const Principal& principal, TimePoint now);

    /// Forget an open entry's failures once its window has passed.
    void expireLocked(LockoutState& state, TimePoint now) const;

    /// Erase @p it when it carries no information; caller holds mutex_.
    void eraseIfIdleLocked(StateMap::iterator it);

    std::size_t pruneLocked(TimePoint now);

    LockoutPolicy policy_;
    TimeSource clock_;
    mutable std::mutex mutex_;
    StateMap states_;
    std::size_t pruneAt_;
};

/// Scoped owner of one reservation taken with
/// AccountLockoutTracker::tryBeginAttempt(). Released without a verdict on
/// destruction unless settled first.
class LockoutAttempt {
public:
    LockoutAttempt(AccountLockoutTracker& tracker, Principal principal)
        : tracker_(tracker), principal_(std::move(principal)) {}

    ~LockoutAttempt() {
        if (open_) {
            tracker_.releaseAttempt(principal_);
        }
    }

    LockoutAttempt(const LockoutAttempt&) = delete;
    LockoutAttempt& operator=(const LockoutAttempt&) = delete;

    FailureOutcome fail() {
        open_ = false;
        return tracker_.settleFailure(principal_);
    }

    /// @return false when a lock set meanwhile was kept.
    [[nodiscard]] bool succeed() {
        open_ = false;
        return tracker_.settleSuccess(principal_);
    }

private:
    AccountLockoutTracker& tracker_;
    Principal principal_;
    bool open_ = true;
};

} // namespace warden::security
