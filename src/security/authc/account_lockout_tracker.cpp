/// @file account_lockout_tracker.cpp
/// @brief AccountLockoutTracker implementation.

#include "warden/security/account_lockout_tracker.hpp"

#include "warden/foundation/security_logger.hpp"

#include <algorithm>

namespace warden::security {

using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

namespace {

// Below this many tracked principals no sweep runs on insertion.
constexpr std::size_t kMinPruneAt = 1024;

} // namespace

AccountLockoutTracker::AccountLockoutTracker(LockoutPolicy policy, TimeSource clock)
    : policy_(policy), clock_(std::move(clock)), pruneAt_(kMinPruneAt) {}

// ---------------------------------------------------------------------------
// Internal helpers
// ---------------------------------------------------------------------------

LockoutState& AccountLockoutTracker::entryLocked(const Principal& principal, TimePoint now) {
    auto it = states_.find(principal);
    if (it != states_.end()) {
        expireLocked(it->second, now);
        return it->second;
    }

    if (states_.size() >= pruneAt_) {
        auto removed = pruneLocked(now);
        pruneAt_ = std::max(kMinPruneAt, states_.size() * 2);
        if (removed > 0) {
            WARDEN_LOG_DEBUG(LogCategory::Authc,
                             "pruned " + std::to_string(removed) + " stale lockout entries");
        }
    }
    auto& state = states_[principal];
    state.principal = principal;
    return state;
}

void AccountLockoutTracker::expireLocked(LockoutState& state, TimePoint now) const {
    const auto& enabled = std::get<LockoutEnabled>(policy_);
    if (!state.locked && state.failedCount > 0 &&
        now - state.firstFailureTime >= enabled.failureWindow) {
        state.failedCount = 0;
        state.firstFailureTime = TimePoint{};
    }
}

void AccountLockoutTracker::eraseIfIdleLocked(StateMap::iterator it) {
    const auto& state = it->second;
    if (!state.locked && state.failedCount == 0 && state.inFlight == 0) {
        states_.erase(it);
    }
}

std::size_t AccountLockoutTracker::pruneLocked(TimePoint now) {
    std::size_t removed = 0;
    for (auto it = states_.begin(); it != states_.end();) {
        expireLocked(it->second, now);
        const auto& state = it->second;
        if (!state.locked && state.failedCount == 0 && state.inFlight == 0) {
            it = states_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

// ---------------------------------------------------------------------------
// Attempts
// ---------------------------------------------------------------------------

bool AccountLockoutTracker::tryBeginAttempt(const Principal& principal) {
    const auto* enabled = std::get_if<LockoutEnabled>(&policy_);
    if (!enabled) {
        return true;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto& state = entryLocked(principal, clock_());
    if (state.locked || state.failedCount + state.inFlight >= enabled->threshold) {
        return false;
    }
    ++state.inFlight;
    return true;
}

FailureOutcome AccountLockoutTracker::countFailure(const Principal& principal,
                                                  bool settlesReservation) {
    const auto* enabled = std::get_if<LockoutEnabled>(&policy_);
    if (!enabled) {
        return {};
    }

    FailureOutcome outcome;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = clock_();
        auto& state = entryLocked(principal, now);
        if (settlesReservation && state.inFlight > 0) {
            --state.inFlight;
        }
        if (state.failedCount == 0) {
            state.firstFailureTime = now;
        }
        ++state.failedCount;

        outcome.failedCount = state.failedCount;
        outcome.newlyLocked = !state.locked && state.failedCount >= enabled->threshold;
        state.locked = state.locked || outcome.newlyLocked;
        outcome.locked = state.locked;
    }

    if (outcome.newlyLocked) {
        WARDEN_LOG_DEBUG(LogCategory::Authc, "lockout threshold reached");
    }
    return outcome;
}

FailureOutcome AccountLockoutTracker::recordFailure(const Principal& principal) {
    return countFailure(principal, false);
}

FailureOutcome AccountLockoutTracker::settleFailure(const Principal& principal) {
    return countFailure(principal, true);
}

void AccountLockoutTracker::recordSuccess(const Principal& principal) {
    if (!enabled()) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = states_.find(principal);
    if (it == states_.end()) {
        return;
    }
    auto& state = it->second;
    state.locked = false;
    state.failedCount = 0;
    state.firstFailureTime = TimePoint{};
    eraseIfIdleLocked(it);
}

bool AccountLockoutTracker::settleSuccess(const Principal& principal) {
    if (!enabled()) {
        return true;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = states_.find(principal);
    if (it == states_.end()) {
        return true;
    }
    auto& state = it->second;
    if (state.inFlight > 0) {
        --state.inFlight;
    }
    // Admission saw the account open, so any lock now was set meanwhile.
    if (state.locked) {
        return false;
    }
    state.failedCount = 0;
    state.firstFailureTime = TimePoint{};
    eraseIfIdleLocked(it);
    return true;
}

void AccountLockoutTracker::releaseAttempt(const Principal& principal) {
    if (!enabled()) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = states_.find(principal);
    if (it == states_.end() || it->second.inFlight == 0) {
        return;
    }
    --it->second.inFlight;
    eraseIfIdleLocked(it);
}

// ---------------------------------------------------------------------------
// Queries / administration
// ---------------------------------------------------------------------------

bool AccountLockoutTracker::isLocked(const Principal& principal) const {
    if (!enabled()) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = states_.find(principal);
    return it != states_.end() && it->second.locked;
}

bool AccountLockoutTracker::unlock(const Principal& principal) {
    if (!enabled()) {
        return false;
    }
    bool existed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = states_.find(principal);
        if (it != states_.end()) {
            existed = true;
            auto& state = it->second;
            state.locked = false;
            state.failedCount = 0;
            state.firstFailureTime = TimePoint{};
            eraseIfIdleLocked(it);
        }
    }
    if (existed) {
        LogContext ctx;
        ctx.principal = principal;
        WARDEN_LOG_CTX(LogLevel::Info, LogCategory::Audit, "account unlocked", ctx);
    }
    return existed;
}

std::optional<LockoutState> AccountLockoutTracker::state(const Principal& principal) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = states_.find(principal);
    if (it == states_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t AccountLockoutTracker::prune() {
    if (!enabled()) {
        return 0;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return pruneLocked(clock_());
}

std::size_t AccountLockoutTracker::trackedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return states_.size();
}

bool AccountLockoutTracker::enabled() const noexcept {
    return std::holds_alternative<LockoutEnabled>(policy_);
}

uint32_t AccountLockoutTracker::threshold() const noexcept {
    const auto* enabled = std::get_if<LockoutEnabled>(&policy_);
    return enabled ? enabled->threshold : 0;
}

} // namespace warden::security
