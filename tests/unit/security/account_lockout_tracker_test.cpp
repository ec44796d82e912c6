#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

#include "warden/security/account_lockout_tracker.hpp"

using namespace warden::security;

TEST(AccountLockoutTrackerTest, LocksAtThreshold) {
    AccountLockoutTracker tracker(LockoutEnabled{3});

    auto first = tracker.recordFailure("alice");
    EXPECT_EQ(first.failedCount, 1u);
    EXPECT_FALSE(first.locked);

    tracker.recordFailure("alice");
    EXPECT_FALSE(tracker.isLocked("alice"));

    auto third = tracker.recordFailure("alice");
    EXPECT_EQ(third.failedCount, 3u);
    EXPECT_TRUE(third.locked);
    EXPECT_TRUE(third.newlyLocked);
    EXPECT_TRUE(tracker.isLocked("alice"));
}

TEST(AccountLockoutTrackerTest, OnlyTheThresholdAttemptIsNewlyLocked) {
    AccountLockoutTracker tracker(LockoutEnabled{2});
    tracker.recordFailure("alice");
    EXPECT_TRUE(tracker.recordFailure("alice").newlyLocked);

    auto after = tracker.recordFailure("alice");
    EXPECT_TRUE(after.locked);
    EXPECT_FALSE(after.newlyLocked);
    EXPECT_EQ(after.failedCount, 3u);
}

TEST(AccountLockoutTrackerTest, SuccessResetsCount) {
    AccountLockoutTracker tracker(LockoutEnabled{3});
    tracker.recordFailure("alice");
    tracker.recordFailure("alice");
    tracker.recordSuccess("alice");

    EXPECT_FALSE(tracker.state("alice").has_value());
    EXPECT_EQ(tracker.recordFailure("alice").failedCount, 1u);
}

TEST(AccountLockoutTrackerTest, UnlockClearsLockedState) {
    AccountLockoutTracker tracker(LockoutEnabled{1});
    tracker.recordFailure("alice");
    ASSERT_TRUE(tracker.isLocked("alice"));

    EXPECT_TRUE(tracker.unlock("alice"));
    EXPECT_FALSE(tracker.isLocked("alice"));
    EXPECT_FALSE(tracker.unlock("alice"));
}

TEST(AccountLockoutTrackerTest, PrincipalsAreIndependent) {
    AccountLockoutTracker tracker(LockoutEnabled{1});
    tracker.recordFailure("alice");
    EXPECT_TRUE(tracker.isLocked("alice"));
    EXPECT_FALSE(tracker.isLocked("bob"));
}

TEST(AccountLockoutTrackerTest, FirstFailureTimeComesFromClock) {
    TimePoint now = TimePoint{} + std::chrono::hours(1);
    AccountLockoutTracker tracker(LockoutEnabled{5}, [&now] { return now; });

    tracker.recordFailure("alice");
    now += std::chrono::minutes(5);
    tracker.recordFailure("alice");

    auto state = tracker.state("alice");
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(state->failedCount, 2u);
    EXPECT_EQ(state->firstFailureTime, TimePoint{} + std::chrono::hours(1));
}

TEST(AccountLockoutTrackerTest, DisabledPolicyKeepsNoState) {
    AccountLockoutTracker tracker(LockoutDisabled{});
    for (int i = 0; i < 100; ++i) {
        auto outcome = tracker.recordFailure("alice");
        EXPECT_FALSE(outcome.locked);
    }
    EXPECT_FALSE(tracker.isLocked("alice"));
    EXPECT_FALSE(tracker.state("alice").has_value());
    EXPECT_FALSE(tracker.enabled());
    EXPECT_EQ(tracker.threshold(), 0u);
}

TEST(AccountLockoutTrackerTest, ConcurrentFailuresAreAllCounted) {
    constexpr int kThreads = 8;
    constexpr int kPerThread = 250;
    AccountLockoutTracker tracker(LockoutEnabled{kThreads * kPerThread});

    std::atomic<int> newlyLocked{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < kPerThread; ++i) {
                if (tracker.recordFailure("alice").newlyLocked) {
                    newlyLocked.fetch_add(1);
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    auto state = tracker.state("alice");
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(state->failedCount, static_cast<uint32_t>(kThreads * kPerThread));
    EXPECT_TRUE(state->locked);
    EXPECT_EQ(newlyLocked.load(), 1);
}

TEST(AccountLockoutTrackerTest, ReservationsCountTowardsThreshold) {
    AccountLockoutTracker tracker(LockoutEnabled{3});
    tracker.recordFailure("alice");

    EXPECT_TRUE(tracker.tryBeginAttempt("alice"));
    EXPECT_TRUE(tracker.tryBeginAttempt("alice"));
    EXPECT_FALSE(tracker.tryBeginAttempt("alice"));

    tracker.settleFailure("alice");
    EXPECT_FALSE(tracker.tryBeginAttempt("alice"));
    auto last = tracker.settleFailure("alice");
    EXPECT_TRUE(last.newlyLocked);

    auto state = tracker.state("alice");
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(state->failedCount, 3u);
    EXPECT_EQ(state->inFlight, 0u);
    EXPECT_FALSE(tracker.tryBeginAttempt("alice"));
}

TEST(AccountLockoutTrackerTest, ReleasedAttemptLeavesNoTrace) {
    AccountLockoutTracker tracker(LockoutEnabled{1});
    ASSERT_TRUE(tracker.tryBeginAttempt("alice"));
    EXPECT_FALSE(tracker.tryBeginAttempt("alice"));

    tracker.releaseAttempt("alice");
    EXPECT_FALSE(tracker.state("alice").has_value());
    EXPECT_TRUE(tracker.tryBeginAttempt("alice"));
}

TEST(AccountLockoutTrackerTest, SuccessKeepsLockEarnedWhileInFlight) {
    AccountLockoutTracker tracker(LockoutEnabled{3});
    ASSERT_TRUE(tracker.tryBeginAttempt("alice"));

    for (int i = 0; i < 3; ++i) {
        tracker.recordFailure("alice");
    }
    ASSERT_TRUE(tracker.isLocked("alice"));

    EXPECT_EQ(tracker.state("alice")->inFlight, 1u);

    EXPECT_FALSE(tracker.settleSuccess("alice"));
    EXPECT_TRUE(tracker.isLocked("alice"));
    EXPECT_EQ(tracker.state("alice")->inFlight, 0u);
}

TEST(AccountLockoutTrackerTest, SuccessWhileOthersInFlightKeepsTheirReservations) {
    AccountLockoutTracker tracker(LockoutEnabled{3});
    ASSERT_TRUE(tracker.tryBeginAttempt("alice"));
    ASSERT_TRUE(tracker.tryBeginAttempt("alice"));

    EXPECT_TRUE(tracker.settleSuccess("alice"));
    auto state = tracker.state("alice");
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(state->failedCount, 0u);
    EXPECT_EQ(state->inFlight, 1u);

    EXPECT_EQ(tracker.settleFailure("alice").failedCount, 1u);
    EXPECT_EQ(tracker.state("alice")->inFlight, 0u);
}

TEST(AccountLockoutTrackerTest, LockoutAttemptReleasesWhenUnsettled) {
    AccountLockoutTracker tracker(LockoutEnabled{2});
    {
        ASSERT_TRUE(tracker.tryBeginAttempt("alice"));
        LockoutAttempt attempt(tracker, "alice");
        EXPECT_EQ(tracker.state("alice")->inFlight, 1u);
    }
    EXPECT_FALSE(tracker.state("alice").has_value());

    {
        ASSERT_TRUE(tracker.tryBeginAttempt("alice"));
        LockoutAttempt attempt(tracker, "alice");
        EXPECT_EQ(attempt.fail().failedCount, 1u);
    }
    auto state = tracker.state("alice");
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(state->failedCount, 1u);
    EXPECT_EQ(state->inFlight, 0u);
}

TEST(AccountLockoutTrackerTest, ConcurrentReservationsAdmitAtMostThreshold) {
    constexpr int kThreads = 16;
    AccountLockoutTracker tracker(LockoutEnabled{3});

    std::atomic<int> admitted{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&] {
            if (tracker.tryBeginAttempt("alice")) {
                admitted.fetch_add(1);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(admitted.load(), 3);
    EXPECT_EQ(tracker.state("alice")->inFlight, 3u);
}

TEST(AccountLockoutTrackerTest, FailuresOutsideWindowAreForgotten) {
    TimePoint now = TimePoint{} + std::chrono::hours(1);
    AccountLockoutTracker tracker(LockoutEnabled{3, std::chrono::seconds(60)},
                                  [&now] { return now; });

    tracker.recordFailure("alice");
    tracker.recordFailure("alice");
    now += std::chrono::seconds(61);

    auto outcome = tracker.recordFailure("alice");
    EXPECT_EQ(outcome.failedCount, 1u);
    EXPECT_FALSE(outcome.locked);
    EXPECT_EQ(tracker.state("alice")->firstFailureTime, now);
}

TEST(AccountLockoutTrackerTest, LockDoesNotExpireWithWindow) {
    TimePoint now = TimePoint{} + std::chrono::hours(1);
    AccountLockoutTracker tracker(LockoutEnabled{2, std::chrono::seconds(60)},
                                  [&now] { return now; });

    tracker.recordFailure("alice");
    tracker.recordFailure("alice");
    now += std::chrono::hours(24);

    EXPECT_EQ(tracker.prune(), 0u);
    EXPECT_TRUE(tracker.isLocked("alice"));
    EXPECT_FALSE(tracker.tryBeginAttempt("alice"));
}

TEST(AccountLockoutTrackerTest, SprayedUnknownNamesArePruned) {
    TimePoint now = TimePoint{} + std::chrono::hours(1);
    AccountLockoutTracker tracker(LockoutEnabled{5, std::chrono::seconds(60)},
                                  [&now] { return now; });

    for (int i = 0; i < 5000; ++i) {
        tracker.recordFailure("nobody-" + std::to_string(i));
    }
    EXPECT_EQ(tracker.trackedCount(), 5000u);

    // Once the window has passed, new insertions sweep the stale entries.
    now += std::chrono::seconds(61);
    for (int i = 0; i < 5000; ++i) {
        tracker.recordFailure("other-" + std::to_string(i));
    }
    EXPECT_LE(tracker.trackedCount(), 5000u + 1024u);

    now += std::chrono::seconds(61);
    EXPECT_GT(tracker.prune(), 0u);
    EXPECT_EQ(tracker.trackedCount(), 0u);
}
