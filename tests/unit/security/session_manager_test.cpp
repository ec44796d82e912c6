#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "warden/foundation/event_bus.hpp"
#include "warden/security/security_events.hpp"
#include "warden/security/session_manager.hpp"

using namespace warden::security;
using warden::foundation::ErrorCode;
using warden::foundation::EventBus;

namespace {

using std::chrono::seconds;

class SessionManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        start_ = TimePoint{} + std::chrono::hours(400000);
        now_ = start_;
        config_.absoluteTimeout = seconds(1800);
        config_.idleTimeout = seconds(300);
        config_.validationInterval = seconds(3600);

        backend_ = std::make_shared<InMemoryCacheBackend>(1000, [this] { return now_; });
        cache_ = std::make_shared<CacheHandler>(backend_, CacheTtlConfig{});
        manager_ = std::make_unique<SessionManager>(config_, store_, cache_, &bus_,
                                                    [this] { return now_; });

        bus_.Subscribe<SessionStarted>(
            [this](const SessionStarted& e) { started_.push_back(e.sessionId); });
        bus_.Subscribe<SessionStopped>(
            [this](const SessionStopped& e) { stopped_.push_back(e.sessionId); });
        bus_.Subscribe<SessionExpired>(
            [this](const SessionExpired& e) { expired_.push_back(e.sessionId); });
    }

    void at(int secondsSinceStart) { now_ = start_ + seconds(secondsSinceStart); }

    Session create(const std::string& principal = "alice") {
        auto created = manager_->create(principal);
        EXPECT_TRUE(created.hasValue());
        return created.valueOr(Session{});
    }

    TimePoint start_;
    TimePoint now_;
    SessionConfig config_;
    EventBus bus_;
    std::shared_ptr<InMemorySessionStore> store_ = std::make_shared<InMemorySessionStore>();
    std::shared_ptr<InMemoryCacheBackend> backend_;
    std::shared_ptr<CacheHandler> cache_;
    std::unique_ptr<SessionManager> manager_;

    std::vector<std::string> started_;
    std::vector<std::string> stopped_;
    std::vector<std::string> expired_;
};

} // namespace

TEST_F(SessionManagerTest, CreateAssignsUniqueIdsAndExpiries) {
    auto a = create();
    auto b = create();

    EXPECT_NE(a.sessionId, b.sessionId);
    EXPECT_GE(a.sessionId.size(), 43u);
    EXPECT_EQ(a.principal, "alice");
    EXPECT_EQ(a.createdAt, start_);
    EXPECT_EQ(a.absoluteExpiry, start_ + seconds(1800));
    EXPECT_EQ(a.idleExpiry, start_ + seconds(300));
    EXPECT_EQ(started_.size(), 2u);
    EXPECT_EQ(store_->size(), 2u);
}

TEST_F(SessionManagerTest, TouchExtendsIdleWindowUntilIdleTimeout) {
    auto session = create();

    at(200);
    auto touched = manager_->touch(session.sessionId);
    ASSERT_TRUE(touched.hasValue());
    EXPECT_EQ(touched.value().lastAccessedAt, start_ + seconds(200));
    EXPECT_EQ(touched.value().idleExpiry, start_ + seconds(500));

    at(600);
    auto late = manager_->touch(session.sessionId);
    ASSERT_TRUE(late.hasError());
    EXPECT_EQ(late.code(), ErrorCode::SessionExpired);
    ASSERT_EQ(expired_.size(), 1u);
    EXPECT_EQ(expired_[0], session.sessionId);

    auto again = manager_->touch(session.sessionId);
    ASSERT_TRUE(again.hasError());
    EXPECT_EQ(again.code(), ErrorCode::SessionNotFound);
}

TEST_F(SessionManagerTest, ActivityCannotOutliveAbsoluteTimeout) {
    auto session = create();
    for (int t = 250; t < 1800; t += 250) {
        at(t);
        ASSERT_TRUE(manager_->touch(session.sessionId).hasValue()) << "t=" << t;
    }

    at(1750);
    auto nearEnd = manager_->touch(session.sessionId);
    ASSERT_TRUE(nearEnd.hasValue());
    EXPECT_EQ(nearEnd.value().idleExpiry, session.absoluteExpiry);

    at(1800);
    auto result = manager_->touch(session.sessionId);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.code(), ErrorCode::SessionExpired);
}

TEST_F(SessionManagerTest, ExpiryBoundaryIsExclusive) {
    auto session = create();
    at(299);
    EXPECT_TRUE(manager_->isValid(session, now_));
    at(300);
    EXPECT_FALSE(manager_->isValid(session, now_));
}

TEST_F(SessionManagerTest, GetDoesNotExtend) {
    auto session = create();
    at(200);
    auto read = manager_->get(session.sessionId);
    ASSERT_TRUE(read.hasValue());
    EXPECT_EQ(read.value().lastAccessedAt, start_);

    at(300);
    auto expired = manager_->get(session.sessionId);
    ASSERT_TRUE(expired.hasError());
    EXPECT_EQ(expired.code(), ErrorCode::SessionExpired);
    EXPECT_EQ(store_->size(), 0u);
}

TEST_F(SessionManagerTest, GetUsesStoredRecordWhenCachedCopyIsStale) {
    auto session = create();
    ASSERT_TRUE(manager_->get(session.sessionId).hasValue());

    // Extend behind the cache's back, as another node would.
    at(250);
    auto stored = store_->find(session.sessionId);
    ASSERT_TRUE(stored.hasValue());
    auto extended = stored.value();
    extended.lastAccessedAt = now_;
    ASSERT_TRUE(store_->save(extended).hasValue());

    at(400);
    auto read = manager_->get(session.sessionId);
    ASSERT_TRUE(read.hasValue());
    EXPECT_EQ(read.value().lastAccessedAt, start_ + seconds(250));
    EXPECT_TRUE(expired_.empty());
}

TEST_F(SessionManagerTest, InvalidateRemovesAndPublishesStop) {
    auto session = create();
    ASSERT_TRUE(manager_->invalidate(session.sessionId).hasValue());

    EXPECT_EQ(stopped_.size(), 1u);
    EXPECT_FALSE(backend_->ttlOf(CacheHandler::sessionKey(session.sessionId)).has_value());

    auto again = manager_->invalidate(session.sessionId);
    ASSERT_TRUE(again.hasError());
    EXPECT_EQ(again.code(), ErrorCode::SessionNotFound);
    EXPECT_EQ(manager_->get(session.sessionId).code(), ErrorCode::SessionNotFound);
}

TEST_F(SessionManagerTest, InvalidateAllForOnlyTouchesThatPrincipal) {
    create("alice");
    create("alice");
    auto bob = create("bob");

    EXPECT_EQ(manager_->invalidateAllFor("alice"), 2u);
    EXPECT_EQ(stopped_.size(), 2u);
    EXPECT_EQ(store_->size(), 1u);
    EXPECT_TRUE(manager_->touch(bob.sessionId).hasValue());
}

TEST_F(SessionManagerTest, ValidateAllEvictsOnlyExpiredSessions) {
    auto idle = create("alice");
    at(200);
    auto active = create("bob");
    at(400);
    ASSERT_TRUE(manager_->touch(active.sessionId).hasValue());

    EXPECT_EQ(manager_->validateAll(), 1u);
    ASSERT_EQ(expired_.size(), 1u);
    EXPECT_EQ(expired_[0], idle.sessionId);
    EXPECT_EQ(store_->size(), 1u);
    EXPECT_FALSE(backend_->ttlOf(CacheHandler::sessionKey(idle.sessionId)).has_value());
}

TEST_F(SessionManagerTest, CachedSessionNeverOutlivesAbsoluteExpiry) {
    auto session = create();
    at(1700);
    auto stored = store_->find(session.sessionId);
    ASSERT_TRUE(stored.hasValue());
    auto recent = stored.value();
    recent.lastAccessedAt = now_ - seconds(10);
    ASSERT_TRUE(store_->save(recent).hasValue());

    ASSERT_TRUE(manager_->touch(session.sessionId).hasValue());
    auto ttl = backend_->ttlOf(CacheHandler::sessionKey(session.sessionId));
    ASSERT_TRUE(ttl.has_value());
    EXPECT_LE(ttl->count(), 100);

    // A cache miss on get() re-caches from the store under the same bound.
    at(1750);
    ASSERT_TRUE(manager_->touch(session.sessionId).hasValue());
    cache_->invalidate(CacheHandler::sessionKey(session.sessionId));
    at(1790);
    ASSERT_TRUE(manager_->get(session.sessionId).hasValue());
    ttl = backend_->ttlOf(CacheHandler::sessionKey(session.sessionId));
    ASSERT_TRUE(ttl.has_value());
    EXPECT_LE(ttl->count(), 10);
}

TEST_F(SessionManagerTest, StoreOutageIsReported) {
    auto session = create();
    store_->setAvailable(false);
    auto touched = manager_->touch(session.sessionId);
    ASSERT_TRUE(touched.hasError());
    EXPECT_EQ(touched.code(), ErrorCode::StoreUnavailable);
    EXPECT_EQ(manager_->validateAll(), 0u);
}

TEST(SessionManagerValidationTest, BackgroundSweepStartsAndStops) {
    SessionConfig config;
    config.validationInterval = std::chrono::seconds(1);
    auto store = std::make_shared<InMemorySessionStore>();
    SessionManager manager(config, store, nullptr);

    manager.startValidation();
    EXPECT_TRUE(manager.validationRunning());
    manager.startValidation();
    manager.stopValidation();
    EXPECT_FALSE(manager.validationRunning());
}

TEST(SessionManagerValidationTest, SweepRunsOnSchedule) {
    SessionConfig config;
    config.absoluteTimeout = std::chrono::seconds(10);
    config.idleTimeout = std::chrono::seconds(5);
    config.validationInterval = std::chrono::seconds(1);

    auto now = TimePoint{} + std::chrono::hours(400000);
    std::mutex clockMutex;
    auto clock = [&] {
        std::lock_guard<std::mutex> lock(clockMutex);
        return now;
    };
    auto store = std::make_shared<InMemorySessionStore>();
    SessionManager manager(config, store, nullptr, nullptr, clock);
    ASSERT_TRUE(manager.create("alice").hasValue());

    {
        std::lock_guard<std::mutex> lock(clockMutex);
        now += std::chrono::seconds(60);
    }
    manager.startValidation();
    for (int i = 0; i < 50 && store->size() > 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    manager.stopValidation();
    EXPECT_EQ(store->size(), 0u);
}
