#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "warden/foundation/event_bus.hpp"

using namespace warden::foundation;

namespace {

struct LoginEvent {
    std::string principal;
};

struct LogoutEvent {
    std::string sessionId;
};

} // namespace

TEST(EventBusTest, PublishReachesSubscribersOfThatType) {
    EventBus bus;
    std::vector<std::string> seen;
    bus.Subscribe<LoginEvent>([&seen](const LoginEvent& e) { seen.push_back(e.principal); });
    bus.Subscribe<LogoutEvent>([&seen](const LogoutEvent& e) { seen.push_back(e.sessionId); });

    bus.Publish(LoginEvent{"alice"});

    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0], "alice");
}

TEST(EventBusTest, LowerPriorityValueRunsFirst) {
    EventBus bus;
    std::vector<int> order;
    bus.Subscribe<LoginEvent>([&order](const LoginEvent&) { order.push_back(1); }, 10);
    bus.Subscribe<LoginEvent>([&order](const LoginEvent&) { order.push_back(2); }, 0);

    bus.Publish(LoginEvent{"bob"});

    ASSERT_EQ(order.size(), 2u);
    EXPECT_EQ(order[0], 2);
    EXPECT_EQ(order[1], 1);
}

TEST(EventBusTest, UnsubscribeStopsDelivery) {
    EventBus bus;
    int calls = 0;
    auto id = bus.Subscribe<LoginEvent>([&calls](const LoginEvent&) { ++calls; });
    EXPECT_EQ(bus.HandlerCountFor<LoginEvent>(), 1u);

    bus.Unsubscribe(id);
    bus.Publish(LoginEvent{"carol"});

    EXPECT_EQ(calls, 0);
    EXPECT_EQ(bus.HandlerCountFor<LoginEvent>(), 0u);
}

TEST(EventBusTest, UnsubscribeAllClearsEveryType) {
    EventBus bus;
    bus.Subscribe<LoginEvent>([](const LoginEvent&) {});
    bus.Subscribe<LogoutEvent>([](const LogoutEvent&) {});

    bus.UnsubscribeAll();

    EXPECT_EQ(bus.HandlerCountFor<LoginEvent>(), 0u);
    EXPECT_EQ(bus.HandlerCountFor<LogoutEvent>(), 0u);
}

TEST(EventBusTest, HandlerMayUnsubscribeDuringPublish) {
    EventBus bus;
    int calls = 0;
    SubscriptionId id = 0;
    id = bus.Subscribe<LoginEvent>([&](const LoginEvent&) {
        ++calls;
        bus.Unsubscribe(id);
    });

    bus.Publish(LoginEvent{"dave"});
    bus.Publish(LoginEvent{"dave"});

    EXPECT_EQ(calls, 1);
}
