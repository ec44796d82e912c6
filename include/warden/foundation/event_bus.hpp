#pragma once

/// @file event_bus.hpp
/// @brief Type-safe synchronous event bus for security lifecycle events.
///
/// Publishers (authenticator, session manager, lockout tracker) and
/// subscribers (cache handler, audit trail) only share event types.

#include <algorithm>
#include <any>
#include <cstdint>
#include <functional>
#include <mutex>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace warden::foundation {

/// Unique identifier for an event subscription.
using SubscriptionId = uint64_t;

/// Synchronous, priority-ordered event bus.
///
/// Handlers run on the publishing thread in priority order (lower value
/// first), subscription order within a priority. Publish() dispatches to a
/// snapshot, so handlers may subscribe or unsubscribe while being called.
///
/// Usage:
/// @code
///   EventBus bus;
///   auto id = bus.Subscribe<SessionStopped>([](const SessionStopped& e) {
///       // drop cached state for e.principal
///   });
///   bus.Publish(SessionStopped{"s-1", "alice"});
///   bus.Unsubscribe(id);
/// @endcode
class EventBus {
public:
    EventBus() = default;
    ~EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    // -- Subscribe ------------------------------------------------------------

    /// Subscribe a handler for events of type E.
    /// @return Subscription ID for Unsubscribe().
    template <typename E>
    SubscriptionId Subscribe(std::function<void(const E&)> handler,
                             int32_t priority = 0) {
        std::lock_guard lock(mutex_);

        auto id = nextId_++;
        auto typeIdx = std::type_index(typeid(E));

        HandlerEntry entry;
        entry.id = id;
        entry.priority = priority;
        entry.handler = [fn = std::move(handler)](const std::any& event) {
            fn(std::any_cast<const E&>(event));
        };

        auto& handlers = handlers_[typeIdx];
        handlers.push_back(std::move(entry));
        std::stable_sort(handlers.begin(), handlers.end(),
                         [](const HandlerEntry& a, const HandlerEntry& b) {
                             return a.priority < b.priority;
                         });

        subscriptionTypes_.insert_or_assign(id, typeIdx);
        return id;
    }

    // -- Unsubscribe ----------------------------------------------------------

    /// Remove a subscription. Unknown IDs are a no-op.
    void Unsubscribe(SubscriptionId id) {
        std::lock_guard lock(mutex_);
        auto typeIt = subscriptionTypes_.find(id);
        if (typeIt == subscriptionTypes_.end()) {
            return;
        }

        auto handlersIt = handlers_.find(typeIt->second);
        if (handlersIt != handlers_.end()) {
            auto& vec = handlersIt->second;
            vec.erase(std::remove_if(vec.begin(), vec.end(),
                                     [id](const HandlerEntry& e) { return e.id == id; }),
                      vec.end());
            if (vec.empty()) {
                handlers_.erase(handlersIt);
            }
        }
        subscriptionTypes_.erase(typeIt);
    }

    void UnsubscribeAll() {
        std::lock_guard lock(mutex_);
        handlers_.clear();
        subscriptionTypes_.clear();
    }

    // -- Publish --------------------------------------------------------------

    template <typename E>
    void Publish(const E& event) {
        std::vector<HandlerEntry> snapshot;
        {
            std::lock_guard lock(mutex_);
            auto it = handlers_.find(std::type_index(typeid(E)));
            if (it == handlers_.end()) {
                return;
            }
            snapshot = it->second;
        }

        std::any wrapped = event;
        for (const auto& entry : snapshot) {
            entry.handler(wrapped);
        }
    }

    // -- Queries --------------------------------------------------------------

    template <typename E>
    [[nodiscard]] std::size_t HandlerCountFor() const {
        std::lock_guard lock(mutex_);
        auto it = handlers_.find(std::type_index(typeid(E)));
        return it == handlers_.end() ? 0 : it->second.size();
    }

private:
    struct HandlerEntry {
        SubscriptionId id = 0;
        int32_t priority = 0;
        std::function<void(const std::any&)> handler;
    };

    std::unordered_map<std::type_index, std::vector<HandlerEntry>> handlers_;
    std::unordered_map<SubscriptionId, std::type_index> subscriptionTypes_;
    SubscriptionId nextId_ = 1;
    mutable std::mutex mutex_;
};

} // namespace warden::foundation
