#pragma once

/// @file cache_handler.hpp
/// @brief TTL-scoped, single-flight cache of credentials, authorization
///        info and sessions.

#include <any>
#include <chrono>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "warden/foundation/event_bus.hpp"
#include "warden/foundation/security_result.hpp"
#include "warden/security/cache_backend.hpp"
#include "warden/security/cache_codec.hpp"
#include "warden/security/security_config.hpp"

namespace warden::security {

/// Cache in front of the account and session stores.
///
/// - Single-flight: concurrent misses on one key run the compute function
///   once; the other callers wait for that result.
/// - Fail-open: a CacheUnavailable backend is bypassed with a warning.
/// - Invalidation wins: invalidating a key while its value is being
///   computed keeps that (possibly stale) value out of the backend.
///
/// Keys: `authc:<len>:<principal>:<realm>`, `authz:<len>:<principal>:<realm>`,
/// `session:<id>`.
///
/// Example:
/// @code
///   CacheHandler cache(backend, config.cache.ttl);
///   auto authz = cache.getOrCompute<AuthorizationRecord>(
///       CacheHandler::authzKey("alice", "default"), TtlClass::AuthzInfo,
///       [&] { return store.findRolesPermissions("alice"); });
/// @endcode
class CacheHandler {
public:
    template <typename T>
    using ComputeFn = std::function<foundation::SecurityResult<T>()>;

    /// Derives a lifetime cap from a freshly computed value.
    template <typename T>
    using TtlCapFn = std::function<std::optional<std::chrono::seconds>(const T&)>;

    /// @param backend nullptr disables caching; every call computes.
    CacheHandler(std::shared_ptr<ICacheBackend> backend, CacheTtlConfig ttl);
    ~CacheHandler();

    CacheHandler(const CacheHandler&) = delete;
    CacheHandler& operator=(const CacheHandler&) = delete;

    /// Cached value for @p key, or the result of @p compute.
    /// Errors from @p compute are returned and never cached.
    /// @param ttlCap upper bound on the entry's lifetime, e.g. the remaining
    ///        lifetime of the record it mirrors.
    template <typename T>
    foundation::SecurityResult<T> getOrCompute(const std::string& key, TtlClass ttlClass,
                                               const ComputeFn<T>& compute,
                                               std::optional<std::chrono::seconds> ttlCap =
                                                   std::nullopt);

    /// As above, with the cap taken from the computed value, for records
    /// that carry their own expiry.
    template <typename T>
    foundation::SecurityResult<T> getOrCompute(const std::string& key, TtlClass ttlClass,
                                               const ComputeFn<T>& compute,
                                               const TtlCapFn<T>& capFor);

    /// Store @p value directly (write-through), bounded like getOrCompute.
    template <typename T>
    void put(const std::string& key, TtlClass ttlClass, const T& value,
             std::optional<std::chrono::seconds> ttlCap = std::nullopt);

    void invalidate(const std::string& key);

    void invalidatePrefix(const std::string& prefix);

    /// Drop cached credentials and authorization info of @p principal in
    /// every realm.
    void invalidatePrincipal(const Principal& principal);

    /// Drop cached authorization info of @p principal in every realm.
    void invalidateAuthorization(const Principal& principal);

    /// Subscribe to session and account events on @p bus. The bus must
    /// outlive this handler.
    void subscribe(foundation::EventBus& bus);

    [[nodiscard]] bool enabled() const noexcept { return backend_ != nullptr; }

    /// TTL configured for @p ttlClass.
    [[nodiscard]] std::chrono::seconds ttlFor(TtlClass ttlClass) const noexcept;

    static std::string credentialKey(const Principal& principal, const std::string& realm);
    static std::string authzKey(const Principal& principal, const std::string& realm);
    static std::string sessionKey(const std::string& sessionId);

private:
    struct InFlight {
        std::promise<std::any> promise;
        std::shared_future<std::any> result;
        bool invalidated = false;
    };

    /// Backend read; nullopt on miss, unavailability or undecodable bytes.
    std::optional<std::vector<uint8_t>> lookup(const std::string& key);

    /// Backend write; caller holds flightMutex_.
    void store(const std::string& key, std::vector<uint8_t> bytes, std::chrono::seconds ttl);

    std::chrono::seconds effectiveTtl(TtlClass ttlClass,
                                      std::optional<std::chrono::seconds> ttlCap) const noexcept;

    void discardUndecodable(const std::string& key, const foundation::SecurityError& error);

    std::shared_ptr<ICacheBackend> backend_;
    CacheTtlConfig ttl_;

    std::mutex flightMutex_;
    std::unordered_map<std::string, std::shared_ptr<InFlight>> flights_;

    foundation::EventBus* bus_ = nullptr;
    std::vector<foundation::SubscriptionId> subscriptions_;
};

// --- Template implementations ---

template <typename T>
foundation::SecurityResult<T> CacheHandler::getOrCompute(
    const std::string& key, TtlClass ttlClass, const ComputeFn<T>& compute,
    std::optional<std::chrono::seconds> ttlCap) {
    return getOrCompute<T>(key, ttlClass, compute,
                           TtlCapFn<T>([ttlCap](const T&) { return ttlCap; }));
}

template <typename T>
foundation::SecurityResult<T> CacheHandler::getOrCompute(
    const std::string& key, TtlClass ttlClass, const ComputeFn<T>& compute,
    const TtlCapFn<T>& capFor) {
    if (!backend_) {
        return compute();
    }

    if (auto cached = lookup(key)) {
        auto decoded = CacheCodec<T>::decode(*cached);
        if (decoded) {
            return decoded;
        }
        discardUndecodable(key, decoded.error());
    }

    std::shared_ptr<InFlight> flight;
    bool leader = false;
    {
        std::lock_guard lock(flightMutex_);
        auto it = flights_.find(key);
        if (it != flights_.end()) {
            flight = it->second;
        } else {
            // A leader may have stored and retired between our miss and
            // taking the lock; check once more before computing.
            if (auto cached = lookup(key)) {
                auto decoded = CacheCodec<T>::decode(*cached);
                if (decoded) {
                    return decoded;
                }
            }
            flight = std::make_shared<InFlight>();
            flight->result = flight->promise.get_future().share();
            flights_.emplace(key, flight);
            leader = true;
        }
    }

    if (!leader) {
        return std::any_cast<foundation::SecurityResult<T>>(flight->result.get());
    }

    std::optional<foundation::SecurityResult<T>> result;
    try {
        result.emplace(compute());
    } catch (...) {
        {
            std::lock_guard lock(flightMutex_);
            flights_.erase(key);
        }
        flight->promise.set_exception(std::current_exception());
        throw;
    }

    {
        std::lock_guard lock(flightMutex_);
        if (result->hasValue() && !flight->invalidated) {
            auto ttl = effectiveTtl(ttlClass, capFor ? capFor(result->value()) : std::nullopt);
            if (ttl.count() > 0) {
                store(key, CacheCodec<T>::encode(result->value()), ttl);
            }
        }
        flights_.erase(key);
    }
    flight->promise.set_value(std::any(*result));
    return std::move(*result);
}

template <typename T>
void CacheHandler::put(const std::string& key, TtlClass ttlClass, const T& value,
                       std::optional<std::chrono::seconds> ttlCap) {
    if (!backend_) {
        return;
    }
    auto ttl = effectiveTtl(ttlClass, ttlCap);
    if (ttl.count() <= 0) {
        invalidate(key);
        return;
    }
    std::lock_guard lock(flightMutex_);
    // A write-through is newer than anything still being computed.
    if (auto it = flights_.find(key); it != flights_.end()) {
        it->second->invalidated = true;
    }
    store(key, CacheCodec<T>::encode(value), ttl);
}

} // namespace warden::security
