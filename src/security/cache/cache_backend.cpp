/// @file cache_backend.cpp
/// @brief InMemoryCacheBackend implementation using a doubly-linked list +
///        hash map for O(1) LRU eviction and lookup.

#include "warden/security/cache_backend.hpp"

#include <atomic>
#include <list>
#include <mutex>
#include <unordered_map>

namespace warden::security {

using foundation::ErrorCode;
using foundation::SecurityResult;

// ── Entry stored in the LRU list ────────────────────────────────────────────

namespace {

struct LruEntry {
    std::string key;
    std::vector<uint8_t> value;
    TimePoint expiresAt;
};

} // namespace

// ── Impl ────────────────────────────────────────────────────────────────────

struct InMemoryCacheBackend::Impl {
    std::size_t maxEntries = 0;
    TimeSource clock;

    // LRU list: front = most recently used, back = least recently used.
    std::list<LruEntry> lruList;
    std::unordered_map<std::string, std::list<LruEntry>::iterator> index;

    mutable std::mutex mutex;

    std::atomic<bool> available{true};
    std::atomic<uint64_t> hits{0};
    std::atomic<uint64_t> misses{0};

    void touch(std::list<LruEntry>::iterator it) {
        lruList.splice(lruList.begin(), lruList, it);
    }

    void evictLru() {
        if (lruList.empty()) {
            return;
        }
        index.erase(lruList.back().key);
        lruList.pop_back();
    }

    template <typename T>
    SecurityResult<T> unavailable() const {
        return SecurityResult<T>::err(ErrorCode::CacheUnavailable, "cache backend unavailable");
    }
};

// ── Construction / destruction ──────────────────────────────────────────────

InMemoryCacheBackend::InMemoryCacheBackend(std::size_t maxEntries, TimeSource clock)
    : impl_(std::make_unique<Impl>()) {
    impl_->maxEntries = maxEntries == 0 ? 1 : maxEntries;
    impl_->clock = std::move(clock);
}

InMemoryCacheBackend::~InMemoryCacheBackend() = default;

// ── get() ───────────────────────────────────────────────────────────────────

SecurityResult<std::optional<std::vector<uint8_t>>> InMemoryCacheBackend::get(
    std::string_view key) {
    using Result = SecurityResult<std::optional<std::vector<uint8_t>>>;
    if (!impl_->available.load(std::memory_order_acquire)) {
        return impl_->unavailable<std::optional<std::vector<uint8_t>>>();
    }

    std::lock_guard lock(impl_->mutex);
    auto it = impl_->index.find(std::string(key));
    if (it == impl_->index.end()) {
        impl_->misses.fetch_add(1, std::memory_order_relaxed);
        return Result::ok(std::nullopt);
    }

    auto listIt = it->second;
    if (listIt->expiresAt <= impl_->clock()) {
        impl_->lruList.erase(listIt);
        impl_->index.erase(it);
        impl_->misses.fetch_add(1, std::memory_order_relaxed);
        return Result::ok(std::nullopt);
    }

    impl_->touch(listIt);
    impl_->hits.fetch_add(1, std::memory_order_relaxed);
    return Result::ok(listIt->value);
}

// ── set() ───────────────────────────────────────────────────────────────────

SecurityResult<void> InMemoryCacheBackend::set(std::string_view key, std::vector<uint8_t> value,
                                               std::chrono::seconds ttl) {
    if (!impl_->available.load(std::memory_order_acquire)) {
        return impl_->unavailable<void>();
    }

    std::lock_guard lock(impl_->mutex);
    auto expiresAt = impl_->clock() + ttl;
    auto keyStr = std::string(key);

    auto it = impl_->index.find(keyStr);
    if (it != impl_->index.end()) {
        it->second->value = std::move(value);
        it->second->expiresAt = expiresAt;
        impl_->touch(it->second);
        return SecurityResult<void>::ok();
    }

    if (impl_->lruList.size() >= impl_->maxEntries) {
        impl_->evictLru();
    }

    impl_->lruList.push_front(LruEntry{keyStr, std::move(value), expiresAt});
    impl_->index[keyStr] = impl_->lruList.begin();
    return SecurityResult<void>::ok();
}

// ── erase() / eraseByPrefix() ───────────────────────────────────────────────

SecurityResult<void> InMemoryCacheBackend::erase(std::string_view key) {
    if (!impl_->available.load(std::memory_order_acquire)) {
        return impl_->unavailable<void>();
    }

    std::lock_guard lock(impl_->mutex);
    auto it = impl_->index.find(std::string(key));
    if (it != impl_->index.end()) {
        impl_->lruList.erase(it->second);
        impl_->index.erase(it);
    }
    return SecurityResult<void>::ok();
}

SecurityResult<std::size_t> InMemoryCacheBackend::eraseByPrefix(std::string_view prefix) {
    if (!impl_->available.load(std::memory_order_acquire)) {
        return impl_->unavailable<std::size_t>();
    }

    std::lock_guard lock(impl_->mutex);
    std::size_t count = 0;
    for (auto it = impl_->lruList.begin(); it != impl_->lruList.end();) {
        if (it->key.compare(0, prefix.size(), prefix) == 0) {
            impl_->index.erase(it->key);
            it = impl_->lruList.erase(it);
            ++count;
        } else {
            ++it;
        }
    }
    return SecurityResult<std::size_t>::ok(count);
}

// ── Accessors ───────────────────────────────────────────────────────────────

void InMemoryCacheBackend::setAvailable(bool available) noexcept {
    impl_->available.store(available, std::memory_order_release);
}

void InMemoryCacheBackend::clear() {
    std::lock_guard lock(impl_->mutex);
    impl_->lruList.clear();
    impl_->index.clear();
}

std::size_t InMemoryCacheBackend::size() const {
    std::lock_guard lock(impl_->mutex);
    return impl_->lruList.size();
}

uint64_t InMemoryCacheBackend::hitCount() const {
    return impl_->hits.load(std::memory_order_relaxed);
}

uint64_t InMemoryCacheBackend::missCount() const {
    return impl_->misses.load(std::memory_order_relaxed);
}

std::optional<std::chrono::seconds> InMemoryCacheBackend::ttlOf(std::string_view key) const {
    std::lock_guard lock(impl_->mutex);
    auto it = impl_->index.find(std::string(key));
    if (it == impl_->index.end()) {
        return std::nullopt;
    }
    return std::chrono::duration_cast<std::chrono::seconds>(it->second->expiresAt - impl_->clock());
}

} // namespace warden::security
