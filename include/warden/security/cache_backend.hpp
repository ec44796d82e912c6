#pragma once

/// @file cache_backend.hpp
/// @brief Key/value cache backend interface and in-memory LRU backend.

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "warden/foundation/security_result.hpp"
#include "warden/security/security_types.hpp"

namespace warden::security {

/// Byte-oriented cache backend (Redis client, memcached, in-process LRU).
///
/// Any call may fail with CacheUnavailable; the CacheHandler then bypasses
/// the cache instead of failing the request.
class ICacheBackend {
public:
    virtual ~ICacheBackend() = default;

    /// Stored bytes, or nullopt on miss or expiry.
    virtual foundation::SecurityResult<std::optional<std::vector<uint8_t>>> get(
        std::string_view key) = 0;

    virtual foundation::SecurityResult<void> set(std::string_view key,
                                                 std::vector<uint8_t> value,
                                                 std::chrono::seconds ttl) = 0;

    virtual foundation::SecurityResult<void> erase(std::string_view key) = 0;

    /// Erase every key starting with @p prefix. @return Number erased.
    virtual foundation::SecurityResult<std::size_t> eraseByPrefix(std::string_view prefix) = 0;
};

/// Thread-safe in-process LRU backend with per-entry TTL.
///
/// Usage:
/// @code
///   InMemoryCacheBackend backend(10000);
///   backend.set("authz:5:alice:default", bytes, std::chrono::seconds(1800));
///   auto hit = backend.get("authz:5:alice:default");
/// @endcode
class InMemoryCacheBackend : public ICacheBackend {
public:
    explicit InMemoryCacheBackend(std::size_t maxEntries = 10000,
                                  TimeSource clock = systemTimeSource());
    ~InMemoryCacheBackend() override;

    InMemoryCacheBackend(const InMemoryCacheBackend&) = delete;
    InMemoryCacheBackend& operator=(const InMemoryCacheBackend&) = delete;

    foundation::SecurityResult<std::optional<std::vector<uint8_t>>> get(
        std::string_view key) override;

    foundation::SecurityResult<void> set(std::string_view key, std::vector<uint8_t> value,
                                         std::chrono::seconds ttl) override;

    foundation::SecurityResult<void> erase(std::string_view key) override;

    foundation::SecurityResult<std::size_t> eraseByPrefix(std::string_view prefix) override;

    /// Simulate an outage: every call fails with CacheUnavailable.
    void setAvailable(bool available) noexcept;

    void clear();

    [[nodiscard]] std::size_t size() const;

    [[nodiscard]] uint64_t hitCount() const;

    [[nodiscard]] uint64_t missCount() const;

    /// Remaining lifetime of @p key, or nullopt when absent.
    [[nodiscard]] std::optional<std::chrono::seconds> ttlOf(std::string_view key) const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace warden::security
