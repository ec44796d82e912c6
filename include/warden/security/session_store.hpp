#pragma once

/// @file session_store.hpp
/// @brief Session persistence interface and in-memory implementation.

#include <atomic>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "warden/foundation/security_result.hpp"
#include "warden/security/security_types.hpp"

namespace warden::security {

/// Abstract session store. Implementations must be thread-safe.
class ISessionStore {
public:
    virtual ~ISessionStore() = default;

    /// Insert or replace by session id.
    virtual foundation::SecurityResult<void> save(const Session& session) = 0;

    /// @return SessionNotFound when absent.
    [[nodiscard]] virtual foundation::SecurityResult<Session> find(
        const std::string& sessionId) const = 0;

    /// Removing an absent session is not an error.
    virtual foundation::SecurityResult<void> remove(const std::string& sessionId) = 0;

    [[nodiscard]] virtual foundation::SecurityResult<std::vector<Session>> list() const = 0;
};

/// Thread-safe in-memory session store for tests and development.
///
/// setAvailable(false) makes every call fail with StoreUnavailable.
class InMemorySessionStore : public ISessionStore {
public:
    foundation::SecurityResult<void> save(const Session& session) override;

    [[nodiscard]] foundation::SecurityResult<Session> find(
        const std::string& sessionId) const override;

    foundation::SecurityResult<void> remove(const std::string& sessionId) override;

    [[nodiscard]] foundation::SecurityResult<std::vector<Session>> list() const override;

    [[nodiscard]] std::size_t size() const;

    void setAvailable(bool available) noexcept;

private:
    foundation::SecurityResult<void> checkAvailable() const;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Session> sessions_;
    std::atomic<bool> available_{true};
};

} // namespace warden::security
