#pragma once

/// @file session_manager.hpp
/// @brief Session lifecycle with absolute and idle expiry and an optional
///        background validation sweep.

#include <atomic>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "warden/foundation/event_bus.hpp"
#include "warden/foundation/security_result.hpp"
#include "warden/security/cache_handler.hpp"
#include "warden/security/security_config.hpp"
#include "warden/security/session_store.hpp"

namespace warden::security {

/// Creates, extends and expires sessions.
///
/// A session is valid iff
/// `now < createdAt + absoluteTimeout && now < lastAccessedAt + idleTimeout`.
/// touch(), get(), invalidate() and the sweep evaluate that predicate and
/// write back under one mutex, so a sweep never evicts a session that a
/// concurrent touch() just extended, and an expired session is never
/// resurrected.
///
/// Example:
/// @code
///   SessionManager sessions(config.session, store, cache, &bus);
///   auto session = sessions.create("alice");
///   auto touched = sessions.touch(session.value().sessionId);
///   if (touched.code() == ErrorCode::SessionExpired) { /* re-authenticate */ }
/// @endcode
class SessionManager {
public:
    /// @param cache may be nullptr; @param bus may be nullptr.
    SessionManager(SessionConfig config,
                   std::shared_ptr<ISessionStore> store,
                   std::shared_ptr<CacheHandler> cache,
                   foundation::EventBus* bus = nullptr,
                   TimeSource clock = systemTimeSource());

    /// Stops the validation thread if running.
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    foundation::SecurityResult<Session> create(const Principal& principal,
                                               std::map<std::string, std::string> attributes = {});

    /// Validate and extend. @return SessionExpired (session removed) or
    /// SessionNotFound.
    foundation::SecurityResult<Session> touch(const std::string& sessionId);

    /// Validate without extending, reading through the cache.
    foundation::SecurityResult<Session> get(const std::string& sessionId);

    /// Remove a session (logout). @return SessionNotFound when absent.
    foundation::SecurityResult<void> invalidate(const std::string& sessionId);

    /// Remove every session of @p principal. @return Number removed.
    std::size_t invalidateAllFor(const Principal& principal);

    /// Evict every expired session from store and cache. @return Number evicted.
    std::size_t validateAll();

    /// Run validateAll() every validationInterval on a dedicated thread.
    void startValidation();

    void stopValidation();

    [[nodiscard]] bool validationRunning() const noexcept;

    /// Shared validity predicate.
    [[nodiscard]] bool isValid(const Session& session, TimePoint now) const noexcept;

    [[nodiscard]] const SessionConfig& config() const noexcept { return config_; }

private:
    /// Remove @p session from store and cache. Caller holds mutex_ and
    /// publishes the matching event after releasing it.
    void removeLocked(const Session& session);

    void publishExpired(const Session& session);

    void cacheSession(const Session& session, TimePoint now);

    void validationLoop();

    SessionConfig config_;
    std::shared_ptr<ISessionStore> store_;
    std::shared_ptr<CacheHandler> cache_;
    foundation::EventBus* bus_;
    TimeSource clock_;

    std::mutex mutex_;

    std::atomic<bool> validating_{false};
    std::mutex wakeMutex_;
    std::condition_variable wake_;
    std::thread validationThread_;
};

} // namespace warden::security
