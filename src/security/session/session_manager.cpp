/// @file session_manager.cpp
/// @brief SessionManager implementation.

#include "warden/security/session_manager.hpp"

#include "warden/foundation/security_logger.hpp"
#include "warden/security/security_events.hpp"

#include "../crypto/crypto_utils.hpp"

#include <algorithm>
#include <vector>

namespace warden::security {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using foundation::SecurityResult;

namespace {

constexpr std::size_t kSessionIdBytes = 32;

LogContext sessionContext(const Session& session) {
    LogContext ctx;
    ctx.principal = session.principal;
    ctx.sessionId = session.sessionId;
    return ctx;
}

std::chrono::seconds remainingLifetime(const Session& session, TimePoint now) {
    return std::chrono::duration_cast<std::chrono::seconds>(session.absoluteExpiry - now);
}

} // namespace

SessionManager::SessionManager(SessionConfig config,
                               std::shared_ptr<ISessionStore> store,
                               std::shared_ptr<CacheHandler> cache,
                               foundation::EventBus* bus,
                               TimeSource clock)
    : config_(std::move(config)),
      store_(std::move(store)),
      cache_(std::move(cache)),
      bus_(bus),
      clock_(std::move(clock)) {}

SessionManager::~SessionManager() {
    stopValidation();
}

bool SessionManager::isValid(const Session& session, TimePoint now) const noexcept {
    return now < session.createdAt + config_.absoluteTimeout &&
           now < session.lastAccessedAt + config_.idleTimeout;
}

// ---------------------------------------------------------------------------
// Internal helpers
// ---------------------------------------------------------------------------

void SessionManager::cacheSession(const Session& session, TimePoint now) {
    if (!cache_) {
        return;
    }
    // Never let the cached copy outlive the session's absolute lifetime.
    cache_->put(CacheHandler::sessionKey(session.sessionId), TtlClass::Session, session,
                remainingLifetime(session, now));
}

void SessionManager::removeLocked(const Session& session) {
    auto removed = store_->remove(session.sessionId);
    if (!removed) {
        WARDEN_LOG_CTX(LogLevel::Warning, LogCategory::Session,
                       "session store remove failed: " + std::string(removed.error().message()),
                       sessionContext(session));
    }
    if (cache_) {
        cache_->invalidate(CacheHandler::sessionKey(session.sessionId));
    }
}

void SessionManager::publishExpired(const Session& session) {
    WARDEN_LOG_CTX(LogLevel::Info, LogCategory::Session, "session expired", sessionContext(session));
    if (bus_) {
        bus_->Publish(SessionExpired{session.sessionId, session.principal});
    }
}

// ---------------------------------------------------------------------------
// create / touch / get / invalidate
// ---------------------------------------------------------------------------

SecurityResult<Session> SessionManager::create(const Principal& principal,
                                               std::map<std::string, std::string> attributes) {
    auto idBytes = detail::randomBytes(kSessionIdBytes);
    if (idBytes.empty()) {
        return SecurityResult<Session>::err(ErrorCode::CryptoFailure,
                                            "session id generation failed");
    }

    const auto now = clock_();
    Session session;
    session.sessionId = detail::base64UrlEncode(idBytes);
    session.principal = principal;
    session.createdAt = now;
    session.lastAccessedAt = now;
    session.absoluteExpiry = now + config_.absoluteTimeout;
    session.idleExpiry = now + config_.idleTimeout;
    session.attributes = std::move(attributes);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto saved = store_->save(session);
        if (!saved) {
            return SecurityResult<Session>::err(saved.error());
        }
        cacheSession(session, now);
    }

    WARDEN_LOG_CTX(LogLevel::Info, LogCategory::Session, "session started", sessionContext(session));
    if (bus_) {
        bus_->Publish(SessionStarted{session.sessionId, session.principal});
    }
    return SecurityResult<Session>::ok(std::move(session));
}

SecurityResult<Session> SessionManager::touch(const std::string& sessionId) {
    std::optional<Session> expired;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto found = store_->find(sessionId);
        if (!found) {
            return found;
        }
        auto session = std::move(found).value();

        const auto now = clock_();
        if (!isValid(session, now)) {
            removeLocked(session);
            expired = std::move(session);
        } else {
            session.lastAccessedAt = now;
            session.idleExpiry = std::min(now + config_.idleTimeout, session.absoluteExpiry);
            auto saved = store_->save(session);
            if (!saved) {
                return SecurityResult<Session>::err(saved.error());
            }
            cacheSession(session, now);
            return SecurityResult<Session>::ok(std::move(session));
        }
    }

    publishExpired(*expired);
    return SecurityResult<Session>::err(ErrorCode::SessionExpired, "session expired");
}

SecurityResult<Session> SessionManager::get(const std::string& sessionId) {
    SecurityResult<Session> found = cache_
        ? cache_->getOrCompute<Session>(
              CacheHandler::sessionKey(sessionId), TtlClass::Session,
              [&] { return store_->find(sessionId); },
              [this](const Session& session) -> std::optional<std::chrono::seconds> {
                  return remainingLifetime(session, clock_());
              })
        : store_->find(sessionId);
    if (!found) {
        return found;
    }
    if (isValid(found.value(), clock_())) {
        return found;
    }

    // The cached copy may predate a touch(); decide on the stored record.
    std::optional<Session> expired;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto stored = store_->find(sessionId);
        if (!stored) {
            if (cache_) {
                cache_->invalidate(CacheHandler::sessionKey(sessionId));
            }
            return SecurityResult<Session>::err(ErrorCode::SessionExpired, "session expired");
        }
        const auto now = clock_();
        if (isValid(stored.value(), now)) {
            cacheSession(stored.value(), now);
            return stored;
        }
        removeLocked(stored.value());
        expired = std::move(stored).value();
    }
    publishExpired(*expired);
    return SecurityResult<Session>::err(ErrorCode::SessionExpired, "session expired");
}

SecurityResult<void> SessionManager::invalidate(const std::string& sessionId) {
    Session session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto found = store_->find(sessionId);
        if (!found) {
            return SecurityResult<void>::err(found.error());
        }
        session = std::move(found).value();
        removeLocked(session);
    }

    WARDEN_LOG_CTX(LogLevel::Info, LogCategory::Session, "session stopped", sessionContext(session));
    if (bus_) {
        bus_->Publish(SessionStopped{session.sessionId, session.principal});
    }
    return SecurityResult<void>::ok();
}

std::size_t SessionManager::invalidateAllFor(const Principal& principal) {
    std::vector<Session> removed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto all = store_->list();
        if (!all) {
            WARDEN_LOG_ERROR(LogCategory::Session,
                             "session revocation failed: " + std::string(all.error().message()));
            return 0;
        }
        for (const auto& session : all.value()) {
            if (session.principal == principal) {
                removeLocked(session);
                removed.push_back(session);
            }
        }
    }

    for (const auto& session : removed) {
        if (bus_) {
            bus_->Publish(SessionStopped{session.sessionId, session.principal});
        }
    }
    LogContext ctx;
    ctx.principal = principal;
    ctx.extra["count"] = std::to_string(removed.size());
    WARDEN_LOG_CTX(LogLevel::Info, LogCategory::Audit, "sessions revoked", ctx);
    return removed.size();
}

// ---------------------------------------------------------------------------
// Validation sweep
// ---------------------------------------------------------------------------

std::size_t SessionManager::validateAll() {
    std::vector<Session> expired;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto all = store_->list();
        if (!all) {
            WARDEN_LOG_WARN(LogCategory::Session,
                            "validation sweep skipped: " + std::string(all.error().message()));
            return 0;
        }
        const auto now = clock_();
        for (const auto& session : all.value()) {
            if (!isValid(session, now)) {
                removeLocked(session);
                expired.push_back(session);
            }
        }
    }

    for (const auto& session : expired) {
        publishExpired(session);
    }
    if (!expired.empty()) {
        WARDEN_LOG_DEBUG(LogCategory::Session,
                         "validation sweep evicted " + std::to_string(expired.size()));
    }
    return expired.size();
}

void SessionManager::startValidation() {
    if (validating_.exchange(true)) {
        return;
    }
    validationThread_ = std::thread([this]() { validationLoop(); });
    WARDEN_LOG_INFO(LogCategory::Session,
                    "session validation every " +
                        std::to_string(config_.validationInterval.count()) + "s");
}

void SessionManager::stopValidation() {
    if (!validating_.exchange(false)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(wakeMutex_);
    }
    wake_.notify_all();
    if (validationThread_.joinable()) {
        validationThread_.join();
    }
}

bool SessionManager::validationRunning() const noexcept {
    return validating_.load(std::memory_order_relaxed);
}

void SessionManager::validationLoop() {
    std::unique_lock<std::mutex> lock(wakeMutex_);
    while (validating_.load()) {
        wake_.wait_for(lock, config_.validationInterval, [this] { return !validating_.load(); });
        if (!validating_.load()) {
            break;
        }
        lock.unlock();
        validateAll();
        lock.lock();
    }
}

} // namespace warden::security
