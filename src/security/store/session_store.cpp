/// @file session_store.cpp
/// @brief InMemorySessionStore implementation.

#include "warden/security/session_store.hpp"

namespace warden::security {

using foundation::ErrorCode;
using foundation::SecurityResult;

SecurityResult<void> InMemorySessionStore::checkAvailable() const {
    if (!available_.load(std::memory_order_acquire)) {
        return SecurityResult<void>::err(ErrorCode::StoreUnavailable, "session store unavailable");
    }
    return SecurityResult<void>::ok();
}

SecurityResult<void> InMemorySessionStore::save(const Session& session) {
    auto available = checkAvailable();
    if (!available) {
        return available;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    sessions_[session.sessionId] = session;
    return SecurityResult<void>::ok();
}

SecurityResult<Session> InMemorySessionStore::find(const std::string& sessionId) const {
    auto available = checkAvailable();
    if (!available) {
        return SecurityResult<Session>::err(available.error());
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(sessionId);
    if (it == sessions_.end()) {
        return SecurityResult<Session>::err(ErrorCode::SessionNotFound, "session not found");
    }
    return SecurityResult<Session>::ok(it->second);
}

SecurityResult<void> InMemorySessionStore::remove(const std::string& sessionId) {
    auto available = checkAvailable();
    if (!available) {
        return available;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    sessions_.erase(sessionId);
    return SecurityResult<void>::ok();
}

SecurityResult<std::vector<Session>> InMemorySessionStore::list() const {
    auto available = checkAvailable();
    if (!available) {
        return SecurityResult<std::vector<Session>>::err(available.error());
    }
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Session> out;
    out.reserve(sessions_.size());
    for (const auto& [_, session] : sessions_) {
        out.push_back(session);
    }
    return SecurityResult<std::vector<Session>>::ok(std::move(out));
}

std::size_t InMemorySessionStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

void InMemorySessionStore::setAvailable(bool available) noexcept {
    available_.store(available, std::memory_order_release);
}

} // namespace warden::security
