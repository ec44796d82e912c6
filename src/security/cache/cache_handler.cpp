/// @file cache_handler.cpp
/// @brief CacheHandler implementation: backend access, TTL policy,
///        invalidation and event subscriptions.

#include "warden/security/cache_handler.hpp"

#include "warden/foundation/security_logger.hpp"
#include "warden/security/security_events.hpp"

#include <algorithm>

namespace warden::security {

using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

namespace {

constexpr const char* kCredentialPrefix = "authc:";
constexpr const char* kAuthzPrefix = "authz:";
constexpr const char* kSessionPrefix = "session:";

// `<length>:<principal>:` so that no principal's segment is a prefix of
// another's, even when principals contain ':'.
std::string principalSegment(const Principal& principal) {
    return std::to_string(principal.size()) + ":" + principal + ":";
}

void warnUnavailable(std::string_view operation, const foundation::SecurityError& error) {
    WARDEN_LOG_WARN(LogCategory::Cache, "cache " + std::string(operation) +
                                            " bypassed: " + std::string(error.message()));
}

} // namespace

CacheHandler::CacheHandler(std::shared_ptr<ICacheBackend> backend, CacheTtlConfig ttl)
    : backend_(std::move(backend)), ttl_(ttl) {}

CacheHandler::~CacheHandler() {
    if (bus_) {
        for (auto id : subscriptions_) {
            bus_->Unsubscribe(id);
        }
    }
}

// ---------------------------------------------------------------------------
// Keys / TTL
// ---------------------------------------------------------------------------

std::string CacheHandler::credentialKey(const Principal& principal, const std::string& realm) {
    return kCredentialPrefix + principalSegment(principal) + realm;
}

std::string CacheHandler::authzKey(const Principal& principal, const std::string& realm) {
    return kAuthzPrefix + principalSegment(principal) + realm;
}

std::string CacheHandler::sessionKey(const std::string& sessionId) {
    return kSessionPrefix + sessionId;
}

std::chrono::seconds CacheHandler::ttlFor(TtlClass ttlClass) const noexcept {
    switch (ttlClass) {
        case TtlClass::Credentials: return ttl_.credentialsTtl;
        case TtlClass::AuthzInfo:   return ttl_.authzInfoTtl;
        case TtlClass::Session:     return ttl_.sessionAbsoluteTtl;
        case TtlClass::Absolute:    return ttl_.absoluteTtl;
    }
    return ttl_.absoluteTtl;
}

std::chrono::seconds CacheHandler::effectiveTtl(
    TtlClass ttlClass, std::optional<std::chrono::seconds> ttlCap) const noexcept {
    auto ttl = std::min(ttlFor(ttlClass), ttl_.absoluteTtl);
    if (ttlCap) {
        ttl = std::min(ttl, *ttlCap);
    }
    return ttl;
}

// ---------------------------------------------------------------------------
// Backend access
// ---------------------------------------------------------------------------

std::optional<std::vector<uint8_t>> CacheHandler::lookup(const std::string& key) {
    auto hit = backend_->get(key);
    if (!hit) {
        warnUnavailable("read", hit.error());
        return std::nullopt;
    }
    return std::move(hit).value();
}

void CacheHandler::store(const std::string& key, std::vector<uint8_t> bytes,
                         std::chrono::seconds ttl) {
    auto stored = backend_->set(key, std::move(bytes), ttl);
    if (!stored) {
        warnUnavailable("write", stored.error());
    }
}

void CacheHandler::discardUndecodable(const std::string& key,
                                      const foundation::SecurityError& error) {
    WARDEN_LOG_WARN(LogCategory::Cache, "dropping undecodable entry " + key + ": " +
                                            std::string(error.message()));
    auto erased = backend_->erase(key);
    if (!erased) {
        warnUnavailable("erase", erased.error());
    }
}

// ---------------------------------------------------------------------------
// Invalidation
// ---------------------------------------------------------------------------

void CacheHandler::invalidate(const std::string& key) {
    if (!backend_) {
        return;
    }
    std::lock_guard lock(flightMutex_);
    if (auto it = flights_.find(key); it != flights_.end()) {
        it->second->invalidated = true;
    }
    auto erased = backend_->erase(key);
    if (!erased) {
        warnUnavailable("erase", erased.error());
    }
}

void CacheHandler::invalidatePrefix(const std::string& prefix) {
    if (!backend_) {
        return;
    }
    std::lock_guard lock(flightMutex_);
    for (auto& [key, flight] : flights_) {
        if (key.compare(0, prefix.size(), prefix) == 0) {
            flight->invalidated = true;
        }
    }
    auto erased = backend_->eraseByPrefix(prefix);
    if (!erased) {
        warnUnavailable("erase", erased.error());
    }
}

void CacheHandler::invalidatePrincipal(const Principal& principal) {
    invalidatePrefix(kCredentialPrefix + principalSegment(principal));
    invalidateAuthorization(principal);
}

void CacheHandler::invalidateAuthorization(const Principal& principal) {
    invalidatePrefix(kAuthzPrefix + principalSegment(principal));
}

// ---------------------------------------------------------------------------
// Events
// ---------------------------------------------------------------------------

void CacheHandler::subscribe(foundation::EventBus& bus) {
    bus_ = &bus;

    subscriptions_.push_back(bus.Subscribe<SessionStopped>([this](const SessionStopped& e) {
        invalidate(sessionKey(e.sessionId));
        invalidateAuthorization(e.principal);
    }));
    subscriptions_.push_back(bus.Subscribe<SessionExpired>([this](const SessionExpired& e) {
        invalidate(sessionKey(e.sessionId));
        invalidateAuthorization(e.principal);
    }));
    subscriptions_.push_back(
        bus.Subscribe<AuthenticationSucceeded>([this](const AuthenticationSucceeded& e) {
            invalidateAuthorization(e.principal);
        }));
    subscriptions_.push_back(bus.Subscribe<AccountChanged>([this](const AccountChanged& e) {
        LogContext ctx;
        ctx.principal = e.principal;
        WARDEN_LOG_CTX(LogLevel::Debug, LogCategory::Cache, "account changed, dropping entries", ctx);
        invalidatePrincipal(e.principal);
    }));
}

} // namespace warden::security
