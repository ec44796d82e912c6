/// @file security_logger.cpp
/// @brief SecurityLogger implementation wrapping kcenon logger_system.

#include "warden/foundation/security_logger.hpp"

// kcenon logger headers (hidden behind PIMPL)
#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

#include <array>
#include <atomic>
#include <sstream>
#include <string>
#include <string_view>

namespace warden::foundation {

namespace kci = kcenon::common::interfaces;

// ---------------------------------------------------------------------------
// Level mapping: warden -> kcenon
// ---------------------------------------------------------------------------
static kci::log_level mapLevel(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return kci::log_level::trace;
        case LogLevel::Debug:    return kci::log_level::debug;
        case LogLevel::Info:     return kci::log_level::info;
        case LogLevel::Warning:  return kci::log_level::warning;
        case LogLevel::Error:    return kci::log_level::error;
        case LogLevel::Critical: return kci::log_level::critical;
        case LogLevel::Off:      return kci::log_level::off;
    }
    return kci::log_level::info;
}

static constexpr std::array<LogLevel, kLogCategoryCount> kDefaultCategoryLevels = {
    LogLevel::Info,     // Core
    LogLevel::Info,     // Authc
    LogLevel::Info,     // Authz
    LogLevel::Info,     // Session
    LogLevel::Warning,  // Cache
    LogLevel::Info,     // Mfa
    LogLevel::Warning,  // Crypto
    LogLevel::Info      // Audit
};

// ---------------------------------------------------------------------------
// Context serialization
// ---------------------------------------------------------------------------

// Extra keys whose values never reach a log sink.
static constexpr std::array<std::string_view, 6> kRedactedKeys = {
    "password", "secret", "code", "token", "pepper", "cipher_key"};

static bool isRedacted(std::string_view key) {
    for (auto redacted : kRedactedKeys) {
        if (key.find(redacted) != std::string_view::npos) {
            return true;
        }
    }
    return false;
}

static std::string formatContext(const LogContext& ctx) {
    std::ostringstream oss;
    bool first = true;

    auto append = [&](std::string_view key, std::string_view val) {
        if (!first) {
            oss << ", ";
        }
        oss << key << '=' << val;
        first = false;
    };

    if (ctx.principal && !ctx.principal->empty()) {
        append("principal", *ctx.principal);
    }
    if (ctx.sessionId && !ctx.sessionId->empty()) {
        append("session_id", *ctx.sessionId);
    }
    if (ctx.realm && !ctx.realm->empty()) {
        append("realm", *ctx.realm);
    }
    for (const auto& [key, val] : ctx.extra) {
        append(key, isRedacted(key) ? std::string_view("[redacted]") : std::string_view(val));
    }

    return oss.str();
}

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------
struct SecurityLogger::Impl {
    std::array<std::atomic<LogLevel>, kLogCategoryCount> categoryLevels;
    std::array<std::string, kLogCategoryCount> loggerNames;

    Impl() {
        for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
            categoryLevels[i].store(kDefaultCategoryLevels[i], std::memory_order_relaxed);
            loggerNames[i] = std::string("warden.") +
                std::string(logCategoryName(static_cast<LogCategory>(i)));
        }
    }

    std::shared_ptr<kci::ILogger> getLogger(LogCategory cat) const {
        auto idx = static_cast<std::size_t>(cat);
        auto& registry = kci::GlobalLoggerRegistry::instance();
        if (idx >= kLogCategoryCount) {
            return kci::GlobalLoggerRegistry::null_logger();
        }
        auto logger = registry.get_logger(loggerNames[idx]);
        // Unregistered names resolve to the null logger; use the default instead.
        if (!logger || logger == kci::GlobalLoggerRegistry::null_logger()) {
            return registry.get_default_logger();
        }
        return logger;
    }

    void write(LogLevel level, LogCategory cat, const std::string& line) const {
        auto logger = getLogger(cat);
        if (logger) {
            logger->log(mapLevel(level), line);
        }
    }
};

// ---------------------------------------------------------------------------
// Construction / Destruction / Move
// ---------------------------------------------------------------------------
SecurityLogger::SecurityLogger() : impl_(std::make_unique<Impl>()) {}

SecurityLogger::~SecurityLogger() = default;

SecurityLogger::SecurityLogger(SecurityLogger&&) noexcept = default;
SecurityLogger& SecurityLogger::operator=(SecurityLogger&&) noexcept = default;

// ---------------------------------------------------------------------------
// log() / logWithContext()
// ---------------------------------------------------------------------------
void SecurityLogger::log(LogLevel level, LogCategory cat, std::string_view msg) {
    if (!isEnabled(level, cat)) {
        return;
    }

    // Format: [Category] message
    std::string formatted;
    formatted.reserve(msg.size() + 16);
    formatted += '[';
    formatted += logCategoryName(cat);
    formatted += "] ";
    formatted += msg;

    impl_->write(level, cat, formatted);
}

void SecurityLogger::logWithContext(LogLevel level, LogCategory cat,
                                    std::string_view msg, const LogContext& ctx) {
    if (!isEnabled(level, cat)) {
        return;
    }

    std::string ctxStr = formatContext(ctx);

    // Format: [Category] message {key=val, ...}
    std::string formatted;
    formatted.reserve(msg.size() + ctxStr.size() + 20);
    formatted += '[';
    formatted += logCategoryName(cat);
    formatted += "] ";
    formatted += msg;
    if (!ctxStr.empty()) {
        formatted += " {";
        formatted += ctxStr;
        formatted += '}';
    }

    impl_->write(level, cat, formatted);
}

// ---------------------------------------------------------------------------
// Category level control
// ---------------------------------------------------------------------------
void SecurityLogger::setCategoryLevel(LogCategory cat, LogLevel minLevel) {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        impl_->categoryLevels[idx].store(minLevel, std::memory_order_release);
    }
}

LogLevel SecurityLogger::getCategoryLevel(LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        return impl_->categoryLevels[idx].load(std::memory_order_acquire);
    }
    return LogLevel::Off;
}

bool SecurityLogger::isEnabled(LogLevel level, LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx >= kLogCategoryCount || level == LogLevel::Off) {
        return false;
    }
    auto minLevel = impl_->categoryLevels[idx].load(std::memory_order_acquire);
    return static_cast<uint8_t>(level) >= static_cast<uint8_t>(minLevel);
}

// ---------------------------------------------------------------------------
// flush() / instance()
// ---------------------------------------------------------------------------
SecurityResult<void> SecurityLogger::flush() {
    auto& registry = kci::GlobalLoggerRegistry::instance();
    auto logger = registry.get_default_logger();
    auto result = logger->flush();
    if (result.is_err()) {
        return SecurityResult<void>::err(ErrorCode::LoggerFlushFailed, "failed to flush logger");
    }
    return SecurityResult<void>::ok();
}

SecurityLogger& SecurityLogger::instance() {
    static SecurityLogger inst;
    return inst;
}

} // namespace warden::foundation
