#pragma once

/// @file security_logger.hpp
/// @brief SecurityLogger wrapping kcenon logger_system for structured,
///        category-filtered logging of security decisions.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "warden/foundation/security_result.hpp"

namespace warden::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level internally.
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Log categories, one per security subsystem.
///
/// Audit is reserved for records that feed security review (lockouts,
/// authentication failure causes, revocations). It never carries secrets.
enum class LogCategory : uint8_t {
    Core    = 0, ///< Startup, configuration, wiring
    Authc   = 1, ///< Credential verification and realms
    Authz   = 2, ///< Permission and role checks
    Session = 3, ///< Session lifecycle
    Cache   = 4, ///< Cache handler and backends
    Mfa     = 5, ///< Second-factor challenges
    Crypto  = 6, ///< Hashing, sealing, signing
    Audit   = 7  ///< Security audit trail
};

inline constexpr std::size_t kLogCategoryCount = 8;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Authc", "Authz", "Session", "Cache", "Mfa", "Crypto", "Audit"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Structured context attached to a log entry.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.principal = "alice";
///   ctx.extra["failures"] = "3";
///   logger.logWithContext(LogLevel::Warning, LogCategory::Audit,
///                         "account locked", ctx);
/// @endcode
struct LogContext {
    std::optional<std::string> principal;
    std::optional<std::string> sessionId;
    std::optional<std::string> realm;
    std::unordered_map<std::string, std::string> extra;
};

/// Security logger on top of kcenon's logging system.
///
/// Each category is routed to a named logger ("warden.<Category>") in the
/// kcenon GlobalLoggerRegistry, falling back to the registry default.
/// Uses PIMPL to keep kcenon headers out of the public API.
///
/// Default levels:
/// | Category | Default Level |
/// |----------|---------------|
/// | Core     | Info          |
/// | Authc    | Info          |
/// | Authz    | Info          |
/// | Session  | Info          |
/// | Cache    | Warning       |
/// | Mfa      | Info          |
/// | Crypto   | Warning       |
/// | Audit    | Info          |
class SecurityLogger {
public:
    SecurityLogger();
    ~SecurityLogger();

    SecurityLogger(const SecurityLogger&) = delete;
    SecurityLogger& operator=(const SecurityLogger&) = delete;
    SecurityLogger(SecurityLogger&&) noexcept;
    SecurityLogger& operator=(SecurityLogger&&) noexcept;

    /// Log a message; no-op below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with structured context appended as key=value pairs.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush the default kcenon logger.
    SecurityResult<void> flush();

    /// Process-wide logger instance.
    static SecurityLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace warden::foundation

// ---------------------------------------------------------------------------
// Convenience macros (global; define WARDEN_MIN_LOG_LEVEL to strip levels
// at compile time: 0=Trace ... 6=Off)
// ---------------------------------------------------------------------------

#ifndef WARDEN_MIN_LOG_LEVEL
    #define WARDEN_MIN_LOG_LEVEL 0
#endif

#define WARDEN_LOG(level, cat, msg)                                                       \
    do {                                                                                  \
        _Pragma("GCC diagnostic push")                                                    \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                               \
        if (static_cast<int>(level) >= WARDEN_MIN_LOG_LEVEL &&                            \
            ::warden::foundation::SecurityLogger::instance().isEnabled((level), (cat)))   \
        {                                                                                 \
            ::warden::foundation::SecurityLogger::instance().log((level), (cat), (msg));  \
        }                                                                                 \
        _Pragma("GCC diagnostic pop")                                                     \
    } while (0)

#define WARDEN_LOG_CTX(level, cat, msg, ctx)                                              \
    do {                                                                                  \
        if (static_cast<int>(level) >= WARDEN_MIN_LOG_LEVEL &&                            \
            ::warden::foundation::SecurityLogger::instance().isEnabled((level), (cat)))   \
        {                                                                                 \
            ::warden::foundation::SecurityLogger::instance().logWithContext(              \
                (level), (cat), (msg), (ctx));                                            \
        }                                                                                 \
    } while (0)

#define WARDEN_LOG_DEBUG(cat, msg) \
    WARDEN_LOG(::warden::foundation::LogLevel::Debug, (cat), (msg))

#define WARDEN_LOG_INFO(cat, msg) \
    WARDEN_LOG(::warden::foundation::LogLevel::Info, (cat), (msg))

#define WARDEN_LOG_WARN(cat, msg) \
    WARDEN_LOG(::warden::foundation::LogLevel::Warning, (cat), (msg))

#define WARDEN_LOG_ERROR(cat, msg) \
    WARDEN_LOG(::warden::foundation::LogLevel::Error, (cat), (msg))
