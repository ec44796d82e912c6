#include <gtest/gtest.h>

#include <atomic>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "warden/foundation/error_code.hpp"
#include "warden/foundation/security_logger.hpp"

// kcenon headers for test infrastructure (mock logger registration)
#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

using namespace warden::foundation;
using kcenon::common::interfaces::log_level;
using kcenon::common::interfaces::ILogger;
using kcenon::common::interfaces::GlobalLoggerRegistry;

// ---------------------------------------------------------------------------
// MockLogger: captures log messages for assertion
// ---------------------------------------------------------------------------

struct LogRecord {
    log_level level;
    std::string message;
};

class MockLogger : public ILogger {
public:
    kcenon::common::VoidResult log(log_level level,
                                    const std::string& message) override {
        std::lock_guard lock(mutex_);
        records_.push_back({level, message});
        logCount_.fetch_add(1, std::memory_order_relaxed);
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    kcenon::common::VoidResult log(
        log_level level, std::string_view message,
        const kcenon::common::interfaces::source_location& /*loc*/) override {
        return log(level, std::string(message));
    }

    kcenon::common::VoidResult log(
        const kcenon::common::interfaces::log_entry& entry) override {
        return log(entry.level, entry.message);
    }

    bool is_enabled(log_level level) const override {
        return level >= minLevel_.load(std::memory_order_acquire);
    }

    kcenon::common::VoidResult set_level(log_level level) override {
        minLevel_.store(level, std::memory_order_release);
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    log_level get_level() const override {
        return minLevel_.load(std::memory_order_acquire);
    }

    kcenon::common::VoidResult flush() override {
        flushed_.store(true, std::memory_order_release);
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    std::vector<LogRecord> records() const {
        std::lock_guard lock(mutex_);
        return records_;
    }

    std::size_t logCount() const {
        return logCount_.load(std::memory_order_relaxed);
    }

    bool wasFlushed() const {
        return flushed_.load(std::memory_order_acquire);
    }

    void reset() {
        std::lock_guard lock(mutex_);
        records_.clear();
        logCount_.store(0, std::memory_order_relaxed);
        flushed_.store(false, std::memory_order_relaxed);
    }

private:
    mutable std::mutex mutex_;
    std::vector<LogRecord> records_;
    std::atomic<std::size_t> logCount_{0};
    std::atomic<log_level> minLevel_{log_level::trace};
    std::atomic<bool> flushed_{false};
};

// ---------------------------------------------------------------------------
// Test fixture: registers a MockLogger as the default logger
// ---------------------------------------------------------------------------

class SecurityLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto& registry = GlobalLoggerRegistry::instance();
        registry.clear();
        mockLogger_ = std::make_shared<MockLogger>();
        registry.set_default_logger(mockLogger_);
    }

    void TearDown() override {
        GlobalLoggerRegistry::instance().clear();
    }

    std::shared_ptr<MockLogger> mockLogger_;
};

// ---------------------------------------------------------------------------
// LogCategory / LogLevel helpers
// ---------------------------------------------------------------------------

TEST(LogCategoryTest, AllCategoryNamesAreValid) {
    EXPECT_EQ(logCategoryName(LogCategory::Core), "Core");
    EXPECT_EQ(logCategoryName(LogCategory::Authc), "Authc");
    EXPECT_EQ(logCategoryName(LogCategory::Authz), "Authz");
    EXPECT_EQ(logCategoryName(LogCategory::Session), "Session");
    EXPECT_EQ(logCategoryName(LogCategory::Cache), "Cache");
    EXPECT_EQ(logCategoryName(LogCategory::Mfa), "Mfa");
    EXPECT_EQ(logCategoryName(LogCategory::Crypto), "Crypto");
    EXPECT_EQ(logCategoryName(LogCategory::Audit), "Audit");
    EXPECT_EQ(logCategoryName(static_cast<LogCategory>(42)), "Unknown");
}

TEST(LogLevelTest, AllLevelNamesAreValid) {
    EXPECT_EQ(logLevelName(LogLevel::Trace), "TRACE");
    EXPECT_EQ(logLevelName(LogLevel::Warning), "WARNING");
    EXPECT_EQ(logLevelName(LogLevel::Off), "OFF");
}

// ---------------------------------------------------------------------------
// Category levels
// ---------------------------------------------------------------------------

TEST(SecurityLoggerBasicTest, DefaultCategoryLevels) {
    SecurityLogger logger;
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Core), LogLevel::Info);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Authc), LogLevel::Info);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Cache), LogLevel::Warning);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Crypto), LogLevel::Warning);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Audit), LogLevel::Info);
}

TEST(SecurityLoggerBasicTest, SetCategoryLevelChangesFiltering) {
    SecurityLogger logger;
    logger.setCategoryLevel(LogCategory::Session, LogLevel::Trace);
    EXPECT_TRUE(logger.isEnabled(LogLevel::Trace, LogCategory::Session));

    logger.setCategoryLevel(LogCategory::Session, LogLevel::Error);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Warning, LogCategory::Session));
    EXPECT_TRUE(logger.isEnabled(LogLevel::Error, LogCategory::Session));
}

TEST(SecurityLoggerBasicTest, InvalidCategoryReturnsOff) {
    SecurityLogger logger;
    auto invalid = static_cast<LogCategory>(99);
    EXPECT_EQ(logger.getCategoryLevel(invalid), LogLevel::Off);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Critical, invalid));
}

// ---------------------------------------------------------------------------
// Formatting
// ---------------------------------------------------------------------------

TEST_F(SecurityLoggerTest, LogFormatsMessageWithCategory) {
    SecurityLogger logger;
    logger.log(LogLevel::Info, LogCategory::Authc, "login succeeded");

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].level, log_level::info);
    EXPECT_EQ(records[0].message, "[Authc] login succeeded");
}

TEST_F(SecurityLoggerTest, LogFiltersMessagesBelowLevel) {
    SecurityLogger logger;
    logger.log(LogLevel::Info, LogCategory::Cache, "filtered");
    EXPECT_TRUE(mockLogger_->records().empty());
}

TEST_F(SecurityLoggerTest, LogWithContextIncludesFields) {
    SecurityLogger logger;

    LogContext ctx;
    ctx.principal = "alice";
    ctx.sessionId = "s-1";
    ctx.realm = "default";
    ctx.extra["failed_count"] = "3";
    logger.logWithContext(LogLevel::Warning, LogCategory::Audit, "account locked", ctx);

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    const auto& msg = records[0].message;
    EXPECT_EQ(records[0].level, log_level::warning);
    EXPECT_NE(msg.find("[Audit] account locked {"), std::string::npos);
    EXPECT_NE(msg.find("principal=alice"), std::string::npos);
    EXPECT_NE(msg.find("session_id=s-1"), std::string::npos);
    EXPECT_NE(msg.find("realm=default"), std::string::npos);
    EXPECT_NE(msg.find("failed_count=3"), std::string::npos);
}

TEST_F(SecurityLoggerTest, SecretLookingFieldsAreRedacted) {
    SecurityLogger logger;

    LogContext ctx;
    ctx.extra["password"] = "hunter2";
    ctx.extra["totp_code"] = "123456";
    ctx.extra["tag"] = "v1";
    logger.logWithContext(LogLevel::Info, LogCategory::Mfa, "challenge", ctx);

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    const auto& msg = records[0].message;
    EXPECT_EQ(msg.find("hunter2"), std::string::npos);
    EXPECT_EQ(msg.find("123456"), std::string::npos);
    EXPECT_NE(msg.find("password=[redacted]"), std::string::npos);
    EXPECT_NE(msg.find("tag=v1"), std::string::npos);
}

TEST_F(SecurityLoggerTest, LogWithEmptyContextOmitsBraces) {
    SecurityLogger logger;
    LogContext ctx;
    logger.logWithContext(LogLevel::Info, LogCategory::Core, "ready", ctx);

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].message, "[Core] ready");
}

TEST_F(SecurityLoggerTest, NamedCategoryLoggerTakesPrecedence) {
    auto auditLogger = std::make_shared<MockLogger>();
    ASSERT_TRUE(GlobalLoggerRegistry::instance().register_logger("warden.Audit", auditLogger).is_ok());

    SecurityLogger logger;
    logger.log(LogLevel::Info, LogCategory::Audit, "audited");
    logger.log(LogLevel::Info, LogCategory::Core, "general");

    ASSERT_EQ(auditLogger->records().size(), 1u);
    EXPECT_EQ(auditLogger->records()[0].message, "[Audit] audited");
    ASSERT_EQ(mockLogger_->records().size(), 1u);
    EXPECT_EQ(mockLogger_->records()[0].message, "[Core] general");
}

TEST_F(SecurityLoggerTest, FlushDelegatesToLogger) {
    SecurityLogger logger;
    auto result = logger.flush();
    EXPECT_TRUE(result.hasValue());
    EXPECT_TRUE(mockLogger_->wasFlushed());
}

// ---------------------------------------------------------------------------
// WARDEN_LOG macros
// ---------------------------------------------------------------------------

TEST_F(SecurityLoggerTest, MacroLogsWhenEnabled) {
    SecurityLogger::instance().setCategoryLevel(LogCategory::Session, LogLevel::Debug);

    WARDEN_LOG_DEBUG(LogCategory::Session, "macro test");

    bool found = false;
    for (const auto& r : mockLogger_->records()) {
        if (r.message.find("macro test") != std::string::npos) {
            found = true;
        }
    }
    EXPECT_TRUE(found);
    SecurityLogger::instance().setCategoryLevel(LogCategory::Session, LogLevel::Info);
}

TEST_F(SecurityLoggerTest, MacroSkipsWhenDisabled) {
    SecurityLogger::instance().setCategoryLevel(LogCategory::Crypto, LogLevel::Error);
    mockLogger_->reset();

    WARDEN_LOG_DEBUG(LogCategory::Crypto, "should not appear");

    EXPECT_TRUE(mockLogger_->records().empty());
    SecurityLogger::instance().setCategoryLevel(LogCategory::Crypto, LogLevel::Warning);
}

TEST_F(SecurityLoggerTest, ConcurrentLoggingIsSafe) {
    SecurityLogger logger;

    constexpr int kThreads = 8;
    constexpr int kMessagesPerThread = 100;

    std::vector<std::thread> threads;
    threads.reserve(kThreads);
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&logger, t] {
            for (int i = 0; i < kMessagesPerThread; ++i) {
                logger.log(LogLevel::Info, LogCategory::Authz,
                           "thread " + std::to_string(t) + " msg " + std::to_string(i));
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    EXPECT_EQ(mockLogger_->logCount(), static_cast<std::size_t>(kThreads * kMessagesPerThread));
}
