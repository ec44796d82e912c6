#include <gtest/gtest.h>

#include <string>

#include "warden/foundation/error_code.hpp"
#include "warden/foundation/security_error.hpp"
#include "warden/foundation/security_result.hpp"

using namespace warden::foundation;

// --- ErrorCode tests ---

TEST(ErrorCodeTest, SubsystemLookup) {
    EXPECT_EQ(errorSubsystem(ErrorCode::Success), "General");
    EXPECT_EQ(errorSubsystem(ErrorCode::InvalidArgument), "General");
    EXPECT_EQ(errorSubsystem(ErrorCode::ConfigurationError), "Config");
    EXPECT_EQ(errorSubsystem(ErrorCode::AuthenticationFailed), "Authc");
    EXPECT_EQ(errorSubsystem(ErrorCode::ExpiredChallenge), "Mfa");
    EXPECT_EQ(errorSubsystem(ErrorCode::PermissionDenied), "Authz");
    EXPECT_EQ(errorSubsystem(ErrorCode::SessionExpired), "Session");
    EXPECT_EQ(errorSubsystem(ErrorCode::StoreUnavailable), "Store");
    EXPECT_EQ(errorSubsystem(ErrorCode::CacheUnavailable), "Cache");
    EXPECT_EQ(errorSubsystem(ErrorCode::CryptoFailure), "Crypto");
    EXPECT_EQ(errorSubsystem(ErrorCode::JobScheduleFailed), "Thread");
    EXPECT_EQ(errorSubsystem(ErrorCode::LoggerFlushFailed), "Logger");
}

TEST(ErrorCodeTest, OnlyTransientErrorsAreRetryable) {
    EXPECT_TRUE(isRetryable(ErrorCode::StoreUnavailable));
    EXPECT_TRUE(isRetryable(ErrorCode::CacheUnavailable));
    EXPECT_TRUE(isRetryable(ErrorCode::Timeout));
    EXPECT_FALSE(isRetryable(ErrorCode::RecordNotFound));
    EXPECT_FALSE(isRetryable(ErrorCode::AuthenticationFailed));
}

// --- SecurityError tests ---

TEST(SecurityErrorTest, DefaultConstruction) {
    SecurityError err;
    EXPECT_EQ(err.code(), ErrorCode::Unknown);
    EXPECT_TRUE(err.message().empty());
    EXPECT_FALSE(err.hasContext());
}

TEST(SecurityErrorTest, CodeAndMessage) {
    SecurityError err(ErrorCode::SessionNotFound, "no such session");
    EXPECT_EQ(err.code(), ErrorCode::SessionNotFound);
    EXPECT_EQ(err.message(), "no such session");
    EXPECT_EQ(err.subsystem(), "Session");
    EXPECT_FALSE(err.retryable());
}

TEST(SecurityErrorTest, WithContext) {
    struct Cause {
        ErrorCode code = ErrorCode::Unknown;
    };
    SecurityError err(ErrorCode::AuthenticationFailed, "authentication failed",
                      Cause{ErrorCode::InvalidCredentials});
    EXPECT_TRUE(err.hasContext());
    auto* cause = err.context<Cause>();
    ASSERT_NE(cause, nullptr);
    EXPECT_EQ(cause->code, ErrorCode::InvalidCredentials);

    // Wrong type returns nullptr
    EXPECT_EQ(err.context<int>(), nullptr);
}

// --- SecurityResult tests ---

TEST(SecurityResultTest, OkValue) {
    auto result = SecurityResult<int>::ok(42);
    EXPECT_TRUE(result.hasValue());
    EXPECT_TRUE(static_cast<bool>(result));
    EXPECT_EQ(result.value(), 42);
    EXPECT_EQ(result.code(), ErrorCode::Success);
}

TEST(SecurityResultTest, ErrorValue) {
    auto result = SecurityResult<int>::err(ErrorCode::InvalidArgument, "bad input");
    EXPECT_TRUE(result.hasError());
    EXPECT_FALSE(static_cast<bool>(result));
    EXPECT_EQ(result.code(), ErrorCode::InvalidArgument);
    EXPECT_EQ(result.error().message(), "bad input");
}

TEST(SecurityResultTest, ValueOr) {
    auto ok = SecurityResult<int>::ok(10);
    auto err = SecurityResult<int>::err(ErrorCode::Timeout, "slow");
    EXPECT_EQ(ok.valueOr(0), 10);
    EXPECT_EQ(err.valueOr(0), 0);
}

TEST(SecurityResultTest, MoveOutValue) {
    auto result = SecurityResult<std::string>::ok("alice");
    std::string principal = std::move(result).value();
    EXPECT_EQ(principal, "alice");
}

TEST(SecurityResultTest, VoidOk) {
    auto result = SecurityResult<void>::ok();
    EXPECT_TRUE(result.hasValue());
    EXPECT_EQ(result.code(), ErrorCode::Success);
}

TEST(SecurityResultTest, VoidError) {
    auto result = SecurityResult<void>::err(ErrorCode::Timeout, "timed out");
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.code(), ErrorCode::Timeout);
    EXPECT_TRUE(result.error().retryable());
}
