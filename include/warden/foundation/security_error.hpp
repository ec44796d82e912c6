#pragma once

/// @file security_error.hpp
/// @brief Error type used with Result<T, SecurityError>.

#include <any>
#include <string>
#include <string_view>
#include <utility>

#include "warden/foundation/error_code.hpp"

namespace warden::foundation {

/// Error carrying a categorized code, a message that is safe to show to
/// the caller, and optional type-erased context for internal auditing.
///
/// Authentication failures keep their precise cause in the context so the
/// audit log can record it while the caller only ever sees the generic
/// message.
class SecurityError {
public:
    SecurityError() = default;

    explicit SecurityError(ErrorCode code)
        : code_(code) {}

    SecurityError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    SecurityError(ErrorCode code, std::string message, std::any context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {}

    /// The categorized error code.
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    /// Human-readable error description.
    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /// The subsystem that produced this error.
    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    /// Access typed context data (nullptr on type mismatch or when empty).
    template <typename T>
    [[nodiscard]] const T* context() const noexcept {
        return std::any_cast<T>(&context_);
    }

    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

    /// True for transient failures (store/cache outages, timeouts).
    [[nodiscard]] bool retryable() const noexcept { return isRetryable(code_); }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    std::any context_;
};

} // namespace warden::foundation
