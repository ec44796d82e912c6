#pragma once

/// @file security_result.hpp
/// @brief SecurityResult<T> for explicit error propagation without exceptions.

#include <string>
#include <utility>
#include <variant>

#include "warden/foundation/security_error.hpp"

namespace warden::foundation {

/// Success value or SecurityError.
///
/// Every operation in the library that can fail returns SecurityResult<T>
/// instead of throwing.
///
/// Example:
/// @code
///   SecurityResult<Principal> lookup(std::string_view name) {
///       if (name.empty()) {
///           return SecurityResult<Principal>::err(ErrorCode::InvalidArgument,
///                                                 "empty principal");
///       }
///       return SecurityResult<Principal>::ok(Principal(name));
///   }
/// @endcode
template <typename T>
class SecurityResult {
public:
    static SecurityResult ok(T value) { return SecurityResult(std::move(value)); }

    static SecurityResult err(SecurityError error) { return SecurityResult(std::move(error)); }

    static SecurityResult err(ErrorCode code, std::string message) {
        return SecurityResult(SecurityError(code, std::move(message)));
    }

    [[nodiscard]] bool hasValue() const noexcept { return std::holds_alternative<T>(data_); }
    [[nodiscard]] bool hasError() const noexcept { return !hasValue(); }
    explicit operator bool() const noexcept { return hasValue(); }

    /// Access the success value (undefined behavior if error).
    [[nodiscard]] const T& value() const& { return std::get<T>(data_); }
    [[nodiscard]] T& value() & { return std::get<T>(data_); }
    [[nodiscard]] T&& value() && { return std::get<T>(std::move(data_)); }

    /// Access the error (undefined behavior if success).
    [[nodiscard]] const SecurityError& error() const& { return std::get<SecurityError>(data_); }

    /// Shorthand for error().code(); Success when a value is held.
    [[nodiscard]] ErrorCode code() const noexcept {
        return hasValue() ? ErrorCode::Success : std::get<SecurityError>(data_).code();
    }

    [[nodiscard]] T valueOr(T fallback) const& {
        return hasValue() ? value() : std::move(fallback);
    }

private:
    explicit SecurityResult(T value) : data_(std::move(value)) {}
    explicit SecurityResult(SecurityError error) : data_(std::move(error)) {}

    std::variant<T, SecurityError> data_;
};

/// Specialization for operations without a success value.
template <>
class SecurityResult<void> {
public:
    static SecurityResult ok() { return SecurityResult(); }

    static SecurityResult err(SecurityError error) { return SecurityResult(std::move(error)); }

    static SecurityResult err(ErrorCode code, std::string message) {
        return SecurityResult(SecurityError(code, std::move(message)));
    }

    [[nodiscard]] bool hasValue() const noexcept { return success_; }
    [[nodiscard]] bool hasError() const noexcept { return !success_; }
    explicit operator bool() const noexcept { return success_; }

    [[nodiscard]] const SecurityError& error() const& { return error_; }

    [[nodiscard]] ErrorCode code() const noexcept {
        return success_ ? ErrorCode::Success : error_.code();
    }

private:
    SecurityResult() : success_(true) {}
    explicit SecurityResult(SecurityError error) : success_(false), error_(std::move(error)) {}

    bool success_ = false;
    SecurityError error_;
};

} // namespace warden::foundation
