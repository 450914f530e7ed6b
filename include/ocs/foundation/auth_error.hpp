#pragma once

/// @file auth_error.hpp
/// @brief Error type used with Result<T, AuthError>.

#include <any>
#include <string>
#include <string_view>
#include <utility>

#include "ocs/foundation/error_code.hpp"

namespace ocs::foundation {

/// Error carrying a categorized code, a human-readable description and
/// optional type-erased context for diagnostics.
///
/// The description of an OAuth-range error is safe to return to a client
/// as `error_description`. Internal errors are converted to ServerError
/// before they leave the authorization server.
class AuthError {
public:
    AuthError() = default;

    explicit AuthError(ErrorCode code)
        : code_(code) {}

    AuthError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    AuthError(ErrorCode code, std::string message, std::any context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    /// Human-readable error description.
    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /// The subsystem that produced this error.
    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    /// RFC 6749 `error` value for this error.
    [[nodiscard]] std::string_view oauthName() const noexcept {
        return oauthErrorName(code_);
    }

    /// Access typed context data (returns nullptr if type mismatch or empty).
    template <typename T>
    [[nodiscard]] const T* context() const noexcept {
        return std::any_cast<T>(&context_);
    }

    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

    [[nodiscard]] bool isSuccess() const noexcept {
        return code_ == ErrorCode::Success;
    }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    std::any context_;
};

} // namespace ocs::foundation
