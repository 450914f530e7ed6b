#pragma once

/// @file oauth_errors.hpp
/// @brief Internal helpers for building and sanitising OAuth errors.

#include <string>
#include <string_view>

#include "ocs/foundation/auth_error.hpp"
#include "ocs/foundation/server_logger.hpp"

namespace ocs::service::detail {

using ocs::foundation::AuthError;
using ocs::foundation::ErrorCode;
using ocs::foundation::LogCategory;
using ocs::foundation::LogContext;
using ocs::foundation::LogLevel;

inline constexpr std::string_view kInternalErrorDescription = "internal server error";

/// The one response every client-authentication failure produces.
inline AuthError invalidClient() {
    return AuthError(ErrorCode::InvalidClient, "client authentication failed");
}

/// Log an internal failure in full and return the opaque ServerError the
/// caller is allowed to see.
inline AuthError internalError(const AuthError& cause, std::string_view operation,
                               LogContext ctx = {}) {
    ctx.extra["operation"] = std::string(operation);
    ctx.extra["subsystem"] = std::string(cause.subsystem());
    ctx.extra["cause"] = std::string(cause.message());
    OCS_LOG_CTX(LogLevel::Error, LogCategory::Core, "internal failure", ctx);
    return AuthError(ErrorCode::ServerError, std::string(kInternalErrorDescription));
}

}  // namespace ocs::service::detail
