#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the authorization server.

#include <cstdint>
#include <string_view>

namespace ocs::foundation {

/// Error codes categorized by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100), making it possible
/// to determine the error source from the code value alone. The OAuth
/// range mirrors the RFC 6749 section 5.2 error taxonomy and is the only
/// range whose codes are ever shown to a client verbatim.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,
    AlreadyExists = 0x0004,
    NotImplemented = 0x0005,

    // OAuth (0x0100 - 0x01FF)
    InvalidRequest = 0x0100,
    InvalidClient = 0x0101,
    InvalidGrant = 0x0102,
    UnauthorizedClient = 0x0103,
    UnsupportedGrantType = 0x0104,
    InvalidScope = 0x0105,
    AccessDenied = 0x0106,
    ServerError = 0x0107,
    TemporarilyUnavailable = 0x0108,
    UnsupportedResponseType = 0x0109,
    InvalidToken = 0x010A,  ///< RFC 6750 bearer token failure.

    // Crypto (0x0200 - 0x02FF)
    CryptoError = 0x0200,
    RandomFailed = 0x0201,
    HashFailed = 0x0202,
    SigningFailed = 0x0203,
    MalformedHash = 0x0204,

    // Storage (0x0300 - 0x03FF)
    StorageError = 0x0300,
    DuplicateKey = 0x0301,
    RecordNotFound = 0x0302,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,

    // Logger (0x0800 - 0x08FF)
    LoggerError = 0x0800,
    LoggerNotInitialized = 0x0801,
    LoggerFlushFailed = 0x0802,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0100: return "OAuth";
        case 0x0200: return "Crypto";
        case 0x0300: return "Storage";
        case 0x0600: return "Config";
        case 0x0800: return "Logger";
        default: return "Unknown";
    }
}

/// Return the RFC 6749 wire name for an error code.
///
/// Anything outside the OAuth range is an internal failure and is reported
/// to clients as `server_error`.
constexpr std::string_view oauthErrorName(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidRequest:          return "invalid_request";
        case ErrorCode::InvalidClient:           return "invalid_client";
        case ErrorCode::InvalidGrant:            return "invalid_grant";
        case ErrorCode::UnauthorizedClient:      return "unauthorized_client";
        case ErrorCode::UnsupportedGrantType:    return "unsupported_grant_type";
        case ErrorCode::InvalidScope:            return "invalid_scope";
        case ErrorCode::AccessDenied:            return "access_denied";
        case ErrorCode::TemporarilyUnavailable:  return "temporarily_unavailable";
        case ErrorCode::UnsupportedResponseType: return "unsupported_response_type";
        case ErrorCode::InvalidToken:            return "invalid_token";
        default:                                 return "server_error";
    }
}

/// Suggested HTTP status for a transport layer returning this error.
constexpr int httpStatusFor(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidRequest:
        case ErrorCode::InvalidGrant:
        case ErrorCode::UnsupportedGrantType:
        case ErrorCode::InvalidScope:
        case ErrorCode::UnsupportedResponseType:
            return 400;
        case ErrorCode::InvalidClient:
        case ErrorCode::UnauthorizedClient:
        case ErrorCode::InvalidToken:
            return 401;
        case ErrorCode::AccessDenied:
            return 403;
        case ErrorCode::TemporarilyUnavailable:
            return 503;
        default:
            return 500;
    }
}

/// True for codes that may be shown to a client as-is.
constexpr bool isOAuthError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xFF00) == 0x0100;
}

} // namespace ocs::foundation
