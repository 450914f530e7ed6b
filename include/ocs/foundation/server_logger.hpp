#pragma once

/// @file server_logger.hpp
/// @brief ServerLogger wrapping kcenon common_system logger interfaces.
///
/// Category-based filtering, structured context and per-category runtime
/// log levels for the authorization server. Raw secrets, codes and tokens
/// must never be passed to the logger; token ids and hash prefixes may be.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "ocs/foundation/auth_result.hpp"

namespace ocs::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level one to one.
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Log categories for structured filtering.
enum class LogCategory : uint8_t {
    Core    = 0, ///< Server lifecycle and wiring
    Client  = 1, ///< Client registration and authentication
    Grant   = 2, ///< Grant dispatch, authorization codes, PKCE
    Token   = 3, ///< Minting, validation, introspection
    Storage = 4, ///< Persistence collaborator
    Audit   = 5, ///< Security-relevant events (replay, revocation, rotation)
    Config  = 6  ///< Configuration loading
};

inline constexpr std::size_t kLogCategoryCount = 7;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Client", "Grant", "Token", "Storage", "Audit", "Config"
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

/// Structured context data attached to log entries.
///
/// @code
///   LogContext ctx;
///   ctx.clientId = client.id;
///   ctx.tokenId = claims.jti;
///   logger.logWithContext(LogLevel::Warning, LogCategory::Audit,
///                         "refresh token replay", ctx);
/// @endcode
struct LogContext {
    std::optional<std::string> clientId;
    std::optional<std::string> subject;
    std::optional<std::string> tokenId;
    std::optional<std::string> traceId;
    std::unordered_map<std::string, std::string> extra;
};

/// Server logger wrapping kcenon's logging interfaces.
///
/// Messages are routed to a named logger "ocs.<Category>" registered in
/// the kcenon GlobalLoggerRegistry, falling back to the registry's default
/// logger. Uses PIMPL to keep kcenon headers out of the public API.
///
/// Default log levels per category:
/// | Category | Default Level |
/// |----------|---------------|
/// | Core     | Info          |
/// | Client   | Info          |
/// | Grant    | Info          |
/// | Token    | Info          |
/// | Storage  | Warning       |
/// | Audit    | Info          |
/// | Config   | Info          |
class ServerLogger {
public:
    ServerLogger();
    ~ServerLogger();

    ServerLogger(const ServerLogger&) = delete;
    ServerLogger& operator=(const ServerLogger&) = delete;
    ServerLogger(ServerLogger&&) noexcept;
    ServerLogger& operator=(ServerLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with context fields appended as `{key=val, ...}`.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);
    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush the default logger.
    AuthResult<void> flush();

    /// Process-wide instance used by the OCS_LOG macros.
    static ServerLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/// Parse a level name ("debug", "WARNING", ...) from configuration.
std::optional<LogLevel> parseLogLevel(std::string_view name);

} // namespace ocs::foundation

// ---------------------------------------------------------------------------
// Convenience macros (global scope)
// ---------------------------------------------------------------------------

/// @name OCS_LOG Macros
/// @brief Logging macros with compile-time and runtime level checks.
///
/// Define OCS_MIN_LOG_LEVEL before including this header to compile out
/// calls below the threshold.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
/// @{

#ifndef OCS_MIN_LOG_LEVEL
    #define OCS_MIN_LOG_LEVEL 0
#endif

#define OCS_LOG(level, cat, msg)                                                    \
    do {                                                                            \
        _Pragma("GCC diagnostic push")                                              \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                         \
        if (static_cast<int>(level) >= OCS_MIN_LOG_LEVEL &&                         \
            ::ocs::foundation::ServerLogger::instance().isEnabled((level), (cat)))  \
        {                                                                           \
            ::ocs::foundation::ServerLogger::instance().log((level), (cat), (msg)); \
        }                                                                           \
        _Pragma("GCC diagnostic pop")                                               \
    } while (0)

#define OCS_LOG_CTX(level, cat, msg, ctx)                                           \
    do {                                                                            \
        _Pragma("GCC diagnostic push")                                              \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                         \
        if (static_cast<int>(level) >= OCS_MIN_LOG_LEVEL &&                         \
            ::ocs::foundation::ServerLogger::instance().isEnabled((level), (cat)))  \
        {                                                                           \
            ::ocs::foundation::ServerLogger::instance().logWithContext(             \
                (level), (cat), (msg), (ctx));                                      \
        }                                                                           \
        _Pragma("GCC diagnostic pop")                                               \
    } while (0)

#define OCS_LOG_DEBUG(cat, msg) \
    OCS_LOG(::ocs::foundation::LogLevel::Debug, (cat), (msg))

#define OCS_LOG_INFO(cat, msg) \
    OCS_LOG(::ocs::foundation::LogLevel::Info, (cat), (msg))

#define OCS_LOG_WARN(cat, msg) \
    OCS_LOG(::ocs::foundation::LogLevel::Warning, (cat), (msg))

#define OCS_LOG_ERROR(cat, msg) \
    OCS_LOG(::ocs::foundation::LogLevel::Error, (cat), (msg))

/// @}
