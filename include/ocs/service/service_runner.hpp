#pragma once

/// @file service_runner.hpp
/// @brief Entry-point utilities: signals, config discovery, shutdown hooks.

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include "ocs/foundation/auth_result.hpp"
#include "ocs/foundation/config_manager.hpp"

namespace ocs::service {

/// Installs SIGINT and SIGTERM handlers and exposes a shutdown flag.
///
/// Only one SignalHandler instance should exist per process. The handler
/// performs a relaxed store on a lock-free atomic, which is
/// async-signal-safe. The destructor restores the default handlers.
class SignalHandler {
public:
    SignalHandler();
    ~SignalHandler();

    SignalHandler(const SignalHandler&) = delete;
    SignalHandler& operator=(const SignalHandler&) = delete;

    [[nodiscard]] bool shutdownRequested() const noexcept;

    /// Sleep for at most @p timeout, returning early on shutdown.
    /// @return true if shutdown was requested.
    bool waitFor(std::chrono::milliseconds timeout) const;

    /// Request shutdown programmatically (same effect as a signal).
    static void requestShutdown() noexcept;

private:
    static std::atomic<bool> shutdownFlag_;
    static void handler(int signal);
};

using ShutdownHook = std::function<void()>;

/// Runs named hooks in registration order when the process stops.
///
/// @code
///   GracefulShutdown shutdown;
///   shutdown.addHook("purge", [&]() { storage.purgeExpired(clock->now()); });
///   shutdown.addHook("flush", [&]() { (void)ServerLogger::instance().flush(); });
///   shutdown.execute();
/// @endcode
class GracefulShutdown {
public:
    void addHook(std::string name, ShutdownHook hook);

    /// Execute all hooks in order. Running twice is a no-op.
    ///
    /// A hook that throws is logged and the remaining hooks still run.
    void execute();

    [[nodiscard]] std::size_t hookCount() const;

private:
    struct Hook {
        std::string name;
        ShutdownHook callback;
    };
    std::vector<Hook> hooks_;
    bool executed_ = false;
};

/// Load a YAML configuration file into @p config.
///
/// OCS_CONFIG_PATH, when set, takes precedence over @p defaultPath.
[[nodiscard]] ocs::foundation::AuthResult<void>
loadConfig(ocs::foundation::ConfigManager& config,
           const std::filesystem::path& defaultPath);

/// Parse `--config <path>` from command-line arguments.
/// @return Config file path, or empty path if not specified.
[[nodiscard]] std::filesystem::path
parseConfigArg(int argc, char* argv[]);

} // namespace ocs::service
