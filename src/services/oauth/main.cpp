/// @file main.cpp
/// @brief ocs_server entry point.
///
/// Development executable: builds the authorization server over in-memory
/// storage and sweeps expired records until SIGINT/SIGTERM.

#include "ocs/foundation/clock.hpp"
#include "ocs/foundation/config_manager.hpp"
#include "ocs/foundation/server_logger.hpp"
#include "ocs/service/authorization_server.hpp"
#include "ocs/service/memory_storage.hpp"
#include "ocs/service/oauth_config.hpp"
#include "ocs/service/oauth_response.hpp"
#include "ocs/service/service_runner.hpp"
#include "ocs/version.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <string>

namespace {

using ocs::foundation::LogCategory;
using ocs::foundation::LogContext;
using ocs::foundation::LogLevel;

constexpr int kDefaultSweepIntervalSeconds = 60;

std::string lowercase(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

/// `logging.level` sets every category; `logging.categories.<name>` overrides one.
void applyLogLevels(const ocs::foundation::ConfigManager& config) {
    auto& logger = ocs::foundation::ServerLogger::instance();

    if (auto level = config.get<std::string>("logging.level")) {
        if (auto parsed = ocs::foundation::parseLogLevel(level.value())) {
            for (std::size_t i = 0; i < ocs::foundation::kLogCategoryCount; ++i) {
                logger.setCategoryLevel(static_cast<LogCategory>(i), *parsed);
            }
        }
    }
    for (std::size_t i = 0; i < ocs::foundation::kLogCategoryCount; ++i) {
        auto cat = static_cast<LogCategory>(i);
        auto key = "logging.categories." + lowercase(ocs::foundation::logCategoryName(cat));
        if (auto level = config.get<std::string>(key)) {
            if (auto parsed = ocs::foundation::parseLogLevel(level.value())) {
                logger.setCategoryLevel(cat, *parsed);
            }
        }
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    ocs::service::SignalHandler signals;

    // Resolve config path: --config flag > OCS_CONFIG_PATH env > default.
    auto configPath = ocs::service::parseConfigArg(argc, argv);
    if (configPath.empty()) {
        configPath = "config/ocs_server.yaml";
    }

    ocs::foundation::ConfigManager config;
    auto loadResult = ocs::service::loadConfig(config, configPath);
    if (!loadResult) {
        std::cerr << "Failed to load config: " << loadResult.error().message() << "\n";
        return EXIT_FAILURE;
    }
    applyLogLevels(config);

    auto oauthConfig = ocs::service::loadOAuthConfig(config);
    if (!oauthConfig) {
        std::cerr << "Invalid oauth configuration: " << oauthConfig.error().message() << "\n";
        return EXIT_FAILURE;
    }

    auto sweepSeconds = config.get<int>("server.sweep_interval_seconds")
                            .valueOr(kDefaultSweepIntervalSeconds);
    if (sweepSeconds <= 0) {
        sweepSeconds = kDefaultSweepIntervalSeconds;
    }

    // In-memory backends for standalone development mode.
    ocs::service::InMemoryStorage storage;
    auto clock = ocs::foundation::SystemClock::shared();

    auto server = ocs::service::AuthorizationServer::create(
        std::move(oauthConfig).value(), storage.view(), nullptr, clock);
    if (!server) {
        std::cerr << "Failed to start authorization server: " << server.error().message()
                  << "\n";
        return EXIT_FAILURE;
    }

    auto sweep = [&storage, &clock]() {
        auto purged = storage.purgeExpired(clock->now());
        if (!purged) {
            OCS_LOG_ERROR(LogCategory::Storage, "expiry sweep failed");
            return;
        }
        if (purged.value() > 0) {
            LogContext ctx;
            ctx.extra["purged"] = std::to_string(purged.value());
            OCS_LOG_CTX(LogLevel::Debug, LogCategory::Storage, "expired records purged", ctx);
        }
    };

    ocs::service::GracefulShutdown shutdown;
    shutdown.addHook("sweep", sweep);
    shutdown.addHook("flush-logs", []() {
        auto flushed = ocs::foundation::ServerLogger::instance().flush();
        if (!flushed) {
            std::cerr << "Failed to flush logs: " << flushed.error().message() << "\n";
        }
    });

    std::cout << "ocs_server " << OCS_VERSION_STRING << " started (config: "
              << configPath.string() << ", issuer: " << server.value().config().issuer << ")\n";
    std::cout << ocs::service::toJson(server.value().metadata()) << "\n";

    while (!signals.waitFor(std::chrono::seconds(sweepSeconds))) {
        sweep();
    }

    shutdown.execute();
    std::cout << "ocs_server stopped\n";
    return EXIT_SUCCESS;
}
