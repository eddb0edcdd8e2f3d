// mimalloc replaces global new/delete; must precede every other include
#include <mimalloc-new-delete.h>

// Utils
#include "common/utils/PlatformUtils.hpp"
#include "common/utils/LoggerManager.hpp"
#include "common/utils/ConfigManager.hpp"
#include "common/utils/ExceptionHandler.hpp"

// Redis
#include "common/database/RedisService.hpp"

// Bridge
#include "modules/bridge/Bridge.hpp"
#include "modules/bridge/Bridge.Controller.hpp"

using namespace drogon;

// ─── Startup errors ──────────────────────────────────────────

/**
 * @brief Print a startup failure to the console and the log
 */
void printStartupError(const std::string& title, const std::string& detail,
                       const std::vector<std::string>& hints = {}) {
    std::string border(60, '=');
    std::cerr << "\n" << border << "\n";
    std::cerr << " [ERROR] " << title << "\n";
    std::cerr << std::string(60, '-') << "\n";
    std::cerr << "  " << detail << "\n";
    if (!hints.empty()) {
        std::cerr << "\n  Check:\n";
        for (const auto& hint : hints) {
            std::cerr << "    - " << hint << "\n";
        }
    }
    std::cerr << border << "\n" << std::endl;

    LOG_FATAL << "[Startup] " << title << ": " << detail;
}

/**
 * @brief Troubleshooting hints for a failed stage
 */
std::vector<std::string> getStageHints(const std::string& stage) {
    if (stage == "redis:client") {
        return {
            "redis_clients in the config",
            "Redis host and port are reachable",
        };
    }
    if (stage == "redis:ping") {
        return {
            "Redis is running",
            "redis_clients host/port in the config",
            "Redis password (requirepass)",
            "firewall rules for the Redis port",
        };
    }
    if (stage == "bridge:create") {
        return {
            "custom_config.bridge values in the config",
            "io_threads is a sensible number",
        };
    }
    if (stage == "bridge:start") {
        return {
            "custom_config.business_system.base_url is reachable",
            "api_key / api_secret are valid",
        };
    }
    return {};
}

/**
 * @brief Server started callback
 */
void onServerStarted() {
    auto listeners = app().getListeners();
    std::cout << "PLC bridge started" << std::endl;
    for (const auto& addr : listeners) {
        std::cout << "  -> http://" << addr.toIpPort() << std::endl;
        LOG_INFO << "Server listening on http://" << addr.toIpPort();
    }
    std::cout << "Logs: ./logs/plc-bridge_*.log" << std::endl;

    // Sequential bootstrap
    async_run([]() -> Task<> {
        std::string stage = "startup:init";
        try {
            if (AppRedisConfig::enabled()) {
                stage = "redis:ping";
                LOG_INFO << "[Startup] " << stage;
                RedisService redisHealthCheck;
                co_await redisHealthCheck.ping();
            }

            stage = "bridge:create";
            LOG_INFO << "[Startup] " << stage;
            auto& bridge = Bridge::create(ConfigManager::settings());

            // A business system that is down is not fatal: the bridge starts empty and retries
            stage = "bridge:start";
            LOG_INFO << "[Startup] " << stage;
            co_await bridge.start(app().getLoop());

            LOG_INFO << "[Startup] bootstrap completed";
        } catch (const std::exception& e) {
            printStartupError("Startup failed at " + stage, e.what(), getStageHints(stage));
            app().getLoop()->queueInLoop([]() {
                app().quit();
            });
        }
    });
}

/**
 * @brief Server stopping callback
 */
void onServerStopping() {
    LOG_INFO << "Server is stopping, cleaning up resources...";

    // Commands refused, polling stopped, sessions closed
    Bridge::destroy();

    LOG_INFO << "All resources cleaned up";
    LoggerManager::close();
}

int main() {
    // 0. mimalloc active
    int v = mi_version();
    std::cout << "mimalloc v" << (v / 100) << "." << (v % 100) << " active" << std::endl;

    // 1. Platform setup
    PlatformUtils::initialize();

    // 2. Logging (AsyncFileLogger, daily rotation)
    LoggerManager::initialize("./logs");

    // 3. Load and validate the config (ConfigManager has printed the details on failure)
    if (!ConfigManager::load()) {
        std::cerr << "Server startup aborted due to configuration errors." << std::endl;
        return 1;
    }

    // 4. Apply it
    if (!LoggerManager::setLogLevel(ConfigManager::getLogLevel())) {
        LOG_WARN << "Unknown log_level '" << ConfigManager::getLogLevel() << "', using INFO";
    }
    LoggerManager::setConsoleEcho(ConfigManager::isConsoleLogEnabled());

    // 5. Global exception handler
    AppExceptionHandler::setup();

    // 6. Startup callback
    app().registerBeginningAdvice([]() {
        if (AppRedisConfig::enabled()) {
            try {
                RedisService().getClient();
                LOG_INFO << "Redis client is configured (fast mode: "
                         << (AppRedisConfig::useFast() ? "true" : "false") << ")";
            } catch (const std::exception& e) {
                printStartupError("Redis client unavailable", e.what(), getStageHints("redis:client"));
                std::exit(1);
            }
        } else {
            LOG_WARN << "Redis not configured: no realtime publish, no command channel";
        }

        onServerStarted();
    });

    // 7. Run
    app().run();

    // 8. Clean up after the event loop exits
    onServerStopping();

    return 0;
}
