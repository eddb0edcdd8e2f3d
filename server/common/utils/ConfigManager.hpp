#pragma once

#include "common/database/RedisService.hpp"
#include "common/utils/Constants.hpp"

namespace fs = std::filesystem;

/**
 * @brief Runtime settings of the bridge (custom_config.bridge + business_system)
 */
struct BridgeSettings {
    // Business system
    std::string baseUrl;
    std::string apiKey;
    std::string apiSecret;

    // Polling
    int pollIntervalMs = Constants::DEFAULT_POLL_INTERVAL_MS;
    std::map<std::string, int> pollIntervalOverrides;   // connection name -> ms
    int requestTimeoutMs = Constants::DEFAULT_REQUEST_TIMEOUT_MS;
    int batchMaxGap = Constants::DEFAULT_BATCH_MAX_GAP;
    double valueTolerance = 0.0;

    // Session reconnect
    double reconnectBaseSec = Constants::RECONNECT_BASE_DELAY_SEC;
    double reconnectMaxSec = Constants::RECONNECT_MAX_DELAY_SEC;
    double reconnectJitter = Constants::RECONNECT_JITTER_RATIO;

    // Catalogue refresh period, 0 = only on demand
    int catalogueRefreshSec = 0;

    /** Device IO threads, 0 = hardware concurrency */
    size_t ioThreads = 0;

    bool persistEvents = true;
    /** Also append events to logs/plc-bridge-events_*.log */
    bool eventAuditFile = true;
    bool subscribeCommands = true;

    /**
     * @brief Poll interval for one connection
     * @param catalogueOverride interval carried by the catalogue entry (0 = none)
     */
    int pollIntervalFor(const std::string& connection, int catalogueOverride = 0) const {
        auto it = pollIntervalOverrides.find(connection);
        int interval = pollIntervalMs;
        if (it != pollIntervalOverrides.end()) {
            interval = it->second;
        } else if (catalogueOverride > 0) {
            interval = catalogueOverride;
        }
        return (std::max)(interval, Constants::MIN_POLL_INTERVAL_MS);
    }

    static BridgeSettings fromConfig(const Json::Value& custom) {
        BridgeSettings s;
        const auto& business = custom["business_system"];
        s.baseUrl = business.get("base_url", "").asString();
        while (!s.baseUrl.empty() && s.baseUrl.back() == '/') s.baseUrl.pop_back();
        s.apiKey = business.get("api_key", "").asString();
        s.apiSecret = business.get("api_secret", "").asString();

        const auto& bridge = custom["bridge"];
        s.pollIntervalMs = bridge.get("poll_interval_ms", s.pollIntervalMs).asInt();
        s.requestTimeoutMs = bridge.get("request_timeout_ms", s.requestTimeoutMs).asInt();
        s.batchMaxGap = bridge.get("batch_max_gap", s.batchMaxGap).asInt();
        s.valueTolerance = bridge.get("value_tolerance", s.valueTolerance).asDouble();
        s.reconnectBaseSec = bridge.get("reconnect_base_sec", s.reconnectBaseSec).asDouble();
        s.reconnectMaxSec = bridge.get("reconnect_max_sec", s.reconnectMaxSec).asDouble();
        s.reconnectJitter = bridge.get("reconnect_jitter", s.reconnectJitter).asDouble();
        s.catalogueRefreshSec = bridge.get("catalogue_refresh_sec", s.catalogueRefreshSec).asInt();
        s.ioThreads = bridge.get("io_threads", 0).asUInt();
        s.persistEvents = bridge.get("persist_events", s.persistEvents).asBool();
        s.eventAuditFile = bridge.get("event_audit_file", s.eventAuditFile).asBool();
        s.subscribeCommands = bridge.get("subscribe_commands", s.subscribeCommands).asBool();

        const auto& overrides = bridge["connection_overrides"];
        if (overrides.isObject()) {
            for (const auto& name : overrides.getMemberNames()) {
                const auto& item = overrides[name];
                if (item.isObject() && item.isMember("poll_interval_ms")) {
                    s.pollIntervalOverrides[name] = item["poll_interval_ms"].asInt();
                } else if (item.isNumeric()) {
                    s.pollIntervalOverrides[name] = item.asInt();
                }
            }
        }
        return s;
    }
};

/**
 * @brief Configuration manager: locate, validate and load the config file
 *
 * Startup checks:
 * - JSON syntax
 * - required sections (listeners, custom_config.business_system)
 * - port ranges and numeric bounds of custom_config.bridge
 * - placeholder values (YOUR_*, CHANGE_ME ...)
 *
 * Environment variables override the file:
 *   BRIDGE_BASE_URL, BRIDGE_API_KEY, BRIDGE_API_SECRET,
 *   BRIDGE_POLL_INTERVAL_MS, BRIDGE_LOG_LEVEL
 */
class ConfigManager {
public:
    /**
     * @brief Load and validate the config file
     * @return false on failure; details have already gone to stderr and the log
     */
    static bool load() {
        AppRedisConfig::useFast() = false;
        AppRedisConfig::enabled() = false;

        // 1. Locate
        auto configPath = findConfigFile();
        if (!configPath) {
            return false;
        }

        // 2. Parse
        Json::Value root;
        if (!parseConfigFile(*configPath, root)) {
            return false;
        }

        // 3. Environment wins over the file
        applyEnvironmentOverrides(root);

        // 4. Validate
        std::vector<std::string> errors;
        std::vector<std::string> warnings;
        validate(root, errors, warnings);
        if (!warnings.empty()) {
            printWarnings("Config warnings (" + *configPath + ")", warnings);
        }
        if (!errors.empty()) {
            printErrors("Config validation failed: " + *configPath, errors);
            return false;
        }

        // 5. Extract bridge settings
        applyConfig(root);

        // 6. Hand over to Drogon
        try {
            drogon::app().loadConfigJson(root);
        } catch (const std::exception& e) {
            printErrors("Drogon rejected the configuration", {e.what()});
            return false;
        }

        LOG_INFO << "Config loaded from: " << *configPath;
        return true;
    }

    static std::string getLogLevel() {
        auto& config = drogon::app().getCustomConfig();
        return config.get("log_level", "INFO").asString();
    }

    static bool isConsoleLogEnabled() {
        auto& config = drogon::app().getCustomConfig();
        return config.get("console_log", false).asBool();
    }

    static const BridgeSettings& settings() {
        return settings_;
    }

    // ─── Validation (public for tests) ─────────────────────────

    static void validate(const Json::Value& root,
                         std::vector<std::string>& errors,
                         std::vector<std::string>& warnings) {
        validateListeners(root, errors);
        validateRedisClients(root, errors, warnings);
        validateBusinessSystem(root, errors, warnings);
        validateBridge(root, errors, warnings);
    }

    static void applyEnvironmentOverrides(Json::Value& root) {
        auto& custom = root["custom_config"];
        if (const char* v = std::getenv("BRIDGE_BASE_URL")) custom["business_system"]["base_url"] = v;
        if (const char* v = std::getenv("BRIDGE_API_KEY")) custom["business_system"]["api_key"] = v;
        if (const char* v = std::getenv("BRIDGE_API_SECRET")) custom["business_system"]["api_secret"] = v;
        if (const char* v = std::getenv("BRIDGE_LOG_LEVEL")) custom["log_level"] = v;
        if (const char* v = std::getenv("BRIDGE_POLL_INTERVAL_MS")) {
            int ms = 0;
            auto [ptr, ec] = std::from_chars(v, v + std::strlen(v), ms);
            if (ec == std::errc() && ptr == v + std::strlen(v)) {
                custom["bridge"]["poll_interval_ms"] = ms;
            } else {
                LOG_WARN << "[Config] BRIDGE_POLL_INTERVAL_MS is not an integer: " << v;
            }
        }
    }

private:
    inline static BridgeSettings settings_;

    // ─── Locate ────────────────────────────────────────────────

    static std::optional<std::string> findConfigFile() {
        static const std::vector<std::string> paths = {
            "./config/config.local.json",
            "../../config/config.local.json",
            "../config/config.local.json",
            "./config/config.json",
            "../../config/config.json",
            "../config/config.json",
            "config.json"
        };

        for (const auto& path : paths) {
            if (fs::exists(path)) {
                return path;
            }
        }

        std::vector<std::string> hints = {"Create a config file in one of:"};
        for (const auto& p : paths) {
            hints.push_back("  - " + p);
        }
        hints.emplace_back("See config/config.example.json");
        printErrors("Config file not found", hints);
        return std::nullopt;
    }

    // ─── Parse ─────────────────────────────────────────────────

    static bool parseConfigFile(const std::string& path, Json::Value& root) {
        std::ifstream ifs(path);
        if (!ifs) {
            printErrors("Cannot open config file: " + path, {"Check that it exists and is readable"});
            return false;
        }

        Json::CharReaderBuilder builder;
        std::string errs;
        if (!Json::parseFromStream(builder, ifs, &root, &errs)) {
            printErrors("JSON parse failed: " + path, {
                errs,
                "Check for missing commas, unbalanced quotes or trailing commas"
            });
            return false;
        }

        if (!root.isObject()) {
            printErrors("Malformed config: " + path, {"The root must be a JSON object"});
            return false;
        }

        return true;
    }

    // ─── Validators ────────────────────────────────────────────

    static void validateListeners(const Json::Value& root, std::vector<std::string>& errors) {
        if (!root.isMember("listeners") || !root["listeners"].isArray() || root["listeners"].empty()) {
            errors.emplace_back("[listeners] at least one listen address is required");
            return;
        }

        for (Json::ArrayIndex i = 0; i < root["listeners"].size(); ++i) {
            const auto& item = root["listeners"][i];
            auto prefix = "[listeners[" + std::to_string(i) + "]] ";

            if (!item.isMember("address") || !item["address"].isString() ||
                item["address"].asString().empty()) {
                errors.push_back(prefix + "missing address");
            }

            validatePort(item, prefix, errors);
        }
    }

    static void validateRedisClients(const Json::Value& root,
                                     std::vector<std::string>& errors,
                                     std::vector<std::string>& warnings) {
        if (!root.isMember("redis_clients") || !root["redis_clients"].isArray() ||
            root["redis_clients"].empty()) {
            warnings.emplace_back("[redis_clients] not configured, realtime publish and the command channel are disabled");
            return;
        }

        for (Json::ArrayIndex i = 0; i < root["redis_clients"].size(); ++i) {
            const auto& redis = root["redis_clients"][i];
            auto prefix = "[redis_clients[" + std::to_string(i) + "]] ";

            if (!redis.isMember("host") || !redis["host"].isString() ||
                redis["host"].asString().empty()) {
                errors.push_back(prefix + "missing host");
            }

            validatePort(redis, prefix, errors);

            if (redis.isMember("passwd") && redis["passwd"].isString() &&
                isPlaceholder(redis["passwd"].asString())) {
                warnings.push_back(prefix + "passwd looks like a placeholder");
            }
        }
    }

    static void validateBusinessSystem(const Json::Value& root,
                                       std::vector<std::string>& errors,
                                       std::vector<std::string>& warnings) {
        if (!root.isMember("custom_config") || !root["custom_config"].isObject()) {
            errors.emplace_back("[custom_config] section missing");
            return;
        }

        const auto& custom = root["custom_config"];
        if (!custom.isMember("business_system") || !custom["business_system"].isObject()) {
            errors.emplace_back("[custom_config.business_system] section missing");
            return;
        }

        const auto& business = custom["business_system"];
        if (!business.isMember("base_url") || !business["base_url"].isString() ||
            business["base_url"].asString().empty()) {
            errors.emplace_back("[business_system] missing base_url");
        } else {
            const auto url = business["base_url"].asString();
            if (!url.starts_with("http://") && !url.starts_with("https://")) {
                errors.push_back("[business_system] base_url must start with http:// or https://: " + url);
            }
        }

        for (const char* field : {"api_key", "api_secret"}) {
            if (!business.isMember(field) || !business[field].isString() ||
                business[field].asString().empty()) {
                warnings.push_back(std::string("[business_system] ") + field +
                                   " is empty, requests go out unauthenticated");
            } else if (isPlaceholder(business[field].asString())) {
                warnings.push_back(std::string("[business_system] ") + field + " looks like a placeholder");
            }
        }

        if (custom.isMember("log_level")) {
            static const std::set<std::string> levels = {"TRACE", "DEBUG", "INFO", "WARN", "ERROR", "FATAL"};
            auto level = custom["log_level"].asString();
            std::transform(level.begin(), level.end(), level.begin(),
                           [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
            if (!levels.count(level)) {
                warnings.push_back("[custom_config] unknown log_level '" +
                                   custom["log_level"].asString() + "', INFO is used");
            }
        }
    }

    static void validateBridge(const Json::Value& root,
                               std::vector<std::string>& errors,
                               std::vector<std::string>& warnings) {
        const auto& bridge = root["custom_config"]["bridge"];
        if (bridge.isNull()) return;
        if (!bridge.isObject()) {
            errors.emplace_back("[custom_config.bridge] must be an object");
            return;
        }

        auto requirePositive = [&](const char* field) {
            if (!bridge.isMember(field)) return;
            if (!bridge[field].isNumeric() || bridge[field].asDouble() <= 0) {
                errors.push_back(std::string("[bridge] ") + field + " must be a positive number");
            }
        };
        requirePositive("poll_interval_ms");
        requirePositive("request_timeout_ms");
        requirePositive("reconnect_base_sec");
        requirePositive("reconnect_max_sec");

        if (bridge.isMember("poll_interval_ms") && bridge["poll_interval_ms"].isNumeric() &&
            bridge["poll_interval_ms"].asInt() < Constants::MIN_POLL_INTERVAL_MS) {
            warnings.push_back("[bridge] poll_interval_ms below " +
                               std::to_string(Constants::MIN_POLL_INTERVAL_MS) + " is raised to it");
        }

        if (bridge.isMember("reconnect_base_sec") && bridge.isMember("reconnect_max_sec") &&
            bridge["reconnect_base_sec"].asDouble() > bridge["reconnect_max_sec"].asDouble()) {
            errors.emplace_back("[bridge] reconnect_base_sec must not exceed reconnect_max_sec");
        }

        if (bridge.isMember("reconnect_jitter")) {
            double jitter = bridge["reconnect_jitter"].asDouble();
            if (jitter < 0.0 || jitter >= 1.0) {
                errors.emplace_back("[bridge] reconnect_jitter must be in [0, 1)");
            }
        }

        for (const char* field : {"value_tolerance", "batch_max_gap", "catalogue_refresh_sec"}) {
            if (bridge.isMember(field) && (!bridge[field].isNumeric() || bridge[field].asDouble() < 0)) {
                errors.push_back(std::string("[bridge] ") + field + " must be a non-negative number");
            }
        }

        const auto& overrides = bridge["connection_overrides"];
        if (!overrides.isNull()) {
            if (!overrides.isObject()) {
                errors.emplace_back("[bridge] connection_overrides must be an object keyed by connection name");
            } else {
                for (const auto& name : overrides.getMemberNames()) {
                    const auto& item = overrides[name];
                    const auto& ms = item.isObject() ? item["poll_interval_ms"] : item;
                    if (!ms.isNumeric() || ms.asInt() <= 0) {
                        errors.push_back("[bridge.connection_overrides." + name +
                                         "] poll_interval_ms must be a positive number");
                    }
                }
            }
        }
    }

    // ─── Apply ─────────────────────────────────────────────────

    static void applyConfig(const Json::Value& root) {
        if (root.isMember("redis_clients") && root["redis_clients"].isArray() &&
            !root["redis_clients"].empty()) {
            AppRedisConfig::enabled() = true;
            AppRedisConfig::useFast() = root["redis_clients"][0].get("is_fast", false).asBool();
        }
        settings_ = BridgeSettings::fromConfig(root["custom_config"]);
    }

    // ─── Helpers ───────────────────────────────────────────────

    static void validatePort(const Json::Value& obj, const std::string& prefix,
                             std::vector<std::string>& errors) {
        if (!obj.isMember("port") || !obj["port"].isNumeric()) {
            errors.push_back(prefix + "missing port");
        } else {
            int port = obj["port"].asInt();
            if (port < 1 || port > 65535) {
                errors.push_back(prefix + "invalid port " +
                    std::to_string(port) + " (valid range: 1-65535)");
            }
        }
    }

    static bool isPlaceholder(const std::string& value) {
        if (value.empty()) return false;
        if (value.starts_with("YOUR_") || value.starts_with("your_")) return true;
        if (value.find("CHANGE_ME") != std::string::npos) return true;
        if (value == "password" || value == "PASSWORD") return true;
        return false;
    }

    static void printErrors(const std::string& title, const std::vector<std::string>& messages) {
        std::string border(60, '=');
        std::cerr << "\n" << border << "\n";
        std::cerr << " [ERROR] " << title << "\n";
        std::cerr << std::string(60, '-') << "\n";
        for (const auto& msg : messages) {
            std::cerr << "  " << msg << "\n";
            LOG_ERROR << "[Config] " << msg;
        }
        std::cerr << border << "\n" << std::endl;
    }

    static void printWarnings(const std::string& title, const std::vector<std::string>& messages) {
        std::cerr << "\n" << std::string(60, '-') << "\n";
        std::cerr << " [WARN] " << title << "\n";
        for (const auto& msg : messages) {
            std::cerr << "  " << msg << "\n";
            LOG_WARN << "[Config] " << msg;
        }
        std::cerr << std::string(60, '-') << "\n" << std::endl;
    }
};
