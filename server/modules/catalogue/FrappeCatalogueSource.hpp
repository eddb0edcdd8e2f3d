#pragma once

#include "CatalogueSource.hpp"
#include "common/business/FrappeClient.hpp"

/**
 * @brief Catalogue from the Frappe REST API
 *
 * 1. list enabled "Modbus Connection" names
 * 2. fetch each connection document (child table "signals")
 * 3. list enabled "Modbus Action" names, fetch each for its "parameters" table
 */
class FrappeCatalogueSource : public CatalogueSource {
public:
    explicit FrappeCatalogueSource(std::shared_ptr<FrappeClient> client)
        : client_(std::move(client)) {}

    Task<CatalogueData> fetch() override {
        Json::Value enabledFilter(Json::arrayValue);
        Json::Value clause(Json::arrayValue);
        clause.append("enabled");
        clause.append("=");
        clause.append(1);
        enabledFilter.append(clause);

        Json::Value nameOnly(Json::arrayValue);
        nameOnly.append("name");

        std::vector<Json::Value> connectionDocs;
        auto connections = co_await client_->listResource(Constants::DOCTYPE_CONNECTION, enabledFilter, nameOnly);
        for (const auto& row : connections) {
            connectionDocs.push_back(co_await client_->getResource(Constants::DOCTYPE_CONNECTION, row["name"].asString()));
        }

        std::vector<Json::Value> actionDocs;
        auto actions = co_await client_->listResource(Constants::DOCTYPE_ACTION, enabledFilter, nameOnly);
        for (const auto& row : actions) {
            actionDocs.push_back(co_await client_->getResource(Constants::DOCTYPE_ACTION, row["name"].asString()));
        }

        co_return fromDocuments(connectionDocs, actionDocs);
    }

    std::string describe() const override {
        return client_->baseUrl();
    }

    // ==================== Document mapping ====================

    /**
     * @brief Map fetched documents; a malformed document is skipped with a warning
     */
    static CatalogueData fromDocuments(const std::vector<Json::Value>& connectionDocs,
                                       const std::vector<Json::Value>& actionDocs) {
        CatalogueData data;
        for (const auto& doc : connectionDocs) {
            try {
                data.connections.push_back(parseConnection(doc));
            } catch (const AppException& e) {
                LOG_WARN << "[Catalogue] Connection '" << JsonHelper::getString(doc, "name")
                         << "' skipped: " << e.what();
            }
        }
        for (const auto& doc : actionDocs) {
            try {
                data.actions.push_back(parseAction(doc));
            } catch (const AppException& e) {
                LOG_WARN << "[Catalogue] Action '" << JsonHelper::getString(doc, "name")
                         << "' skipped: " << e.what();
            }
        }
        return data;
    }

    /** @throws ValidationException missing host, or port / unit_id / poll_interval_ms of the wrong type or range */
    static ConnectionRecord parseConnection(const Json::Value& doc) {
        if (!doc.isObject()) {
            throw ValidationException("document is not an object");
        }
        ConnectionRecord record;
        auto& conn = record.connection;
        conn.name = JsonHelper::getString(doc, "name");
        conn.deviceName = JsonHelper::getString(doc, "device_name", conn.name);
        conn.host = JsonHelper::getString(doc, "host");
        if (conn.host.empty()) {
            throw ValidationException("host is empty");
        }
        conn.port = static_cast<uint16_t>(integerField(doc, "port", 502, 1, 65535));
        conn.unitId = static_cast<uint8_t>(integerField(doc, "unit_id", Constants::DEFAULT_UNIT_ID, 0, 255));
        conn.enabled = JsonHelper::getFlag(doc, "enabled", true);
        conn.pollIntervalMs = static_cast<int>(integerField(doc, "poll_interval_ms", 0, 0, 86400000));

        for (const auto& row : doc["signals"]) {
            if (!row.isObject()) {
                LOG_WARN << "[Catalogue] Non-object signal row on " << conn.name << " skipped";
                continue;
            }
            SignalRecord signal;
            signal.name = JsonHelper::getString(row, "name");
            signal.label = JsonHelper::getString(row, "signal_name", signal.name);
            signal.kind = JsonHelper::getString(row, "signal_type");
            if (row.isMember("modbus_address") && row["modbus_address"].isNumeric()) {
                signal.linearAddress = row["modbus_address"].asInt64();
            }
            signal.hierarchicalAddress = JsonHelper::getString(row, "plc_address");
            if (row.isMember("digital_value") && !row["digital_value"].isNull()) {
                signal.value = row["digital_value"];
            } else if (row.isMember("float_value") && !row["float_value"].isNull()) {
                signal.value = row["float_value"];
            } else if (row.isMember("value")) {
                signal.value = row["value"];
            }
            record.signals.push_back(std::move(signal));
        }
        return record;
    }

    static Action parseAction(const Json::Value& doc) {
        if (!doc.isObject()) {
            throw ValidationException("document is not an object");
        }
        Action action;
        action.name = JsonHelper::getString(doc, "name");
        action.enabled = JsonHelper::getFlag(doc, "enabled", true);
        action.signal = JsonHelper::getString(doc, "modbus_signal", JsonHelper::getString(doc, "signal"));
        action.serverScript = JsonHelper::getString(doc, "server_script");
        action.trigger = parseTriggerType(JsonHelper::getString(doc, "trigger_type", "API"));
        action.condition = parseSignalCondition(JsonHelper::getString(doc, "signal_condition", "Any Change"));
        action.conditionValue = JsonHelper::getString(doc, "signal_value");
        action.intervalSeconds = static_cast<int>(integerField(doc, "interval_seconds", 0, 0, 86400 * 366));
        action.docEvent = JsonHelper::getString(doc, "trigger_event");

        for (const auto& row : doc["parameters"]) {
            action.parameters.push_back({
                JsonHelper::getString(row, "parameter"),
                JsonHelper::getString(row, "value")
            });
        }
        return action;
    }

private:
    std::shared_ptr<FrappeClient> client_;

    /** Whole number (or numeric text) in [min, max]; absent or null gives the fallback */
    static int64_t integerField(const Json::Value& doc, const char* key, int64_t fallback, int64_t min, int64_t max) {
        if (!doc.isMember(key) || doc[key].isNull()) return fallback;
        const auto& value = doc[key];

        std::optional<int64_t> number;
        if (value.isInt64()) {
            number = value.asInt64();
        } else if (value.isString()) {
            const std::string text = value.asString();
            int64_t parsed = 0;
            auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed);
            if (!text.empty() && ec == std::errc() && end == text.data() + text.size()) number = parsed;
        }
        if (!number || *number < min || *number > max) {
            throw ValidationException(std::string(key) + " must be a whole number in " + std::to_string(min) +
                                      ".." + std::to_string(max) + ", got " + JsonHelper::serialize(value));
        }
        return *number;
    }
};
