#pragma once

#include "SignalValue.hpp"
#include "modules/address/AddressTranslator.hpp"
#include "common/protocol/modbus/Modbus.Types.hpp"
#include "common/utils/Constants.hpp"

/**
 * @brief One physical or simulated device endpoint
 */
struct Connection {
    std::string name;             // catalogue key
    std::string deviceName;
    std::string host;
    uint16_t port = 502;
    uint8_t unitId = Constants::DEFAULT_UNIT_ID;
    bool enabled = true;
    int pollIntervalMs = 0;       // 0 = global interval

    /** Same device endpoint (a change forces a new session) */
    bool sameEndpoint(const Connection& other) const {
        return host == other.host && port == other.port && unitId == other.unitId;
    }

    Json::Value toJson() const {
        Json::Value json;
        json["name"] = name;
        json["device_name"] = deviceName;
        json["host"] = host;
        json["port"] = port;
        json["unit_id"] = unitId;
        json["enabled"] = enabled;
        if (pollIntervalMs > 0) json["poll_interval_ms"] = pollIntervalMs;
        return json;
    }
};

/**
 * @brief One monitored/controlled point
 *
 * The linear address is the only stored address; the hierarchical form is derived.
 */
struct Signal {
    std::string name;             // catalogue key, unique across connections
    std::string label;            // display name
    std::string connection;
    SignalKind kind = SignalKind::DigitalOutputCoil;
    uint32_t linearAddress = 0;
    std::shared_ptr<SignalSlot> slot;

    std::string address() const {
        return AddressTranslator::toHierarchical(kind, linearAddress);
    }

    const SignalKindInfo& kindInfo() const {
        return AddressTranslator::info(kind);
    }

    SignalValue value() const {
        return slot->get();
    }

    Json::Value toJson() const {
        Json::Value json;
        json["name"] = name;
        json["signal_name"] = label;
        json["connection"] = connection;
        json["signal_type"] = kindInfo().label;
        json["modbus_address"] = linearAddress;
        json["plc_address"] = address();
        json["value"] = SignalValues::toJson(value());
        return json;
    }
};

// ==================== Actions ====================

enum class TriggerType { Api, Scheduler, DocEvent, SignalChange };

enum class SignalCondition { AnyChange, Equals, GreaterThan, LessThan };

inline TriggerType parseTriggerType(const std::string& text) {
    if (text == "Scheduler") return TriggerType::Scheduler;
    if (text == "Doc Event" || text == "DocEvent") return TriggerType::DocEvent;
    if (text == "Signal Change" || text == "SignalChange") return TriggerType::SignalChange;
    return TriggerType::Api;
}

inline std::string triggerTypeToString(TriggerType type) {
    switch (type) {
        case TriggerType::Api: return "API";
        case TriggerType::Scheduler: return "Scheduler";
        case TriggerType::DocEvent: return "Doc Event";
        case TriggerType::SignalChange: return "Signal Change";
    }
    return "API";
}

inline SignalCondition parseSignalCondition(const std::string& text) {
    if (text == "Equals") return SignalCondition::Equals;
    if (text == "Greater Than") return SignalCondition::GreaterThan;
    if (text == "Less Than") return SignalCondition::LessThan;
    return SignalCondition::AnyChange;
}

inline std::string signalConditionToString(SignalCondition condition) {
    switch (condition) {
        case SignalCondition::AnyChange: return "Any Change";
        case SignalCondition::Equals: return "Equals";
        case SignalCondition::GreaterThan: return "Greater Than";
        case SignalCondition::LessThan: return "Less Than";
    }
    return "Any Change";
}

struct ActionParameter {
    std::string name;
    std::string value;
};

/**
 * @brief Automation rule bound to one signal and one business-system script
 */
struct Action {
    std::string name;
    bool enabled = true;
    std::string signal;
    std::string serverScript;     // API method run by the business system
    TriggerType trigger = TriggerType::Api;
    SignalCondition condition = SignalCondition::AnyChange;
    std::string conditionValue;   // literal compared against the signal value
    int intervalSeconds = 0;      // Scheduler trigger
    std::string docEvent;         // DocEvent trigger
    std::vector<ActionParameter> parameters;

    /** Ordered parameters as a {name: value} object */
    Json::Value parametersJson() const {
        Json::Value json(Json::objectValue);
        for (const auto& p : parameters) {
            json[p.name] = p.value;
        }
        return json;
    }

    Json::Value toJson() const {
        Json::Value json;
        json["name"] = name;
        json["enabled"] = enabled;
        json["signal"] = signal;
        json["server_script"] = serverScript;
        json["trigger_type"] = triggerTypeToString(trigger);
        if (trigger == TriggerType::SignalChange) {
            json["signal_condition"] = signalConditionToString(condition);
            json["signal_value"] = conditionValue;
        }
        json["parameters"] = parametersJson();
        return json;
    }
};

// ==================== Snapshot ====================

/**
 * @brief Polling plan of one connection
 */
struct ConnectionPlan {
    Connection connection;
    std::vector<size_t> signals;              // indexes into CatalogueSnapshot::signals
    std::vector<modbus::ReadGroup> batches;   // RegisterDef::tag = signal index
};

/**
 * @brief Immutable catalogue view
 *
 * Built once by the loader and published whole; never edited afterwards.
 * Only the per-signal slots change value.
 */
class CatalogueSnapshot {
public:
    uint64_t version = 0;
    std::string loadedAt;
    std::vector<Signal> signals;
    std::vector<ConnectionPlan> connections;
    std::vector<Action> actions;

    const Signal* findSignal(const std::string& name) const {
        auto it = signalIndex_.find(name);
        return it == signalIndex_.end() ? nullptr : &signals[it->second];
    }

    const ConnectionPlan* findConnection(const std::string& name) const {
        auto it = connectionIndex_.find(name);
        return it == connectionIndex_.end() ? nullptr : &connections[it->second];
    }

    const Action* findAction(const std::string& name) const {
        auto it = actionIndex_.find(name);
        return it == actionIndex_.end() ? nullptr : &actions[it->second];
    }

    /** Enabled signal-change actions bound to a signal */
    std::vector<const Action*> signalChangeActions(const std::string& signal) const {
        std::vector<const Action*> result;
        auto range = actionsBySignal_.equal_range(signal);
        for (auto it = range.first; it != range.second; ++it) {
            const auto& action = actions[it->second];
            if (action.enabled && action.trigger == TriggerType::SignalChange) {
                result.push_back(&action);
            }
        }
        return result;
    }

    /** Rebuild lookup tables; called by the builder after filling the vectors */
    void buildIndexes() {
        signalIndex_.clear();
        connectionIndex_.clear();
        actionIndex_.clear();
        actionsBySignal_.clear();
        for (size_t i = 0; i < signals.size(); ++i) signalIndex_.emplace(signals[i].name, i);
        for (size_t i = 0; i < connections.size(); ++i) connectionIndex_.emplace(connections[i].connection.name, i);
        for (size_t i = 0; i < actions.size(); ++i) {
            actionIndex_.emplace(actions[i].name, i);
            actionsBySignal_.emplace(actions[i].signal, i);
        }
    }

private:
    std::unordered_map<std::string, size_t> signalIndex_;
    std::unordered_map<std::string, size_t> connectionIndex_;
    std::unordered_map<std::string, size_t> actionIndex_;
    std::unordered_multimap<std::string, size_t> actionsBySignal_;
};
