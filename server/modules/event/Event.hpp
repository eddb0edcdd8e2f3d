#pragma once

#include "modules/catalogue/domain/SignalValue.hpp"

enum class EventType {
    // Option of the business system's event record; polled values only
    // become events when they change (SignalUpdate), so nothing records it
    Read,
    Write,
    SignalUpdate,
    ConnectionTest,
    ActionExecution,
    Error
};

enum class EventStatus { Success, Failed };

/** Business-system label of an event type */
inline std::string eventTypeToString(EventType type) {
    switch (type) {
        case EventType::Read:            return "Read";
        case EventType::Write:           return "Write";
        case EventType::SignalUpdate:    return "Signal Update";
        case EventType::ConnectionTest:  return "Connection Test";
        case EventType::ActionExecution: return "Action Execution";
        case EventType::Error:           return "Error";
    }
    return "Error";
}

/** Accepts the label ("Signal Update") or the slug ("signal_update") */
inline std::optional<EventType> parseEventType(const std::string& text) {
    static const std::vector<std::pair<std::string, EventType>> names = {
        {"read", EventType::Read},
        {"write", EventType::Write},
        {"signal_update", EventType::SignalUpdate},
        {"connection_test", EventType::ConnectionTest},
        {"action_execution", EventType::ActionExecution},
        {"error", EventType::Error},
    };
    std::string slug;
    for (unsigned char c : text) {
        slug.push_back(c == ' ' ? '_' : static_cast<char>(std::tolower(c)));
    }
    for (const auto& [name, type] : names) {
        if (name == slug) return type;
    }
    return std::nullopt;
}

inline std::string eventStatusToString(EventStatus status) {
    return status == EventStatus::Success ? "Success" : "Failed";
}

/**
 * @brief Audit record of one bridge activity
 */
struct Event {
    EventType type = EventType::Error;
    EventStatus status = EventStatus::Success;
    std::string connection;
    std::string signal;
    std::string action;
    std::optional<SignalValue> previousValue;
    std::optional<SignalValue> newValue;
    std::string message;
    std::string errorMessage;
    std::string timestamp;       // stamped by EventLog::record
    uint64_t sequence = 0;       // stamped by EventLog::record

    // ==================== Factories ====================

    static Event signalUpdate(const std::string& connection, const std::string& signal,
                              const SignalValue& previous, const SignalValue& current) {
        Event e;
        e.type = EventType::SignalUpdate;
        e.connection = connection;
        e.signal = signal;
        e.previousValue = previous;
        e.newValue = current;
        e.message = signal + ": " + SignalValues::toString(previous) + " -> " + SignalValues::toString(current);
        return e;
    }

    static Event write(const std::string& connection, const std::string& signal,
                       const SignalValue& previous, const SignalValue& current) {
        Event e;
        e.type = EventType::Write;
        e.connection = connection;
        e.signal = signal;
        e.previousValue = previous;
        e.newValue = current;
        e.message = "Wrote " + SignalValues::toString(current) + " to " + signal;
        return e;
    }

    static Event error(const std::string& connection, const std::string& signal, const std::string& error) {
        Event e;
        e.type = EventType::Error;
        e.status = EventStatus::Failed;
        e.connection = connection;
        e.signal = signal;
        e.errorMessage = error;
        return e;
    }

    // ==================== Serialization ====================

    /** Shape served by GET /api/bridge/events */
    Json::Value toJson() const {
        Json::Value json;
        json["sequence"] = static_cast<Json::UInt64>(sequence);
        json["event_type"] = eventTypeToString(type);
        json["status"] = eventStatusToString(status);
        json["timestamp"] = timestamp;
        if (!connection.empty()) json["connection"] = connection;
        if (!signal.empty()) json["signal"] = signal;
        if (!action.empty()) json["action"] = action;
        if (previousValue) json["previous_value"] = SignalValues::toJson(*previousValue);
        if (newValue) json["new_value"] = SignalValues::toJson(*newValue);
        if (!message.empty()) json["message"] = message;
        if (!errorMessage.empty()) json["error_message"] = errorMessage;
        return json;
    }

    /** "Modbus Event" document; values are stored as text */
    Json::Value toDocument() const {
        Json::Value doc;
        doc["event_type"] = eventTypeToString(type);
        doc["status"] = eventStatusToString(status);
        doc["timestamp"] = timestamp;
        if (!connection.empty()) doc["connection"] = connection;
        if (!signal.empty()) doc["signal"] = signal;
        if (!action.empty()) doc["action"] = action;
        if (previousValue) doc["previous_value"] = SignalValues::toString(*previousValue);
        if (newValue) doc["new_value"] = SignalValues::toString(*newValue);
        if (!message.empty()) doc["message"] = message;
        if (!errorMessage.empty()) doc["error_message"] = errorMessage;
        return doc;
    }
};
