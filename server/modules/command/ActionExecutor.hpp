#pragma once

#include "common/business/FrappeClient.hpp"
#include "modules/catalogue/SignalRegistry.hpp"
#include "modules/event/EventLog.hpp"

/**
 * @brief Runs the business-system script of an action
 */
class ScriptRunner {
public:
    template<typename T = void> using Task = drogon::Task<T>;

    virtual ~ScriptRunner() = default;

    /**
     * @param method  script API method
     * @param context {action, signal, value, params}
     * @return whatever the script returned
     */
    virtual Task<Json::Value> run(const std::string& method, const Json::Value& context) = 0;
};

/**
 * @brief POST /api/method/<server_script>
 */
class FrappeScriptRunner : public ScriptRunner {
public:
    explicit FrappeScriptRunner(std::shared_ptr<FrappeClient> client) : client_(std::move(client)) {}

    Task<Json::Value> run(const std::string& method, const Json::Value& context) override {
        co_return co_await client_->callMethod(method, context);
    }

private:
    std::shared_ptr<FrappeClient> client_;
};

/**
 * @brief Action outcome as returned to API callers
 */
struct ActionResult {
    bool success = false;
    std::string error;
    Json::Value result;

    Json::Value toJson() const {
        Json::Value json;
        json["success"] = success;
        if (!error.empty()) json["error"] = error;
        if (!result.isNull()) json["result"] = result;
        return json;
    }
};

/**
 * @brief Evaluates signal-change triggers and executes actions
 */
class ActionExecutor {
public:
    template<typename T = void> using Task = drogon::Task<T>;

    ActionExecutor(SignalRegistry& registry, std::shared_ptr<ScriptRunner> runner, EventLog& events)
        : registry_(registry), runner_(std::move(runner)), events_(events) {}

    // ==================== Triggers ====================

    /**
     * @brief Whether a signal-change action fires for `value`
     *
     * Any Change: always.
     * Equals: boolean values compare against "true" (case-insensitive); other
     *         values compare numerically, or as text when the literal is not a number.
     * Greater Than / Less Than: numeric; a non-numeric literal never fires.
     */
    static bool conditionHolds(const Action& action, const SignalValue& value) {
        switch (action.condition) {
            case SignalCondition::AnyChange:
                return true;

            case SignalCondition::Equals: {
                if (SignalValues::isBool(value)) {
                    return std::get<bool>(value) == (toLower(action.conditionValue) == "true");
                }
                if (auto target = parseNumber(action.conditionValue)) {
                    return SignalValues::toDouble(value) == *target;
                }
                return SignalValues::toString(value) == action.conditionValue;
            }

            case SignalCondition::GreaterThan:
            case SignalCondition::LessThan: {
                auto target = parseNumber(action.conditionValue);
                if (!target) {
                    LOG_ERROR << "[Action] " << action.name << ": '" << action.conditionValue
                              << "' is not a number, " << signalConditionToString(action.condition)
                              << " never fires";
                    return false;
                }
                double current = SignalValues::toDouble(value);
                return action.condition == SignalCondition::GreaterThan ? current > *target
                                                                        : current < *target;
            }
        }
        return false;
    }

    /**
     * @brief Fire the matching signal-change actions of a changed signal
     * Returns at once; scripts run in the background.
     */
    void onSignalChange(const CatalogueSnapshot& snapshot, const Signal& signal, const SignalValue& value) {
        for (const Action* action : snapshot.signalChangeActions(signal.name)) {
            if (!conditionHolds(*action, value)) {
                LOG_DEBUG << "[Action] " << action->name << ": condition not met for "
                          << signal.name << "=" << SignalValues::toString(value);
                continue;
            }
            LOG_INFO << "[Action] " << action->name << " triggered by " << signal.name
                     << "=" << SignalValues::toString(value);

            drogon::async_run([this, action = *action, signalName = signal.name, connection = signal.connection,
                               value]() -> Task<void> {
                try {
                    co_await run(action, signalName, connection, value, Json::Value(Json::objectValue));
                } catch (const std::exception& e) {
                    LOG_ERROR << "[Action] " << action.name << " failed: " << e.what();
                }
            });
        }
    }

    // ==================== Explicit execution ====================

    /**
     * @brief Execute an action by name
     * @param parameters merged over the action's stored parameters (call wins)
     * @throws NotFoundException unknown action
     * @throws ValidationException action disabled
     */
    Task<ActionResult> executeAction(std::string name, Json::Value parameters) {
        auto snapshot = registry_.snapshot();
        const Action* found = snapshot->findAction(name);
        if (!found) {
            throw NotFoundException("Action '" + name + "' not found");
        }
        if (!found->enabled) {
            throw ValidationException("Action '" + name + "' is disabled");
        }
        if (!parameters.isNull() && !parameters.isObject()) {
            throw ValidationException("parameters must be an object");
        }

        Action action = *found;
        std::string connection;
        std::optional<SignalValue> value;
        if (const auto* signal = snapshot->findSignal(action.signal)) {
            connection = signal->connection;
            value = signal->value();
        }
        co_return co_await run(action, action.signal, connection, value, parameters);
    }

private:
    SignalRegistry& registry_;
    std::shared_ptr<ScriptRunner> runner_;
    EventLog& events_;

    Task<ActionResult> run(const Action& action, const std::string& signal, const std::string& connection,
                           std::optional<SignalValue> value, const Json::Value& parameters) {
        Json::Value params = action.parametersJson();
        if (parameters.isObject()) {
            for (const auto& key : parameters.getMemberNames()) {
                params[key] = parameters[key];
            }
        }

        Json::Value context;
        context["action"] = action.name;
        context["signal"] = signal;
        context["value"] = value ? SignalValues::toJson(*value) : Json::Value();
        context["params"] = params;

        Event event;
        event.type = EventType::ActionExecution;
        event.connection = connection;
        event.signal = signal;
        event.action = action.name;
        event.newValue = value;

        ActionResult result;
        if (action.serverScript.empty()) {
            result.error = "Action '" + action.name + "' has no server script";
        } else {
            try {
                result.result = co_await runner_->run(action.serverScript, context);
                result.success = true;
            } catch (const std::exception& e) {
                result.error = e.what();
            }
        }

        if (result.success) {
            event.status = EventStatus::Success;
            event.message = "Executed " + action.serverScript;
        } else {
            event.status = EventStatus::Failed;
            event.errorMessage = result.error;
        }
        events_.record(std::move(event));
        co_return result;
    }

    static std::string toLower(std::string text) {
        std::transform(text.begin(), text.end(), text.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return text;
    }

    static std::optional<double> parseNumber(const std::string& text) {
        if (text.empty()) return std::nullopt;
        char* end = nullptr;
        double value = std::strtod(text.c_str(), &end);
        if (end == text.c_str()) return std::nullopt;
        while (*end && std::isspace(static_cast<unsigned char>(*end))) ++end;
        if (*end != '\0' || !std::isfinite(value)) return std::nullopt;
        return value;
    }
};
