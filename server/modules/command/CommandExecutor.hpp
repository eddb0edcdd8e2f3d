#pragma once

#include "ActionExecutor.hpp"
#include "modules/change/ChangeDetector.hpp"
#include "modules/session/DeviceSessionPool.hpp"

/**
 * @brief Outcome of a write command: {success, error?}
 */
struct CommandResult {
    bool success = false;
    std::string error;
    int code = 0;

    Json::Value toJson() const {
        Json::Value json;
        json["success"] = success;
        if (!error.empty()) json["error"] = error;
        return json;
    }
};

/**
 * @brief Validates and executes commands from the business system
 *
 * Checks run before any I/O, in this order: signal exists, kind is writable,
 * value fits the kind. A validated write goes through the connection's session
 * (FIFO with the polls); device-side failures come back as {success:false}.
 */
class CommandExecutor {
public:
    template<typename T = void> using Task = drogon::Task<T>;

    CommandExecutor(SignalRegistry& registry, DeviceSessionPool& pool, ChangeDetector& detector,
                    EventLog& events, ActionExecutor& actions)
        : registry_(registry), pool_(pool), detector_(detector), events_(events), actions_(actions) {}

    /**
     * @brief Dispatch {signal_name, value} or {action_name, parameters}
     * @throws ValidationException neither form
     */
    Task<Json::Value> execute(Json::Value command) {
        if (!command.isObject()) {
            throw ValidationException("Command must be a JSON object");
        }
        if (command.isMember("action_name")) {
            auto result = co_await actions_.executeAction(command["action_name"].asString(), command["parameters"]);
            co_return result.toJson();
        }
        if (command.isMember("signal_name")) {
            if (!command.isMember("value")) {
                throw ValidationException("value is required");
            }
            auto result = co_await writeSignal(command["signal_name"].asString(), command["value"]);
            co_return result.toJson();
        }
        throw ValidationException("Command needs signal_name and value, or action_name");
    }

    /**
     * @brief Write a value to a signal
     * @throws NotFoundException, NotWritableError, ValidationException before any I/O
     * @throws ServiceUnavailableException after close()
     */
    Task<CommandResult> writeSignal(std::string signalName, Json::Value requested) {
        if (closed_) {
            throw ServiceUnavailableException("Bridge is shutting down");
        }

        auto snapshot = registry_.snapshot();
        auto [signal, value] = validate(*snapshot, signalName, requested);
        auto frame = SignalCodec::encode(signal->kind, value);

        inFlight_.fetch_add(1);
        CommandResult result;
        std::string failure;
        int failureCode = ErrorCodes::CONNECTION_FAILED;

        auto session = pool_.get(signal->connection);
        if (!session) {
            failure = "No session for connection " + signal->connection;
        } else {
            try {
                co_await session->writeCoro(frame.functionCode, static_cast<uint16_t>(signal->linearAddress),
                                            std::move(frame.data));
            } catch (const AppException& e) {
                failure = e.getMessage();
                failureCode = e.getCode();
            } catch (const std::exception& e) {
                failure = e.what();
                failureCode = ErrorCodes::INTERNAL_ERROR;
            }
        }

        if (failure.empty()) {
            detector_.applyWrite(*snapshot, *signal, value);
            result.success = true;
        } else {
            LOG_WARN << "[Command] Write " << SignalValues::toString(value) << " to " << signal->name
                     << " (" << signal->address() << ") failed: " << failure;
            Event event = Event::error(signal->connection, signal->name, failure);
            event.newValue = value;
            event.message = "Write " + SignalValues::toString(value) + " to " + signal->address();
            events_.record(std::move(event));
            result.error = failure;
            result.code = failureCode;
        }
        inFlight_.fetch_sub(1);
        co_return result;
    }

    /**
     * @brief Look up and check a write request
     * @return the target signal (owned by `snapshot`) and the converted value
     */
    static std::pair<const Signal*, SignalValue> validate(const CatalogueSnapshot& snapshot,
                                                          const std::string& signalName,
                                                          const Json::Value& requested) {
        if (signalName.empty()) {
            throw ValidationException("signal_name is required");
        }
        const Signal* signal = snapshot.findSignal(signalName);
        if (!signal) {
            throw NotFoundException("Signal '" + signalName + "' not found");
        }
        const auto& info = signal->kindInfo();
        if (!info.writable) {
            throw NotWritableError("Signal '" + signalName + "' is a " + info.label + " and cannot be written");
        }
        return {signal, SignalCodec::coerce(signal->kind, requested)};
    }

    /** Refuse new commands; writes already running finish */
    void close() {
        closed_ = true;
        LOG_INFO << "[Command] Closed, " << inFlight_.load() << " writes in flight";
    }

    bool isClosed() const { return closed_; }
    int inFlight() const { return inFlight_.load(); }

private:
    SignalRegistry& registry_;
    DeviceSessionPool& pool_;
    ChangeDetector& detector_;
    EventLog& events_;
    ActionExecutor& actions_;

    std::atomic<bool> closed_{false};
    std::atomic<int> inFlight_{0};
};
