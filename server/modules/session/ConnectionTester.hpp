#pragma once

#include "DeviceSessionPool.hpp"
#include "modules/address/SignalCodec.hpp"
#include "modules/event/EventLog.hpp"

/**
 * @brief Ad-hoc reachability check of a device
 *
 * Opens a throw-away session (no reconnect), optionally reads a list of
 * signals through it, closes it, and reports in plain text. Never throws for
 * device problems; they end up in the message.
 */
class ConnectionTester {
public:
    template<typename T = void> using Task = drogon::Task<T>;

    struct Request {
        std::string connection;     // optional catalogue name, for the event and the signal list
        std::string host;
        uint16_t port = 502;
        uint8_t unitId = Constants::DEFAULT_UNIT_ID;
        std::vector<Signal> signals;
    };

    struct Result {
        bool success = false;
        std::string message;

        Json::Value toJson() const {
            Json::Value json;
            json["success"] = success;
            json["message"] = message;
            return json;
        }
    };

    ConnectionTester(DeviceSessionPool& pool, EventLog& events) : pool_(pool), events_(events) {}

    Task<Result> test(Request request) {
        if (request.host.empty()) {
            throw ValidationException("host is required");
        }

        Connection conn;
        conn.name = request.connection.empty() ? request.host + ":" + std::to_string(request.port)
                                               : request.connection;
        conn.host = request.host;
        conn.port = request.port;
        conn.unitId = request.unitId;

        auto options = pool_.options();
        options.autoReconnect = false;
        auto session = std::make_shared<DeviceSession>(conn, pool_.getNextLoop(), pool_.transportFactory(), options);

        LOG_INFO << "[ConnectionTest] Testing " << conn.host << ":" << conn.port
                 << " (unit " << static_cast<int>(conn.unitId) << ")";
        session->start();
        auto [connected, error] = co_await SettleAwaiter(session);

        Result result;
        if (!connected) {
            result.message = "Connection failed: " + error;
        } else {
            std::vector<std::string> lines;
            for (const auto& signal : request.signals) {
                lines.push_back(co_await readOne(session, signal));
            }
            result.success = true;
            result.message = "Connection successful to " + conn.host + ":" + std::to_string(conn.port);
            if (!lines.empty()) {
                result.message += " - ";
                for (size_t i = 0; i < lines.size(); ++i) {
                    if (i > 0) result.message += "; ";
                    result.message += lines[i];
                }
            }
        }
        session->stop();

        Event event;
        event.type = EventType::ConnectionTest;
        event.status = result.success ? EventStatus::Success : EventStatus::Failed;
        event.connection = conn.name;
        if (result.success) {
            event.message = result.message;
        } else {
            event.errorMessage = result.message;
        }
        events_.record(std::move(event));

        co_return result;
    }

private:
    DeviceSessionPool& pool_;
    EventLog& events_;

    struct SettleAwaiter : drogon::CallbackAwaiter<std::pair<bool, std::string>> {
        explicit SettleAwaiter(DeviceSessionPtr session) : session_(std::move(session)) {}

        void await_suspend(std::coroutine_handle<> handle) {
            session_->whenSettled([this, handle](bool connected, const std::string& error) {
                setValue({connected, error});
                handle.resume();
            });
        }

    private:
        DeviceSessionPtr session_;
    };

    static Task<std::string> readOne(DeviceSessionPtr session, const Signal& signal) {
        std::string label = signal.name + " (" + signal.address() + ")";
        try {
            const auto& info = signal.kindInfo();
            auto response = co_await session->readCoro(modbus::registerTypeToFuncCode(info.table),
                                                       static_cast<uint16_t>(signal.linearAddress),
                                                       info.quantity);
            auto value = SignalCodec::decode(signal.kind, 0, response.data);
            if (!value) co_return label + ": Error: short response";
            if (SignalValues::isBool(*value)) {
                co_return label + ": " + (std::get<bool>(*value) ? "On" : "Off");
            }
            co_return label + ": " + SignalValues::toString(*value);
        } catch (const std::exception& e) {
            co_return label + ": Error: " + e.what();
        }
    }
};
