#pragma once

#include "common/database/RedisService.hpp"
#include "modules/change/SignalPublisher.hpp"
#include "modules/command/CommandExecutor.hpp"

/**
 * @brief Commands arriving on the Redis plc:command channel
 *
 *   {"command":"write_signal","signal":"PICK_BIN_01","value":true}
 *   {"command":"reload_signals"}
 *   {"command":"status"}
 *
 * Results are logged; status replies go out on plc:status.
 */
class CommandChannel {
public:
    template<typename T = void> using Task = drogon::Task<T>;
    using ReloadFn = std::function<Task<void>()>;
    using StatusFn = std::function<Json::Value()>;

    CommandChannel(CommandExecutor& commands, SignalPublisher& publisher, ReloadFn reload, StatusFn status)
        : commands_(commands), publisher_(publisher), reload_(std::move(reload)), status_(std::move(status)) {}

    ~CommandChannel() {
        unsubscribe();
    }

    void subscribe() {
        RedisService redis;
        subscriber_ = redis.newSubscriber();
        subscriber_->subscribe(Constants::CHANNEL_COMMAND,
            [this](const std::string& channel, const std::string& message) {
                drogon::async_run([this, message]() -> Task<void> {
                    try {
                        co_await handle(message);
                    } catch (const std::exception& e) {
                        LOG_ERROR << "[CommandChannel] " << e.what();
                    }
                });
            });
        LOG_INFO << "[CommandChannel] Subscribed to " << Constants::CHANNEL_COMMAND;
    }

    void unsubscribe() {
        if (subscriber_) {
            subscriber_->unsubscribe(Constants::CHANNEL_COMMAND);
            subscriber_.reset();
        }
    }

    /**
     * @brief Execute one command message
     * @throws AppException for malformed or rejected commands
     */
    Task<void> handle(std::string payload) {
        auto message = JsonHelper::parse(payload);
        auto command = JsonHelper::getString(message, "command");

        if (command == "write_signal") {
            auto signal = JsonHelper::getString(message, "signal", JsonHelper::getString(message, "signal_name"));
            auto result = co_await commands_.writeSignal(signal, message["value"]);
            if (result.success) {
                LOG_INFO << "[CommandChannel] write_signal " << signal << " ok";
            } else {
                LOG_WARN << "[CommandChannel] write_signal " << signal << " failed: " << result.error;
            }
        } else if (command == "reload_signals") {
            co_await reload_();
        } else if (command == "status") {
            publisher_.publishStatus(status_());
        } else {
            throw ValidationException("Unknown command '" + command + "'");
        }
    }

private:
    CommandExecutor& commands_;
    SignalPublisher& publisher_;
    ReloadFn reload_;
    StatusFn status_;
    RedisService::RedisSubscriberPtr subscriber_;
};
