#pragma once

#include "common/database/RedisService.hpp"
#include "common/network/SessionState.hpp"
#include "common/utils/TimestampHelper.hpp"
#include "modules/catalogue/domain/SignalValue.hpp"

/**
 * @brief Realtime fan-out of signal values and bridge status
 *
 * Best effort: publish calls return at once and never throw.
 */
class SignalPublisher {
public:
    virtual ~SignalPublisher() = default;

    virtual void publishSignal(const std::string& signal, const SignalValue& value) = 0;
    virtual void publishStatus(const Json::Value& status) = 0;

    /** {"signal_name","value","timestamp"} */
    static Json::Value signalMessage(const std::string& signal, const SignalValue& value) {
        Json::Value msg;
        msg["signal_name"] = signal;
        msg["value"] = SignalValues::toJson(value);
        msg["timestamp"] = TimestampHelper::now();
        return msg;
    }

    /** {"connection","status","error","timestamp"} */
    static Json::Value sessionMessage(const std::string& connection, SessionState state, const std::string& error) {
        Json::Value msg;
        msg["connection"] = connection;
        msg["status"] = sessionStateToString(state);
        msg["error"] = error;
        msg["timestamp"] = TimestampHelper::now();
        return msg;
    }
};

/**
 * @brief PUBLISH on the plc:* Redis channels
 *
 * Messages leave in the order they were published: one drain coroutine
 * sends them one after another. Past MAX_PENDING the oldest is dropped.
 */
class RedisSignalPublisher : public SignalPublisher {
public:
    template<typename T = void> using Task = drogon::Task<T>;
    using SendFn = std::function<Task<void>(std::string channel, Json::Value message)>;

    static constexpr size_t MAX_PENDING = 10000;

    RedisSignalPublisher() : send_(redisSend), requiresRedis_(true) {}

    /** Send through another transport, Redis settings are not consulted */
    explicit RedisSignalPublisher(SendFn send) : send_(std::move(send)), requiresRedis_(false) {}

    void publishSignal(const std::string& signal, const SignalValue& value) override {
        publish(Constants::CHANNEL_SIGNAL_UPDATE, signalMessage(signal, value));
    }

    void publishStatus(const Json::Value& status) override {
        publish(Constants::CHANNEL_STATUS, status);
    }

    size_t pending() const {
        std::lock_guard lock(mutex_);
        return pending_.size();
    }

    int64_t dropped() const { return dropped_.load(std::memory_order_relaxed); }

private:
    SendFn send_;
    bool requiresRedis_;
    mutable std::mutex mutex_;
    std::deque<std::pair<std::string, Json::Value>> pending_;
    bool draining_ = false;
    std::atomic<int64_t> failures_{0};
    std::atomic<int64_t> dropped_{0};

    static Task<void> redisSend(std::string channel, Json::Value message) {
        RedisService redis;
        co_await redis.publish(channel, message);
    }

    void publish(std::string channel, Json::Value message) {
        if (requiresRedis_ && !AppRedisConfig::enabled()) return;
        {
            std::lock_guard lock(mutex_);
            if (pending_.size() >= MAX_PENDING) {
                pending_.pop_front();
                if (dropped_.fetch_add(1, std::memory_order_relaxed) % 1000 == 0) {
                    LOG_WARN << "[Publisher] Backlog full, dropping oldest messages";
                }
            }
            pending_.emplace_back(std::move(channel), std::move(message));
            if (draining_) return;
            draining_ = true;
        }
        drogon::async_run([this]() -> Task<void> { co_await drain(); });
    }

    Task<void> drain() {
        for (;;) {
            std::pair<std::string, Json::Value> next;
            {
                std::lock_guard lock(mutex_);
                if (pending_.empty()) {
                    draining_ = false;
                    break;
                }
                next = std::move(pending_.front());
                pending_.pop_front();
            }
            try {
                co_await send_(next.first, std::move(next.second));
            } catch (const std::exception& e) {
                // first failure, then every 100th
                auto n = failures_.fetch_add(1, std::memory_order_relaxed);
                if (n % 100 == 0) {
                    LOG_WARN << "[Publisher] PUBLISH " << next.first << " failed (" << (n + 1)
                             << " so far): " << e.what();
                }
            }
        }
    }
};
