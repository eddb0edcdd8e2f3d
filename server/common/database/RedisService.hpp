#pragma once

#include "common/utils/AppException.hpp"
#include "common/utils/JsonHelper.hpp"

/**
 * @brief Redis configuration (set by ConfigManager)
 */
struct AppRedisConfig {
    static bool& useFast() {
        static bool value = false;
        return value;
    }

    /** redis_clients present in the config */
    static bool& enabled() {
        static bool value = false;
        return value;
    }
};

/**
 * @brief Redis access for the plc:signal_update, plc:status and plc:command channels
 *
 * Stateless; every call resolves Drogon's "default" client.
 */
class RedisService {
public:
    using RedisClientPtr = drogon::nosql::RedisClientPtr;
    using RedisSubscriberPtr = std::shared_ptr<drogon::nosql::RedisSubscriber>;
    template<typename T = void> using Task = drogon::Task<T>;

    /**
     * @throws ServiceUnavailableException when Redis is not configured or Drogon has no client
     */
    RedisClientPtr getClient() const {
        if (!AppRedisConfig::enabled()) {
            throw ServiceUnavailableException("Redis is not configured");
        }
        RedisClientPtr client;
        try {
            client = AppRedisConfig::useFast()
                ? drogon::app().getFastRedisClient("default")
                : drogon::app().getRedisClient("default");
        } catch (const std::exception& e) {
            throw ServiceUnavailableException(std::string("Redis client 'default': ") + e.what());
        }
        if (!client) {
            throw ServiceUnavailableException("Redis client 'default' was not created");
        }
        return client;
    }

    /** @throws ServiceUnavailableException unless the server answers PONG */
    Task<void> ping() {
        auto client = getClient();
        auto result = co_await client->execCommandCoro("PING");
        std::string reply = result.isNil() ? "nil" : result.asString();
        if (reply != "PONG" && reply != "pong") {
            throw ServiceUnavailableException("Redis PING answered " + reply);
        }
    }

    /**
     * @brief PUBLISH a JSON message
     * @return number of subscribers that received it
     */
    Task<int64_t> publish(const std::string& channel, const Json::Value& message) {
        auto client = getClient();
        auto payload = JsonHelper::serialize(message);
        auto result = co_await client->execCommandCoro("PUBLISH %s %s", channel.c_str(), payload.c_str());
        co_return result.asInteger();
    }

    /** The caller keeps the subscriber alive */
    RedisSubscriberPtr newSubscriber() const {
        return getClient()->newSubscriber();
    }
};
