#pragma once

#include "Event.hpp"
#include "common/business/FrappeClient.hpp"
#include "common/utils/JsonHelper.hpp"
#include "common/utils/LoggerManager.hpp"

/**
 * @brief Durable destination of audit events
 *
 * deliver() must not throw and must not block the caller.
 */
class EventSink {
public:
    virtual ~EventSink() = default;
    virtual void deliver(const Event& event) = 0;
};

/**
 * @brief Inserts "Modbus Event" documents into the business system
 */
class FrappeEventSink : public EventSink {
public:
    template<typename T = void> using Task = drogon::Task<T>;

    explicit FrappeEventSink(std::shared_ptr<FrappeClient> client) : client_(std::move(client)) {}

    void deliver(const Event& event) override {
        drogon::async_run([client = client_, doc = event.toDocument(), seq = event.sequence]() -> Task<void> {
            try {
                co_await client->insertResource(Constants::DOCTYPE_EVENT, doc);
            } catch (const std::exception& e) {
                LOG_WARN << "[EventLog] Event #" << seq << " not persisted: " << e.what();
            }
        });
    }

private:
    std::shared_ptr<FrappeClient> client_;
};

/**
 * @brief Appends events as JSON lines to a local daily file
 *
 * Kept even when the business system is unreachable.
 */
class FileEventSink : public EventSink {
public:
    explicit FileEventSink(DailyLogFile* file) : file_(file) {}

    void deliver(const Event& event) override {
        if (!file_) return;
        file_->write(JsonHelper::serialize(event.toJson()) + "\n");
    }

private:
    DailyLogFile* file_;
};

/**
 * @brief Delivers every event to several sinks; one failing sink does not stop the rest
 */
class FanOutEventSink : public EventSink {
public:
    explicit FanOutEventSink(std::vector<std::shared_ptr<EventSink>> sinks) : sinks_(std::move(sinks)) {}

    void deliver(const Event& event) override {
        for (const auto& sink : sinks_) {
            try {
                sink->deliver(event);
            } catch (const std::exception& e) {
                LOG_WARN << "[EventLog] Sink rejected event #" << event.sequence << ": " << e.what();
            }
        }
    }

    size_t size() const { return sinks_.size(); }

private:
    std::vector<std::shared_ptr<EventSink>> sinks_;
};
