#pragma once

#include "EventSink.hpp"
#include "common/utils/TimestampHelper.hpp"

/**
 * @brief Bridge audit trail
 *
 * record() stamps the event, logs it, keeps it in a bounded in-memory ring and
 * hands it to the sink. Safe from any thread; never throws to the caller.
 */
class EventLog {
public:
    explicit EventLog(std::shared_ptr<EventSink> sink = nullptr,
                      size_t capacity = Constants::EVENT_LOG_CAPACITY)
        : sink_(std::move(sink)), capacity_(capacity) {}

    void setSink(std::shared_ptr<EventSink> sink) {
        std::lock_guard<std::mutex> lock(mutex_);
        sink_ = std::move(sink);
    }

    void record(Event event) {
        std::shared_ptr<EventSink> sink;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            event.sequence = ++sequence_;
            if (event.timestamp.empty()) event.timestamp = TimestampHelper::now();
            recent_.push_back(event);
            while (recent_.size() > capacity_) recent_.pop_front();
            sink = sink_;
        }

        log(event);

        if (sink) {
            try {
                sink->deliver(event);
            } catch (const std::exception& e) {
                LOG_ERROR << "[EventLog] Sink failed for event #" << event.sequence << ": " << e.what();
            }
        }
    }

    /**
     * @brief Most recent events, newest first
     * @param limit 0 = all kept
     * @param type only this type when set
     */
    std::vector<Event> recent(size_t limit = 0, std::optional<EventType> type = std::nullopt) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Event> result;
        for (auto it = recent_.rbegin(); it != recent_.rend(); ++it) {
            if (type && it->type != *type) continue;
            result.push_back(*it);
            if (limit > 0 && result.size() >= limit) break;
        }
        return result;
    }

    uint64_t count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sequence_;
    }

private:
    mutable std::mutex mutex_;
    std::shared_ptr<EventSink> sink_;
    size_t capacity_;
    std::deque<Event> recent_;
    uint64_t sequence_ = 0;

    static void log(const Event& event) {
        std::ostringstream line;
        line << "[Event] " << eventTypeToString(event.type) << " " << eventStatusToString(event.status);
        if (!event.connection.empty()) line << " conn=" << event.connection;
        if (!event.signal.empty()) line << " signal=" << event.signal;
        if (!event.action.empty()) line << " action=" << event.action;
        if (event.previousValue) line << " prev=" << SignalValues::toString(*event.previousValue);
        if (event.newValue) line << " new=" << SignalValues::toString(*event.newValue);
        if (!event.message.empty()) line << " | " << event.message;
        if (!event.errorMessage.empty()) line << " | " << event.errorMessage;

        if (event.status == EventStatus::Failed) {
            LOG_WARN << line.str();
        } else if (event.type == EventType::SignalUpdate) {
            LOG_DEBUG << line.str();
        } else {
            LOG_INFO << line.str();
        }
    }
};
