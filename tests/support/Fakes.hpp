#pragma once

#include "modules/catalogue/CatalogueLoader.hpp"
#include "modules/change/SignalPublisher.hpp"
#include "modules/command/ActionExecutor.hpp"
#include "modules/event/EventSink.hpp"

namespace testing_support {

/**
 * @brief Catalogue served from memory; `failing` makes fetch() throw
 */
class FakeCatalogueSource : public CatalogueSource {
public:
    CatalogueData data;
    std::atomic<bool> failing{false};
    std::atomic<int> fetches{0};

    Task<CatalogueData> fetch() override {
        fetches.fetch_add(1);
        if (failing) {
            throw BusinessSystemError("GET Modbus Connection failed: connection refused");
        }
        co_return data;
    }

    std::string describe() const override {
        return "memory";
    }
};

/**
 * @brief Remembers every publish
 */
class RecordingPublisher : public SignalPublisher {
public:
    void publishSignal(const std::string& signal, const SignalValue& value) override {
        std::lock_guard<std::mutex> lock(mutex_);
        signals_.emplace_back(signal, value);
    }

    void publishStatus(const Json::Value& status) override {
        std::lock_guard<std::mutex> lock(mutex_);
        statuses_.push_back(status);
    }

    std::vector<std::pair<std::string, SignalValue>> signals() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return signals_;
    }

    std::vector<Json::Value> statuses() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return statuses_;
    }

    size_t countFor(const std::string& signal) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<size_t>(std::count_if(signals_.begin(), signals_.end(),
            [&](const auto& entry) { return entry.first == signal; }));
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::pair<std::string, SignalValue>> signals_;
    std::vector<Json::Value> statuses_;
};

/**
 * @brief Script runner that records calls; `failure` makes it throw
 */
class FakeScriptRunner : public ScriptRunner {
public:
    struct Call {
        std::string method;
        Json::Value context;
    };

    std::string failure;
    Json::Value reply = Json::Value("ok");

    Task<Json::Value> run(const std::string& method, const Json::Value& context) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            calls_.push_back({method, context});
        }
        if (!failure.empty()) {
            throw BusinessSystemError(failure);
        }
        co_return reply;
    }

    std::vector<Call> calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<Call> calls_;
};

class RecordingSink : public EventSink {
public:
    void deliver(const Event& event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(event);
    }

    std::vector<Event> events() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<Event> events_;
};

// ==================== Builders ====================

inline SignalRecord signalRow(const std::string& name, const std::string& kind, std::optional<int64_t> linear,
                              const std::string& plcAddress = "", Json::Value value = Json::Value()) {
    SignalRecord row;
    row.name = name;
    row.label = name;
    row.kind = kind;
    row.linearAddress = linear;
    row.hierarchicalAddress = plcAddress;
    row.value = std::move(value);
    return row;
}

inline ConnectionRecord connectionRow(const std::string& name, const std::string& host, uint16_t port,
                                      std::vector<SignalRecord> signals) {
    ConnectionRecord record;
    record.connection.name = name;
    record.connection.deviceName = name;
    record.connection.host = host;
    record.connection.port = port;
    record.signals = std::move(signals);
    return record;
}

inline Action signalChangeAction(const std::string& name, const std::string& signal,
                                 SignalCondition condition = SignalCondition::AnyChange,
                                 const std::string& literal = "") {
    Action action;
    action.name = name;
    action.signal = signal;
    action.serverScript = "warehouse.api." + name;
    action.trigger = TriggerType::SignalChange;
    action.condition = condition;
    action.conditionValue = literal;
    return action;
}

/** Snapshot built the way the loader builds it */
inline SignalRegistry::SnapshotPtr buildSnapshot(const CatalogueData& data, uint64_t version = 1,
                                                 int batchMaxGap = 0) {
    return CatalogueLoader::buildSnapshot(data, nullptr, version, batchMaxGap);
}

/**
 * @brief Poll `predicate` until it holds or `timeoutMs` passes
 */
template<typename Predicate>
bool waitFor(Predicate predicate, int timeoutMs = 3000) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return predicate();
}

}  // namespace testing_support
