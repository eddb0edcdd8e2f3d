#pragma once

#include "modules/change/ChangeDetector.hpp"
#include "modules/session/DeviceSessionPool.hpp"

/**
 * @brief Periodic batch reads, one timer per connection
 *
 * The timer lives on the connection's session loop. A tick is skipped while
 * the session is not Connected or the previous cycle is still running.
 * A cycle reads the connection's precomputed batches one after the other;
 * the first failure ends the cycle (no inline retry).
 */
class PollScheduler {
public:
    using SnapshotPtr = SignalRegistry::SnapshotPtr;
    using IntervalFn = std::function<int(const Connection&)>;

    PollScheduler(SignalRegistry& registry, DeviceSessionPool& pool, ChangeDetector& detector, IntervalFn intervalFor)
        : registry_(registry), pool_(pool), detector_(detector), intervalFor_(std::move(intervalFor)) {}

    ~PollScheduler() {
        stopAll();
    }

    PollScheduler(const PollScheduler&) = delete;
    PollScheduler& operator=(const PollScheduler&) = delete;

    /**
     * @brief Start, restart or cancel timers to match a snapshot
     * Call after the session pool has been synced with the same snapshot.
     */
    void sync(const SnapshotPtr& snapshot) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) return;

        std::map<std::string, std::shared_ptr<Poller>> next;
        for (const auto& plan : snapshot->connections) {
            auto session = pool_.get(plan.connection.name);
            if (!session) continue;
            int intervalMs = intervalFor_(plan.connection);

            auto it = pollers_.find(plan.connection.name);
            if (it != pollers_.end() && it->second->session == session && it->second->intervalMs == intervalMs) {
                next.emplace(plan.connection.name, it->second);
                pollers_.erase(it);
                continue;
            }
            if (it != pollers_.end()) {
                cancel(*it->second);
                pollers_.erase(it);
            }

            auto poller = std::make_shared<Poller>();
            poller->connection = plan.connection.name;
            poller->session = session;
            poller->intervalMs = intervalMs;
            start(poller);
            next.emplace(plan.connection.name, poller);
        }

        for (auto& [name, poller] : pollers_) {
            LOG_INFO << "[Poll] " << name << " no longer polled";
            cancel(*poller);
        }
        pollers_ = std::move(next);
    }

    void stopAll() {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_ = true;
        for (auto& [name, poller] : pollers_) cancel(*poller);
        pollers_.clear();
    }

    /**
     * @brief Run one cycle for a connection now (no-op when busy or not connected)
     */
    void pollNow(const std::string& connection) {
        std::shared_ptr<Poller> poller;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = pollers_.find(connection);
            if (it == pollers_.end()) return;
            poller = it->second;
        }
        poller->session->loop()->queueInLoop([this, poller]() { tick(poller); });
    }

    Json::Value statusJson() const {
        Json::Value json(Json::objectValue);
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [name, poller] : pollers_) {
            Json::Value item;
            item["interval_ms"] = poller->intervalMs;
            item["cycles"] = static_cast<Json::Int64>(poller->cycles.load(std::memory_order_relaxed));
            item["skipped"] = static_cast<Json::Int64>(poller->skipped.load(std::memory_order_relaxed));
            item["failures"] = static_cast<Json::Int64>(poller->failures.load(std::memory_order_relaxed));
            json[name] = item;
        }
        return json;
    }

private:
    struct Poller {
        std::string connection;
        DeviceSessionPtr session;
        int intervalMs = 0;
        trantor::TimerId timerId{0};
        std::atomic<bool> busy{false};
        std::atomic<bool> cancelled{false};
        std::atomic<int64_t> cycles{0};
        std::atomic<int64_t> skipped{0};
        std::atomic<int64_t> failures{0};
    };

    /** State of one running cycle */
    struct Cycle {
        std::shared_ptr<Poller> poller;
        SnapshotPtr snapshot;
        const ConnectionPlan* plan = nullptr;
        size_t next = 0;
    };

    SignalRegistry& registry_;
    DeviceSessionPool& pool_;
    ChangeDetector& detector_;
    IntervalFn intervalFor_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Poller>> pollers_;
    bool stopped_ = false;

    void start(const std::shared_ptr<Poller>& poller) {
        auto* loop = poller->session->loop();
        double interval = static_cast<double>(poller->intervalMs) / 1000.0;
        poller->timerId = loop->runEvery(interval, [this, weak = std::weak_ptr<Poller>(poller)]() {
            auto p = weak.lock();
            if (!p || p->cancelled) return;
            try {
                tick(p);
            } catch (const std::exception& e) {
                p->busy = false;
                LOG_ERROR << "[Poll] " << p->connection << " tick failed: " << e.what();
            }
        });
        LOG_INFO << "[Poll] " << poller->connection << " every " << poller->intervalMs << "ms";
    }

    static void cancel(Poller& poller) {
        poller.cancelled = true;
        poller.session->loop()->invalidateTimer(poller.timerId);
    }

    void tick(const std::shared_ptr<Poller>& poller) {
        if (poller->cancelled) return;
        if (!poller->session->isConnected() || poller->busy) {
            poller->skipped.fetch_add(1, std::memory_order_relaxed);
            return;
        }

        auto cycle = std::make_shared<Cycle>();
        cycle->poller = poller;
        cycle->snapshot = registry_.snapshot();
        cycle->plan = cycle->snapshot->findConnection(poller->connection);
        if (!cycle->plan || cycle->plan->batches.empty()) return;

        poller->busy = true;
        poller->cycles.fetch_add(1, std::memory_order_relaxed);
        readNext(cycle);
    }

    void readNext(const std::shared_ptr<Cycle>& cycle) {
        auto& poller = *cycle->poller;
        if (poller.cancelled || cycle->next >= cycle->plan->batches.size()) {
            poller.busy = false;
            return;
        }

        const auto& batch = cycle->plan->batches[cycle->next];
        poller.session->read(batch.functionCode, batch.startAddress, batch.totalQuantity,
            [this, cycle](ExchangeResult result) {
                const auto& batch = cycle->plan->batches[cycle->next];
                if (!result.ok()) {
                    cycle->poller->failures.fetch_add(1, std::memory_order_relaxed);
                    cycle->poller->busy = false;
                    onFailure(*cycle, batch, result.error);
                    return;
                }
                detector_.onBatch(*cycle->snapshot, batch, result.response);
                ++cycle->next;
                readNext(cycle);
            });
    }

    /**
     * Device exceptions are audited here; connection-level failures are
     * audited by the session status change they cause.
     */
    void onFailure(const Cycle& cycle, const modbus::ReadGroup& batch, const std::exception_ptr& error) {
        const auto& name = cycle.poller->connection;
        try {
            std::rethrow_exception(error);
        } catch (const ProtocolError& e) {
            detector_.onReadFailure(name, batch, e.what());
        } catch (const ConnectionError& e) {
            LOG_DEBUG << "[Poll] " << name << " cycle aborted: " << e.what();
        } catch (const std::exception& e) {
            detector_.onReadFailure(name, batch, e.what());
        }
    }
};
