#pragma once

#include "DeviceSession.hpp"
#include "modules/catalogue/SignalRegistry.hpp"

/**
 * @brief One DeviceSession per connection, spread over an IO loop pool
 *
 * A session is pinned to the loop it was created on; loops are handed out
 * round-robin. sync() follows the catalogue: new connections get a session,
 * removed ones are stopped, and an endpoint change replaces the session.
 */
class DeviceSessionPool {
public:
    using EventLoop = trantor::EventLoop;
    using EventLoopThreadPool = trantor::EventLoopThreadPool;
    using SnapshotPtr = SignalRegistry::SnapshotPtr;

    DeviceSessionPool(TransportFactory factory, DeviceSession::Options options, size_t numThreads = 0)
        : factory_(std::move(factory)), options_(std::move(options)) {
        if (numThreads == 0) {
            numThreads = std::thread::hardware_concurrency();
            if (numThreads == 0) numThreads = 4;
        }
        ioLoopPool_ = std::make_unique<EventLoopThreadPool>(numThreads, "DeviceIoPool");
        ioLoopPool_->start();
        LOG_INFO << "[SessionPool] Started with " << numThreads << " IO threads";
    }

    ~DeviceSessionPool() {
        stopAll(options_.requestTimeoutMs);
    }

    DeviceSessionPool(const DeviceSessionPool&) = delete;
    DeviceSessionPool& operator=(const DeviceSessionPool&) = delete;

    /** Applied to every session created afterwards */
    void addStatusListener(DeviceSession::StatusListener listener) {
        std::lock_guard<std::mutex> lock(mutex_);
        statusListeners_.push_back(std::move(listener));
    }

    /**
     * @brief Reconcile sessions with a catalogue snapshot
     */
    void sync(const SnapshotPtr& snapshot) {
        std::vector<DeviceSessionPtr> toStop;
        std::vector<DeviceSessionPtr> toStart;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) return;

            std::map<std::string, DeviceSessionPtr> next;
            for (const auto& plan : snapshot->connections) {
                const auto& conn = plan.connection;
                auto it = sessions_.find(conn.name);
                if (it != sessions_.end() && it->second->connection().sameEndpoint(conn)) {
                    next.emplace(conn.name, it->second);
                    sessions_.erase(it);
                    continue;
                }
                if (it != sessions_.end()) {
                    LOG_INFO << "[SessionPool] Endpoint of " << conn.name << " changed, replacing session";
                    toStop.push_back(it->second);
                    sessions_.erase(it);
                }
                auto session = createSession(conn);
                next.emplace(conn.name, session);
                toStart.push_back(session);
            }

            for (auto& [name, session] : sessions_) {
                LOG_INFO << "[SessionPool] Connection " << name << " removed from catalogue";
                toStop.push_back(session);
            }
            sessions_ = std::move(next);
        }

        for (auto& session : toStop) session->stop();
        for (auto& session : toStart) session->start();
    }

    DeviceSessionPtr get(const std::string& connection) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(connection);
        return it == sessions_.end() ? nullptr : it->second;
    }

    std::vector<DeviceSessionPtr> sessions() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<DeviceSessionPtr> result;
        result.reserve(sessions_.size());
        for (const auto& [name, session] : sessions_) result.push_back(session);
        return result;
    }

    Json::Value statusJson() const {
        Json::Value json(Json::arrayValue);
        for (const auto& session : sessions()) {
            json.append(session->statusJson());
        }
        return json;
    }

    EventLoop* getNextLoop() {
        return ioLoopPool_->getNextLoop();
    }

    TransportFactory transportFactory() const { return factory_; }
    const DeviceSession::Options& options() const { return options_; }

    /**
     * @brief Stop every session, waiting at most `timeoutMs` for in-flight exchanges
     *
     * Must not be called from a device IO loop.
     */
    void stopAll(int timeoutMs) {
        std::map<std::string, DeviceSessionPtr> sessions;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) return;
            closed_ = true;
            sessions.swap(sessions_);
        }
        if (sessions.empty()) return;

        auto remaining = std::make_shared<std::atomic<size_t>>(sessions.size());
        auto done = std::make_shared<std::promise<void>>();
        auto future = done->get_future();
        for (auto& [name, session] : sessions) {
            session->stop([remaining, done]() {
                if (remaining->fetch_sub(1) == 1) done->set_value();
            });
        }

        // in-flight exchange, plus a second for the transports to close
        auto budget = std::chrono::milliseconds(timeoutMs + 1000);
        if (future.wait_for(budget) != std::future_status::ready) {
            LOG_WARN << "[SessionPool] " << remaining->load() << " sessions still closing after "
                     << budget.count() << "ms";
        } else {
            LOG_INFO << "[SessionPool] All " << sessions.size() << " sessions closed";
        }
    }

private:
    TransportFactory factory_;
    DeviceSession::Options options_;
    std::unique_ptr<EventLoopThreadPool> ioLoopPool_;

    mutable std::mutex mutex_;
    std::map<std::string, DeviceSessionPtr> sessions_;
    std::vector<DeviceSession::StatusListener> statusListeners_;
    bool closed_ = false;

    DeviceSessionPtr createSession(const Connection& conn) {
        auto session = std::make_shared<DeviceSession>(conn, ioLoopPool_->getNextLoop(), factory_, options_);
        for (const auto& listener : statusListeners_) {
            session->addStatusListener(listener);
        }
        return session;
    }
};
