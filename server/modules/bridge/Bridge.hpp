#pragma once

#include "CommandChannel.hpp"
#include "common/utils/ConfigManager.hpp"
#include "modules/catalogue/CatalogueLoader.hpp"
#include "modules/catalogue/FrappeCatalogueSource.hpp"
#include "modules/event/EventSink.hpp"
#include "modules/poll/PollScheduler.hpp"
#include "modules/session/ConnectionTester.hpp"

/**
 * @brief Wires the bridge components together
 *
 *   catalogue source -> loader -> registry -> session pool -> poll scheduler
 *                                                 |              |
 *                                   command executor       change detector -> publisher, actions, events
 *
 * A registry swap re-syncs the pool and then the scheduler. Session status
 * changes are published on plc:status and audited as Error events.
 */
class Bridge {
public:
    template<typename T = void> using Task = drogon::Task<T>;

    /**
     * @brief Replaceable collaborators; empty members get the production default
     */
    struct Dependencies {
        std::shared_ptr<CatalogueSource> source;
        TransportFactory transportFactory;
        std::shared_ptr<SignalPublisher> publisher;
        std::shared_ptr<ScriptRunner> scriptRunner;
        std::shared_ptr<EventSink> eventSink;
        ReconnectPolicy::JitterSource jitter;
    };

    Bridge(BridgeSettings settings, Dependencies deps)
        : settings_(std::move(settings)),
          client_(makeClient(settings_)),
          events_(resolveSink(deps, settings_, client_), Constants::EVENT_LOG_CAPACITY),
          publisher_(deps.publisher ? deps.publisher : std::make_shared<RedisSignalPublisher>()),
          pool_(deps.transportFactory ? deps.transportFactory : TcpModbusTransport::factory(),
                sessionOptions(settings_, deps.jitter), settings_.ioThreads),
          actions_(registry_,
                   deps.scriptRunner ? deps.scriptRunner : std::make_shared<FrappeScriptRunner>(client_),
                   events_),
          detector_(*publisher_, events_, &actions_, settings_.valueTolerance),
          scheduler_(registry_, pool_, detector_, [this](const Connection& conn) {
              return settings_.pollIntervalFor(conn.name, conn.pollIntervalMs);
          }),
          commands_(registry_, pool_, detector_, events_, actions_),
          tester_(pool_, events_),
          loader_(deps.source ? deps.source : std::make_shared<FrappeCatalogueSource>(client_),
                  registry_, settings_.batchMaxGap),
          channel_(commands_, *publisher_, [this]() { return reload(); }, [this]() { return summary(); }) {

        pool_.addStatusListener([this](const std::string& connection, SessionState from, SessionState to,
                                       const std::string& error) {
            onSessionStatus(connection, from, to, error);
        });

        registry_.addListener([this](const SnapshotPtr& previous, const SnapshotPtr& current) {
            pool_.sync(current);
            scheduler_.sync(current);
        });
    }

    ~Bridge() {
        shutdown();
    }

    Bridge(const Bridge&) = delete;
    Bridge& operator=(const Bridge&) = delete;

    // ==================== Process-wide instance ====================

    static Bridge& create(BridgeSettings settings, Dependencies deps = {}) {
        std::lock_guard<std::mutex> lock(instanceMutex_);
        instance_ = std::make_unique<Bridge>(std::move(settings), std::move(deps));
        return *instance_;
    }

    /**
     * @throws ServiceUnavailableException before create()
     */
    static Bridge& instance() {
        std::lock_guard<std::mutex> lock(instanceMutex_);
        if (!instance_) {
            throw ServiceUnavailableException("Bridge is not running");
        }
        return *instance_;
    }

    static void destroy() {
        std::unique_ptr<Bridge> bridge;
        {
            std::lock_guard<std::mutex> lock(instanceMutex_);
            bridge = std::move(instance_);
        }
    }

    // ==================== Lifecycle ====================

    /**
     * @brief Initial catalogue load, periodic refresh and the command channel
     *
     * A failed first load leaves the bridge running with an empty catalogue and
     * retries every CATALOGUE_RETRY_SEC until a load succeeds.
     */
    Task<void> start(trantor::EventLoop* loop) {
        loop_ = loop;
        try {
            co_await loader_.load();
        } catch (const CatalogueUnavailableError& e) {
            LOG_WARN << "[Bridge] " << e.what() << ", retrying every "
                     << Constants::CATALOGUE_RETRY_SEC << "s";
            scheduleRetry();
        }

        loader_.startPeriodicRefresh(loop_, settings_.catalogueRefreshSec);

        if (settings_.subscribeCommands && AppRedisConfig::enabled()) {
            channel_.subscribe();
        }
        LOG_INFO << "[Bridge] Started (business system " << client_->baseUrl() << ")";
    }

    /**
     * @brief Reload the catalogue now
     * @throws CatalogueUnavailableError the previous catalogue stays active
     */
    Task<void> reload() {
        co_await loader_.refresh();
    }

    /**
     * @brief Stop accepting commands, stop polling and close every session
     * Safe to call more than once.
     */
    void shutdown() {
        if (stopped_.exchange(true)) return;
        LOG_INFO << "[Bridge] Shutting down";
        channel_.unsubscribe();
        commands_.close();
        if (loop_ && retryTimer_ != 0) loop_->invalidateTimer(retryTimer_);
        loader_.stopPeriodicRefresh();
        scheduler_.stopAll();
        pool_.stopAll(settings_.requestTimeoutMs);
        LOG_INFO << "[Bridge] Stopped";
    }

    // ==================== Queries ====================

    Json::Value status() const {
        auto snapshot = registry_.snapshot();

        Json::Value json;
        json["timestamp"] = TimestampHelper::now();

        Json::Value catalogue;
        catalogue["version"] = static_cast<Json::UInt64>(snapshot->version);
        catalogue["loaded_at"] = snapshot->loadedAt;
        catalogue["connections"] = static_cast<Json::UInt>(snapshot->connections.size());
        catalogue["signals"] = static_cast<Json::UInt>(snapshot->signals.size());
        catalogue["actions"] = static_cast<Json::UInt>(snapshot->actions.size());
        json["catalogue"] = catalogue;

        json["sessions"] = pool_.statusJson();
        json["polling"] = scheduler_.statusJson();

        Json::Value commands;
        commands["closed"] = commands_.isClosed();
        commands["in_flight"] = commands_.inFlight();
        json["commands"] = commands;

        json["events_recorded"] = static_cast<Json::UInt64>(events_.count());
        return json;
    }

    /** Reply to the "status" command on plc:status */
    Json::Value summary() const {
        Json::Value json;
        json["running"] = !stopped_.load();
        json["signal_count"] = static_cast<Json::UInt>(registry_.snapshot()->signals.size());
        json["connections"] = pool_.statusJson();
        json["timestamp"] = TimestampHelper::now();
        return json;
    }

    // ==================== Components ====================

    const BridgeSettings& settings() const { return settings_; }
    SignalRegistry& registry() { return registry_; }
    EventLog& events() { return events_; }
    DeviceSessionPool& pool() { return pool_; }
    PollScheduler& scheduler() { return scheduler_; }
    ChangeDetector& detector() { return detector_; }
    CommandExecutor& commands() { return commands_; }
    ActionExecutor& actions() { return actions_; }
    ConnectionTester& tester() { return tester_; }
    CatalogueLoader& loader() { return loader_; }
    CommandChannel& channel() { return channel_; }

private:
    using SnapshotPtr = SignalRegistry::SnapshotPtr;

    BridgeSettings settings_;
    std::shared_ptr<FrappeClient> client_;
    SignalRegistry registry_;
    EventLog events_;
    std::shared_ptr<SignalPublisher> publisher_;
    DeviceSessionPool pool_;
    ActionExecutor actions_;
    ChangeDetector detector_;
    PollScheduler scheduler_;
    CommandExecutor commands_;
    ConnectionTester tester_;
    CatalogueLoader loader_;
    CommandChannel channel_;

    trantor::EventLoop* loop_ = nullptr;
    trantor::TimerId retryTimer_{0};
    std::atomic<bool> stopped_{false};

    inline static std::mutex instanceMutex_;
    inline static std::unique_ptr<Bridge> instance_;

    static std::shared_ptr<FrappeClient> makeClient(const BridgeSettings& settings) {
        FrappeClient::Options options;
        options.baseUrl = settings.baseUrl;
        options.apiKey = settings.apiKey;
        options.apiSecret = settings.apiSecret;
        return std::make_shared<FrappeClient>(options);
    }

    static std::shared_ptr<EventSink> resolveSink(const Dependencies& deps, const BridgeSettings& settings,
                                                  const std::shared_ptr<FrappeClient>& client) {
        if (deps.eventSink) return deps.eventSink;
        std::vector<std::shared_ptr<EventSink>> sinks;
        if (settings.persistEvents) sinks.push_back(std::make_shared<FrappeEventSink>(client));
        if (settings.eventAuditFile) {
            if (auto* file = LoggerManager::auditLog()) sinks.push_back(std::make_shared<FileEventSink>(file));
        }
        if (sinks.empty()) return nullptr;
        if (sinks.size() == 1) return sinks.front();
        return std::make_shared<FanOutEventSink>(std::move(sinks));
    }

    static DeviceSession::Options sessionOptions(const BridgeSettings& settings,
                                                 ReconnectPolicy::JitterSource jitter) {
        DeviceSession::Options options;
        options.requestTimeoutMs = settings.requestTimeoutMs;
        options.reconnect.baseSec = settings.reconnectBaseSec;
        options.reconnect.maxSec = settings.reconnectMaxSec;
        options.reconnect.jitter = settings.reconnectJitter;
        options.jitter = std::move(jitter);
        return options;
    }

    void scheduleRetry() {
        if (!loop_ || stopped_) return;
        retryTimer_ = loop_->runAfter(static_cast<double>(Constants::CATALOGUE_RETRY_SEC), [this]() {
            retryTimer_ = 0;
            if (stopped_ || registry_.loaded()) return;
            drogon::async_run([this]() -> Task<void> {
                try {
                    co_await loader_.load();
                    LOG_INFO << "[Bridge] Catalogue available";
                } catch (const CatalogueUnavailableError& e) {
                    LOG_WARN << "[Bridge] " << e.what();
                    scheduleRetry();
                }
            });
        });
    }

    void onSessionStatus(const std::string& connection, SessionState from, SessionState to,
                         const std::string& error) {
        publisher_->publishStatus(SignalPublisher::sessionMessage(connection, to, error));

        if (to == SessionState::Error) {
            LOG_WARN << "[Bridge] " << connection << " " << sessionStateToString(from)
                     << " -> error: " << error;
            Event event = Event::error(connection, "", error);
            event.message = "Session " + sessionStateToString(from) + " -> error";
            events_.record(std::move(event));
        } else {
            LOG_INFO << "[Bridge] " << connection << " " << sessionStateToString(from)
                     << " -> " << sessionStateToString(to);
        }
    }
};
