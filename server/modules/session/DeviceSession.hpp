#pragma once

#include "common/network/ModbusTransport.hpp"
#include "common/network/SessionState.hpp"
#include "common/protocol/modbus/Modbus.hpp"
#include "common/utils/AppException.hpp"
#include "modules/catalogue/domain/Catalogue.hpp"

/**
 * @brief Outcome of one request/response exchange
 */
struct ExchangeResult {
    modbus::ModbusResponse response;
    std::exception_ptr error;

    bool ok() const { return !error; }
};

/**
 * @brief Session to one device: transport, state machine and exchange queue
 *
 * Pinned to one event loop. Every member below the public API is touched only
 * on that loop; public calls hop onto it with queueInLoop. Exchanges run FIFO
 * with at most one in flight, each bounded by the request timeout.
 *
 * Failure (timeout, I/O error, peer close) moves the session to Error, fails
 * the in-flight exchange with its cause and the queued ones with
 * ConnectionError, drops the transport and schedules a reconnect with backoff.
 * A Modbus exception response fails only its own exchange.
 */
class DeviceSession : public std::enable_shared_from_this<DeviceSession> {
public:
    template<typename T = void> using Task = drogon::Task<T>;
    using ExchangeCallback = std::function<void(ExchangeResult)>;
    using StatusListener = std::function<void(const std::string& connection, SessionState from,
                                              SessionState to, const std::string& error)>;
    using SettledCallback = std::function<void(bool connected, const std::string& error)>;

    struct Options {
        int requestTimeoutMs = Constants::DEFAULT_REQUEST_TIMEOUT_MS;
        ReconnectPolicy::Options reconnect;
        ReconnectPolicy::JitterSource jitter;
        bool autoReconnect = true;
    };

    DeviceSession(Connection connection, trantor::EventLoop* loop, TransportFactory factory, Options options)
        : connection_(std::move(connection)),
          loop_(loop),
          factory_(std::move(factory)),
          options_(std::move(options)),
          fsm_(ReconnectPolicy(options_.reconnect, options_.jitter)) {}

    DeviceSession(const DeviceSession&) = delete;
    DeviceSession& operator=(const DeviceSession&) = delete;

    // ==================== Lifecycle ====================

    void start() {
        loop_->queueInLoop([weak = weak_from_this()]() {
            if (auto self = weak.lock()) self->doStart();
        });
    }

    /**
     * @brief Stop the session
     *
     * Queued exchanges fail at once; the in-flight one may finish (or time out)
     * before the transport closes. `onClosed` fires on the session loop.
     */
    void stop(std::function<void()> onClosed = nullptr) {
        loop_->queueInLoop([self = shared_from_this(), onClosed = std::move(onClosed)]() mutable {
            self->doStop(std::move(onClosed));
        });
    }

    /** Listeners must be added before start() */
    void addStatusListener(StatusListener listener) {
        statusListeners_.push_back(std::move(listener));
    }

    /**
     * @brief Fires once the session reaches Connected or Error
     */
    void whenSettled(SettledCallback cb) {
        loop_->queueInLoop([weak = weak_from_this(), cb = std::move(cb)]() mutable {
            auto self = weak.lock();
            if (!self) {
                cb(false, "Session released");
                return;
            }
            auto state = self->fsm_.state();
            if (state == SessionState::Connected) {
                cb(true, "");
            } else if (state == SessionState::Error) {
                cb(false, self->fsm_.errorMsg());
            } else {
                self->settleWaiters_.push_back(std::move(cb));
            }
        });
    }

    // ==================== Exchanges ====================

    /**
     * @brief Queue a read (FC01-04)
     * The callback runs on the session loop.
     */
    void read(uint8_t functionCode, uint16_t address, uint16_t quantity, ExchangeCallback callback) {
        Exchange ex;
        ex.functionCode = functionCode;
        ex.address = address;
        ex.quantity = quantity;
        ex.callback = std::move(callback);
        submit(std::move(ex));
    }

    /**
     * @brief Queue a write (FC05/06/10)
     * @param data FC05: {0|1}; FC06/FC10: big-endian register bytes
     */
    void write(uint8_t functionCode, uint16_t address, std::vector<uint8_t> data, ExchangeCallback callback) {
        Exchange ex;
        ex.functionCode = functionCode;
        ex.address = address;
        ex.quantity = functionCode == modbus::FuncCodes::WRITE_MULTIPLE_REGISTERS
            ? static_cast<uint16_t>(data.size() / 2) : 1;
        ex.data = std::move(data);
        ex.callback = std::move(callback);
        submit(std::move(ex));
    }

    Task<modbus::ModbusResponse> readCoro(uint8_t functionCode, uint16_t address, uint16_t quantity) {
        co_return co_await ExchangeAwaiter([this, functionCode, address, quantity](ExchangeCallback cb) {
            read(functionCode, address, quantity, std::move(cb));
        });
    }

    Task<modbus::ModbusResponse> writeCoro(uint8_t functionCode, uint16_t address, std::vector<uint8_t> data) {
        co_return co_await ExchangeAwaiter([this, functionCode, address, data = std::move(data)](ExchangeCallback cb) mutable {
            write(functionCode, address, std::move(data), std::move(cb));
        });
    }

    // ==================== Status ====================

    const Connection& connection() const { return connection_; }
    const std::string& name() const { return connection_.name; }
    trantor::EventLoop* loop() const { return loop_; }

    SessionState state() const { return stateMirror_.load(std::memory_order_acquire); }
    bool isConnected() const { return state() == SessionState::Connected; }

    Json::Value statusJson() const {
        Json::Value json;
        json["connection"] = connection_.name;
        json["host"] = connection_.host;
        json["port"] = connection_.port;
        json["unit_id"] = connection_.unitId;
        json["status"] = sessionStateToString(state());
        json["exchanges"] = static_cast<Json::Int64>(totalExchanges_.load(std::memory_order_relaxed));
        json["failures"] = static_cast<Json::Int64>(totalFailures_.load(std::memory_order_relaxed));
        json["timeouts"] = static_cast<Json::Int64>(totalTimeouts_.load(std::memory_order_relaxed));
        json["reconnect_attempts"] = reconnectAttemptsMirror_.load(std::memory_order_relaxed);
        {
            std::lock_guard<std::mutex> lock(errorMutex_);
            if (!lastError_.empty()) json["last_error"] = lastError_;
        }
        return json;
    }

private:
    struct Exchange {
        uint8_t functionCode = 0;
        uint16_t address = 0;
        uint16_t quantity = 0;
        std::vector<uint8_t> data;
        uint16_t transactionId = 0;
        ExchangeCallback callback;
    };

    /**
     * @brief Suspends a coroutine until the exchange callback fires
     */
    struct ExchangeAwaiter : drogon::CallbackAwaiter<modbus::ModbusResponse> {
        using Submit = std::function<void(ExchangeCallback)>;

        explicit ExchangeAwaiter(Submit submit) : submit_(std::move(submit)) {}

        void await_suspend(std::coroutine_handle<> handle) {
            submit_([this, handle](ExchangeResult result) {
                if (result.error) {
                    setException(result.error);
                } else {
                    setValue(std::move(result.response));
                }
                handle.resume();
            });
        }

    private:
        Submit submit_;
    };

    Connection connection_;
    trantor::EventLoop* loop_;
    TransportFactory factory_;
    Options options_;

    // loop-only state
    SessionStateMachine fsm_;
    ModbusTransportPtr transport_;
    uint64_t transportGeneration_ = 0;
    std::vector<uint8_t> rxBuffer_;
    std::deque<Exchange> queue_;
    std::optional<Exchange> inFlight_;
    uint16_t nextTransactionId_ = 1;
    trantor::TimerId exchangeTimer_{0};
    trantor::TimerId connectTimer_{0};
    trantor::TimerId reconnectTimer_{0};
    bool stopping_ = false;
    std::vector<std::function<void()>> closedCallbacks_;
    std::vector<SettledCallback> settleWaiters_;
    std::vector<StatusListener> statusListeners_;

    // readable from any thread
    std::atomic<SessionState> stateMirror_{SessionState::Disconnected};
    std::atomic<int> reconnectAttemptsMirror_{0};
    std::atomic<int64_t> totalExchanges_{0};
    std::atomic<int64_t> totalFailures_{0};
    std::atomic<int64_t> totalTimeouts_{0};
    mutable std::mutex errorMutex_;
    std::string lastError_;

    // ==================== Lifecycle (loop) ====================

    void doStart() {
        if (stopping_ || fsm_.state() != SessionState::Disconnected) return;
        LOG_INFO << "[Session " << name() << "] Connecting to " << connection_.host << ":" << connection_.port
                 << " (unit " << static_cast<int>(connection_.unitId) << ")";
        changeState([this]() { return fsm_.onStart(); });
        openTransport();
    }

    void doStop(std::function<void()> onClosed) {
        if (onClosed) closedCallbacks_.push_back(std::move(onClosed));
        if (fsm_.state() == SessionState::Disconnected && !transport_) {
            finishStop();
            return;
        }
        if (!stopping_) {
            stopping_ = true;
            LOG_INFO << "[Session " << name() << "] Stopping"
                     << (inFlight_ ? ", waiting for the exchange in flight" : "");
        }
        cancelTimer(reconnectTimer_);
        cancelTimer(connectTimer_);
        failQueued("Session " + name() + " is stopping");
        if (!inFlight_) finishStop();
    }

    void finishStop() {
        cancelTimer(exchangeTimer_);
        cancelTimer(connectTimer_);
        cancelTimer(reconnectTimer_);
        dropTransport();
        changeState([this]() { return fsm_.onStop(); });
        settle(false, "Session stopped");

        auto callbacks = std::move(closedCallbacks_);
        closedCallbacks_.clear();
        for (auto& cb : callbacks) {
            try {
                cb();
            } catch (const std::exception& e) {
                LOG_ERROR << "[Session " << name() << "] Close callback failed: " << e.what();
            }
        }
    }

    void openTransport() {
        auto generation = ++transportGeneration_;
        auto weak = weak_from_this();
        rxBuffer_.clear();

        try {
            transport_ = factory_(loop_, connection_.host, connection_.port);
        } catch (const std::exception& e) {
            handleFailure(std::make_exception_ptr(ConnectionError(e.what())), e.what());
            return;
        }

        transport_->setConnectionCallback([weak, generation](bool connected) {
            auto self = weak.lock();
            if (!self || generation != self->transportGeneration_) return;
            self->onTransportConnection(connected);
        });
        transport_->setMessageCallback([weak, generation](const uint8_t* data, size_t len) {
            auto self = weak.lock();
            if (!self || generation != self->transportGeneration_) return;
            self->onTransportData(data, len);
        });
        transport_->setErrorCallback([weak, generation](const std::string& reason) {
            auto self = weak.lock();
            if (!self || generation != self->transportGeneration_) return;
            self->handleFailure(std::make_exception_ptr(ConnectionError(reason)), reason);
        });

        connectTimer_ = loop_->runAfter(timeoutSec(), [weak, generation]() {
            auto self = weak.lock();
            if (!self || generation != self->transportGeneration_) return;
            self->connectTimer_ = 0;
            if (self->fsm_.state() != SessionState::Connecting) return;
            std::string reason = "Connect to " + self->transport_->peer() + " timed out after " +
                                 std::to_string(self->options_.requestTimeoutMs) + "ms";
            self->handleFailure(std::make_exception_ptr(TimeoutError(reason)), reason);
        });

        transport_->connect();
    }

    /** Release the transport after the current callback has unwound */
    void dropTransport() {
        ++transportGeneration_;
        rxBuffer_.clear();
        if (!transport_) return;
        auto transport = std::move(transport_);
        transport_.reset();
        transport->disconnect();
        loop_->queueInLoop([transport]() {});
    }

    // ==================== Transport events (loop) ====================

    void onTransportConnection(bool connected) {
        if (connected) {
            cancelTimer(connectTimer_);
            if (stopping_) return;
            LOG_INFO << "[Session " << name() << "] Connected to " << transport_->peer();
            changeState([this]() { return fsm_.onConnected(); });
            settle(true, "");
            pump();
        } else if (fsm_.state() == SessionState::Connected || fsm_.state() == SessionState::Connecting) {
            std::string reason = "Connection to " + connection_.host + ":" +
                                 std::to_string(connection_.port) + " closed";
            handleFailure(std::make_exception_ptr(ConnectionError(reason)), reason);
        }
    }

    void onTransportData(const uint8_t* data, size_t len) {
        rxBuffer_.insert(rxBuffer_.end(), data, data + len);

        while (!rxBuffer_.empty()) {
            size_t skip = modbus::ModbusUtils::skipInvalidMbapData(rxBuffer_);
            if (skip > 0) {
                LOG_DEBUG << "[Session " << name() << "] Skipped " << skip << " stray bytes";
                rxBuffer_.erase(rxBuffer_.begin(), rxBuffer_.begin() + static_cast<std::ptrdiff_t>(skip));
                continue;
            }

            modbus::ModbusResponse response;
            size_t consumed = modbus::ModbusUtils::parseTcpResponse(rxBuffer_, response);
            if (consumed == 0) break;
            if (consumed == modbus::ModbusUtils::FRAME_CORRUPT) {
                rxBuffer_.erase(rxBuffer_.begin());
                continue;
            }
            rxBuffer_.erase(rxBuffer_.begin(), rxBuffer_.begin() + static_cast<std::ptrdiff_t>(consumed));
            onResponse(std::move(response));

            // the callback may have failed the session and dropped the transport
            if (!transport_) break;
        }
    }

    void onResponse(modbus::ModbusResponse response) {
        if (!inFlight_ || inFlight_->transactionId != response.transactionId) {
            LOG_DEBUG << "[Session " << name() << "] Dropped response with unexpected transaction "
                      << response.transactionId;
            return;
        }
        if (response.functionCode != inFlight_->functionCode) {
            std::string reason = "Function code mismatch: sent " + std::to_string(inFlight_->functionCode) +
                                 ", got " + std::to_string(response.functionCode);
            completeInFlight({{}, std::make_exception_ptr(ProtocolError(reason, 0))});
            return;
        }

        // any frame proves the device is reachable
        fsm_.onExchangeSucceeded();
        reconnectAttemptsMirror_.store(fsm_.reconnectAttempts(), std::memory_order_relaxed);

        if (response.isException) {
            std::string reason = "Device exception " + modbus::exceptionCodeToString(response.exceptionCode) +
                                 " for FC" + std::to_string(response.functionCode) +
                                 " at " + std::to_string(inFlight_->address);
            LOG_WARN << "[Session " << name() << "] " << reason;
            completeInFlight({{}, std::make_exception_ptr(ProtocolError(reason, response.exceptionCode))});
            return;
        }

        if (!modbus::isWriteFunction(response.functionCode)) {
            bool bits = response.functionCode == modbus::FuncCodes::READ_COILS ||
                        response.functionCode == modbus::FuncCodes::READ_DISCRETE_INPUTS;
            size_t expected = bits ? (inFlight_->quantity + 7u) / 8u : inFlight_->quantity * 2u;
            if (response.data.size() < expected) {
                std::string reason = "Short response: expected " + std::to_string(expected) +
                                     " bytes, got " + std::to_string(response.data.size());
                completeInFlight({{}, std::make_exception_ptr(ProtocolError(reason, 0))});
                return;
            }
        }

        completeInFlight({std::move(response), nullptr});
    }

    // ==================== Exchange queue (loop) ====================

    void submit(Exchange ex) {
        loop_->queueInLoop([weak = weak_from_this(), ex = std::move(ex)]() mutable {
            auto self = weak.lock();
            if (!self) {
                invoke(ex.callback, {{}, std::make_exception_ptr(ConnectionError("Session released"))});
                return;
            }
            if (self->stopping_ || self->fsm_.state() != SessionState::Connected) {
                self->totalFailures_.fetch_add(1, std::memory_order_relaxed);
                std::string reason = "Connection " + self->name() + " is " + self->fsm_.stateString();
                if (!self->fsm_.errorMsg().empty()) reason += ": " + self->fsm_.errorMsg();
                invoke(ex.callback, {{}, std::make_exception_ptr(ConnectionError(reason))});
                return;
            }
            self->queue_.push_back(std::move(ex));
            self->pump();
        });
    }

    void pump() {
        if (inFlight_ || queue_.empty() || fsm_.state() != SessionState::Connected || !transport_) return;

        inFlight_ = std::move(queue_.front());
        queue_.pop_front();

        auto& ex = *inFlight_;
        ex.transactionId = nextTransactionId_++;
        if (nextTransactionId_ == 0) nextTransactionId_ = 1;

        std::vector<uint8_t> frame;
        if (modbus::isWriteFunction(ex.functionCode)) {
            modbus::ModbusWriteRequest req{connection_.unitId, ex.functionCode, ex.address, ex.data,
                                           ex.quantity, ex.transactionId};
            frame = modbus::ModbusUtils::buildWriteTcpRequest(req);
        } else {
            modbus::ModbusRequest req{connection_.unitId, ex.functionCode, ex.address, ex.quantity,
                                      ex.transactionId};
            frame = modbus::ModbusUtils::buildTcpRequest(req);
        }

        totalExchanges_.fetch_add(1, std::memory_order_relaxed);
        LOG_TRACE << "[Session " << name() << "] TX " << modbus::ModbusUtils::toHexString(frame);

        if (!transport_->send(frame)) {
            std::string reason = "Send to " + transport_->peer() + " failed";
            handleFailure(std::make_exception_ptr(ConnectionError(reason)), reason);
            return;
        }

        auto tid = ex.transactionId;
        exchangeTimer_ = loop_->runAfter(timeoutSec(), [weak = weak_from_this(), tid]() {
            auto self = weak.lock();
            if (!self) return;
            self->exchangeTimer_ = 0;
            self->onExchangeTimeout(tid);
        });
    }

    void onExchangeTimeout(uint16_t transactionId) {
        if (!inFlight_ || inFlight_->transactionId != transactionId) return;
        totalTimeouts_.fetch_add(1, std::memory_order_relaxed);
        std::string reason = "No response from " + name() + " within " +
                             std::to_string(options_.requestTimeoutMs) + "ms (FC" +
                             std::to_string(inFlight_->functionCode) + " at " +
                             std::to_string(inFlight_->address) + ")";
        handleFailure(std::make_exception_ptr(TimeoutError(reason)), reason);
    }

    void completeInFlight(ExchangeResult result) {
        cancelTimer(exchangeTimer_);
        if (!inFlight_) return;
        if (result.error) totalFailures_.fetch_add(1, std::memory_order_relaxed);

        auto callback = std::move(inFlight_->callback);
        inFlight_.reset();
        invoke(callback, std::move(result));

        if (stopping_ && !inFlight_) {
            finishStop();
            return;
        }
        pump();
    }

    void failQueued(const std::string& reason) {
        auto pending = std::move(queue_);
        queue_.clear();
        for (auto& ex : pending) {
            totalFailures_.fetch_add(1, std::memory_order_relaxed);
            invoke(ex.callback, {{}, std::make_exception_ptr(ConnectionError(reason))});
        }
    }

    // ==================== Failure / reconnect (loop) ====================

    void handleFailure(std::exception_ptr error, const std::string& reason) {
        if (fsm_.state() == SessionState::Disconnected) return;

        cancelTimer(exchangeTimer_);
        cancelTimer(connectTimer_);
        LOG_WARN << "[Session " << name() << "] " << reason;
        {
            std::lock_guard<std::mutex> lock(errorMutex_);
            lastError_ = reason;
        }

        changeState([this, &reason]() { return fsm_.onFailure(reason); });
        dropTransport();

        if (inFlight_) {
            totalFailures_.fetch_add(1, std::memory_order_relaxed);
            auto callback = std::move(inFlight_->callback);
            inFlight_.reset();
            invoke(callback, {{}, error});
        }
        failQueued("Connection " + name() + " failed: " + reason);
        settle(false, reason);

        if (stopping_) {
            finishStop();
            return;
        }
        if (options_.autoReconnect) {
            scheduleReconnect();
        }
    }

    void scheduleReconnect() {
        cancelTimer(reconnectTimer_);
        double delay = fsm_.getReconnectDelay();
        LOG_INFO << "[Session " << name() << "] Reconnect in " << std::fixed << std::setprecision(1)
                 << delay << "s (attempt " << (fsm_.reconnectAttempts() + 1) << ")";
        reconnectTimer_ = loop_->runAfter(delay, [weak = weak_from_this()]() {
            auto self = weak.lock();
            if (!self) return;
            self->reconnectTimer_ = 0;
            if (self->stopping_ || self->fsm_.state() != SessionState::Error) return;
            self->changeState([&self]() { return self->fsm_.onRetry(); });
            self->reconnectAttemptsMirror_.store(self->fsm_.reconnectAttempts(), std::memory_order_relaxed);
            self->openTransport();
        });
    }

    // ==================== Helpers (loop) ====================

    template<typename Fn>
    void changeState(Fn&& transition) {
        SessionState from = fsm_.state();
        if (!transition()) return;
        SessionState to = fsm_.state();
        stateMirror_.store(to, std::memory_order_release);

        for (const auto& listener : statusListeners_) {
            try {
                listener(connection_.name, from, to, fsm_.errorMsg());
            } catch (const std::exception& e) {
                LOG_ERROR << "[Session " << name() << "] Status listener failed: " << e.what();
            }
        }
    }

    void settle(bool connected, const std::string& error) {
        auto waiters = std::move(settleWaiters_);
        settleWaiters_.clear();
        for (auto& cb : waiters) {
            try {
                cb(connected, error);
            } catch (const std::exception& e) {
                LOG_ERROR << "[Session " << name() << "] Settle callback failed: " << e.what();
            }
        }
    }

    void cancelTimer(trantor::TimerId& id) {
        if (id != 0) {
            loop_->invalidateTimer(id);
            id = 0;
        }
    }

    double timeoutSec() const {
        return static_cast<double>(options_.requestTimeoutMs) / 1000.0;
    }

    static void invoke(const ExchangeCallback& callback, ExchangeResult result) {
        if (!callback) return;
        try {
            callback(std::move(result));
        } catch (const std::exception& e) {
            LOG_ERROR << "[Session] Exchange callback failed: " << e.what();
        }
    }
};

using DeviceSessionPtr = std::shared_ptr<DeviceSession>;
