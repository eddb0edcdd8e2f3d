#pragma once

/**
 * @brief Byte stream to one Modbus device
 *
 * All callbacks fire on the loop the transport was created for.
 */
class ModbusTransport {
public:
    using MessageCallback = std::function<void(const uint8_t* data, size_t len)>;
    using ConnectionCallback = std::function<void(bool connected)>;
    using ErrorCallback = std::function<void(const std::string& reason)>;

    virtual ~ModbusTransport() = default;

    void setMessageCallback(MessageCallback cb) { messageCallback_ = std::move(cb); }
    void setConnectionCallback(ConnectionCallback cb) { connectionCallback_ = std::move(cb); }
    void setErrorCallback(ErrorCallback cb) { errorCallback_ = std::move(cb); }

    virtual void connect() = 0;
    virtual void disconnect() = 0;

    /** @return false when there is no open connection */
    virtual bool send(const std::vector<uint8_t>& frame) = 0;

    virtual std::string peer() const = 0;

protected:
    MessageCallback messageCallback_;
    ConnectionCallback connectionCallback_;
    ErrorCallback errorCallback_;
};

using ModbusTransportPtr = std::shared_ptr<ModbusTransport>;

/** Creates the transport of one session on the session's loop */
using TransportFactory = std::function<ModbusTransportPtr(trantor::EventLoop* loop,
                                                          const std::string& host,
                                                          uint16_t port)>;

/**
 * @brief Modbus TCP over trantor::TcpClient
 *
 * Host names go through trantor::Resolver on every connect(); IP literals
 * and "localhost" are used as they are. No built-in retry: reconnecting
 * is the session's decision.
 */
class TcpModbusTransport : public ModbusTransport, public std::enable_shared_from_this<TcpModbusTransport> {
public:
    using TcpClient = trantor::TcpClient;
    using TcpConnectionPtr = trantor::TcpConnectionPtr;
    using MsgBuffer = trantor::MsgBuffer;
    using InetAddress = trantor::InetAddress;

    static constexpr size_t RESOLVE_TIMEOUT_SEC = 10;

    /** Literal address of a host that needs no lookup */
    struct LiteralAddress {
        std::string ip;
        bool ipv6 = false;
    };

    TcpModbusTransport(trantor::EventLoop* loop, const std::string& host, uint16_t port)
        : loop_(loop), host_(host), port_(port) {}

    ~TcpModbusTransport() override {
        if (client_) {
            client_->stop();
            client_->disconnect();
        }
    }

    void connect() override {
        auto generation = ++generation_;
        if (auto literal = literalAddress(host_)) {
            open(InetAddress(literal->ip, port_, literal->ipv6));
            return;
        }

        if (!resolver_) resolver_ = trantor::Resolver::newResolver(loop_, RESOLVE_TIMEOUT_SEC);
        std::weak_ptr<TcpModbusTransport> weak = weak_from_this();
        // the callback may run on a resolver thread
        resolver_->resolve(host_, [weak, loop = loop_, generation](const InetAddress& resolved) {
            loop->runInLoop([weak, generation, resolved]() {
                auto self = weak.lock();
                if (!self || self->generation_ != generation) return;
                if (!resolved.isIpV6() && resolved.ipNetEndian() == 0) {
                    LOG_WARN << "[Transport] Cannot resolve " << self->host_;
                    if (self->errorCallback_) self->errorCallback_("Cannot resolve host " + self->host_);
                    return;
                }
                LOG_DEBUG << "[Transport] " << self->host_ << " resolved to " << resolved.toIp();
                self->open(InetAddress(resolved.toIp(), self->port_, resolved.isIpV6()));
            });
        });
    }

    void disconnect() override {
        ++generation_;
        if (!client_) return;
        client_->stop();
        client_->disconnect();
        conn_.reset();
    }

    bool send(const std::vector<uint8_t>& frame) override {
        if (!conn_ || !conn_->connected()) return false;
        conn_->send(frame.data(), frame.size());
        return true;
    }

    std::string peer() const override {
        return host_ + ":" + std::to_string(port_);
    }

    /**
     * @brief Address to connect to without a lookup
     * @return nullopt when host is a name for the resolver
     */
    static std::optional<LiteralAddress> literalAddress(const std::string& host) {
        if (host == "localhost") return LiteralAddress{"127.0.0.1", false};
        unsigned char buf[sizeof(struct in6_addr)];
        if (inet_pton(AF_INET, host.c_str(), buf) == 1) return LiteralAddress{host, false};
        if (inet_pton(AF_INET6, host.c_str(), buf) == 1) return LiteralAddress{host, true};
        return std::nullopt;
    }

    static TransportFactory factory() {
        return [](trantor::EventLoop* loop, const std::string& host, uint16_t port) -> ModbusTransportPtr {
            return std::make_shared<TcpModbusTransport>(loop, host, port);
        };
    }

private:
    trantor::EventLoop* loop_;
    std::string host_;
    uint16_t port_;
    std::shared_ptr<trantor::Resolver> resolver_;
    std::shared_ptr<TcpClient> client_;
    TcpConnectionPtr conn_;
    // bumped by connect()/disconnect(); stale lookups are ignored
    uint64_t generation_ = 0;

    void open(const InetAddress& addr) {
        if (client_) {
            client_->stop();
            client_->disconnect();
        }
        client_ = std::make_shared<TcpClient>(loop_, addr, "ModbusClient_" + host_ + ":" + std::to_string(port_));

        client_->setConnectionCallback([this](const TcpConnectionPtr& conn) {
            if (conn->connected()) {
                conn_ = conn;
                conn_->setTcpNoDelay(true);
            } else {
                conn_.reset();
            }
            if (connectionCallback_) connectionCallback_(conn->connected());
        });

        client_->setMessageCallback([this](const TcpConnectionPtr&, MsgBuffer* buf) {
            std::vector<uint8_t> data(buf->peek(), buf->peek() + buf->readableBytes());
            buf->retrieveAll();
            if (messageCallback_) messageCallback_(data.data(), data.size());
        });

        client_->setConnectionErrorCallback([this]() {
            if (errorCallback_) errorCallback_("Connection to " + peer() + " refused or unreachable");
        });

        client_->connect();
    }
};
