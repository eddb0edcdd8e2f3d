#include <gtest/gtest.h>

#include "modules/session/ConnectionTester.hpp"
#include "support/FakeModbusDevice.hpp"
#include "support/Fakes.hpp"

using namespace testing_support;

namespace {

DeviceSession::Options fastOptions() {
    DeviceSession::Options options;
    options.requestTimeoutMs = 200;
    options.reconnect.baseSec = 0.05;
    options.reconnect.maxSec = 0.2;
    options.reconnect.jitter = 0.0;
    return options;
}

Connection endpoint(const std::string& name, const std::string& host, uint16_t port) {
    Connection conn;
    conn.name = name;
    conn.deviceName = name;
    conn.host = host;
    conn.port = port;
    return conn;
}

}  // namespace

class DeviceSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        loopThread.run();
    }

    void TearDown() override {
        for (auto& session : sessions) {
            std::promise<void> closed;
            session->stop([&closed]() { closed.set_value(); });
            closed.get_future().wait_for(std::chrono::seconds(2));
        }
        sessions.clear();
    }

    DeviceSessionPtr open(const std::string& name, uint16_t port, DeviceSession::Options options = fastOptions()) {
        auto session = std::make_shared<DeviceSession>(endpoint(name, "127.0.0.1", port), loopThread.getLoop(),
                                                       network.factory(), options);
        session->addStatusListener([this](const std::string& conn, SessionState, SessionState to,
                                          const std::string&) {
            std::lock_guard<std::mutex> lock(mutex);
            transitions.emplace_back(conn, to);
        });
        session->start();
        sessions.push_back(session);
        return session;
    }

    bool reached(const std::string& conn, SessionState state) {
        std::lock_guard<std::mutex> lock(mutex);
        for (const auto& [name, to] : transitions) {
            if (name == conn && to == state) return true;
        }
        return false;
    }

    trantor::EventLoopThread loopThread{"SessionTestLoop"};
    FakeNetwork network;
    std::vector<DeviceSessionPtr> sessions;
    std::mutex mutex;
    std::vector<std::pair<std::string, SessionState>> transitions;
};

TEST_F(DeviceSessionTest, ReadsFromTheDevice) {
    auto device = network.add("127.0.0.1", 5020);
    device->setHolding(10, 300);
    device->setCoil(1, true);

    auto session = open("OpenPLC Simulator", 5020);
    ASSERT_TRUE(waitFor([&] { return session->isConnected(); }));

    auto registers = drogon::sync_wait(session->readCoro(modbus::FuncCodes::READ_HOLDING_REGISTERS, 10, 1));
    EXPECT_EQ(registers.data, (std::vector<uint8_t>{0x01, 0x2C}));

    auto coils = drogon::sync_wait(session->readCoro(modbus::FuncCodes::READ_COILS, 0, 2));
    EXPECT_EQ(coils.data, (std::vector<uint8_t>{0b10}));
}

TEST_F(DeviceSessionTest, SilentDeviceDoesNotAffectOthers) {
    auto stuck = network.add("127.0.0.1", 5021);
    auto healthy = network.add("127.0.0.1", 5022);
    healthy->setHolding(0, 7);

    auto bad = open("Stuck", 5021);
    auto good = open("Healthy", 5022);
    ASSERT_TRUE(waitFor([&] { return bad->isConnected() && good->isConnected(); }));

    stuck->silent = true;
    auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(drogon::sync_wait(bad->readCoro(modbus::FuncCodes::READ_HOLDING_REGISTERS, 0, 1)), TimeoutError);
    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(150));
    EXPECT_TRUE(reached("Stuck", SessionState::Error));

    auto value = drogon::sync_wait(good->readCoro(modbus::FuncCodes::READ_HOLDING_REGISTERS, 0, 1));
    EXPECT_EQ(value.data, (std::vector<uint8_t>{0x00, 0x07}));
    EXPECT_TRUE(good->isConnected());
    EXPECT_FALSE(reached("Healthy", SessionState::Error));
}

TEST_F(DeviceSessionTest, UnreachableDeviceGoesToErrorAndRetries) {
    auto session = open("Nowhere", 6000);
    ASSERT_TRUE(waitFor([&] { return reached("Nowhere", SessionState::Error); }));

    // a second Connecting proves the backoff timer fired
    EXPECT_TRUE(waitFor([&] {
        std::lock_guard<std::mutex> lock(mutex);
        return std::count(transitions.begin(), transitions.end(),
                          std::make_pair(std::string("Nowhere"), SessionState::Connecting)) >= 2;
    }));

    EXPECT_THROW(drogon::sync_wait(session->readCoro(modbus::FuncCodes::READ_COILS, 0, 1)), ConnectionError);
}

TEST_F(DeviceSessionTest, ReconnectsOnceTheDeviceComesBack) {
    auto device = network.add("127.0.0.1", 5023);
    device->reachable = false;

    auto session = open("Flaky", 5023);
    ASSERT_TRUE(waitFor([&] { return reached("Flaky", SessionState::Error); }));

    device->reachable = true;
    ASSERT_TRUE(waitFor([&] { return session->isConnected(); }));
    EXPECT_NO_THROW(drogon::sync_wait(session->readCoro(modbus::FuncCodes::READ_COILS, 0, 1)));
}

TEST_F(DeviceSessionTest, ExceptionResponseFailsOnlyThatExchange) {
    auto device = network.add("127.0.0.1", 5024);
    auto session = open("Picky", 5024);
    ASSERT_TRUE(waitFor([&] { return session->isConnected(); }));

    device->exceptionCode = 0x02;
    try {
        drogon::sync_wait(session->readCoro(modbus::FuncCodes::READ_HOLDING_REGISTERS, 9000, 1));
        FAIL() << "expected ProtocolError";
    } catch (const ProtocolError& e) {
        EXPECT_NE(e.getMessage().find("ILLEGAL DATA ADDRESS"), std::string::npos);
    }
    EXPECT_TRUE(session->isConnected());

    device->exceptionCode = 0;
    EXPECT_NO_THROW(drogon::sync_wait(session->readCoro(modbus::FuncCodes::READ_HOLDING_REGISTERS, 0, 1)));
}

TEST_F(DeviceSessionTest, ExchangesRunInSubmissionOrder) {
    auto device = network.add("127.0.0.1", 5025);
    auto session = open("Ordered", 5025);
    ASSERT_TRUE(waitFor([&] { return session->isConnected(); }));

    std::mutex orderMutex;
    std::vector<int> completed;
    std::atomic<int> remaining{3};
    auto record = [&](int id) {
        return [&, id](ExchangeResult result) {
            EXPECT_TRUE(result.ok());
            std::lock_guard<std::mutex> lock(orderMutex);
            completed.push_back(id);
            --remaining;
        };
    };

    session->read(modbus::FuncCodes::READ_COILS, 0, 1, record(1));
    session->write(modbus::FuncCodes::WRITE_SINGLE_COIL, 0, {1}, record(2));
    session->read(modbus::FuncCodes::READ_HOLDING_REGISTERS, 0, 1, record(3));

    ASSERT_TRUE(waitFor([&] { return remaining.load() == 0; }));
    EXPECT_EQ(completed, (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(device->requests(), (std::vector<uint8_t>{0x01, 0x05, 0x03}));
    EXPECT_TRUE(device->coil(0));
}

TEST_F(DeviceSessionTest, StopFailsQueuedExchanges) {
    auto device = network.add("127.0.0.1", 5026);
    auto session = open("Stopping", 5026);
    ASSERT_TRUE(waitFor([&] { return session->isConnected(); }));
    device->silent = true;

    std::atomic<int> failed{0};
    for (int i = 0; i < 3; ++i) {
        session->read(modbus::FuncCodes::READ_COILS, 0, 1, [&](ExchangeResult result) {
            if (!result.ok()) ++failed;
        });
    }
    std::promise<void> closed;
    session->stop([&closed]() { closed.set_value(); });

    // queued ones fail at once, the silent in-flight one by its timeout
    ASSERT_EQ(closed.get_future().wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_EQ(failed.load(), 3);
    EXPECT_EQ(session->state(), SessionState::Disconnected);
    sessions.clear();
}

TEST_F(DeviceSessionTest, PoolFollowsTheCatalogue) {
    network.add("10.0.0.1", 502);
    network.add("10.0.0.2", 502);
    DeviceSessionPool pool(network.factory(), fastOptions(), 2);

    CatalogueData data;
    data.connections.push_back(connectionRow("A", "10.0.0.1", 502, {signalRow("A1", "Digital Output Coil", 0)}));
    data.connections.push_back(connectionRow("B", "10.0.0.2", 502, {signalRow("B1", "Digital Output Coil", 0)}));
    pool.sync(buildSnapshot(data, 1));
    ASSERT_EQ(pool.sessions().size(), 2u);
    auto a = pool.get("A");
    ASSERT_TRUE(waitFor([&] { return a->isConnected(); }));

    // B removed, A unchanged keeps its session
    data.connections.pop_back();
    pool.sync(buildSnapshot(data, 2));
    EXPECT_EQ(pool.get("A"), a);
    EXPECT_EQ(pool.get("B"), nullptr);

    // A moves to another endpoint: new session
    data.connections[0].connection.host = "10.0.0.2";
    pool.sync(buildSnapshot(data, 3));
    EXPECT_NE(pool.get("A"), a);

    pool.stopAll(200);
    EXPECT_TRUE(pool.sessions().empty());
}

// ==================== ConnectionTester ====================

TEST(ConnectionTesterTest, ReportsValuesOfRequestedSignals) {
    FakeNetwork network;
    auto device = network.add("127.0.0.1", 5030);
    device->setCoil(2000, true);
    device->setHolding(4, 321);

    DeviceSessionPool pool(network.factory(), fastOptions(), 1);
    EventLog events;
    ConnectionTester tester(pool, events);

    CatalogueData data;
    data.connections.push_back(connectionRow("OpenPLC Simulator", "127.0.0.1", 5030, {
        signalRow("PICK_BIN_01", "Digital Output Coil", 2000),
        signalRow("SETPOINT", "Analog Output Holding Register", 4),
    }));
    auto snapshot = buildSnapshot(data);

    ConnectionTester::Request request;
    request.connection = "OpenPLC Simulator";
    request.host = "127.0.0.1";
    request.port = 5030;
    request.signals = snapshot->signals;

    auto result = drogon::sync_wait(tester.test(request));
    EXPECT_TRUE(result.success);
    EXPECT_NE(result.message.find("Connection successful to 127.0.0.1:5030"), std::string::npos);
    EXPECT_NE(result.message.find("PICK_BIN_01 (%QX250.0): On"), std::string::npos);
    EXPECT_NE(result.message.find("SETPOINT (%QW4): 321"), std::string::npos);

    auto tests = events.recent(0, EventType::ConnectionTest);
    ASSERT_EQ(tests.size(), 1u);
    EXPECT_EQ(tests[0].status, EventStatus::Success);
    EXPECT_EQ(tests[0].connection, "OpenPLC Simulator");
}

TEST(ConnectionTesterTest, UnreachableHostIsAFailedResult) {
    FakeNetwork network;
    DeviceSessionPool pool(network.factory(), fastOptions(), 1);
    EventLog events;
    ConnectionTester tester(pool, events);

    ConnectionTester::Request request;
    request.host = "192.0.2.1";
    auto result = drogon::sync_wait(tester.test(request));
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.message.find("Connection failed"), std::string::npos);

    auto tests = events.recent(0, EventType::ConnectionTest);
    ASSERT_EQ(tests.size(), 1u);
    EXPECT_EQ(tests[0].status, EventStatus::Failed);
    EXPECT_EQ(tests[0].connection, "192.0.2.1:502");

    request.host.clear();
    EXPECT_THROW(drogon::sync_wait(tester.test(request)), ValidationException);
}
