#include <gtest/gtest.h>

#include "modules/command/CommandExecutor.hpp"
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

Json::Value command(const std::string& signal, Json::Value value) {
    Json::Value json;
    json["signal_name"] = signal;
    json["value"] = std::move(value);
    return json;
}

}  // namespace

class CommandExecutorTest : public ::testing::Test {
protected:
    void SetUp() override {
        device = network.add("127.0.0.1", 5020);
        CatalogueData data;
        data.connections.push_back(connectionRow("OpenPLC Simulator", "127.0.0.1", 5020, {
            signalRow("PICK_BIN_01", "Digital Output Coil", 2000),
            signalRow("DOOR_OPEN", "Digital Input Contact", 3),
            signalRow("SETPOINT", "Analog Output Holding Register", 4),
            signalRow("TOTAL", "Memory Register (32 bit)", 10),
        }));
        data.connections.push_back(connectionRow("Offline PLC", "10.9.9.9", 502, {
            signalRow("REMOTE_LAMP", "Digital Output Coil", 0),
        }));
        Action reset;
        reset.name = "reset_counters";
        reset.serverScript = "warehouse.api.reset_counters";
        data.actions.push_back(reset);

        registry.swap(buildSnapshot(data));
        pool.sync(registry.snapshot());
        ASSERT_TRUE(waitFor([&] { return pool.get("OpenPLC Simulator")->isConnected(); }));
    }

    FakeNetwork network;
    std::shared_ptr<FakeModbusDevice> device;
    SignalRegistry registry;
    EventLog events;
    RecordingPublisher publisher;
    std::shared_ptr<FakeScriptRunner> runner = std::make_shared<FakeScriptRunner>();
    ActionExecutor actions{registry, runner, events};
    ChangeDetector detector{publisher, events, &actions};
    DeviceSessionPool pool{network.factory(), fastOptions(), 1};
    CommandExecutor commands{registry, pool, detector, events, actions};
};

TEST_F(CommandExecutorTest, RejectsBeforeAnyDeviceIo) {
    EXPECT_THROW(drogon::sync_wait(commands.writeSignal("NOPE", Json::Value(true))), NotFoundException);
    EXPECT_THROW(drogon::sync_wait(commands.writeSignal("DOOR_OPEN", Json::Value(true))), NotWritableError);
    EXPECT_THROW(drogon::sync_wait(commands.writeSignal("SETPOINT", Json::Value(70000))), ValidationException);
    EXPECT_THROW(drogon::sync_wait(commands.writeSignal("PICK_BIN_01", Json::Value("maybe"))), ValidationException);
    EXPECT_THROW(drogon::sync_wait(commands.writeSignal("", Json::Value(1))), ValidationException);
    EXPECT_EQ(device->requestCount(), 0u);
}

TEST_F(CommandExecutorTest, NotFoundIsCheckedBeforeTheValue) {
    EXPECT_THROW(drogon::sync_wait(commands.writeSignal("NOPE", Json::Value("garbage"))), NotFoundException);
    EXPECT_THROW(drogon::sync_wait(commands.writeSignal("DOOR_OPEN", Json::Value("garbage"))), NotWritableError);
}

TEST_F(CommandExecutorTest, PickBinWritesTheSlaveCoil) {
    auto result = drogon::sync_wait(commands.writeSignal("PICK_BIN_01", Json::Value(true)));
    EXPECT_TRUE(result.success) << result.error;

    EXPECT_EQ(device->requests(), (std::vector<uint8_t>{modbus::FuncCodes::WRITE_SINGLE_COIL}));
    EXPECT_TRUE(device->coil(2000));
    EXPECT_EQ(registry.valueOf("PICK_BIN_01"), std::optional<SignalValue>(true));
    EXPECT_EQ(publisher.countFor("PICK_BIN_01"), 1u);

    auto writes = events.recent(0, EventType::Write);
    ASSERT_EQ(writes.size(), 1u);
    EXPECT_EQ(writes[0].previousValue, std::optional<SignalValue>(false));
}

TEST_F(CommandExecutorTest, WideRegisterUsesMultipleWrite) {
    auto result = drogon::sync_wait(commands.writeSignal("TOTAL", Json::Value(70000)));
    ASSERT_TRUE(result.success) << result.error;
    EXPECT_EQ(device->requests(), (std::vector<uint8_t>{modbus::FuncCodes::WRITE_MULTIPLE_REGISTERS}));
    EXPECT_EQ(device->holding(10), 0x0001);
    EXPECT_EQ(device->holding(11), 0x1170);
}

TEST_F(CommandExecutorTest, WriteThenReadSeesTheNewValue) {
    ASSERT_TRUE(drogon::sync_wait(commands.writeSignal("SETPOINT", Json::Value(1234))).success);

    auto session = pool.get("OpenPLC Simulator");
    auto response = drogon::sync_wait(session->readCoro(modbus::FuncCodes::READ_HOLDING_REGISTERS, 4, 1));
    EXPECT_EQ(response.data, (std::vector<uint8_t>{0x04, 0xD2}));
}

TEST_F(CommandExecutorTest, DeviceExceptionIsReportedNotThrown) {
    device->exceptionCode = 0x04;
    auto result = drogon::sync_wait(commands.writeSignal("SETPOINT", Json::Value(5)));

    EXPECT_FALSE(result.success);
    EXPECT_NE(result.error.find("SERVER DEVICE FAILURE"), std::string::npos);
    EXPECT_EQ(registry.valueOf("SETPOINT"), std::optional<SignalValue>(int64_t{0}));
    EXPECT_EQ(publisher.countFor("SETPOINT"), 0u);

    auto errors = events.recent(0, EventType::Error);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].signal, "SETPOINT");
}

TEST_F(CommandExecutorTest, DisconnectedDeviceIsReportedNotThrown) {
    auto result = drogon::sync_wait(commands.writeSignal("REMOTE_LAMP", Json::Value(true)));
    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.error.empty());
    EXPECT_EQ(registry.valueOf("REMOTE_LAMP"), std::optional<SignalValue>(false));
}

TEST_F(CommandExecutorTest, ClosedExecutorRefusesCommands) {
    commands.close();
    EXPECT_TRUE(commands.isClosed());
    EXPECT_THROW(drogon::sync_wait(commands.writeSignal("PICK_BIN_01", Json::Value(true))),
                 ServiceUnavailableException);
    EXPECT_EQ(device->requestCount(), 0u);
}

TEST_F(CommandExecutorTest, ExecuteDispatchesBothForms) {
    auto written = drogon::sync_wait(commands.execute(command("PICK_BIN_01", Json::Value(1))));
    EXPECT_TRUE(written["success"].asBool());

    Json::Value call;
    call["action_name"] = "reset_counters";
    call["parameters"]["zone"] = "A";
    auto executed = drogon::sync_wait(commands.execute(call));
    EXPECT_TRUE(executed["success"].asBool());
    ASSERT_EQ(runner->calls().size(), 1u);
    EXPECT_EQ(runner->calls()[0].context["params"]["zone"].asString(), "A");

    Json::Value neither;
    neither["foo"] = 1;
    EXPECT_THROW(drogon::sync_wait(commands.execute(neither)), ValidationException);

    Json::Value missingValue;
    missingValue["signal_name"] = "PICK_BIN_01";
    EXPECT_THROW(drogon::sync_wait(commands.execute(missingValue)), ValidationException);
}
