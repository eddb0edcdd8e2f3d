#include <gtest/gtest.h>

#include "modules/bridge/Bridge.hpp"
#include "support/FakeModbusDevice.hpp"
#include "support/Fakes.hpp"

using namespace testing_support;

namespace {

BridgeSettings testSettings() {
    BridgeSettings settings;
    settings.baseUrl = "http://erp.test";
    settings.pollIntervalMs = 50;
    settings.requestTimeoutMs = 200;
    settings.reconnectBaseSec = 0.05;
    settings.reconnectMaxSec = 0.2;
    settings.reconnectJitter = 0.0;
    settings.ioThreads = 1;
    settings.persistEvents = false;
    settings.subscribeCommands = false;
    return settings;
}

}  // namespace

class BridgeTest : public ::testing::Test {
protected:
    void SetUp() override {
        loopThread.run();
        device = network.add("127.0.0.1", 5020);
        source->data.connections.push_back(connectionRow("OpenPLC Simulator", "127.0.0.1", 5020, {
            signalRow("PICK_BIN_01", "Digital Output Coil", 2000),
            signalRow("BIN_COUNT", "Memory Register (16 bit)", 10),
            signalRow("DOOR_OPEN", "Digital Input Contact", 0),
        }));

        Bridge::Dependencies deps;
        deps.source = source;
        deps.transportFactory = network.factory();
        deps.publisher = publisher;
        deps.scriptRunner = runner;
        deps.eventSink = sink;
        bridge = std::make_unique<Bridge>(testSettings(), deps);
    }

    void TearDown() override {
        bridge.reset();
    }

    void start() {
        drogon::sync_wait(bridge->start(loopThread.getLoop()));
    }

    trantor::EventLoopThread loopThread{"BridgeTestLoop"};
    FakeNetwork network;
    std::shared_ptr<FakeModbusDevice> device;
    std::shared_ptr<FakeCatalogueSource> source = std::make_shared<FakeCatalogueSource>();
    std::shared_ptr<RecordingPublisher> publisher = std::make_shared<RecordingPublisher>();
    std::shared_ptr<FakeScriptRunner> runner = std::make_shared<FakeScriptRunner>();
    std::shared_ptr<RecordingSink> sink = std::make_shared<RecordingSink>();
    std::unique_ptr<Bridge> bridge;
};

TEST_F(BridgeTest, PollsWhatTheCatalogueDescribes) {
    device->setHolding(10, 12);
    start();

    ASSERT_TRUE(waitFor([&] {
        return bridge->registry().valueOf("BIN_COUNT") == std::optional<SignalValue>(int64_t{12});
    }));
    EXPECT_EQ(publisher->countFor("BIN_COUNT"), 1u);

    auto status = bridge->status();
    EXPECT_EQ(status["catalogue"]["version"].asUInt64(), 1u);
    EXPECT_EQ(status["catalogue"]["signals"].asUInt(), 3u);
    ASSERT_EQ(status["sessions"].size(), 1u);
    EXPECT_EQ(status["sessions"][0]["status"].asString(), "connected");
    EXPECT_TRUE(status["polling"].isMember("OpenPLC Simulator"));
    EXPECT_FALSE(status["commands"]["closed"].asBool());
}

TEST_F(BridgeTest, FailedReloadKeepsPollingTheLastCatalogue) {
    start();
    ASSERT_TRUE(waitFor([&] { return bridge->pool().get("OpenPLC Simulator")->isConnected(); }));

    source->failing = true;
    EXPECT_THROW(drogon::sync_wait(bridge->reload()), CatalogueUnavailableError);
    EXPECT_EQ(bridge->registry().snapshot()->version, 1u);

    device->setCoil(2000, true);
    ASSERT_TRUE(waitFor([&] {
        return bridge->registry().valueOf("PICK_BIN_01") == std::optional<SignalValue>(true);
    }));

    auto result = drogon::sync_wait(bridge->commands().writeSignal("PICK_BIN_01", Json::Value(false)));
    EXPECT_TRUE(result.success) << result.error;
    EXPECT_FALSE(device->coil(2000));
}

TEST_F(BridgeTest, StartsEmptyWhenTheCatalogueIsUnavailable) {
    source->failing = true;
    EXPECT_NO_THROW(start());
    EXPECT_FALSE(bridge->registry().loaded());
    EXPECT_TRUE(bridge->pool().sessions().empty());

    auto summary = bridge->summary();
    EXPECT_TRUE(summary["running"].asBool());
    EXPECT_EQ(summary["signal_count"].asUInt(), 0u);

    // a manual reload recovers without waiting for the retry timer
    source->failing = false;
    drogon::sync_wait(bridge->reload());
    EXPECT_TRUE(bridge->registry().loaded());
    EXPECT_EQ(bridge->pool().sessions().size(), 1u);
}

TEST_F(BridgeTest, SessionErrorsArePublishedAndAudited) {
    device->reachable = false;
    start();

    ASSERT_TRUE(waitFor([&] { return !bridge->events().recent(0, EventType::Error).empty(); }));
    auto errors = bridge->events().recent(0, EventType::Error);
    EXPECT_EQ(errors.back().connection, "OpenPLC Simulator");

    auto statuses = publisher->statuses();
    EXPECT_TRUE(std::any_of(statuses.begin(), statuses.end(), [](const Json::Value& msg) {
        return msg["connection"].asString() == "OpenPLC Simulator" && msg["status"].asString() == "error";
    }));
    EXPECT_FALSE(sink->events().empty());
}

TEST_F(BridgeTest, ChannelWritesSignals) {
    start();
    ASSERT_TRUE(waitFor([&] { return bridge->pool().get("OpenPLC Simulator")->isConnected(); }));

    drogon::sync_wait(bridge->channel().handle(R"({"command":"write_signal","signal":"PICK_BIN_01","value":true})"));
    EXPECT_TRUE(device->coil(2000));

    drogon::sync_wait(bridge->channel().handle(R"({"command":"write_signal","signal_name":"PICK_BIN_01","value":false})"));
    EXPECT_FALSE(device->coil(2000));

    EXPECT_THROW(drogon::sync_wait(bridge->channel().handle(R"({"command":"write_signal","signal":"DOOR_OPEN","value":true})")),
                 NotWritableError);
}

TEST_F(BridgeTest, ChannelAnswersStatusAndReload) {
    start();

    drogon::sync_wait(bridge->channel().handle(R"({"command":"status"})"));
    auto statuses = publisher->statuses();
    ASSERT_FALSE(statuses.empty());
    EXPECT_EQ(statuses.back()["signal_count"].asUInt(), 3u);
    EXPECT_TRUE(statuses.back()["running"].asBool());

    source->data.connections[0].signals.push_back(signalRow("LAMP", "Digital Output Coil", 5));
    drogon::sync_wait(bridge->channel().handle(R"({"command":"reload_signals"})"));
    EXPECT_EQ(bridge->registry().snapshot()->version, 2u);
    EXPECT_NE(bridge->registry().snapshot()->findSignal("LAMP"), nullptr);

    EXPECT_THROW(drogon::sync_wait(bridge->channel().handle(R"({"command":"reboot"})")), ValidationException);
    EXPECT_THROW(drogon::sync_wait(bridge->channel().handle("not json")), ValidationException);
}

TEST_F(BridgeTest, ShutdownRefusesCommandsAndIsIdempotent) {
    start();
    bridge->shutdown();
    bridge->shutdown();

    EXPECT_FALSE(bridge->summary()["running"].asBool());
    EXPECT_TRUE(bridge->status()["commands"]["closed"].asBool());
    EXPECT_THROW(drogon::sync_wait(bridge->commands().writeSignal("PICK_BIN_01", Json::Value(true))),
                 ServiceUnavailableException);
}

TEST(BridgeInstanceTest, InstanceRequiresCreate) {
    Bridge::destroy();
    EXPECT_THROW(Bridge::instance(), ServiceUnavailableException);
}
