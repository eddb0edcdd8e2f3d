#include <gtest/gtest.h>

#include "modules/poll/PollScheduler.hpp"
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

}  // namespace

class PollSchedulerTest : public ::testing::Test {
protected:
    void SetUp() override {
        device = network.add("127.0.0.1", 5020);
        data.connections.push_back(connectionRow("OpenPLC Simulator", "127.0.0.1", 5020, {
            signalRow("CONVEYOR_RUN", "Digital Output Coil", 0),
            signalRow("DOOR_OPEN", "Digital Input Contact", 2),
            signalRow("BIN_COUNT", "Memory Register (16 bit)", 10),
            signalRow("LEVEL", "Analog Input Register", 1),
        }));
        registry.addListener([this](const SignalRegistry::SnapshotPtr&, const SignalRegistry::SnapshotPtr& current) {
            pool.sync(current);
            scheduler.sync(current);
        });
        registry.swap(buildSnapshot(data));
        ASSERT_TRUE(waitFor([&] { return pool.get("OpenPLC Simulator")->isConnected(); }));
    }

    CatalogueData data;
    int intervalMs = 50;
    FakeNetwork network;
    std::shared_ptr<FakeModbusDevice> device;
    SignalRegistry registry;
    EventLog events;
    RecordingPublisher publisher;
    ChangeDetector detector{publisher, events};
    DeviceSessionPool pool{network.factory(), fastOptions(), 1};
    PollScheduler scheduler{registry, pool, detector, [this](const Connection&) { return intervalMs; }};
};

TEST_F(PollSchedulerTest, PublishesOnlyWhatChanged) {
    device->setCoil(0, true);
    device->setHolding(10, 5);
    device->setInput(1, 900);

    ASSERT_TRUE(waitFor([&] { return registry.valueOf("LEVEL") == std::optional<SignalValue>(int64_t{900}); }));
    EXPECT_EQ(registry.valueOf("CONVEYOR_RUN"), std::optional<SignalValue>(true));
    EXPECT_EQ(registry.valueOf("BIN_COUNT"), std::optional<SignalValue>(int64_t{5}));

    // several more cycles with nothing new
    std::this_thread::sleep_for(std::chrono::milliseconds(250));
    EXPECT_EQ(publisher.countFor("CONVEYOR_RUN"), 1u);
    EXPECT_EQ(publisher.countFor("BIN_COUNT"), 1u);
    EXPECT_EQ(publisher.countFor("DOOR_OPEN"), 0u);

    device->setDiscreteInput(2, true);
    ASSERT_TRUE(waitFor([&] { return publisher.countFor("DOOR_OPEN") == 1; }));
    EXPECT_EQ(registry.valueOf("DOOR_OPEN"), std::optional<SignalValue>(true));
}

TEST_F(PollSchedulerTest, ReadsOneBatchPerKind) {
    ASSERT_TRUE(waitFor([&] { return device->requestCount() >= 4; }));
    auto first = device->requests();
    first.resize(4);
    std::sort(first.begin(), first.end());
    EXPECT_EQ(first, (std::vector<uint8_t>{0x01, 0x02, 0x03, 0x04}));
}

TEST_F(PollSchedulerTest, DeviceExceptionRecordsOneError) {
    device->exceptionCode = 0x02;
    ASSERT_TRUE(waitFor([&] { return !events.recent(0, EventType::Error).empty(); }));

    // same error repeating every cycle is not recorded again
    std::this_thread::sleep_for(std::chrono::milliseconds(250));
    EXPECT_EQ(events.recent(0, EventType::Error).size(), 1u);
    EXPECT_TRUE(pool.get("OpenPLC Simulator")->isConnected());

    auto status = scheduler.statusJson();
    EXPECT_GT(status["OpenPLC Simulator"]["failures"].asInt64(), 0);
}

TEST_F(PollSchedulerTest, StopAllEndsPolling) {
    ASSERT_TRUE(waitFor([&] { return device->requestCount() > 0; }));
    scheduler.stopAll();
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    auto settled = device->requestCount();
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    EXPECT_EQ(device->requestCount(), settled);
    EXPECT_TRUE(scheduler.statusJson().empty());
}

TEST_F(PollSchedulerTest, PollNowRunsACycleImmediately) {
    // same catalogue, slower interval: the poller is restarted
    intervalMs = 60000;
    registry.swap(buildSnapshot(data, 2));
    EXPECT_EQ(scheduler.statusJson()["OpenPLC Simulator"]["interval_ms"].asInt(), 60000);

    std::this_thread::sleep_for(std::chrono::milliseconds(150));
    auto before = device->requestCount();
    device->setHolding(10, 77);

    scheduler.pollNow("OpenPLC Simulator");
    ASSERT_TRUE(waitFor([&] { return registry.valueOf("BIN_COUNT") == std::optional<SignalValue>(int64_t{77}); }));
    EXPECT_EQ(device->requestCount(), before + 4);

    scheduler.pollNow("Unknown");
}

// ==================== Isolation ====================

TEST(PollIsolationTest, TimingOutConnectionDoesNotDelayTheHealthyOne) {
    FakeNetwork network;
    auto healthy = network.add("127.0.0.1", 5040);
    auto stuck = network.add("127.0.0.1", 5041);
    stuck->silent = true;

    auto options = fastOptions();
    options.requestTimeoutMs = 1000;

    CatalogueData data;
    data.connections.push_back(connectionRow("Healthy", "127.0.0.1", 5040, {
        signalRow("COUNTER", "Memory Register (16 bit)", 0),
    }));
    data.connections.push_back(connectionRow("Stuck", "127.0.0.1", 5041, {
        signalRow("STUCK_COUNTER", "Memory Register (16 bit)", 0),
    }));

    SignalRegistry registry;
    EventLog events;
    RecordingPublisher publisher;
    ChangeDetector detector{publisher, events};
    // one IO loop: both sessions and both timers share it
    DeviceSessionPool pool{network.factory(), options, 1};
    PollScheduler scheduler{registry, pool, detector, [](const Connection&) { return 50; }};
    registry.addListener([&](const SignalRegistry::SnapshotPtr&, const SignalRegistry::SnapshotPtr& current) {
        pool.sync(current);
        scheduler.sync(current);
    });
    registry.swap(buildSnapshot(data));
    ASSERT_TRUE(waitFor([&] { return pool.get("Healthy")->isConnected() && pool.get("Stuck")->isConnected(); }));
    ASSERT_TRUE(waitFor([&] { return stuck->requestCount() == 1; }));

    // every healthy cycle picks up a new value while the stuck read is pending
    for (int value = 1; value <= 5; ++value) {
        healthy->setHolding(0, static_cast<uint16_t>(value));
        ASSERT_TRUE(waitFor([&] {
            return registry.valueOf("COUNTER") == std::optional<SignalValue>(int64_t{value});
        }, 500));
    }

    EXPECT_TRUE(pool.get("Stuck")->isConnected());
    EXPECT_TRUE(events.recent(0, EventType::Error).empty());
    EXPECT_EQ(stuck->requestCount(), 1u);
    EXPECT_GE(healthy->requestCount(), 5u);
    EXPECT_EQ(publisher.countFor("COUNTER"), 5u);
    EXPECT_EQ(publisher.countFor("STUCK_COUNTER"), 0u);

    // the stuck exchange does time out eventually, and only that connection is affected
    ASSERT_TRUE(waitFor([&] { return !events.recent(0, EventType::Error).empty(); }));
    EXPECT_EQ(events.recent(0, EventType::Error).front().connection, "Stuck");

    scheduler.stopAll();
    pool.stopAll(200);
}
