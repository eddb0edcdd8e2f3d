#include <gtest/gtest.h>

#include "modules/event/EventLog.hpp"
#include "support/Fakes.hpp"

using namespace testing_support;

namespace {

class ThrowingSink : public EventSink {
public:
    void deliver(const Event&) override {
        throw BusinessSystemError("POST Modbus Event failed: 503");
    }
};

}  // namespace

TEST(EventLogTest, KeepsTheNewestWithinCapacity) {
    EventLog log(nullptr, 3);
    for (int i = 0; i < 5; ++i) {
        log.record(Event::signalUpdate("PLC", "S" + std::to_string(i), int64_t{i}, int64_t{i + 1}));
    }

    auto recent = log.recent();
    ASSERT_EQ(recent.size(), 3u);
    EXPECT_EQ(recent[0].signal, "S4");
    EXPECT_EQ(recent[2].signal, "S2");
    EXPECT_EQ(recent[0].sequence, 5u);
    EXPECT_EQ(log.count(), 5u);
}

TEST(EventLogTest, FiltersByTypeAndLimit) {
    EventLog log;
    log.record(Event::write("PLC", "LAMP", false, true));
    log.record(Event::error("PLC", "", "refused"));
    log.record(Event::write("PLC", "LAMP", true, false));
    log.record(Event::error("PLC", "", "timeout"));

    auto errors = log.recent(0, EventType::Error);
    ASSERT_EQ(errors.size(), 2u);
    EXPECT_EQ(errors[0].errorMessage, "timeout");

    EXPECT_EQ(log.recent(1, EventType::Write).size(), 1u);
    EXPECT_TRUE(log.recent(0, EventType::ConnectionTest).empty());
}

TEST(EventLogTest, StampsAndDeliversToTheSink) {
    auto sink = std::make_shared<RecordingSink>();
    EventLog log(sink);
    log.record(Event::write("PLC", "LAMP", false, true));

    auto delivered = sink->events();
    ASSERT_EQ(delivered.size(), 1u);
    EXPECT_EQ(delivered[0].sequence, 1u);
    EXPECT_FALSE(delivered[0].timestamp.empty());
}

TEST(EventLogTest, SinkFailureDoesNotReachTheCaller) {
    EventLog log(std::make_shared<ThrowingSink>());
    EXPECT_NO_THROW(log.record(Event::error("PLC", "", "refused")));
    EXPECT_EQ(log.recent().size(), 1u);
}

TEST(EventLogTest, DocumentStoresValuesAsText) {
    auto event = Event::signalUpdate("OpenPLC Simulator", "BIN_COUNT", int64_t{3}, int64_t{4});
    auto doc = event.toDocument();
    EXPECT_EQ(doc["event_type"].asString(), "Signal Update");
    EXPECT_EQ(doc["status"].asString(), "Success");
    EXPECT_EQ(doc["previous_value"].asString(), "3");
    EXPECT_EQ(doc["new_value"].asString(), "4");

    auto json = event.toJson();
    EXPECT_EQ(json["new_value"].asInt64(), 4);
}

TEST(EventTypeTest, ParsesLabelsAndSlugs) {
    EXPECT_EQ(parseEventType("Signal Update"), std::optional<EventType>(EventType::SignalUpdate));
    EXPECT_EQ(parseEventType("action_execution"), std::optional<EventType>(EventType::ActionExecution));
    EXPECT_EQ(parseEventType("ERROR"), std::optional<EventType>(EventType::Error));
    EXPECT_EQ(parseEventType("reboot"), std::nullopt);
}

TEST(EventTypeTest, ReadIsAValidFilterThatPollingNeverFills) {
    ASSERT_EQ(parseEventType("Read"), std::optional<EventType>(EventType::Read));
    EXPECT_EQ(eventTypeToString(EventType::Read), "Read");

    EventLog log;
    log.record(Event::signalUpdate("PLC", "COUNTER", int64_t{1}, int64_t{2}));
    log.record(Event::write("PLC", "LAMP", false, true));
    log.record(Event::error("PLC", "", "timeout"));
    EXPECT_TRUE(log.recent(0, EventType::Read).empty());
    EXPECT_EQ(log.recent(0, EventType::SignalUpdate).size(), 1u);
}
