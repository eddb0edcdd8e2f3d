#include <gtest/gtest.h>

#include "modules/command/ActionExecutor.hpp"
#include "support/Fakes.hpp"

using namespace testing_support;

namespace {

Action withCondition(SignalCondition condition, const std::string& literal) {
    return signalChangeAction("check", "BIN_COUNT", condition, literal);
}

}  // namespace

// ==================== Conditions ====================

TEST(ActionConditionTest, AnyChangeAlwaysHolds) {
    auto action = withCondition(SignalCondition::AnyChange, "");
    EXPECT_TRUE(ActionExecutor::conditionHolds(action, false));
    EXPECT_TRUE(ActionExecutor::conditionHolds(action, int64_t{0}));
}

TEST(ActionConditionTest, EqualsOnBooleansReadsTheLiteral) {
    EXPECT_TRUE(ActionExecutor::conditionHolds(withCondition(SignalCondition::Equals, "True"), true));
    EXPECT_FALSE(ActionExecutor::conditionHolds(withCondition(SignalCondition::Equals, "true"), false));
    EXPECT_TRUE(ActionExecutor::conditionHolds(withCondition(SignalCondition::Equals, "false"), false));
    EXPECT_TRUE(ActionExecutor::conditionHolds(withCondition(SignalCondition::Equals, "1"), false));
}

TEST(ActionConditionTest, EqualsOnNumbers) {
    EXPECT_TRUE(ActionExecutor::conditionHolds(withCondition(SignalCondition::Equals, "42"), int64_t{42}));
    EXPECT_TRUE(ActionExecutor::conditionHolds(withCondition(SignalCondition::Equals, "42.0"), int64_t{42}));
    EXPECT_FALSE(ActionExecutor::conditionHolds(withCondition(SignalCondition::Equals, "41"), int64_t{42}));
    EXPECT_FALSE(ActionExecutor::conditionHolds(withCondition(SignalCondition::Equals, "full"), int64_t{42}));
}

TEST(ActionConditionTest, ComparisonsAreNumeric) {
    EXPECT_TRUE(ActionExecutor::conditionHolds(withCondition(SignalCondition::GreaterThan, "100"), int64_t{101}));
    EXPECT_FALSE(ActionExecutor::conditionHolds(withCondition(SignalCondition::GreaterThan, "100"), int64_t{100}));
    EXPECT_TRUE(ActionExecutor::conditionHolds(withCondition(SignalCondition::LessThan, "0.5"), int64_t{0}));
    EXPECT_FALSE(ActionExecutor::conditionHolds(withCondition(SignalCondition::LessThan, " 10 "), int64_t{10}));
}

TEST(ActionConditionTest, NonNumericLiteralNeverFires) {
    EXPECT_FALSE(ActionExecutor::conditionHolds(withCondition(SignalCondition::GreaterThan, "lots"), int64_t{1000}));
    EXPECT_FALSE(ActionExecutor::conditionHolds(withCondition(SignalCondition::LessThan, ""), int64_t{-1}));
}

// ==================== Execution ====================

class ActionExecutorTest : public ::testing::Test {
protected:
    void SetUp() override {
        CatalogueData data;
        data.connections.push_back(connectionRow("OpenPLC Simulator", "127.0.0.1", 5020, {
            signalRow("BIN_COUNT", "Memory Register (16 bit)", 10, "", Json::Value(12)),
        }));

        Action notify = signalChangeAction("notify_full", "BIN_COUNT", SignalCondition::GreaterThan, "10");
        notify.parameters = {{"zone", "A"}, {"priority", "low"}};
        data.actions.push_back(notify);

        Action disabled = signalChangeAction("legacy", "BIN_COUNT");
        disabled.enabled = false;
        data.actions.push_back(disabled);

        Action noScript;
        noScript.name = "unscripted";
        data.actions.push_back(noScript);

        registry.swap(buildSnapshot(data));
    }

    SignalRegistry registry;
    std::shared_ptr<RecordingSink> sink = std::make_shared<RecordingSink>();
    EventLog events{sink};
    std::shared_ptr<FakeScriptRunner> runner = std::make_shared<FakeScriptRunner>();
    ActionExecutor executor{registry, runner, events};
};

TEST_F(ActionExecutorTest, UnknownActionIsNotFound) {
    EXPECT_THROW(drogon::sync_wait(executor.executeAction("nope", Json::Value())), NotFoundException);
    EXPECT_TRUE(runner->calls().empty());
}

TEST_F(ActionExecutorTest, DisabledActionIsRejected) {
    EXPECT_THROW(drogon::sync_wait(executor.executeAction("legacy", Json::Value())), ValidationException);
    EXPECT_TRUE(runner->calls().empty());
}

TEST_F(ActionExecutorTest, CallParametersWinOverStoredOnes) {
    Json::Value params;
    params["priority"] = "high";
    params["operator"] = "kim";

    auto result = drogon::sync_wait(executor.executeAction("notify_full", params));
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.result.asString(), "ok");

    ASSERT_EQ(runner->calls().size(), 1u);
    const auto& call = runner->calls()[0];
    EXPECT_EQ(call.method, "warehouse.api.notify_full");
    EXPECT_EQ(call.context["action"].asString(), "notify_full");
    EXPECT_EQ(call.context["signal"].asString(), "BIN_COUNT");
    EXPECT_EQ(call.context["value"].asInt64(), 12);
    EXPECT_EQ(call.context["params"]["zone"].asString(), "A");
    EXPECT_EQ(call.context["params"]["priority"].asString(), "high");
    EXPECT_EQ(call.context["params"]["operator"].asString(), "kim");

    auto executions = events.recent(0, EventType::ActionExecution);
    ASSERT_EQ(executions.size(), 1u);
    EXPECT_EQ(executions[0].status, EventStatus::Success);
    EXPECT_EQ(executions[0].action, "notify_full");
}

TEST_F(ActionExecutorTest, ScriptFailureBecomesAFailedEvent) {
    runner->failure = "POST /api/method/warehouse.api.notify_full returned 417";
    auto result = drogon::sync_wait(executor.executeAction("notify_full", Json::Value()));

    EXPECT_FALSE(result.success);
    EXPECT_NE(result.error.find("417"), std::string::npos);

    auto delivered = sink->events();
    ASSERT_EQ(delivered.size(), 1u);
    EXPECT_EQ(delivered[0].type, EventType::ActionExecution);
    EXPECT_EQ(delivered[0].status, EventStatus::Failed);
}

TEST_F(ActionExecutorTest, ActionWithoutScriptFails) {
    auto result = drogon::sync_wait(executor.executeAction("unscripted", Json::Value()));
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.error.find("no server script"), std::string::npos);
    EXPECT_TRUE(runner->calls().empty());
}

TEST_F(ActionExecutorTest, ParametersMustBeAnObject) {
    EXPECT_THROW(drogon::sync_wait(executor.executeAction("notify_full", Json::Value("x"))), ValidationException);
}

TEST_F(ActionExecutorTest, SignalChangeFiresOnlyEnabledMatchingActions) {
    auto snapshot = registry.snapshot();
    const Signal& count = *snapshot->findSignal("BIN_COUNT");

    executor.onSignalChange(*snapshot, count, int64_t{5});
    EXPECT_TRUE(runner->calls().empty());

    executor.onSignalChange(*snapshot, count, int64_t{11});
    ASSERT_TRUE(waitFor([&] { return runner->calls().size() == 1; }));
    EXPECT_EQ(runner->calls()[0].method, "warehouse.api.notify_full");
    EXPECT_EQ(runner->calls()[0].context["params"]["priority"].asString(), "low");
}
