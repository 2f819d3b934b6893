/*
automation-engine: RuleEngine Tests
Role: Verify binding, status reporting and trigger-driven execution of rules
Testing Strategy: Mock factory → set rules → fire triggers → assert status and handler calls
Coverage: missing handlers, enablement, conditions, action chaining, failures, removal, queries
*/
#include <gtest/gtest.h>
#include "engine/rule_engine.hpp"
#include "fixtures/mock_handlers.hpp"
#include "fixtures/rules.hpp"
#include "modules/builtin_factory.hpp"

#include <memory>
#include <sstream>
#include <stdexcept>

using namespace automation_engine;
using fixtures::MockHandlerFactory;
using fixtures::one_value;
using fixtures::simple_rule;

class RuleEngineTest : public ::testing::Test {
protected:
    std::shared_ptr<MockHandlerFactory> foo = std::make_shared<MockHandlerFactory>(std::set<std::string>{"Foo"});
    RuleEngine engine;

    bool fire(const std::string& trigger_id, const ValueMap& outputs) {
        auto* trigger = foo->trigger(trigger_id);
        return trigger != nullptr && trigger->fire(outputs);
    }
};

// =============================================================================
// Binding
// =============================================================================

TEST_F(RuleEngineTest, UnresolvedTypesLeaveRuleUninitializedWithOneErrorPerType) {
    Rule rule = fixtures::mixed_rule("r1", "Foo", "Bar", "Bar:Custom");
    engine.set_rule(rule);

    auto status = engine.get_status("r1");
    ASSERT_TRUE(status.has_value());
    EXPECT_FALSE(status->initialized);
    EXPECT_TRUE(status->enabled);
    ASSERT_EQ(status->errors.size(), 2u);
    for (const auto& error : status->errors) {
        EXPECT_EQ(error.code, RuleErrorCode::MissingHandler);
    }
    EXPECT_TRUE(engine.get_rule("r1").has_value());
}

TEST_F(RuleEngineTest, RegisteringFactoryInitializesWaitingRule) {
    engine.set_rule(simple_rule("r1", "Foo"));
    ASSERT_FALSE(engine.get_status("r1")->initialized);

    engine.register_factory(foo);

    auto status = engine.get_status("r1");
    EXPECT_TRUE(status->initialized);
    EXPECT_TRUE(status->errors.empty());
    EXPECT_TRUE(engine.has_callback("r1"));
    EXPECT_EQ(foo->live_handler_count(), 3u);
}

TEST_F(RuleEngineTest, PartialResolutionReleasesCreatedHandlers) {
    engine.register_factory(foo);
    engine.set_rule(fixtures::mixed_rule("r1", "Foo", "Foo", "Bar"));

    auto status = engine.get_status("r1");
    EXPECT_FALSE(status->initialized);
    ASSERT_EQ(status->errors.size(), 1u);
    EXPECT_NE(status->errors[0].message.find("Bar"), std::string::npos);
    EXPECT_EQ(foo->live_handler_count(), 0u);
    EXPECT_EQ(foo->trigger("r1_t"), nullptr);
}

TEST_F(RuleEngineTest, SubTypeUsesSystemTypeFactory) {
    engine.register_factory(foo);
    engine.set_rule(simple_rule("r1", "Foo:Special"));

    EXPECT_TRUE(engine.get_status("r1")->initialized);
    EXPECT_EQ(engine.rules_depending_on("Foo"), (std::set<std::string>{"r1"}));
    EXPECT_EQ(engine.rules_depending_on("Foo:Other"), (std::set<std::string>{"r1"}));
}

TEST_F(RuleEngineTest, FactoryReturningNoHandlerCountsAsMissing) {
    foo->refuse("r1_a");
    engine.register_factory(foo);
    engine.set_rule(simple_rule("r1", "Foo"));

    auto status = engine.get_status("r1");
    EXPECT_FALSE(status->initialized);
    ASSERT_EQ(status->errors.size(), 1u);
    EXPECT_EQ(status->errors[0].code, RuleErrorCode::MissingHandler);
}

TEST_F(RuleEngineTest, HandlerCreationFailureIsReportedOnStatus) {
    foo->fail_creation("r1_c");
    engine.register_factory(foo);
    engine.set_rule(simple_rule("r1", "Foo"));

    auto status = engine.get_status("r1");
    EXPECT_FALSE(status->initialized);
    ASSERT_EQ(status->errors.size(), 1u);
    EXPECT_NE(status->errors[0].message.find("mock creation failure"), std::string::npos);
    EXPECT_EQ(foo->live_handler_count(), 0u);
}

TEST_F(RuleEngineTest, NonStandardCreationFailureIsReportedOnStatus) {
    foo->on_create([](const Module& module) {
        if (module.id == "r1_a") {
            throw 7;
        }
    });
    engine.register_factory(foo);

    EXPECT_NO_THROW(engine.set_rule(simple_rule("r1", "Foo")));

    auto status = engine.get_status("r1");
    ASSERT_TRUE(status.has_value());
    EXPECT_FALSE(status->initialized);
    ASSERT_EQ(status->errors.size(), 1u);
    EXPECT_EQ(status->errors[0].code, RuleErrorCode::MissingHandler);
    EXPECT_NE(status->errors[0].message.find("unknown exception"), std::string::npos);
    EXPECT_EQ(foo->live_handler_count(), 0u);
    EXPECT_EQ(engine.rules_depending_on("Foo").count("r1"), 1u);
}

TEST_F(RuleEngineTest, InvalidConnectionIsReportedButRuleRuns) {
    engine.register_factory(foo);
    Rule rule = simple_rule("r1", "Foo", false);
    rule.actions[0].connections.push_back({"ghost", "nowhere", "x"});
    engine.set_rule(rule);

    auto status = engine.get_status("r1");
    EXPECT_TRUE(status->initialized);
    ASSERT_EQ(status->errors.size(), 1u);
    EXPECT_EQ(status->errors[0].code, RuleErrorCode::InvalidConnection);

    EXPECT_TRUE(fire("r1_t", one_value("value", 7)));
    auto inputs = foo->action_inputs("r1_a");
    ASSERT_EQ(inputs.size(), 1u);
    EXPECT_EQ(inputs[0].count("ghost"), 0u);
    EXPECT_EQ(inputs[0].at("value").int64_value(), 7);
}

TEST_F(RuleEngineTest, MalformedRuleIsRejectedBeforeAnyStateChange) {
    Rule rule = simple_rule("r1", "Foo");
    rule.actions[0].id = rule.triggers[0].id;

    EXPECT_THROW(engine.set_rule(rule), std::invalid_argument);
    EXPECT_FALSE(engine.get_rule("r1").has_value());
    EXPECT_FALSE(engine.get_status("r1").has_value());
    EXPECT_TRUE(engine.rules_depending_on("Foo").empty());
}

// =============================================================================
// Execution
// =============================================================================

TEST_F(RuleEngineTest, FiringRunsConditionsThenActions) {
    engine.register_factory(foo);
    engine.set_rule(simple_rule("r1", "Foo"));

    ASSERT_TRUE(fire("r1_t", one_value("value", 22)));

    EXPECT_EQ(foo->calls(), (std::vector<std::string>{"condition:r1_c", "action:r1_a"}));
    auto record = engine.last_execution("r1");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->result, FiringResult::Executed);
    EXPECT_EQ(record->trigger_module_id, "r1_t");
    EXPECT_EQ(record->firing_count, 1u);
}

TEST_F(RuleEngineTest, DisabledRuleDropsFiringsButStaysInitialized) {
    engine.register_factory(foo);
    engine.set_rule(simple_rule("r1", "Foo"));
    fire("r1_t", one_value("value", 1));
    ASSERT_EQ(foo->action_count("r1_a"), 1u);

    EXPECT_TRUE(engine.set_enabled("r1", false));
    fire("r1_t", one_value("value", 2));

    EXPECT_EQ(foo->action_count("r1_a"), 1u);
    auto status = engine.get_status("r1");
    EXPECT_TRUE(status->initialized);
    EXPECT_FALSE(status->enabled);

    engine.set_enabled("r1", true);
    fire("r1_t", one_value("value", 3));
    EXPECT_EQ(foo->action_count("r1_a"), 2u);
}

TEST_F(RuleEngineTest, RuleDeclaredDisabledNeverFires) {
    engine.register_factory(foo);
    Rule rule = simple_rule("r1", "Foo");
    rule.initial_enabled = false;
    engine.set_rule(rule);

    fire("r1_t", one_value("value", 1));

    EXPECT_TRUE(engine.get_status("r1")->initialized);
    EXPECT_EQ(foo->action_count("r1_a"), 0u);
}

TEST_F(RuleEngineTest, FalseConditionBlocksEveryAction) {
    engine.register_factory(foo);
    Rule rule = simple_rule("r1", "Foo");
    rule.actions.push_back(make_action("r1_a2", "Foo", {}));
    engine.set_rule(rule);
    foo->set_condition_result("r1_c", false);

    fire("r1_t", one_value("value", 1));

    EXPECT_EQ(foo->action_count("r1_a"), 0u);
    EXPECT_EQ(foo->action_count("r1_a2"), 0u);
    EXPECT_EQ(engine.last_execution("r1")->result, FiringResult::ConditionsNotMet);
}

TEST_F(RuleEngineTest, EmptyConditionListAlwaysExecutes) {
    engine.register_factory(foo);
    engine.set_rule(simple_rule("r1", "Foo", false));

    fire("r1_t", one_value("value", 1));
    fire("r1_t", one_value("value", 2));

    EXPECT_EQ(foo->action_count("r1_a"), 2u);
}

TEST_F(RuleEngineTest, ConditionsShortCircuitInOrder) {
    engine.register_factory(foo);
    Rule rule = simple_rule("r1", "Foo");
    rule.conditions.push_back(make_condition("r1_c2", "Foo", {}));
    engine.set_rule(rule);
    foo->set_condition_result("r1_c", false);

    fire("r1_t", one_value("value", 1));

    EXPECT_EQ(foo->calls(), (std::vector<std::string>{"condition:r1_c"}));
}

TEST_F(RuleEngineTest, ActionOutputsFeedLaterActions) {
    engine.register_factory(foo);
    Rule rule = simple_rule("r1", "Foo", false);
    rule.actions.push_back(make_action("r1_a2", "Foo", {{"scaled", "r1_a", "result"}}));
    engine.set_rule(rule);
    foo->set_action_outputs("r1_a", one_value("result", 44));

    fire("r1_t", one_value("value", 22));

    auto inputs = foo->action_inputs("r1_a2");
    ASSERT_EQ(inputs.size(), 1u);
    EXPECT_EQ(inputs[0].at("scaled").int64_value(), 44);
}

TEST_F(RuleEngineTest, TriggerOutputsAreReplacedOnEachFiring) {
    engine.register_factory(foo);
    Rule rule = simple_rule("r1", "Foo", false);
    rule.actions[0].connections.push_back({"extra", "r1_t", "extra"});
    engine.set_rule(rule);

    ValueMap first = one_value("value", 1);
    first["extra"] = make_string("once");
    fire("r1_t", first);
    fire("r1_t", one_value("value", 2));

    auto inputs = foo->action_inputs("r1_a");
    ASSERT_EQ(inputs.size(), 2u);
    EXPECT_EQ(inputs[0].count("extra"), 1u);
    EXPECT_EQ(inputs[1].count("extra"), 0u);
}

TEST_F(RuleEngineTest, FailingActionAbortsFiringOnly) {
    engine.register_factory(foo);
    Rule rule = simple_rule("r1", "Foo", false);
    rule.actions.push_back(make_action("r1_a2", "Foo", {}));
    engine.set_rule(rule);
    foo->fail_action("r1_a");

    fire("r1_t", one_value("value", 1));

    EXPECT_EQ(foo->action_count("r1_a2"), 0u);
    auto record = engine.last_execution("r1");
    EXPECT_EQ(record->result, FiringResult::Failed);
    EXPECT_EQ(record->failed_module_id, "r1_a");
    EXPECT_EQ(record->error_message, "mock action failure");

    auto status = engine.get_status("r1");
    EXPECT_TRUE(status->initialized);
    EXPECT_TRUE(status->enabled);
    EXPECT_FALSE(status->running);

    // The next firing runs again
    fire("r1_t", one_value("value", 2));
    EXPECT_EQ(foo->action_count("r1_a"), 2u);
}

TEST_F(RuleEngineTest, NonStandardActionFailureIsContained) {
    engine.register_factory(foo);
    engine.set_rule(simple_rule("r1", "Foo"));
    foo->on_execute([](const std::string& id) {
        if (id == "r1_a") {
            throw 42;
        }
    });

    EXPECT_NO_THROW(fire("r1_t", one_value("value", 1)));

    auto record = engine.last_execution("r1");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->result, FiringResult::Failed);
    EXPECT_EQ(record->failed_module_id, "r1_a");
    EXPECT_EQ(record->error_message, "unknown exception");
    EXPECT_FALSE(engine.is_running("r1"));
    EXPECT_TRUE(engine.get_status("r1")->initialized);
}

TEST_F(RuleEngineTest, ThrowingStatusListenerDoesNotBreakFiring) {
    engine.register_factory(foo);
    engine.set_rule(simple_rule("r1", "Foo"));
    engine.set_status_listener([](const std::string&, const RuleStatus&) {
        throw std::runtime_error("listener failure");
    });

    EXPECT_NO_THROW(fire("r1_t", one_value("value", 1)));

    EXPECT_EQ(foo->action_count("r1_a"), 1u);
    EXPECT_EQ(engine.last_execution("r1")->result, FiringResult::Executed);
    EXPECT_FALSE(engine.is_running("r1"));
}

TEST_F(RuleEngineTest, RunningIsReportedDuringFiring) {
    engine.register_factory(foo);
    engine.set_rule(simple_rule("r1", "Foo"));
    bool running_inside = false;
    foo->on_execute([&](const std::string&) { running_inside = engine.is_running("r1"); });

    fire("r1_t", one_value("value", 1));

    EXPECT_TRUE(running_inside);
    EXPECT_FALSE(engine.is_running("r1"));
}

TEST_F(RuleEngineTest, ActionMayDisableItsOwnRule) {
    engine.register_factory(foo);
    engine.set_rule(simple_rule("r1", "Foo"));
    foo->on_execute([&](const std::string&) { engine.set_enabled("r1", false); });

    fire("r1_t", one_value("value", 1));
    fire("r1_t", one_value("value", 2));

    EXPECT_EQ(foo->action_count("r1_a"), 1u);
    EXPECT_FALSE(engine.get_status("r1")->enabled);
}

// =============================================================================
// Scenario: temperature alarm with built-in modules
// =============================================================================

TEST(RuleEngineScenario, TemperatureAboveThresholdRunsLogAction) {
    std::ostringstream log;
    auto builtins = std::make_shared<builtin_modules::BuiltinHandlerFactory>(log);
    RuleEngine engine;
    engine.register_factory(builtins);

    Rule rule;
    rule.id = "heat_alarm";
    ValueMap trigger_config{{"channel", make_string("temperature")}};
    rule.triggers.push_back(make_trigger("t1", "core.ManualTrigger", trigger_config));
    ValueMap condition_config{{"operator", make_string(">")}, {"threshold", make_int64(20)}};
    rule.conditions.push_back(make_condition("c1", "core.CompareCondition", {{"value", "t1", "temp"}}, condition_config));
    rule.actions.push_back(make_action("a1", "core.LogAction", {{"reading", "t1", "temp"}}));
    engine.set_rule(rule);
    ASSERT_TRUE(engine.get_status("heat_alarm")->initialized);

    EXPECT_EQ(builtins->fire("temperature", one_value("temp", 22)), 1u);
    EXPECT_NE(log.str().find("[LogAction] a1: reading=22"), std::string::npos);
    EXPECT_EQ(engine.last_execution("heat_alarm")->result, FiringResult::Executed);

    log.str("");
    builtins->fire("temperature", one_value("temp", 18));
    EXPECT_TRUE(log.str().empty());
    EXPECT_EQ(engine.last_execution("heat_alarm")->result, FiringResult::ConditionsNotMet);
}

// =============================================================================
// Replacement & Removal
// =============================================================================

TEST_F(RuleEngineTest, RemoveRuleLeavesNoTrace) {
    engine.register_factory(foo);
    engine.set_rule(simple_rule("r1", "Foo"));
    ASSERT_TRUE(engine.has_callback("r1"));

    auto removed = engine.remove_rule("r1");

    ASSERT_TRUE(removed.has_value());
    EXPECT_EQ(removed->id, "r1");
    EXPECT_FALSE(engine.get_rule("r1").has_value());
    EXPECT_FALSE(engine.get_status("r1").has_value());
    EXPECT_TRUE(engine.rules_depending_on("Foo").empty());
    EXPECT_FALSE(engine.has_callback("r1"));
    EXPECT_EQ(foo->live_handler_count(), 0u);
    EXPECT_FALSE(engine.remove_rule("r1").has_value());
}

TEST_F(RuleEngineTest, ReplacingRuleKeepsEnablementAndCallback) {
    engine.register_factory(foo);
    engine.set_rule(simple_rule("r1", "Foo"));
    engine.set_enabled("r1", false);

    Rule replacement = simple_rule("r1", "Foo", false);
    replacement.label = "second";
    engine.set_rule(replacement);

    EXPECT_EQ(engine.get_rule("r1")->label, "second");
    EXPECT_FALSE(engine.get_status("r1")->enabled);
    EXPECT_TRUE(engine.get_status("r1")->initialized);
    EXPECT_TRUE(engine.has_callback("r1"));
    EXPECT_EQ(foo->live_handler_count(), 2u);
}

TEST_F(RuleEngineTest, ReplacementDropsStaleDependencies) {
    auto bar = std::make_shared<MockHandlerFactory>(std::set<std::string>{"Bar"});
    engine.register_factory(foo);
    engine.register_factory(bar);
    engine.set_rule(fixtures::mixed_rule("r1", "Foo", "Foo", "Bar"));
    ASSERT_EQ(engine.rules_depending_on("Bar"), (std::set<std::string>{"r1"}));

    engine.set_rule(simple_rule("r1", "Foo"));

    EXPECT_TRUE(engine.rules_depending_on("Bar").empty());
    EXPECT_EQ(bar->live_handler_count(), 0u);
}

TEST_F(RuleEngineTest, SetEnabledOnUnknownRuleReturnsFalse) {
    EXPECT_FALSE(engine.set_enabled("ghost", true));
    EXPECT_FALSE(engine.get_status("ghost").has_value());
    EXPECT_FALSE(engine.is_running("ghost"));
}

// =============================================================================
// Queries
// =============================================================================

TEST_F(RuleEngineTest, TagQueriesUseAnyMatch) {
    Rule a = simple_rule("a", "Foo");
    a.tags = {"climate", "alarm"};
    a.scope = "kitchen";
    Rule b = simple_rule("b", "Foo");
    b.tags = {"lighting"};
    b.scope = "kitchen";
    Rule c = simple_rule("c", "Foo");
    c.scope = "garage";
    engine.set_rule(a);
    engine.set_rule(b);
    engine.set_rule(c);

    EXPECT_EQ(engine.get_rules().size(), 3u);
    ASSERT_EQ(engine.get_rules_by_tag("climate").size(), 1u);
    EXPECT_EQ(engine.get_rules_by_tag("climate")[0].id, "a");
    EXPECT_EQ(engine.get_rules_by_tags({"alarm", "lighting"}).size(), 2u);
    EXPECT_TRUE(engine.get_rules_by_tags({}).empty());
    EXPECT_EQ(engine.get_scope_ids(), (std::set<std::string>{"garage", "kitchen"}));
}

// =============================================================================
// Status Listener
// =============================================================================

TEST_F(RuleEngineTest, ListenerObservesInitializationAndEnablement) {
    std::vector<RuleStatus> seen;
    engine.set_status_listener([&](const std::string& id, const RuleStatus& status) {
        if (id == "r1") {
            seen.push_back(status);
        }
    });

    engine.set_rule(simple_rule("r1", "Foo"));
    engine.register_factory(foo);
    engine.set_enabled("r1", false);
    engine.set_enabled("r1", false);

    ASSERT_GE(seen.size(), 3u);
    EXPECT_FALSE(seen.front().initialized);
    EXPECT_TRUE(seen.back().initialized);
    EXPECT_FALSE(seen.back().enabled);
    for (std::size_t i = 1; i < seen.size(); ++i) {
        EXPECT_NE(seen[i - 1], seen[i]);
    }
}
