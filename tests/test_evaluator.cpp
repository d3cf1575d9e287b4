// tests/test_evaluator.cpp
#include <catch2/catch_test_macros.hpp>
#include "modules/evaluator/statechart_evaluator.h"
#include "modules/composer/sequence_composer.h"
#include "modules/goal/goal.h"
#include <chrono>
#include <memory>
#include <string>
#include <thread>

using namespace motionchart;

namespace {

struct NamedExpression : SymbolicExpression {
    std::string label;
    explicit NamedExpression(std::string l) : label(std::move(l)) {}
    std::string describe() const override { return label; }
};

StatechartEvaluator::Config quiet_config() {
    StatechartEvaluator::Config config;
    config.trace = false;
    return config;
}

} // namespace

// Test 1: a node never sees a sibling's transition from the same tick
TEST_CASE("Transitions are computed against the previous tick", "[evaluator]") {
    NodeRegistry registry;
    ObservationRegistry observations;
    registry.emplace<Task>("a");
    Task& b = registry.emplace<Task>("b");
    Task& c = registry.emplace<Task>("c");
    b.start_condition = Condition::reference("a", Predicate::IS_RUNNING);
    c.start_condition = Condition::reference("b", Predicate::IS_RUNNING);

    StatechartEvaluator evaluator(registry, observations, quiet_config());

    auto r1 = evaluator.tick();
    REQUIRE(r1.tick == 1);
    REQUIRE(r1.running == std::set<NodeName>{"a"});
    REQUIRE(r1.transitions.size() == 1);
    REQUIRE(r1.transitions[0].node == "a");
    REQUIRE(r1.transitions[0].from == LifecycleState::DORMANT);
    REQUIRE(r1.transitions[0].to == LifecycleState::RUNNING);

    auto r2 = evaluator.tick();
    REQUIRE(r2.running == std::set<NodeName>{"a", "b"});

    auto r3 = evaluator.tick();
    REQUIRE(r3.running == std::set<NodeName>{"a", "b", "c"});

    // Nothing left to change
    REQUIRE(evaluator.tick().transitions.empty());
    REQUIRE(evaluator.tick_count() == 4);
}

TEST_CASE("Mutual references resolve symmetrically", "[evaluator]") {
    NodeRegistry registry;
    ObservationRegistry observations;
    Task& a = registry.emplace<Task>("a");
    Task& b = registry.emplace<Task>("b");
    // Each pauses while the other runs: both start together, then both pause
    a.pause_condition = Condition::reference("b", Predicate::IS_RUNNING);
    b.pause_condition = Condition::reference("a", Predicate::IS_RUNNING);

    StatechartEvaluator evaluator(registry, observations, quiet_config());
    evaluator.tick();
    REQUIRE(a.is_running());
    REQUIRE(b.is_running());

    evaluator.tick();
    REQUIRE(a.is_paused());
    REQUIRE(b.is_paused());

    // Neither is running any more, so both resume
    evaluator.tick();
    REQUIRE(a.is_running());
    REQUIRE(b.is_running());
}

TEST_CASE("Observations are pulled before every tick", "[evaluator][observation]") {
    NodeRegistry registry;
    ObservationRegistry observations;
    Task& reach = registry.emplace<Task>("reach");
    Monitor& collision = registry.emplace<Monitor>("collision", "collision_detected");
    reach.pause_condition = Condition::reference("collision", Predicate::IS_OBSERVED);
    reach.end_condition = Condition::reference("reach", Predicate::IS_OBSERVED);
    collision.end_condition = Condition::reference("reach", Predicate::IS_ENDED);

    bool reached = false;
    bool colliding = false;
    observations.register_observation("reach", [&reached]() { return reached; });
    observations.register_observation("collision_detected", [&colliding]() { return colliding; });
    REQUIRE(observations.list_observations() == std::vector<std::string>{"collision_detected", "reach"});
    REQUIRE_THROWS_AS(observations.observe("ghost"), UnresolvedReferenceError);

    StatechartEvaluator evaluator(registry, observations, quiet_config());
    evaluator.tick();
    REQUIRE(reach.is_running());

    colliding = true;
    evaluator.tick();
    REQUIRE(reach.is_paused());
    REQUIRE(collision.last_observation());

    colliding = false;
    evaluator.tick();
    REQUIRE(reach.is_running());

    reached = true;
    evaluator.tick();
    REQUIRE(reach.is_ended());
    evaluator.tick();
    REQUIRE(collision.is_ended());
}

TEST_CASE("Cancellation ends active nodes and blocks dormant ones", "[evaluator][cancel]") {
    NodeRegistry registry;
    ObservationRegistry observations;
    Task& a = registry.emplace<Task>("a");
    Task& b = registry.emplace<Task>("b");
    b.start_condition = Condition::reference("a", Predicate::IS_ENDED);

    StatechartEvaluator evaluator(registry, observations, quiet_config());
    evaluator.tick();
    REQUIRE(a.is_running());
    REQUIRE(b.is_dormant());

    evaluator.request_cancel();
    REQUIRE_FALSE(evaluator.cancelled());
    evaluator.tick();
    REQUIRE(evaluator.cancelled());
    REQUIRE(a.is_ended());
    REQUIRE(b.is_dormant());

    // Sticky: b's start is true now but it never starts
    evaluator.tick();
    REQUIRE(b.is_dormant());
}

TEST_CASE("Cancelled run reports failure", "[evaluator][cancel]") {
    NodeRegistry registry;
    ObservationRegistry observations;
    registry.emplace<Task>("a");

    StatechartEvaluator evaluator(registry, observations, quiet_config());
    evaluator.request_cancel();
    auto result = evaluator.run();
    REQUIRE_FALSE(result.success);
    REQUIRE(result.message.find("cancelled") != std::string::npos);
    REQUIRE(result.ticks == 1);
}

TEST_CASE("Cancel requested after the tasks ended still fails the run", "[evaluator][cancel]") {
    NodeRegistry registry;
    ObservationRegistry observations;
    Task& a = registry.emplace<Task>("a");
    a.end_condition = Condition::reference("a", Predicate::IS_OBSERVED);
    registry.set_observation("a", true);

    auto config = quiet_config();
    config.pushed_observations = true;
    StatechartEvaluator evaluator(registry, observations, config);
    evaluator.tick();
    evaluator.tick();
    REQUIRE(a.is_ended());
    REQUIRE(evaluator.is_finished());

    evaluator.request_cancel();
    auto result = evaluator.run();
    REQUIRE_FALSE(result.success);
    REQUIRE(result.message.find("cancelled") != std::string::npos);
    REQUIRE(evaluator.cancelled());
}

TEST_CASE("Nodes sharing an observation key see one value per tick", "[evaluator][observation]") {
    NodeRegistry registry;
    ObservationRegistry observations;
    Monitor& left = registry.emplace<Monitor>("left_finger", "contact");
    Monitor& right = registry.emplace<Monitor>("right_finger", "contact");

    int calls = 0;
    // Alternates on every call
    observations.register_observation("contact", [&calls]() { return ++calls % 2 == 1; });

    StatechartEvaluator evaluator(registry, observations, quiet_config());
    evaluator.tick();
    REQUIRE(calls == 1);
    REQUIRE(left.last_observation());
    REQUIRE(right.last_observation());

    evaluator.tick();
    REQUIRE(calls == 2);
    REQUIRE_FALSE(left.last_observation());
    REQUIRE_FALSE(right.last_observation());
}

TEST_CASE("Wall-time budget counts from the first tick", "[evaluator][budget]") {
    NodeRegistry registry;
    ObservationRegistry observations;
    registry.emplace<Task>("hold");

    TickBudget budget;
    budget.max_duration_ms = 30;
    auto config = quiet_config();
    config.budget = budget;
    StatechartEvaluator evaluator(registry, observations, config);

    // Idle time before the episode starts is not charged
    std::this_thread::sleep_for(std::chrono::milliseconds(60));
    auto result = evaluator.run();

    REQUIRE_FALSE(result.success);
    REQUIRE(result.ticks >= 1);
    REQUIRE(result.message.find("budget exhausted") != std::string::npos);
    REQUIRE(evaluator.get_budget_controller().exceeded());
    REQUIRE(evaluator.get_budget_controller().elapsed_ms() >= 30);
    REQUIRE_FALSE(evaluator.get_budget_controller().remaining_ticks().has_value());
}

TEST_CASE("Run stops on budget or completion", "[evaluator][budget]") {
    NodeRegistry registry;
    ObservationRegistry observations;
    registry.emplace<Task>("a");
    registry.emplace<Task>("b");
    arrange_in_sequence(registry, {"a", "b"});

    SECTION("Budget exhausted") {
        TickBudget budget;
        budget.max_ticks = 3;
        auto config = quiet_config();
        config.budget = budget;
        StatechartEvaluator evaluator(registry, observations, config);

        auto result = evaluator.run();
        REQUIRE_FALSE(result.success);
        REQUIRE(result.ticks == 3);
        REQUIRE(evaluator.get_budget_controller().ticks_used() == 3);
        REQUIRE(evaluator.get_budget_controller().remaining_ticks() == 0);
        REQUIRE(evaluator.get_budget_controller().exceeded());
        REQUIRE(result.message.find("budget exhausted") != std::string::npos);
        REQUIRE(result.final_states.at("a") == LifecycleState::RUNNING);
    }

    SECTION("Every task ended") {
        registry.set_observation("a", true);
        registry.set_observation("b", true);
        auto config = quiet_config();
        config.pushed_observations = true;
        StatechartEvaluator evaluator(registry, observations, config);

        auto result = evaluator.run();
        REQUIRE(result.success);
        // a: start, end; b: start, end
        REQUIRE(result.ticks == 4);
        REQUIRE(result.final_states.at("b") == LifecycleState::ENDED);
        REQUIRE(evaluator.is_finished());
    }

    SECTION("Termination node") {
        registry.set_observation("a", true);
        auto config = quiet_config();
        config.termination_node = "a";
        StatechartEvaluator evaluator(registry, observations, config);

        auto result = evaluator.run();
        REQUIRE(result.success);
        REQUIRE(result.ticks == 2);
        REQUIRE(result.final_states.at("b") == LifecycleState::DORMANT);
    }
}

TEST_CASE("Validation before the first tick", "[evaluator][validate]") {
    NodeRegistry registry;
    ObservationRegistry observations;

    SECTION("Unknown reference") {
        Task& a = registry.emplace<Task>("a");
        a.start_condition = Condition::reference("ghost", Predicate::IS_ENDED);
        StatechartEvaluator evaluator(registry, observations);
        REQUIRE_THROWS_AS(evaluator.validate(), UnresolvedReferenceError);
        REQUIRE_THROWS_AS(evaluator.tick(), UnresolvedReferenceError);
    }
    SECTION("Goal without tasks") {
        registry.emplace<Goal>("empty");
        StatechartEvaluator evaluator(registry, observations);
        REQUIRE_THROWS_AS(evaluator.validate(), GoalInitializationError);
    }
    SECTION("Unknown termination node") {
        registry.emplace<Task>("a");
        auto config = quiet_config();
        config.termination_node = "ghost";
        StatechartEvaluator evaluator(registry, observations, config);
        REQUIRE_THROWS_AS(evaluator.run(), UnresolvedReferenceError);
    }
}

TEST_CASE("Active constraints are the running tasks with an expression", "[evaluator]") {
    NodeRegistry registry;
    ObservationRegistry observations;
    registry.emplace<Task>("reach", std::make_shared<NamedExpression>("reach_pose"));
    Task& grasp = registry.emplace<Task>("grasp", std::make_shared<NamedExpression>("close_gripper"));
    registry.emplace<Task>("bare");
    grasp.start_condition = Condition::reference("reach", Predicate::IS_ENDED);

    StatechartEvaluator evaluator(registry, observations, quiet_config());
    REQUIRE(evaluator.active_constraints().empty());

    evaluator.tick();
    auto active = evaluator.active_constraints();
    REQUIRE(active.size() == 1);
    REQUIRE(active[0]->name == "reach");
    REQUIRE(active[0]->expression->describe() == "reach_pose");
}

TEST_CASE("Transitions are traced per tick", "[evaluator][trace]") {
    NodeRegistry registry;
    ObservationRegistry observations;
    Task& a = registry.emplace<Task>("a");
    a.metadata["controller"] = "cartesian";
    a.end_condition = Condition::reference("a", Predicate::IS_OBSERVED);
    registry.set_observation("a", true);

    StatechartEvaluator::Config config;
    config.episode_id = "ep-1";
    config.pushed_observations = true;
    StatechartEvaluator evaluator(registry, observations, config);
    evaluator.tick();
    evaluator.tick();

    auto traces = evaluator.get_trace_exporter().get_traces();
    REQUIRE(traces.size() == 2);
    REQUIRE(traces[0].tick == 1);
    REQUIRE(traces[0].to == LifecycleState::RUNNING);
    REQUIRE(traces[1].tick == 2);
    REQUIRE(traces[1].from == LifecycleState::RUNNING);
    REQUIRE(traces[1].to == LifecycleState::ENDED);

    auto j = evaluator.get_trace_exporter().to_json();
    REQUIRE(j[1]["episode_id"] == "ep-1");
    REQUIRE(j[1]["node"] == "a");
    REQUIRE(j[1]["type"] == "task");
    REQUIRE(j[1]["to"] == "ended");
    REQUIRE(j[1]["metadata"]["controller"] == "cartesian");
}
