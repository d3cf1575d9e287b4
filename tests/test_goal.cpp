// tests/test_goal.cpp
#include <catch2/catch_test_macros.hpp>
#include "modules/goal/goal.h"
#include "modules/registry/node_registry.h"
#include "modules/evaluator/statechart_evaluator.h"

using namespace motionchart;

namespace {

Condition running(const std::string& name) { return Condition::reference(name, Predicate::IS_RUNNING); }
Condition ended(const std::string& name) { return Condition::reference(name, Predicate::IS_ENDED); }

} // namespace

TEST_CASE("Goal membership", "[goal]") {
    NodeRegistry registry;
    Goal& pick = registry.emplace<Goal>("pick");
    Task& reach = registry.emplace<Task>("reach");
    Monitor& collision = registry.emplace<Monitor>("collision");

    REQUIRE_THROWS_AS(pick.check_tasks(), GoalInitializationError);

    pick.add_task(reach);
    pick.add_monitor(collision);
    REQUIRE(pick.has_tasks());
    REQUIRE(pick.has_task("reach"));
    REQUIRE_FALSE(pick.has_task("collision"));
    REQUIRE(pick.monitors().size() == 1);
    REQUIRE_NOTHROW(pick.check_tasks());
}

// Test 1: merging constraints of another goal
TEST_CASE("Merging goals rejects duplicate constraints", "[goal]") {
    NodeRegistry registry;
    Goal& g1 = registry.emplace<Goal>("g1");
    Goal& g2 = registry.emplace<Goal>("g2");
    Goal& g3 = registry.emplace<Goal>("g3");
    Task& a = registry.emplace<Task>("a");
    Task& b = registry.emplace<Task>("b");

    g1.add_task(a);
    g2.add_task(b);
    g3.add_task(a);

    g1.add_constraints_of_goal(g2);
    REQUIRE(g1.tasks().size() == 2);
    REQUIRE(g1.has_task("b"));

    try {
        g1.add_constraints_of_goal(g3);
        FAIL("expected DuplicateConstraintError");
    } catch (const DuplicateConstraintError& e) {
        REQUIRE(e.task_name == "a");
    }
}

// Test 2: condition broadcast to all tasks
TEST_CASE("Connecting conditions to all tasks", "[goal]") {
    NodeRegistry registry;
    Goal& goal = registry.emplace<Goal>("goal");
    Task& a = registry.emplace<Task>("a");
    Task& b = registry.emplace<Task>("b");
    registry.emplace<Monitor>("m");
    goal.add_task(a);
    goal.add_task(b);

    b.start_condition = ended("a");
    b.end_condition = ended("m");

    SECTION("Start conjoins, replacing the default True") {
        goal.connect_start_condition_to_all_tasks(running("m"));
        REQUIRE(a.start_condition == running("m"));
        REQUIRE(b.start_condition.to_string() == "(a.ended and m.running)");
    }
    SECTION("Pause disjoins, replacing the default False") {
        goal.connect_pause_condition_to_all_tasks(running("m"));
        goal.connect_pause_condition_to_all_tasks(ended("m"));
        REQUIRE(a.pause_condition.to_string() == "(m.running or m.ended)");
    }
    SECTION("End replaces the default False, conjoins otherwise") {
        goal.connect_end_condition_to_all_tasks(running("m"));
        REQUIRE(a.end_condition == running("m"));
        REQUIRE(b.end_condition.to_string() == "(m.ended and m.running)");
    }
    SECTION("A False end condition never disables an existing one") {
        goal.connect_end_condition_to_all_tasks(Condition::literal(false));
        REQUIRE(a.end_condition.is_false());
        REQUIRE(b.end_condition == ended("m"));
    }
    SECTION("Monitors connect all three at once") {
        goal.connect_monitors_to_all_tasks(Condition::literal(true), running("m"), ended("m"));
        REQUIRE(a.start_condition.is_true());
        REQUIRE(a.pause_condition == running("m"));
        REQUIRE(a.end_condition == ended("m"));
    }
}

TEST_CASE("Goal aggregate end over its tasks", "[goal]") {
    NodeRegistry registry;
    Goal& goal = registry.emplace<Goal>("goal");
    REQUIRE(goal.all_tasks_ended().is_true());

    Task& a = registry.emplace<Task>("a");
    Task& b = registry.emplace<Task>("b");
    goal.add_task(a);
    goal.add_task(b);
    REQUIRE(goal.all_tasks_ended().to_string() == "(a.ended and b.ended)");

    // Goal ends once both tasks ended
    goal.end_condition = goal.all_tasks_ended();
    a.end_condition = Condition::reference("a", Predicate::IS_OBSERVED);
    b.end_condition = Condition::reference("b", Predicate::IS_OBSERVED);

    tick(registry);
    REQUIRE(goal.is_running());
    registry.set_observation("a", true);
    tick(registry);
    REQUIRE(a.is_ended());
    tick(registry);
    REQUIRE(goal.is_running());

    registry.set_observation("b", true);
    tick(registry);
    tick(registry);
    REQUIRE(goal.is_ended());
}
