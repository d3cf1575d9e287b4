// modules/goal/goal.cpp
#include "modules/goal/goal.h"
#include "core/types/errors.h"
#include <algorithm>

namespace motionchart {

Goal::Goal(NodeName name)
    : GraphNode(std::move(name), NodeKind::GOAL) {}

void Goal::add_task(Task& task) {
    tasks_.push_back(&task);
}

void Goal::add_monitor(Monitor& monitor) {
    monitors_.push_back(&monitor);
}

void Goal::add_goal(Goal& goal) {
    goals_.push_back(&goal);
}

bool Goal::has_task(const NodeName& name) const {
    return std::any_of(tasks_.begin(), tasks_.end(),
                       [&name](const Task* t) { return t->name == name; });
}

void Goal::add_constraints_of_goal(const Goal& other) {
    for (Task* task : other.tasks()) {
        if (has_task(task->name)) {
            throw DuplicateConstraintError(task->name);
        }
        tasks_.push_back(task);
    }
}

void Goal::connect_start_condition_to_all_tasks(const Condition& condition) {
    for (Task* task : tasks_) {
        if (task->start_condition.is_true()) {
            task->start_condition = condition;
        } else {
            task->start_condition = Condition::conjoin(task->start_condition, condition);
        }
    }
}

void Goal::connect_pause_condition_to_all_tasks(const Condition& condition) {
    for (Task* task : tasks_) {
        if (task->pause_condition.is_false()) {
            task->pause_condition = condition;
        } else {
            task->pause_condition = Condition::disjoin(task->pause_condition, condition);
        }
    }
}

void Goal::connect_end_condition_to_all_tasks(const Condition& condition) {
    for (Task* task : tasks_) {
        // 默认 False 表示“尚无结束条件”，直接覆盖而不是合取
        if (task->end_condition.is_false()) {
            task->end_condition = condition;
        } else if (!condition.is_false()) {
            task->end_condition = Condition::conjoin(task->end_condition, condition);
        }
    }
}

void Goal::connect_monitors_to_all_tasks(const Condition& start_condition,
                                         const Condition& pause_condition,
                                         const Condition& end_condition) {
    connect_start_condition_to_all_tasks(start_condition);
    connect_pause_condition_to_all_tasks(pause_condition);
    connect_end_condition_to_all_tasks(end_condition);
}

Condition Goal::all_tasks_ended() const {
    Condition result = Condition::literal(true);
    for (const Task* task : tasks_) {
        result = Condition::conjoin(result, Condition::reference(task->name, Predicate::IS_ENDED));
    }
    return result;
}

void Goal::check_tasks() const {
    if (!has_tasks()) {
        throw GoalInitializationError(name, "has no tasks.");
    }
}

} // namespace motionchart
