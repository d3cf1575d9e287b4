// modules/goal/goal.h
#ifndef MOTIONCHART_MODULES_GOAL_GOAL_H
#define MOTIONCHART_MODULES_GOAL_GOAL_H

#include "core/types/node.h"
#include <vector>

namespace motionchart {

// Groups child Tasks, Monitors and nested Goals under one name.
//
// Children are owned by the NodeRegistry; the goal keeps non-owning
// pointers, valid for the lifetime of the episode.
class Goal : public GraphNode {
public:
    explicit Goal(NodeName name);

    // No uniqueness check here; add_constraints_of_goal checks.
    void add_task(Task& task);
    void add_monitor(Monitor& monitor);
    void add_goal(Goal& goal);

    // Throws DuplicateConstraintError if a task of the same name exists.
    void add_constraints_of_goal(const Goal& other);

    void connect_start_condition_to_all_tasks(const Condition& condition);
    void connect_pause_condition_to_all_tasks(const Condition& condition);
    void connect_end_condition_to_all_tasks(const Condition& condition);
    void connect_monitors_to_all_tasks(const Condition& start_condition,
                                       const Condition& pause_condition,
                                       const Condition& end_condition);

    // Conjunction of "ended" over all tasks; literal True for no tasks.
    Condition all_tasks_ended() const;

    bool has_tasks() const { return !tasks_.empty(); }
    bool has_task(const NodeName& name) const;

    // Throws GoalInitializationError when the goal has no tasks
    void check_tasks() const;

    const std::vector<Task*>& tasks() const { return tasks_; }
    const std::vector<Monitor*>& monitors() const { return monitors_; }
    const std::vector<Goal*>& goals() const { return goals_; }

private:
    std::vector<Task*> tasks_;
    std::vector<Monitor*> monitors_;
    std::vector<Goal*> goals_;
};

} // namespace motionchart

#endif // MOTIONCHART_MODULES_GOAL_GOAL_H
