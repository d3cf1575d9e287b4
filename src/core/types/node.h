#ifndef MOTIONCHART_TYPES_NODE_H
#define MOTIONCHART_TYPES_NODE_H

#include "lifecycle.h" // 引入 NodeName, LifecycleState
#include "condition.h" // 引入 Condition
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

namespace motionchart {

// Opaque handle to the symbolic constraint expression a Task contributes.
// Only its presence matters to the statechart; the optimizer owns its meaning.
struct SymbolicExpression {
    virtual ~SymbolicExpression() = default;
    virtual std::string describe() const = 0;
};

using ExpressionHandle = std::shared_ptr<const SymbolicExpression>;

// Base of Task, Monitor and Goal.
//
// Conditions and metadata are plain fields written while the statechart is
// being built. Lifecycle state and the latest observation are only written
// by the evaluator (and by NodeRegistry for pushed observations).
class GraphNode {
public:
    NodeName name;
    NodeKind kind;
    Condition start_condition = Condition::literal(true);
    Condition pause_condition = Condition::literal(false);
    Condition end_condition = Condition::literal(false);
    std::string observation; // 自身完成信号的名称，默认与节点同名
    nlohmann::json metadata;

    GraphNode(NodeName name, NodeKind kind);
    virtual ~GraphNode() = default;

    GraphNode(const GraphNode&) = delete;
    GraphNode& operator=(const GraphNode&) = delete;

    LifecycleState state() const { return state_; }
    bool last_observation() const { return observed_; }

    bool is_dormant() const { return state_ == LifecycleState::DORMANT; }
    bool is_running() const { return state_ == LifecycleState::RUNNING; }
    bool is_paused() const { return state_ == LifecycleState::PAUSED; }
    bool is_ended() const { return state_ == LifecycleState::ENDED; }

    // Next state under the transition precedence, computed against a
    // snapshot of the previous tick. Does not modify the node.
    LifecycleState compute_next_state(const StateSnapshot& snapshot) const;

    nlohmann::json describe() const;

private:
    friend class StatechartEvaluator;
    friend class NodeRegistry;

    LifecycleState state_ = LifecycleState::DORMANT;
    bool observed_ = false;
};

// Contributes one named constraint while RUNNING.
class Task : public GraphNode {
public:
    ExpressionHandle expression;

    explicit Task(NodeName name, ExpressionHandle expression = nullptr);

    bool contributes_constraint() const { return is_running() && expression != nullptr; }
};

// Observes world state; other nodes use its lifecycle in their conditions.
class Monitor : public GraphNode {
public:
    explicit Monitor(NodeName name);
    Monitor(NodeName name, std::string observation_key);
};

} // namespace motionchart

#endif // MOTIONCHART_TYPES_NODE_H
