// src/core/nodes.cpp
#include "core/types/node.h"
#include "modules/lifecycle/transition.h"
#include <utility>

namespace motionchart {

// ————————————————————————
// GraphNode
// ————————————————————————

GraphNode::GraphNode(NodeName node_name, NodeKind node_kind)
    : name(std::move(node_name)),
      kind(node_kind),
      metadata(nlohmann::json::object()) {
    observation = name;
}

LifecycleState GraphNode::compute_next_state(const StateSnapshot& snapshot) const {
    TransitionInputs inputs;
    switch (state_) {
        case LifecycleState::ENDED:
            return state_;
        case LifecycleState::DORMANT:
            inputs.start = start_condition.evaluate(snapshot);
            break;
        case LifecycleState::RUNNING:
        case LifecycleState::PAUSED:
            inputs.end = end_condition.evaluate(snapshot);
            inputs.pause = pause_condition.evaluate(snapshot);
            break;
    }
    return next_lifecycle_state(state_, inputs);
}

nlohmann::json GraphNode::describe() const {
    nlohmann::json obj;
    obj["name"] = name;
    obj["type"] = to_string(kind);
    obj["state"] = to_string(state_);
    obj["observation"] = observation;
    obj["start"] = start_condition.to_json();
    obj["pause"] = pause_condition.to_json();
    obj["end"] = end_condition.to_json();
    if (!metadata.empty()) {
        obj["metadata"] = metadata;
    }
    return obj;
}

// ————————————————————————
// Task
// ————————————————————————

Task::Task(NodeName name, ExpressionHandle expr)
    : GraphNode(std::move(name), NodeKind::TASK),
      expression(std::move(expr)) {}

// ————————————————————————
// Monitor
// ————————————————————————

Monitor::Monitor(NodeName name)
    : GraphNode(std::move(name), NodeKind::MONITOR) {}

Monitor::Monitor(NodeName name, std::string observation_key)
    : GraphNode(std::move(name), NodeKind::MONITOR) {
    observation = std::move(observation_key);
}

} // namespace motionchart
