#ifndef MOTIONCHART_TYPES_LIFECYCLE_H
#define MOTIONCHART_TYPES_LIFECYCLE_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace motionchart {

// 节点名称类型
using NodeName = std::string; // e.g., "reach_pregrasp"

// 节点生命周期状态
enum class LifecycleState : uint8_t {
    DORMANT,
    RUNNING,
    PAUSED,
    ENDED
};

// Leaf predicates a condition may test on a referenced node.
// IS_OBSERVED tests the node's latest world observation, not its state.
enum class Predicate : uint8_t {
    IS_DORMANT,
    IS_RUNNING,
    IS_PAUSED,
    IS_ENDED,
    IS_OBSERVED
};

enum class NodeKind : uint8_t {
    TASK,
    MONITOR,
    GOAL
};

inline const char* to_string(LifecycleState state) {
    switch (state) {
        case LifecycleState::DORMANT: return "dormant";
        case LifecycleState::RUNNING: return "running";
        case LifecycleState::PAUSED:  return "paused";
        case LifecycleState::ENDED:   return "ended";
    }
    return "unknown";
}

inline const char* to_string(Predicate predicate) {
    switch (predicate) {
        case Predicate::IS_DORMANT:  return "dormant";
        case Predicate::IS_RUNNING:  return "running";
        case Predicate::IS_PAUSED:   return "paused";
        case Predicate::IS_ENDED:    return "ended";
        case Predicate::IS_OBSERVED: return "observed";
    }
    return "unknown";
}

inline const char* to_string(NodeKind kind) {
    switch (kind) {
        case NodeKind::TASK:    return "task";
        case NodeKind::MONITOR: return "monitor";
        case NodeKind::GOAL:    return "goal";
    }
    return "unknown";
}

// Parse the YAML/JSON key of a predicate ("ended", "running", ...)
inline std::optional<Predicate> parse_predicate(std::string_view key) {
    if (key == "dormant") return Predicate::IS_DORMANT;
    if (key == "running") return Predicate::IS_RUNNING;
    if (key == "paused") return Predicate::IS_PAUSED;
    if (key == "ended") return Predicate::IS_ENDED;
    if (key == "observed") return Predicate::IS_OBSERVED;
    return std::nullopt;
}

inline std::optional<NodeKind> parse_node_kind(std::string_view key) {
    if (key == "task") return NodeKind::TASK;
    if (key == "monitor") return NodeKind::MONITOR;
    if (key == "goal") return NodeKind::GOAL;
    return std::nullopt;
}

// 一个 tick 开始时所有节点状态的只读快照
struct StateSnapshot {
    struct Entry {
        LifecycleState state = LifecycleState::DORMANT;
        bool observed = false;
    };

    std::unordered_map<NodeName, Entry> entries;

    const Entry* find(const NodeName& name) const {
        auto it = entries.find(name);
        return (it != entries.end()) ? &it->second : nullptr;
    }
};

} // namespace motionchart

#endif // MOTIONCHART_TYPES_LIFECYCLE_H
