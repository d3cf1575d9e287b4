#ifndef MOTIONCHART_TYPES_ERRORS_H
#define MOTIONCHART_TYPES_ERRORS_H

#include "lifecycle.h" // 引入 NodeName
#include <stdexcept>
#include <string>

namespace motionchart {

// Base of every statechart construction / configuration error.
// None of them is retried: the owner aborts statechart construction.
struct StatechartError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct DuplicateNodeNameError : public StatechartError {
    NodeName node_name;

    explicit DuplicateNodeNameError(const NodeName& name)
        : StatechartError("Duplicate node name: " + name), node_name(name) {}
};

struct DuplicateConstraintError : public StatechartError {
    NodeName task_name;

    explicit DuplicateConstraintError(const NodeName& name)
        : StatechartError("Constraint with name " + name + " already exists."), task_name(name) {}
};

struct GoalInitializationError : public StatechartError {
    NodeName goal_name;

    GoalInitializationError(const NodeName& name, const std::string& reason)
        : StatechartError("Goal " + name + " " + reason), goal_name(name) {}
};

struct UnresolvedReferenceError : public StatechartError {
    NodeName reference;

    explicit UnresolvedReferenceError(const NodeName& name)
        : StatechartError("Unresolved node reference: " + name), reference(name) {}

    UnresolvedReferenceError(const NodeName& name, const std::string& context)
        : StatechartError("Unresolved node reference: " + name + " (" + context + ")"), reference(name) {}
};

struct EmptySequenceError : public StatechartError {
    EmptySequenceError() : StatechartError("Cannot arrange an empty list of nodes in sequence") {}
};

struct StatechartParseError : public StatechartError {
    using StatechartError::StatechartError;
};

// 首个 tick 之后注册表结构不可再修改
struct RegistryFrozenError : public StatechartError {
    explicit RegistryFrozenError(const NodeName& name)
        : StatechartError("Cannot register node " + name + " after the first tick") {}
};

} // namespace motionchart

#endif // MOTIONCHART_TYPES_ERRORS_H
