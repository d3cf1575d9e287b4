// modules/registry/node_registry.h
#ifndef MOTIONCHART_MODULES_REGISTRY_NODE_REGISTRY_H
#define MOTIONCHART_MODULES_REGISTRY_NODE_REGISTRY_H

#include "core/types/node.h"
#include "core/types/errors.h"
#include <memory>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace motionchart {

// Owns every node of one motion episode and resolves them by name.
// Passed explicitly to whoever evaluates conditions; there is no global instance.
class NodeRegistry {
public:
    NodeRegistry() = default;
    NodeRegistry(NodeRegistry&&) = default;
    NodeRegistry& operator=(NodeRegistry&&) = default;
    NodeRegistry(const NodeRegistry&) = delete;
    NodeRegistry& operator=(const NodeRegistry&) = delete;

    // Throws DuplicateNodeNameError, or RegistryFrozenError after the first tick.
    GraphNode& register_node(std::unique_ptr<GraphNode> node);

    template <typename T, typename... Args>
    T& emplace(Args&&... args) {
        auto node = std::make_unique<T>(std::forward<Args>(args)...);
        T& ref = *node;
        register_node(std::move(node));
        return ref;
    }

    // Throws UnresolvedReferenceError
    GraphNode& resolve(const NodeName& name);
    const GraphNode& resolve(const NodeName& name) const;

    // Throws StatechartError when the node exists with another kind
    template <typename T>
    T& resolve_as(const NodeName& name) {
        GraphNode& node = resolve(name);
        T* typed = dynamic_cast<T*>(&node);
        if (typed == nullptr) {
            throw StatechartError("Node " + name + " is a " + to_string(node.kind) +
                                  ", not the expected kind");
        }
        return *typed;
    }

    const GraphNode* find(const NodeName& name) const;
    bool contains(const NodeName& name) const;
    size_t size() const { return all_nodes_.size(); }

    // Registration order
    const std::vector<std::unique_ptr<GraphNode>>& nodes() const { return all_nodes_; }

    template <typename T>
    std::vector<T*> nodes_of_type() const {
        std::vector<T*> out;
        for (const auto& node_ptr : all_nodes_) {
            if (auto* typed = dynamic_cast<T*>(node_ptr.get())) {
                out.push_back(typed);
            }
        }
        return out;
    }

    // World layer pushes a resolved boolean before the tick begins.
    void set_observation(const NodeName& name, bool value);

    StateSnapshot snapshot() const;
    std::set<NodeName> running_set() const;
    bool all_ended() const;

    void freeze() { frozen_ = true; }
    bool frozen() const { return frozen_; }

private:
    std::vector<std::unique_ptr<GraphNode>> all_nodes_;
    std::unordered_map<NodeName, GraphNode*> node_map_;
    bool frozen_ = false;
};

} // namespace motionchart

#endif // MOTIONCHART_MODULES_REGISTRY_NODE_REGISTRY_H
