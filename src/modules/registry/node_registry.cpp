// modules/registry/node_registry.cpp
#include "modules/registry/node_registry.h"
#include <stdexcept>

namespace motionchart {

GraphNode& NodeRegistry::register_node(std::unique_ptr<GraphNode> node) {
    if (!node) {
        throw std::invalid_argument("Cannot register a null node");
    }
    if (frozen_) {
        throw RegistryFrozenError(node->name);
    }
    if (node_map_.count(node->name) > 0) {
        throw DuplicateNodeNameError(node->name);
    }
    GraphNode* raw = node.get();
    node_map_[raw->name] = raw;
    all_nodes_.push_back(std::move(node));
    return *raw;
}

GraphNode& NodeRegistry::resolve(const NodeName& name) {
    auto it = node_map_.find(name);
    if (it == node_map_.end()) {
        throw UnresolvedReferenceError(name);
    }
    return *it->second;
}

const GraphNode& NodeRegistry::resolve(const NodeName& name) const {
    auto it = node_map_.find(name);
    if (it == node_map_.end()) {
        throw UnresolvedReferenceError(name);
    }
    return *it->second;
}

const GraphNode* NodeRegistry::find(const NodeName& name) const {
    auto it = node_map_.find(name);
    return (it != node_map_.end()) ? it->second : nullptr;
}

bool NodeRegistry::contains(const NodeName& name) const {
    return node_map_.find(name) != node_map_.end();
}

void NodeRegistry::set_observation(const NodeName& name, bool value) {
    resolve(name).observed_ = value;
}

StateSnapshot NodeRegistry::snapshot() const {
    StateSnapshot snap;
    snap.entries.reserve(all_nodes_.size());
    for (const auto& node_ptr : all_nodes_) {
        snap.entries[node_ptr->name] = StateSnapshot::Entry{node_ptr->state(), node_ptr->last_observation()};
    }
    return snap;
}

std::set<NodeName> NodeRegistry::running_set() const {
    std::set<NodeName> running;
    for (const auto& node_ptr : all_nodes_) {
        if (node_ptr->is_running()) {
            running.insert(node_ptr->name);
        }
    }
    return running;
}

bool NodeRegistry::all_ended() const {
    for (const auto& node_ptr : all_nodes_) {
        if (!node_ptr->is_ended()) {
            return false;
        }
    }
    return true;
}

} // namespace motionchart
