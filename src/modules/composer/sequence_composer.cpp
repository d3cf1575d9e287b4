// modules/composer/sequence_composer.cpp
#include "modules/composer/sequence_composer.h"
#include "core/types/errors.h"
#include <stdexcept>

namespace motionchart {

void arrange_in_sequence(const std::vector<GraphNode*>& nodes) {
    if (nodes.empty()) {
        throw EmptySequenceError();
    }
    for (const GraphNode* node : nodes) {
        if (node == nullptr) {
            throw std::invalid_argument("Null node in sequence");
        }
    }

    GraphNode* previous = nodes.front();
    previous->end_condition = Condition::reference(previous->name, Predicate::IS_OBSERVED);
    for (size_t i = 1; i < nodes.size(); ++i) {
        GraphNode* node = nodes[i];
        node->start_condition = Condition::reference(previous->name, Predicate::IS_ENDED);
        node->end_condition = Condition::reference(node->name, Predicate::IS_OBSERVED);
        previous = node;
    }
}

void arrange_in_sequence(NodeRegistry& registry, const std::vector<NodeName>& names) {
    std::vector<GraphNode*> nodes;
    nodes.reserve(names.size());
    for (const auto& name : names) {
        nodes.push_back(&registry.resolve(name));
    }
    arrange_in_sequence(nodes);
}

} // namespace motionchart
