// modules/composer/sequence_composer.h
#ifndef MOTIONCHART_MODULES_COMPOSER_SEQUENCE_COMPOSER_H
#define MOTIONCHART_MODULES_COMPOSER_SEQUENCE_COMPOSER_H

#include "core/types/node.h"
#include "modules/registry/node_registry.h"
#include <vector>

namespace motionchart {

// Wires nodes into a strict chain:
//   nodes[0].end   = nodes[0].observed
//   nodes[i].start = nodes[i-1].ended
//   nodes[i].end   = nodes[i].observed
// A node that never ends blocks the rest of the chain.
// Throws EmptySequenceError on an empty list.
void arrange_in_sequence(const std::vector<GraphNode*>& nodes);

// Same, resolving the names in the registry first.
void arrange_in_sequence(NodeRegistry& registry, const std::vector<NodeName>& names);

} // namespace motionchart

#endif // MOTIONCHART_MODULES_COMPOSER_SEQUENCE_COMPOSER_H
