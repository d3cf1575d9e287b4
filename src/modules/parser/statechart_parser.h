// modules/parser/statechart_parser.h
#ifndef MOTIONCHART_MODULES_PARSER_STATECHART_PARSER_H
#define MOTIONCHART_MODULES_PARSER_STATECHART_PARSER_H

#include "core/types/budget.h"
#include "core/types/node.h"
#include "modules/registry/node_registry.h"
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace motionchart {

struct ParsedStatechart {
    NodeRegistry registry;
    std::optional<TickBudget> budget;
    std::optional<NodeName> termination_node;
};

// Builds a statechart from a YAML document:
//
//   budget: { max_ticks: 200, max_duration_ms: 5000 }
//   termination_node: pick
//   nodes:
//     - { name: reach, type: task, observation: reach_done }
//     - name: pick
//       type: goal
//       tasks: [reach]
//       connect: { pause: { running: collision } }
//       end_when_tasks_ended: true
//   sequences:
//     - [reach, grasp]
//
// Conditions: true | false | {dormant|running|paused|ended|observed: name}
//             | {all_of: [...]} | {any_of: [...]} | {not: cond}
class StatechartParser {
public:
    ParsedStatechart parse_from_string(const std::string& yaml_content);
    ParsedStatechart parse_from_file(const std::string& file_path);

    // Same document already converted to JSON
    ParsedStatechart parse_from_json(const nlohmann::json& doc);

    std::unique_ptr<GraphNode> create_node_from_json(const nlohmann::json& node_json);

private:
    std::optional<TickBudget> parse_budget(const nlohmann::json& budget_json);
    void link_goal_children(NodeRegistry& registry, const nlohmann::json& node_json);
    void merge_goal_constraints(NodeRegistry& registry, const nlohmann::json& node_json);
    void connect_goal_conditions(NodeRegistry& registry, const nlohmann::json& node_json);
};

} // namespace motionchart

#endif // MOTIONCHART_MODULES_PARSER_STATECHART_PARSER_H
