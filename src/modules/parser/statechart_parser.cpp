// modules/parser/statechart_parser.cpp
#include "modules/parser/statechart_parser.h"
#include "modules/composer/sequence_composer.h"
#include "modules/goal/goal.h"
#include "common/utils/parser_utils.h"
#include "common/utils/yaml_json.h"
#include "core/types/errors.h"
#include <fstream>
#include <sstream>
#include <yaml-cpp/yaml.h>

namespace motionchart {

namespace {

std::optional<Condition> optional_condition(const nlohmann::json& node_json, const std::string& key) {
    if (!node_json.contains(key) || node_json[key].is_null()) {
        return std::nullopt;
    }
    return Condition::from_json(node_json[key]);
}

bool is_goal_json(const nlohmann::json& node_json) {
    return node_json.value("type", std::string()) == "goal";
}

} // namespace

ParsedStatechart StatechartParser::parse_from_string(const std::string& yaml_content) {
    nlohmann::json doc;
    try {
        YAML::Node yaml_root = YAML::Load(yaml_content);
        doc = yaml_to_json(yaml_root);
    } catch (const YAML::Exception& e) {
        throw StatechartParseError("YAML parse error: " + std::string(e.what()));
    }
    return parse_from_json(doc);
}

ParsedStatechart StatechartParser::parse_from_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw StatechartParseError("Cannot open file: " + file_path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse_from_string(buffer.str());
}

ParsedStatechart StatechartParser::parse_from_json(const nlohmann::json& doc) {
    if (!doc.is_object()) {
        throw StatechartParseError("Statechart document must be a mapping");
    }
    if (!doc.contains("nodes") || !doc["nodes"].is_array()) {
        throw StatechartParseError("Statechart document requires a 'nodes' list");
    }

    ParsedStatechart result;
    try {
        if (doc.contains("budget")) {
            result.budget = parse_budget(doc["budget"]);
        }
        if (doc.contains("termination_node")) {
            result.termination_node = doc["termination_node"].get<std::string>();
        }

        NodeRegistry& registry = result.registry;
        const auto& nodes_json = doc["nodes"];

        // 1. 所有节点先注册，条件允许前向引用
        for (const auto& node_json : nodes_json) {
            registry.register_node(create_node_from_json(node_json));
        }

        // 2. Goal 子节点
        for (const auto& node_json : nodes_json) {
            if (is_goal_json(node_json)) {
                link_goal_children(registry, node_json);
            }
        }

        // 3. 顺序链
        if (doc.contains("sequences")) {
            if (!doc["sequences"].is_array()) {
                throw StatechartParseError("'sequences' must be a list of name lists");
            }
            for (const auto& seq_json : doc["sequences"]) {
                if (!seq_json.is_array()) {
                    throw StatechartParseError("Each sequence must be a list of names: " + seq_json.dump());
                }
                std::vector<NodeName> names;
                for (const auto& item : seq_json) {
                    names.push_back(item.get<std::string>());
                }
                arrange_in_sequence(registry, names);
            }
        }

        // 4. merge, 5. connect (after merge so merged tasks are connected too)
        for (const auto& node_json : nodes_json) {
            if (is_goal_json(node_json)) {
                merge_goal_constraints(registry, node_json);
            }
        }
        for (const auto& node_json : nodes_json) {
            if (is_goal_json(node_json)) {
                connect_goal_conditions(registry, node_json);
            }
        }

        for (Goal* goal : registry.nodes_of_type<Goal>()) {
            goal->check_tasks();
        }
    } catch (const nlohmann::json::exception& e) {
        throw StatechartParseError("Malformed statechart document: " + std::string(e.what()));
    }

    return result;
}

std::unique_ptr<GraphNode> StatechartParser::create_node_from_json(const nlohmann::json& node_json) {
    if (!node_json.is_object()) {
        throw StatechartParseError("Node entry must be a mapping: " + node_json.dump());
    }
    const std::string name = node_json.value("name", std::string());
    if (!is_valid_node_name(name)) {
        throw StatechartParseError("Invalid node name: '" + name + "'");
    }
    const std::string type_str = node_json.value("type", std::string());
    auto kind = parse_node_kind(type_str);
    if (!kind.has_value()) {
        throw StatechartParseError("Unknown node type '" + type_str + "' for node: " + name);
    }

    std::unique_ptr<GraphNode> node;
    switch (kind.value()) {
        case NodeKind::TASK:
            node = std::make_unique<Task>(name);
            break;
        case NodeKind::MONITOR:
            node = std::make_unique<Monitor>(name);
            break;
        case NodeKind::GOAL:
            node = std::make_unique<Goal>(name);
            break;
    }

    if (node_json.contains("observation")) {
        node->observation = node_json["observation"].get<std::string>();
    }
    node->metadata = node_json.value("metadata", nlohmann::json::object());

    if (auto c = optional_condition(node_json, "start")) node->start_condition = *c;
    if (auto c = optional_condition(node_json, "pause")) node->pause_condition = *c;
    if (auto c = optional_condition(node_json, "end")) node->end_condition = *c;

    return node;
}

std::optional<TickBudget> StatechartParser::parse_budget(const nlohmann::json& budget_json) {
    if (!budget_json.is_object()) {
        throw StatechartParseError("'budget' must be a mapping");
    }
    TickBudget budget;
    if (budget_json.contains("max_ticks") && budget_json["max_ticks"].is_number_integer()) {
        budget.max_ticks = budget_json["max_ticks"].get<int>();
    }
    if (budget_json.contains("max_duration_ms") && budget_json["max_duration_ms"].is_number_integer()) {
        budget.max_duration_ms = budget_json["max_duration_ms"].get<int>();
    }
    return budget;
}

void StatechartParser::link_goal_children(NodeRegistry& registry, const nlohmann::json& node_json) {
    const NodeName name = node_json.at("name").get<std::string>();
    Goal& goal = registry.resolve_as<Goal>(name);

    for (const auto& task_name : parse_name_list(node_json, "tasks", name)) {
        goal.add_task(registry.resolve_as<Task>(task_name));
    }
    for (const auto& monitor_name : parse_name_list(node_json, "monitors", name)) {
        goal.add_monitor(registry.resolve_as<Monitor>(monitor_name));
    }
    for (const auto& goal_name : parse_name_list(node_json, "goals", name)) {
        if (goal_name == name) {
            throw StatechartParseError("Goal " + name + " cannot contain itself");
        }
        goal.add_goal(registry.resolve_as<Goal>(goal_name));
    }
}

void StatechartParser::merge_goal_constraints(NodeRegistry& registry, const nlohmann::json& node_json) {
    const NodeName name = node_json.at("name").get<std::string>();
    Goal& goal = registry.resolve_as<Goal>(name);
    for (const auto& other_name : parse_name_list(node_json, "merge", name)) {
        goal.add_constraints_of_goal(registry.resolve_as<Goal>(other_name));
    }
}

void StatechartParser::connect_goal_conditions(NodeRegistry& registry, const nlohmann::json& node_json) {
    const NodeName name = node_json.at("name").get<std::string>();
    Goal& goal = registry.resolve_as<Goal>(name);

    if (node_json.contains("connect")) {
        const auto& connect = node_json["connect"];
        if (!connect.is_object()) {
            throw StatechartParseError("'connect' of goal " + name + " must be a mapping");
        }
        if (auto c = optional_condition(connect, "start")) goal.connect_start_condition_to_all_tasks(*c);
        if (auto c = optional_condition(connect, "pause")) goal.connect_pause_condition_to_all_tasks(*c);
        if (auto c = optional_condition(connect, "end")) goal.connect_end_condition_to_all_tasks(*c);
    }

    if (node_json.value("end_when_tasks_ended", false)) {
        Condition aggregate = goal.all_tasks_ended();
        goal.end_condition = goal.end_condition.is_false()
            ? aggregate
            : Condition::conjoin(goal.end_condition, aggregate);
    }
}

} // namespace motionchart
