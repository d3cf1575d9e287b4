#ifndef MOTIONCHART_COMMON_UTILS_PARSER_UTILS_H
#define MOTIONCHART_COMMON_UTILS_PARSER_UTILS_H

#include "core/types/lifecycle.h" // 引入 NodeName
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace motionchart {

// 节点名称只允许字母、数字、下划线、'-' 和 '/'
bool is_valid_node_name(const std::string& name);

// Reads `key` of `node_json` as a single name or a list of names.
// Missing key yields an empty list.
std::vector<NodeName> parse_name_list(const nlohmann::json& node_json, const std::string& key, const NodeName& owner);

} // namespace motionchart

#endif // MOTIONCHART_COMMON_UTILS_PARSER_UTILS_H
