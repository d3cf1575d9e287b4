// common/utils/parser_utils.cpp
#include "common/utils/parser_utils.h"
#include "core/types/errors.h"
#include <regex>

namespace motionchart {

bool is_valid_node_name(const std::string& name) {
    if (name.empty()) return false;
    static const std::regex valid(R"(^[\w][\w/\-]*$)");
    return std::regex_match(name, valid);
}

std::vector<NodeName> parse_name_list(const nlohmann::json& node_json, const std::string& key, const NodeName& owner) {
    std::vector<NodeName> names;
    if (!node_json.contains(key)) {
        return names;
    }
    const auto& value = node_json[key];
    if (value.is_string()) {
        names.push_back(value.get<std::string>());
    } else if (value.is_array()) {
        for (const auto& item : value) {
            if (!item.is_string()) {
                throw StatechartParseError("'" + key + "' of node " + owner + " must contain names only");
            }
            names.push_back(item.get<std::string>());
        }
    } else if (!value.is_null()) {
        throw StatechartParseError("'" + key + "' must be a name or a list of names in node: " + owner);
    }
    return names;
}

} // namespace motionchart
