// common/utils/yaml_json.cpp
#include "common/utils/yaml_json.h"
#include <string>

namespace motionchart {

namespace {

// Plain scalars are typed with yaml-cpp's own decoders, in the order
// null, bool, integer, float; anything left is a string.
nlohmann::json plain_scalar_to_json(const YAML::Node& node) {
    const std::string& text = node.Scalar();
    if (text.empty() || text == "~" || text == "null" || text == "Null" || text == "NULL") {
        return nullptr;
    }

    bool flag = false;
    if (YAML::convert<bool>::decode(node, flag)) {
        return flag;
    }
    long long integer = 0;
    if (YAML::convert<long long>::decode(node, integer)) {
        return integer;
    }
    double real = 0.0;
    if (YAML::convert<double>::decode(node, real)) {
        return real;
    }
    return text;
}

} // namespace

nlohmann::json yaml_to_json(const YAML::Node& node) {
    if (!node.IsDefined() || node.IsNull()) {
        return nullptr;
    }
    if (node.IsScalar()) {
        // 带引号的标量 (标签 "!") 保持字符串
        return node.Tag() == "!" ? nlohmann::json(node.Scalar()) : plain_scalar_to_json(node);
    }

    if (node.IsSequence()) {
        nlohmann::json items = nlohmann::json::array();
        for (const auto& item : node) {
            items.push_back(yaml_to_json(item));
        }
        return items;
    }

    nlohmann::json fields = nlohmann::json::object();
    for (const auto& entry : node) {
        fields[entry.first.Scalar()] = yaml_to_json(entry.second);
    }
    return fields;
}

} // namespace motionchart
