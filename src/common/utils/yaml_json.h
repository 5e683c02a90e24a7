#ifndef DISPATCHKIT_COMMON_UTILS_YAML_JSON_H
#define DISPATCHKIT_COMMON_UTILS_YAML_JSON_H

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>
#include <string>

namespace dispatchkit {

// 将 YAML::Node 转换为 nlohmann::json
nlohmann::json yaml_to_json(const YAML::Node& node);

// Parses a YAML (or JSON, a YAML subset) document held in memory
nlohmann::json parse_yaml(const std::string& text);

// Reads a .json file with nlohmann, anything else through yaml-cpp
nlohmann::json load_document(const std::string& path);

} // namespace dispatchkit

#endif // DISPATCHKIT_COMMON_UTILS_YAML_JSON_H
