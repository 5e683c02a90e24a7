// common/utils/yaml_json.cpp
#include "common/utils/yaml_json.h"
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace dispatchkit {

namespace {

bool is_integer(const std::string& s) {
    if (s.empty()) return false;
    size_t start = (s[0] == '-' || s[0] == '+') ? 1 : 0;
    if (start >= s.size()) return false;
    for (size_t i = start; i < s.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    }
    return true;
}

// Integers, floats and scientific notation; the whole string must be consumed
bool is_numeric(const std::string& s) {
    if (s.empty()) return false;
    std::istringstream iss(s);
    double d;
    iss >> d;
    return !iss.fail() && iss.eof();
}

bool has_suffix(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

nlohmann::json yaml_to_json(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Null:
            return nullptr;
        case YAML::NodeType::Scalar: {
            const std::string& s = node.Scalar();
            // 带引号的标量保持为字符串
            if (node.Tag() == "!") return s;

            if (s == "true" || s == "True") return true;
            if (s == "false" || s == "False") return false;
            if (s == "~" || s == "null" || s.empty()) return nullptr;

            if (is_numeric(s)) {
                try {
                    if (is_integer(s)) {
                        return std::stoll(s);
                    }
                    return std::stod(s);
                } catch (const std::out_of_range&) {
                    // too large for the numeric types: kept as text below
                }
            }
            return s;
        }
        case YAML::NodeType::Sequence: {
            nlohmann::json arr = nlohmann::json::array();
            for (const auto& item : node) {
                arr.push_back(yaml_to_json(item));
            }
            return arr;
        }
        case YAML::NodeType::Map: {
            nlohmann::json obj = nlohmann::json::object();
            for (const auto& kv : node) {
                obj[kv.first.as<std::string>()] = yaml_to_json(kv.second);
            }
            return obj;
        }
        default:
            return nullptr;
    }
}

nlohmann::json parse_yaml(const std::string& text) {
    try {
        return yaml_to_json(YAML::Load(text));
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("YAML parse error: " + std::string(e.what()));
    }
}

nlohmann::json load_document(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    if (has_suffix(path, ".json")) {
        try {
            return nlohmann::json::parse(buffer.str());
        } catch (const nlohmann::json::parse_error& e) {
            throw std::runtime_error("JSON parse error in " + path + ": " + e.what());
        }
    }
    return parse_yaml(buffer.str());
}

} // namespace dispatchkit
