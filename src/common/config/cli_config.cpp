// common/config/cli_config.cpp
#include "common/config/cli_config.h"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace dispatchkit {

namespace fs = std::filesystem;

void CliConfig::merge(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::runtime_error("config must be a JSON object");
    }
    for (auto it = j.begin(); it != j.end(); ++it) {
        const std::string& key = it.key();
        const auto& value = it.value();
        if (key == "log_level" && value.is_string()) {
            log_level = value.get<std::string>();
        } else if (key == "stop_on_outputs" && value.is_boolean()) {
            stop_on_outputs = value.get<bool>();
        } else if (key == "record_values" && value.is_boolean()) {
            record_values = value.get<bool>();
        } else if (key == "graph_title" && value.is_string()) {
            graph_title = value.get<std::string>();
        } else {
            spdlog::warn("ignoring config key '{}' = {}", key, value.dump());
        }
    }
}

nlohmann::json CliConfig::to_json() const {
    return nlohmann::json{
        {"log_level", log_level},
        {"stop_on_outputs", stop_on_outputs},
        {"record_values", record_values},
        {"graph_title", graph_title},
    };
}

Resolver::Config CliConfig::resolver_config() const {
    Resolver::Config config;
    config.stop_on_outputs = stop_on_outputs;
    config.record_values = record_values;
    return config;
}

std::vector<std::string> config_search_paths(const std::optional<std::string>& env_paths,
                                             const std::optional<std::string>& home) {
    std::vector<std::string> paths;
    if (env_paths && !env_paths->empty()) {
        std::stringstream ss(*env_paths);
        std::string entry;
        while (std::getline(ss, entry, ':')) {
            if (entry.empty()) continue;
            std::error_code ec;
            if (fs::is_directory(entry, ec)) {
                paths.push_back((fs::path(entry) / kConfigFileName).string());
            } else {
                paths.push_back(entry);
            }
        }
    }
    if (home && !home->empty()) {
        paths.push_back((fs::path(*home) / ".dispatchkit" / kConfigFileName).string());
    }
    paths.push_back((fs::path(".") / kConfigFileName).string());
    return paths;
}

std::vector<std::string> config_search_paths() {
    std::optional<std::string> env_paths;
    std::optional<std::string> home;
    if (const char* v = std::getenv(kConfigPathEnv)) env_paths = v;
    if (const char* v = std::getenv("HOME")) home = v;
    return config_search_paths(env_paths, home);
}

CliConfig load_cli_config(const std::vector<std::string>& search_paths) {
    CliConfig config;
    for (const auto& path : search_paths) {
        std::error_code ec;
        if (!fs::is_regular_file(path, ec)) continue;

        std::ifstream file(path);
        if (!file.is_open()) {
            throw std::runtime_error("Cannot open config file: " + path);
        }
        nlohmann::json j;
        try {
            file >> j;
        } catch (const nlohmann::json::parse_error& e) {
            throw std::runtime_error("Malformed config file " + path + ": " + e.what());
        }
        config.merge(j);
        config.source = path;
        spdlog::debug("loaded config from {}", path);
        break;
    }
    return config;
}

void apply_log_level(const std::string& level) {
    auto parsed = spdlog::level::from_str(level);
    if (parsed == spdlog::level::off && level != "off") {
        throw std::invalid_argument("Unknown log level: " + level);
    }
    spdlog::set_level(parsed);
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
}

} // namespace dispatchkit
