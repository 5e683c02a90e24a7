// common/config/cli_config.h
#ifndef DISPATCHKIT_COMMON_CONFIG_CLI_CONFIG_H
#define DISPATCHKIT_COMMON_CONFIG_CLI_CONFIG_H

#include "modules/resolver/resolver.h"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace dispatchkit {

inline constexpr const char* kConfigFileName = "dispatchkit_config.json";
inline constexpr const char* kConfigPathEnv = "DISPATCHKIT_CONFIG_PATH";

// Settings of dispatchkit-cli: built-in defaults < first config file found < command-line flags
struct CliConfig {
    std::string log_level = "info";
    bool stop_on_outputs = true;
    bool record_values = true;
    std::string graph_title = "Dispatcher";
    std::optional<std::string> source; // config file the values came from, if any

    // Applies the well-typed known keys of `j`; unknown or mistyped keys are logged and skipped
    void merge(const nlohmann::json& j);
    nlohmann::json to_json() const;
    Resolver::Config resolver_config() const;
};

// Candidate config files in priority order. `env_paths` is a ':'-separated list; a directory
// entry names `<dir>/dispatchkit_config.json`. `home` adds ~/.dispatchkit/dispatchkit_config.json.
std::vector<std::string> config_search_paths(const std::optional<std::string>& env_paths,
                                             const std::optional<std::string>& home);
// Same, from $DISPATCHKIT_CONFIG_PATH and $HOME
std::vector<std::string> config_search_paths();

// Defaults merged with the first existing file of `search_paths`.
// An unreadable or malformed file throws std::runtime_error.
CliConfig load_cli_config(const std::vector<std::string>& search_paths);

// Sets the global spdlog level and pattern; throws std::invalid_argument for an unknown level
void apply_log_level(const std::string& level);

} // namespace dispatchkit

#endif // DISPATCHKIT_COMMON_CONFIG_CLI_CONFIG_H
