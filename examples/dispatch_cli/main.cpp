// main.cpp
#include <algorithm>
#include <fstream>
#include <iostream>
#include <map>
#include <sstream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "dispatchkit/core/dispatcher.h"
#include "common/config/cli_config.h"
#include "common/utils/yaml_json.h"
#include "modules/draw/dot_renderer.h"

using namespace dispatchkit;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitMissingOutputs = 2;

void print_usage(const char* prog) {
    std::cerr << "Usage:\n"
              << "  " << prog << " run  <model.yaml> [--inputs FILE] [--outputs a,b] [--solution FILE]\n"
              << "                      [--workflow FILE] [--dot FILE] [options]\n"
              << "  " << prog << " draw <model.yaml> [--dot FILE] [--json FILE] [options]\n"
              << "  " << prog << " config show|paths\n"
              << "Options:\n"
              << "  --log-level LEVEL   trace|debug|info|warn|error|off\n"
              << "  --title TITLE       graph title in DOT output\n"
              << "  --no-stop           compute everything reachable, not just the requested outputs\n"
              << "  --no-values         do not record flowed values in the workflow\n";
}

std::vector<std::string> split_ids(const std::string& text) {
    std::vector<std::string> ids;
    std::stringstream ss(text);
    std::string id;
    while (std::getline(ss, id, ',')) {
        if (!id.empty()) ids.push_back(id);
    }
    return ids;
}

void write_file(const std::string& path, const std::string& content) {
    std::ofstream out(path);
    if (!out.is_open()) {
        throw std::runtime_error("Cannot write file: " + path);
    }
    out << content;
}

// --flag VALUE pairs and bare switches after the positional arguments
struct Arguments {
    std::vector<std::string> positional;
    std::map<std::string, std::string> options;
    std::vector<std::string> switches;

    bool has_switch(const std::string& name) const {
        return std::find(switches.begin(), switches.end(), name) != switches.end();
    }
    const std::string* option(const std::string& name) const {
        auto it = options.find(name);
        return it == options.end() ? nullptr : &it->second;
    }
};

Arguments parse_arguments(int argc, char* argv[]) {
    static const std::vector<std::string> kSwitches = {"--no-stop", "--no-values"};
    Arguments args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.rfind("--", 0) != 0) {
            args.positional.push_back(arg);
        } else if (std::find(kSwitches.begin(), kSwitches.end(), arg) != kSwitches.end()) {
            args.switches.push_back(arg);
        } else if (i + 1 < argc) {
            args.options[arg] = argv[++i];
        } else {
            throw std::invalid_argument("Missing value for " + arg);
        }
    }
    return args;
}

void apply_flags(CliConfig& config, const Arguments& args) {
    if (const auto* level = args.option("--log-level")) config.log_level = *level;
    if (const auto* title = args.option("--title")) config.graph_title = *title;
    if (args.has_switch("--no-stop")) config.stop_on_outputs = false;
    if (args.has_switch("--no-values")) config.record_values = false;
}

int run_command(const Arguments& args, const CliConfig& config) {
    if (args.positional.size() < 2) {
        throw std::invalid_argument("run: missing model file");
    }
    FunctionRegistry registry;
    auto dispatcher = Dispatcher::from_file(args.positional[1], registry);

    Context inputs = Context::object();
    if (const auto* path = args.option("--inputs")) {
        inputs = load_document(*path);
        if (!inputs.is_object()) {
            throw std::invalid_argument("inputs file must hold a map: " + *path);
        }
    }
    std::vector<DataId> outputs;
    if (const auto* ids = args.option("--outputs")) outputs = split_ids(*ids);

    DispatchResult result = dispatcher->dispatch(inputs, outputs, config.resolver_config());

    if (const auto* path = args.option("--solution")) {
        write_file(*path, result.solution.dump(2) + "\n");
        spdlog::info("solution written to {}", *path);
    } else {
        std::cout << result.solution.dump(2) << std::endl;
    }
    if (const auto* path = args.option("--workflow")) {
        write_file(*path, result.workflow->to_json().dump(2) + "\n");
        spdlog::info("workflow written to {}", *path);
    }
    if (const auto* path = args.option("--dot")) {
        DotRenderer::Options options;
        options.title = config.graph_title;
        write_file(*path, DotRenderer(options).render(*result.workflow));
        spdlog::info("workflow graph written to {}", *path);
    }

    if (!result.success()) {
        return kExitMissingOutputs;
    }
    return kExitOk;
}

int draw_command(const Arguments& args, const CliConfig& config) {
    if (args.positional.size() < 2) {
        throw std::invalid_argument("draw: missing model file");
    }
    FunctionRegistry registry;
    auto dispatcher = Dispatcher::from_file(args.positional[1], registry);

    DotRenderer::Options options;
    options.title = config.graph_title;
    std::string dot = DotRenderer(options).render(dispatcher->graph());

    if (const auto* path = args.option("--json")) {
        write_file(*path, graph_to_json(dispatcher->graph()).dump(2) + "\n");
    }
    if (const auto* path = args.option("--dot")) {
        write_file(*path, dot);
    } else {
        std::cout << dot;
    }
    return kExitOk;
}

int config_command(const Arguments& args, const CliConfig& config, const std::vector<std::string>& search_paths) {
    const std::string sub = args.positional.size() > 1 ? args.positional[1] : "show";
    if (sub == "show") {
        nlohmann::json j = config.to_json();
        j["source"] = config.source ? nlohmann::json(*config.source) : nlohmann::json(nullptr);
        std::cout << j.dump(2) << std::endl;
        return kExitOk;
    }
    if (sub == "paths") {
        for (const auto& path : search_paths) {
            bool loaded = config.source && *config.source == path;
            std::cout << path << (loaded ? "  (loaded)" : "") << "\n";
        }
        return kExitOk;
    }
    throw std::invalid_argument("config: unknown subcommand '" + sub + "'");
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return kExitError;
    }

    try {
        Arguments args = parse_arguments(argc, argv);
        if (args.positional.empty()) {
            print_usage(argv[0]);
            return kExitError;
        }

        auto search_paths = config_search_paths();
        CliConfig config = load_cli_config(search_paths);
        apply_flags(config, args);
        apply_log_level(config.log_level);

        const std::string& command = args.positional[0];
        if (command == "run") return run_command(args, config);
        if (command == "draw") return draw_command(args, config);
        if (command == "config") return config_command(args, config, search_paths);

        std::cerr << "Unknown command: " << command << "\n";
        print_usage(argv[0]);
        return kExitError;
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return kExitError;
    }
}
