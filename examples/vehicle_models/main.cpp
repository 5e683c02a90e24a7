// main.cpp
#include <algorithm>
#include <iostream>
#include <fstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "dispatchkit/core/dispatcher.h"
#include "modules/draw/dot_renderer.h"

using namespace dispatchkit;

// Engine idle speed: either from a (median, std) pair or identified from measured speeds.
// Cheaper producers win; `engine_speeds_out` falls back to the hot speeds at weight 50.
int main(int argc, char* argv[]) {
    spdlog::set_level(argc > 1 && std::string(argv[1]) == "-v" ? spdlog::level::debug : spdlog::level::info);

    try {
        FunctionRegistry registry;
        Dispatcher engine("Engine", "Models the vehicle engine.");

        engine.add_data("idle_engine_speed_median", std::nullopt, false, "Idle engine speed [RPM].");
        engine.add_data("idle_engine_speed_std", 100.0, false, "Standard deviation of idle engine speed [RPM].");

        engine.add_function("bypass", {"idle_engine_speed_median", "idle_engine_speed_std"},
                            {"idle_engine_speed"},
                            [](const std::vector<Value>& args) -> std::vector<Value> {
                                return {Value::array({args[0], args[1]})};
                            });

        engine.add_function("identify_idle_engine_speed_out", {"velocities", "engine_speeds_out"},
                            {"idle_engine_speed"},
                            [](const std::vector<Value>& args) -> std::vector<Value> {
                                const auto& velocities = args[0];
                                const auto& speeds = args[1];
                                double sum = 0.0;
                                size_t n = 0;
                                for (size_t i = 0; i < velocities.size() && i < speeds.size(); ++i) {
                                    if (velocities[i].get<double>() < 1.0) {
                                        sum += speeds[i].get<double>();
                                        ++n;
                                    }
                                }
                                if (n == 0) {
                                    throw std::runtime_error("no idle samples");
                                }
                                return {Value::array({sum / static_cast<double>(n), 0.0})};
                            },
                            5.0);

        engine.add_function("calculate_engine_speeds_out_hot", {"gear_box_speeds_in", "idle_engine_speed"},
                            {"engine_speeds_out_hot"},
                            [](const std::vector<Value>& args) -> std::vector<Value> {
                                double idle = args[1][0].get<double>();
                                Value out = Value::array();
                                for (const auto& s : args[0]) {
                                    out.push_back(std::max(s.get<double>(), idle));
                                }
                                return {out};
                            });

        FunctionSpec fallback;
        fallback.name = "bypass";
        fallback.function = registry.get("bypass");
        fallback.inputs = {"engine_speeds_out_hot"};
        fallback.outputs = {"engine_speeds_out"};
        fallback.weight = 50.0;
        engine.add_function(std::move(fallback));

        Context inputs = {
            {"idle_engine_speed_median", 750.0},
            {"gear_box_speeds_in", {0.0, 1200.0, 1850.0, 2400.0}},
        };
        DispatchResult result = engine.dispatch(inputs, {"engine_speeds_out"});

        std::cout << "Solution:\n" << result.solution.dump(2) << "\n";
        std::cout << "Invoked:";
        for (const auto& id : result.workflow->invocation_order()) {
            std::cout << " " << id;
        }
        std::cout << "\n";

        std::ofstream dot("engine_workflow.dot");
        DotRenderer::Options options;
        options.title = "Engine";
        dot << DotRenderer(options).render(*result.workflow);
        std::cout << "Workflow graph exported to engine_workflow.dot\n";

        return result.success() ? 0 : 2;
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return 1;
    }
}
