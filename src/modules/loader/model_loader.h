// modules/loader/model_loader.h
#ifndef DISPATCHKIT_MODULES_LOADER_MODEL_LOADER_H
#define DISPATCHKIT_MODULES_LOADER_MODEL_LOADER_H

#include "common/functions/registry.h"
#include "modules/graph/capability_graph.h"
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace dispatchkit {

// Every model of one document, built; `main` names the entry model
struct ModelSet {
    std::string main;
    std::map<std::string, std::shared_ptr<CapabilityGraph>> models;

    std::shared_ptr<CapabilityGraph> main_graph() const;
};

// Builds capability graphs from model documents:
//
//   main: <model>
//   models:
//     <name>:
//       description: ...
//       data:        [{id, default, wait_inputs, description}]
//       functions:   [{id, function | expression, inputs, outputs, weight, input_domain}]
//       dispatchers: [{id, model, inputs, outputs, input_domain, include_defaults, weight}]
//
// Malformed documents throw ModelError naming the model and entry.
class ModelLoader {
public:
    explicit ModelLoader(const FunctionRegistry& registry);

    ModelSet load(const nlohmann::json& document) const;
    ModelSet load_string(const std::string& yaml_text) const;
    ModelSet load_file(const std::string& path) const;

private:
    const FunctionRegistry& registry_;

    struct BuildState {
        const nlohmann::json* models = nullptr;
        std::map<std::string, std::shared_ptr<CapabilityGraph>> built;
        std::vector<std::string> stack; // models under construction, for cycle reports
    };

    std::shared_ptr<CapabilityGraph> build_model(const std::string& name, BuildState& state) const;
    void add_data_entries(CapabilityGraph& graph, const std::string& model, const nlohmann::json& entries) const;
    void add_function_entries(CapabilityGraph& graph, const std::string& model, const nlohmann::json& entries) const;
    void add_dispatcher_entries(CapabilityGraph& graph, const std::string& model, const nlohmann::json& entries,
                                BuildState& state) const;
};

// inja-backed predicate over the raw inputs; throws when the expression does not render a boolean
InputDomain make_expression_domain(std::string expression);

// Callable rendering an inja template over its inputs (by id)
FunctionCallable make_expression_function(std::string expression,
                                          std::vector<DataId> inputs,
                                          size_t output_count);

} // namespace dispatchkit

#endif // DISPATCHKIT_MODULES_LOADER_MODEL_LOADER_H
