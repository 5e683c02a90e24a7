// modules/loader/model_loader.cpp
#include "modules/loader/model_loader.h"
#include "common/utils/template_renderer.h"
#include "common/utils/yaml_json.h"
#include <algorithm>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace dispatchkit {

namespace {

[[noreturn]] void fail(const std::string& model, const std::string& what) {
    throw ModelError("model '" + model + "': " + what);
}

std::vector<DataId> id_list(const nlohmann::json& entry, const char* key, const std::string& model,
                            const std::string& where) {
    std::vector<DataId> ids;
    if (!entry.contains(key)) return ids;
    const auto& list = entry.at(key);
    if (list.is_string()) {
        ids.push_back(list.get<std::string>());
        return ids;
    }
    if (!list.is_array()) {
        fail(model, where + ": '" + key + "' must be a list of ids");
    }
    for (const auto& item : list) {
        if (!item.is_string()) {
            fail(model, where + ": '" + key + "' entries must be strings");
        }
        ids.push_back(item.get<std::string>());
    }
    return ids;
}

// A rename map given either as {from: to} or as a list of ids mapped to themselves
RenameMap rename_map(const nlohmann::json& entry, const char* key, const std::string& model,
                     const std::string& where) {
    RenameMap renames;
    if (!entry.contains(key)) return renames;
    const auto& value = entry.at(key);
    if (value.is_object()) {
        for (auto it = value.begin(); it != value.end(); ++it) {
            if (!it.value().is_string()) {
                fail(model, where + ": '" + key + "." + it.key() + "' must name an id");
            }
            renames[it.key()] = it.value().get<std::string>();
        }
    } else if (value.is_array()) {
        for (const auto& id : id_list(entry, key, model, where)) {
            renames[id] = id;
        }
    } else {
        fail(model, where + ": '" + key + "' must be a map or a list");
    }
    return renames;
}

std::string entry_label(const nlohmann::json& entry, const char* kind, size_t index) {
    if (entry.contains("id") && entry["id"].is_string()) {
        return std::string(kind) + " '" + entry["id"].get<std::string>() + "'";
    }
    return std::string(kind) + " #" + std::to_string(index);
}

double weight_of(const nlohmann::json& entry, const std::string& model, const std::string& where) {
    if (!entry.contains("weight")) return 0.0;
    if (!entry["weight"].is_number()) {
        fail(model, where + ": 'weight' must be a number");
    }
    return entry["weight"].get<double>();
}

} // namespace

std::shared_ptr<CapabilityGraph> ModelSet::main_graph() const {
    auto it = models.find(main);
    return it == models.end() ? nullptr : it->second;
}

InputDomain make_expression_domain(std::string expression) {
    return [expression = std::move(expression)](const Context& inputs) {
        return ExpressionRenderer::thread_instance().evaluate_condition(expression, inputs);
    };
}

FunctionCallable make_expression_function(std::string expression, std::vector<DataId> inputs,
                                          size_t output_count) {
    return [expression = std::move(expression), inputs = std::move(inputs),
            output_count](const std::vector<Value>& args) -> std::vector<Value> {
        Context scope = Context::object();
        for (size_t i = 0; i < inputs.size() && i < args.size(); ++i) {
            scope[inputs[i]] = args[i];
        }
        Value value = ExpressionRenderer::thread_instance().render_value(expression, scope);
        if (output_count == 1) {
            return {value};
        }
        if (!value.is_array() || value.size() != output_count) {
            throw std::runtime_error("expression must render an array of " + std::to_string(output_count) +
                                     " values, got " + value.dump());
        }
        return std::vector<Value>(value.begin(), value.end());
    };
}

ModelLoader::ModelLoader(const FunctionRegistry& registry) : registry_(registry) {}

ModelSet ModelLoader::load_string(const std::string& yaml_text) const {
    try {
        return load(parse_yaml(yaml_text));
    } catch (const ModelError&) {
        throw;
    } catch (const std::runtime_error& e) {
        throw ModelError(e.what());
    }
}

ModelSet ModelLoader::load_file(const std::string& path) const {
    nlohmann::json document;
    try {
        document = load_document(path);
    } catch (const std::runtime_error& e) {
        throw ModelError(e.what());
    }
    return load(document);
}

ModelSet ModelLoader::load(const nlohmann::json& document) const {
    if (!document.is_object() || !document.contains("models") || !document["models"].is_object()) {
        throw ModelError("model document needs a 'models' map");
    }
    const auto& models = document["models"];
    if (models.empty()) {
        throw ModelError("model document defines no models");
    }

    ModelSet set;
    if (document.contains("main")) {
        if (!document["main"].is_string()) {
            throw ModelError("'main' must name a model");
        }
        set.main = document["main"].get<std::string>();
        if (!models.contains(set.main)) {
            throw ModelError("main model '" + set.main + "' is not defined");
        }
    } else if (models.size() == 1) {
        set.main = models.begin().key();
    } else {
        throw ModelError("document defines several models but no 'main'");
    }

    BuildState state;
    state.models = &models;
    for (auto it = models.begin(); it != models.end(); ++it) {
        build_model(it.key(), state);
    }
    set.models = std::move(state.built);
    spdlog::debug("loaded {} models, main '{}'", set.models.size(), set.main);
    return set;
}

std::shared_ptr<CapabilityGraph> ModelLoader::build_model(const std::string& name, BuildState& state) const {
    auto built = state.built.find(name);
    if (built != state.built.end()) {
        return built->second;
    }
    if (std::find(state.stack.begin(), state.stack.end(), name) != state.stack.end()) {
        std::string chain;
        for (const auto& m : state.stack) chain += m + " -> ";
        throw ModelError("model reference cycle: " + chain + name);
    }
    if (!state.models->contains(name)) {
        throw ModelError("unknown model '" + name + "'");
    }
    const auto& spec = (*state.models)[name];
    if (!spec.is_object()) {
        fail(name, "definition must be a map");
    }

    state.stack.push_back(name);
    std::shared_ptr<CapabilityGraph> graph;
    try {
        graph = std::make_shared<CapabilityGraph>(name, spec.value("description", std::string{}));
        if (spec.contains("data")) add_data_entries(*graph, name, spec["data"]);
        if (spec.contains("functions")) add_function_entries(*graph, name, spec["functions"]);
        if (spec.contains("dispatchers")) add_dispatcher_entries(*graph, name, spec["dispatchers"], state);
    } catch (const ModelError&) {
        throw;
    } catch (const DispatchError& e) {
        fail(name, e.what());
    } catch (const std::invalid_argument& e) {
        fail(name, e.what());
    } catch (const nlohmann::json::exception& e) {
        fail(name, e.what());
    }
    state.stack.pop_back();

    for (const auto& issue : graph->validate()) {
        spdlog::warn("model '{}': {}", name, issue);
    }
    state.built[name] = graph;
    return graph;
}

void ModelLoader::add_data_entries(CapabilityGraph& graph, const std::string& model,
                                   const nlohmann::json& entries) const {
    if (!entries.is_array()) fail(model, "'data' must be a list");
    for (size_t i = 0; i < entries.size(); ++i) {
        const auto& entry = entries[i];
        if (entry.is_string()) {
            graph.add_data(entry.get<std::string>());
            continue;
        }
        if (!entry.is_object() || !entry.contains("id") || !entry["id"].is_string()) {
            fail(model, entry_label(entry, "data", i) + " needs an 'id'");
        }
        DataSpec spec;
        spec.id = entry["id"].get<std::string>();
        if (entry.contains("default")) spec.default_value = entry["default"];
        spec.wait_inputs = entry.value("wait_inputs", false);
        spec.description = entry.value("description", std::string{});
        graph.add_data(std::move(spec));
    }
}

void ModelLoader::add_function_entries(CapabilityGraph& graph, const std::string& model,
                                       const nlohmann::json& entries) const {
    if (!entries.is_array()) fail(model, "'functions' must be a list");
    for (size_t i = 0; i < entries.size(); ++i) {
        const auto& entry = entries[i];
        const std::string where = entry_label(entry, "function", i);
        if (!entry.is_object()) fail(model, where + " must be a map");

        FunctionSpec spec;
        spec.inputs = id_list(entry, "inputs", model, where);
        spec.outputs = id_list(entry, "outputs", model, where);
        if (spec.outputs.empty()) fail(model, where + " has no 'outputs'");
        spec.weight = weight_of(entry, model, where);
        spec.description = entry.value("description", std::string{});
        if (entry.contains("id")) spec.id = entry["id"].get<std::string>();

        if (entry.contains("function")) {
            const std::string fn_name = entry["function"].get<std::string>();
            if (!registry_.has_function(fn_name)) {
                fail(model, where + ": unknown function '" + fn_name + "'");
            }
            spec.name = fn_name;
            spec.function = registry_.get(fn_name);
        } else if (entry.contains("expression")) {
            spec.name = "expression";
            spec.function = make_expression_function(entry["expression"].get<std::string>(), spec.inputs,
                                                     spec.outputs.size());
        } else {
            fail(model, where + " needs 'function' or 'expression'");
        }

        if (entry.contains("input_domain")) {
            spec.input_domain = make_expression_domain(entry["input_domain"].get<std::string>());
        }
        graph.add_function(std::move(spec));
    }
}

void ModelLoader::add_dispatcher_entries(CapabilityGraph& graph, const std::string& model,
                                         const nlohmann::json& entries, BuildState& state) const {
    if (!entries.is_array()) fail(model, "'dispatchers' must be a list");
    for (size_t i = 0; i < entries.size(); ++i) {
        const auto& entry = entries[i];
        const std::string where = entry_label(entry, "dispatcher", i);
        if (!entry.is_object()) fail(model, where + " must be a map");
        if (!entry.contains("model") || !entry["model"].is_string()) {
            fail(model, where + " needs a 'model'");
        }

        SubDispatcherSpec spec;
        spec.graph = build_model(entry["model"].get<std::string>(), state);
        spec.inputs = rename_map(entry, "inputs", model, where);
        spec.outputs = rename_map(entry, "outputs", model, where);
        if (spec.outputs.empty()) fail(model, where + " has no 'outputs'");
        spec.weight = weight_of(entry, model, where);
        spec.include_defaults = entry.value("include_defaults", false);
        spec.description = entry.value("description", std::string{});
        if (entry.contains("id")) spec.id = entry["id"].get<std::string>();
        if (entry.contains("input_domain")) {
            spec.input_domain = make_expression_domain(entry["input_domain"].get<std::string>());
        }
        graph.add_sub_dispatcher(std::move(spec));
    }
}

} // namespace dispatchkit
