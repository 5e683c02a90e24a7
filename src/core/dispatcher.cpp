// src/core/dispatcher.cpp
#include "dispatchkit/core/dispatcher.h"
#include "modules/loader/model_loader.h"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace dispatchkit {

Dispatcher::Dispatcher(std::string name, std::string description)
    : graph_(std::make_shared<CapabilityGraph>(std::move(name), std::move(description))) {}

Dispatcher::Dispatcher(std::shared_ptr<CapabilityGraph> graph) : graph_(std::move(graph)) {
    if (!graph_) {
        throw std::invalid_argument("Dispatcher: null graph");
    }
}

std::unique_ptr<Dispatcher> Dispatcher::from_yaml(const std::string& yaml_content, const FunctionRegistry& registry) {
    ModelLoader loader(registry);
    ModelSet models = loader.load_string(yaml_content);
    return std::make_unique<Dispatcher>(models.main_graph());
}

std::unique_ptr<Dispatcher> Dispatcher::from_file(const std::string& file_path, const FunctionRegistry& registry) {
    ModelLoader loader(registry);
    ModelSet models = loader.load_file(file_path);
    return std::make_unique<Dispatcher>(models.main_graph());
}

DataId Dispatcher::add_data(DataId id, std::optional<Value> default_value, bool wait_inputs, std::string description) {
    return graph_->add_data(std::move(id), std::move(default_value), wait_inputs, std::move(description));
}

NodeId Dispatcher::add_function(FunctionSpec spec) {
    return graph_->add_function(std::move(spec));
}

NodeId Dispatcher::add_function(std::string name, std::vector<DataId> inputs, std::vector<DataId> outputs,
                                FunctionCallable function, double weight, InputDomain input_domain) {
    return graph_->add_function(std::move(name), std::move(inputs), std::move(outputs), std::move(function), weight,
                                std::move(input_domain));
}

NodeId Dispatcher::add_sub_dispatcher(SubDispatcherSpec spec) {
    return graph_->add_sub_dispatcher(std::move(spec));
}

NodeId Dispatcher::add_sub_dispatcher(const Dispatcher& child, RenameMap inputs, RenameMap outputs,
                                      InputDomain input_domain, double weight) {
    SubDispatcherSpec spec;
    spec.graph = child.shared_graph();
    spec.inputs = std::move(inputs);
    spec.outputs = std::move(outputs);
    spec.input_domain = std::move(input_domain);
    spec.weight = weight;
    return graph_->add_sub_dispatcher(std::move(spec));
}

std::vector<NodeId> Dispatcher::add_from_lists(std::vector<DataSpec> data_list,
                                               std::vector<FunctionSpec> function_list) {
    return graph_->add_from_lists(std::move(data_list), std::move(function_list));
}

void Dispatcher::set_default_value(const DataId& id, Value value) {
    graph_->set_default_value(id, std::move(value));
}

DispatchResult Dispatcher::dispatch(const Context& inputs, const std::vector<DataId>& outputs,
                                    Resolver::Config config) const {
    Resolver resolver(config);
    DispatchResult result = resolver.dispatch(*graph_, inputs, outputs);
    for (const auto& id : result.missing_outputs()) {
        spdlog::warn("[{}] requested output '{}' could not be computed", name(), id);
    }
    return result;
}

} // namespace dispatchkit
