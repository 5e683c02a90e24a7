// modules/subdispatch/sub_dispatcher.cpp
#include "modules/subdispatch/sub_dispatcher.h"
#include "modules/graph/capability_graph.h"
#include "modules/resolver/resolver.h"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace dispatchkit {

namespace {
std::vector<DataId> parent_inputs(const RenameMap& input_renames) {
    std::vector<DataId> ids;
    ids.reserve(input_renames.size());
    for (const auto& [parent_id, child_id] : input_renames) {
        ids.push_back(parent_id);
    }
    return ids;
}
} // namespace

std::vector<DataId> SubDispatcherNode::parent_outputs(const RenameMap& output_renames) {
    std::vector<DataId> ids;
    for (const auto& [child_id, parent_id] : output_renames) {
        if (std::find(ids.begin(), ids.end(), parent_id) == ids.end()) {
            ids.push_back(parent_id);
        }
    }
    return ids;
}

SubDispatcherNode::SubDispatcherNode(NodeId id, std::shared_ptr<const CapabilityGraph> graph,
                                     RenameMap input_renames, RenameMap output_renames,
                                     double weight, InputDomain input_domain, std::string description)
    : FunctionNode(std::move(id), NodeType::SUB_DISPATCHER, parent_inputs(input_renames),
                   parent_outputs(output_renames), weight, std::move(input_domain), std::move(description)),
      graph(std::move(graph)),
      input_renames(std::move(input_renames)),
      output_renames(std::move(output_renames)) {}

bool SubDispatcherNode::triggered_by(const DataId& data_id) const {
    auto it = input_renames.find(data_id);
    return it != input_renames.end() && it->second != SINK;
}

Context SubDispatcherNode::child_inputs(const Context& arguments) const {
    Context inputs = Context::object();
    for (const auto& [parent_id, child_id] : input_renames) {
        if (child_id == SINK) continue;
        auto it = arguments.find(parent_id);
        if (it != arguments.end()) {
            inputs[child_id] = *it;
        }
    }
    return inputs;
}

std::vector<DataId> SubDispatcherNode::child_outputs() const {
    std::vector<DataId> ids;
    ids.reserve(output_renames.size());
    for (const auto& [child_id, parent_id] : output_renames) {
        ids.push_back(child_id);
    }
    return ids;
}

Invocation SubDispatcherNode::invoke(const Context& arguments, const InvocationScope& scope) const {
    Resolver::Config config;
    config.stop_on_outputs = true;
    config.record_values = scope.record_values;
    Resolver resolver(config);

    Context inputs = child_inputs(arguments);
    spdlog::debug("[{}] entering sub-dispatcher with {} inputs", id, inputs.size());
    DispatchResult result = resolver.dispatch(*graph, inputs, child_outputs());

    Invocation invocation;
    for (const auto& [child_id, parent_id] : output_renames) {
        auto it = result.solution.find(child_id);
        if (it != result.solution.end()) {
            invocation.outputs[parent_id] = *it;
        }
    }
    invocation.sub_workflow = result.workflow;
    return invocation;
}

} // namespace dispatchkit
