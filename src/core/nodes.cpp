// src/core/nodes.cpp
#include "core/types/node.h"
#include "core/types/errors.h"
#include <algorithm>
#include <stdexcept>

namespace dispatchkit {

const char* to_string(NodeType type) {
    switch (type) {
        case NodeType::START: return "start";
        case NodeType::SINK: return "sink";
        case NodeType::DATA: return "data";
        case NodeType::FUNCTION: return "function";
        case NodeType::SUB_DISPATCHER: return "dispatcher";
    }
    return "unknown";
}

DataNode::DataNode(NodeId id, std::optional<Value> default_value, bool wait_inputs,
                   std::string description, NodeType type)
    : Node(std::move(id), type, std::move(description)),
      default_value(std::move(default_value)),
      wait_inputs(wait_inputs) {}

FunctionNode::FunctionNode(NodeId id, NodeType type, std::vector<DataId> inputs,
                           std::vector<DataId> outputs, double weight,
                           InputDomain input_domain, std::string description)
    : Node(std::move(id), type, std::move(description)),
      inputs(std::move(inputs)),
      outputs(std::move(outputs)),
      weight(weight),
      input_domain(std::move(input_domain)) {}

bool FunctionNode::triggered_by(const DataId& data_id) const {
    return std::find(inputs.begin(), inputs.end(), data_id) != inputs.end();
}

CallableNode::CallableNode(NodeId id, FunctionCallable function, std::vector<DataId> inputs,
                           std::vector<DataId> outputs, double weight,
                           InputDomain input_domain, std::string description)
    : FunctionNode(std::move(id), NodeType::FUNCTION, std::move(inputs), std::move(outputs),
                   weight, std::move(input_domain), std::move(description)),
      function(std::move(function)) {}

Invocation CallableNode::invoke(const Context& arguments, const InvocationScope& /*scope*/) const {
    if (!function) {
        throw CallableFailure(id, "no callable bound");
    }

    std::vector<Value> args;
    args.reserve(inputs.size());
    for (const auto& input : inputs) {
        auto it = arguments.find(input);
        if (it == arguments.end()) {
            throw CallableFailure(id, "missing argument '" + input + "'");
        }
        args.push_back(*it);
    }

    std::vector<Value> results = function(args);
    if (results.size() != outputs.size()) {
        throw CallableFailure(id, "returned " + std::to_string(results.size()) +
                                  " values, expected " + std::to_string(outputs.size()));
    }

    Invocation invocation;
    for (size_t i = 0; i < outputs.size(); ++i) {
        invocation.outputs[outputs[i]] = std::move(results[i]);
    }
    return invocation;
}

} // namespace dispatchkit
