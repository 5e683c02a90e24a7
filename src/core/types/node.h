#ifndef DISPATCHKIT_CORE_TYPES_NODE_H
#define DISPATCHKIT_CORE_TYPES_NODE_H

#include "dispatchkit/common/types.h"
#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace dispatchkit {

class Workflow;

// 节点类型枚举
enum class NodeType : uint8_t {
    START,
    SINK,
    DATA,
    FUNCTION,
    SUB_DISPATCHER
};

const char* to_string(NodeType type);

// What one invocation hands back to the resolver
struct Invocation {
    Context outputs = Context::object();       // output id -> value; a missing id was not produced
    std::shared_ptr<const Workflow> sub_workflow; // set by sub-dispatchers only
};

// Run-wide information a function may need besides its own arguments
struct InvocationScope {
    const Context& raw_inputs;
    bool record_values = true;
};

// Base Node
struct Node {
    NodeId id;
    NodeType type;
    std::string description;
    nlohmann::json metadata;

    Node(NodeId id, NodeType type, std::string description = {})
        : id(std::move(id)),
          type(type),
          description(std::move(description)),
          metadata(nlohmann::json::object()) {}

    virtual ~Node() = default;

    bool is_data() const { return type == NodeType::DATA || type == NodeType::START || type == NodeType::SINK; }
    bool is_function() const { return type == NodeType::FUNCTION || type == NodeType::SUB_DISPATCHER; }
};

// Data Node
struct DataNode : public Node {
    std::optional<Value> default_value;
    bool wait_inputs = false; // default only used when no producer settles the node

    DataNode(NodeId id,
             std::optional<Value> default_value = std::nullopt,
             bool wait_inputs = false,
             std::string description = {},
             NodeType type = NodeType::DATA);
};

// Function Node: AND over `inputs`, atomically produces `outputs`
struct FunctionNode : public Node {
    std::vector<DataId> inputs;
    std::vector<DataId> outputs;
    double weight = 0.0;
    InputDomain input_domain;
    size_t order = 0; // registration index, set by the graph

    FunctionNode(NodeId id,
                 NodeType type,
                 std::vector<DataId> inputs,
                 std::vector<DataId> outputs,
                 double weight = 0.0,
                 InputDomain input_domain = nullptr,
                 std::string description = {});

    // false: eligible as soon as any triggering input settles
    virtual bool waits_all_inputs() const { return true; }
    // Whether settling `data_id` counts towards making this node eligible
    virtual bool triggered_by(const DataId& data_id) const;

    // `arguments` holds the settled values of this node's inputs, keyed by id
    [[nodiscard]] virtual Invocation invoke(const Context& arguments, const InvocationScope& scope) const = 0;
};

// Function node wrapping a plain positional callable
struct CallableNode : public FunctionNode {
    FunctionCallable function;

    CallableNode(NodeId id,
                 FunctionCallable function,
                 std::vector<DataId> inputs,
                 std::vector<DataId> outputs,
                 double weight = 0.0,
                 InputDomain input_domain = nullptr,
                 std::string description = {});

    [[nodiscard]] Invocation invoke(const Context& arguments, const InvocationScope& scope) const override;
};

} // namespace dispatchkit

#endif // DISPATCHKIT_CORE_TYPES_NODE_H
