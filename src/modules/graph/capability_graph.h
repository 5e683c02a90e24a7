// modules/graph/capability_graph.h
#ifndef DISPATCHKIT_MODULES_GRAPH_CAPABILITY_GRAPH_H
#define DISPATCHKIT_MODULES_GRAPH_CAPABILITY_GRAPH_H

#include "core/types/node.h"
#include "core/types/errors.h"
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace dispatchkit {

class CapabilityGraph;

struct DataSpec {
    DataId id;
    std::optional<Value> default_value;
    bool wait_inputs = false;
    std::string description;
};

struct FunctionSpec {
    std::optional<NodeId> id;   // explicit id; duplicates are an error
    std::string name;           // used to derive an id when `id` is empty
    FunctionCallable function;
    std::vector<DataId> inputs;
    std::vector<DataId> outputs;
    double weight = 0.0;
    InputDomain input_domain;
    std::string description;
};

struct SubDispatcherSpec {
    std::shared_ptr<const CapabilityGraph> graph;
    RenameMap inputs;   // parent id -> child id, or SINK
    RenameMap outputs;  // child id -> parent id
    InputDomain input_domain;
    double weight = 0.0;
    std::optional<NodeId> id; // defaults to the child graph's name
    bool include_defaults = false;
    std::string description;
};

using Edge = std::pair<NodeId, NodeId>;

// Bipartite data <-> function graph. Built once, read-only while dispatching.
// Once bound into a parent by add_sub_dispatcher every mutator throws GraphFrozen.
class CapabilityGraph {
public:
    explicit CapabilityGraph(std::string name = "Dispatcher", std::string description = {});

    CapabilityGraph(const CapabilityGraph&) = delete;
    CapabilityGraph& operator=(const CapabilityGraph&) = delete;
    CapabilityGraph(CapabilityGraph&&) = default;
    CapabilityGraph& operator=(CapabilityGraph&&) = default;

    const std::string& name() const { return name_; }
    const std::string& description() const { return description_; }

    DataId add_data(DataId id,
                    std::optional<Value> default_value = std::nullopt,
                    bool wait_inputs = false,
                    std::string description = {});
    DataId add_data(DataSpec spec);

    NodeId add_function(FunctionSpec spec);
    // Id derived from `name`, suffixed with <n> when already taken
    NodeId add_function(std::string name,
                        std::vector<DataId> inputs,
                        std::vector<DataId> outputs,
                        FunctionCallable function,
                        double weight = 0.0,
                        InputDomain input_domain = nullptr);

    NodeId add_sub_dispatcher(SubDispatcherSpec spec);

    // Bulk registration; data first, then functions
    std::vector<NodeId> add_from_lists(std::vector<DataSpec> data_list,
                                       std::vector<FunctionSpec> function_list = {});

    void set_default_value(const DataId& id, Value value);

    // --- structural queries ---
    bool contains(const NodeId& id) const;
    const Node& node(const NodeId& id) const;
    const DataNode& data_node(const NodeId& id) const;
    const FunctionNode& function_node(const NodeId& id) const;

    const std::vector<NodeId>& predecessors(const NodeId& id) const;
    const std::vector<NodeId>& successors(const NodeId& id) const;

    // Functions consuming / producing a data node, in registration order
    const std::vector<const FunctionNode*>& consumers(const DataId& id) const;
    const std::vector<const FunctionNode*>& producers(const DataId& id) const;

    const std::vector<const DataNode*>& data_nodes() const { return data_nodes_; }
    const std::vector<const FunctionNode*>& function_nodes() const { return function_nodes_; }
    std::vector<Edge> edges() const;
    Context default_values() const;

    // Malformed registrations, as readable messages; never throws
    std::vector<std::string> validate() const;

    bool frozen() const { return frozen_; }

private:
    std::string name_;
    std::string description_;
    std::vector<std::unique_ptr<Node>> all_nodes_;
    std::unordered_map<NodeId, Node*> node_map_;
    std::unordered_map<NodeId, std::vector<NodeId>> successors_;
    std::unordered_map<NodeId, std::vector<NodeId>> predecessors_;
    std::unordered_map<DataId, std::vector<const FunctionNode*>> consumers_;
    std::unordered_map<DataId, std::vector<const FunctionNode*>> producers_;
    std::vector<const DataNode*> data_nodes_;
    std::vector<const FunctionNode*> function_nodes_;
    mutable bool frozen_ = false; // set when a parent binds this graph

    Node* find(const NodeId& id) const;
    DataNode* ensure_data_node(const DataId& id);
    // `base`, or `base<n>` for the first n free in the graph and in `reserved`
    NodeId unused_id(const std::string& base, const std::vector<DataId>& reserved = {}) const;
    void check_mutable() const;
    void check_endpoints(const NodeId& id, const std::vector<DataId>& inputs,
                         const std::vector<DataId>& outputs) const;
    NodeId register_function(std::unique_ptr<FunctionNode> node);
    void add_edge(const NodeId& from, const NodeId& to);
};

} // namespace dispatchkit

#endif // DISPATCHKIT_MODULES_GRAPH_CAPABILITY_GRAPH_H
