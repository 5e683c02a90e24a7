// modules/graph/capability_graph.cpp
#include "modules/graph/capability_graph.h"
#include "modules/subdispatch/sub_dispatcher.h"
#include <algorithm>
#include <stdexcept>
#include <unordered_set>

namespace dispatchkit {

namespace {
const std::vector<NodeId> kNoIds;
const std::vector<const FunctionNode*> kNoFunctions;

std::vector<DataId> unique_ids(const std::vector<DataId>& ids) {
    std::vector<DataId> out;
    for (const auto& id : ids) {
        if (std::find(out.begin(), out.end(), id) == out.end()) {
            out.push_back(id);
        }
    }
    return out;
}
} // namespace

CapabilityGraph::CapabilityGraph(std::string name, std::string description)
    : name_(std::move(name)), description_(std::move(description)) {
    // START/SINK are ordinary data slots for the graph structure, but never user data
    for (const auto& [id, type] : {std::pair{START, NodeType::START}, std::pair{SINK, NodeType::SINK}}) {
        auto node = std::make_unique<DataNode>(id, std::nullopt, false, std::string{}, type);
        node_map_[id] = node.get();
        all_nodes_.push_back(std::move(node));
    }
}

Node* CapabilityGraph::find(const NodeId& id) const {
    auto it = node_map_.find(id);
    return it == node_map_.end() ? nullptr : it->second;
}

bool CapabilityGraph::contains(const NodeId& id) const {
    return node_map_.count(id) > 0;
}

const Node& CapabilityGraph::node(const NodeId& id) const {
    Node* node = find(id);
    if (!node) {
        throw UnknownNode(id);
    }
    return *node;
}

const DataNode& CapabilityGraph::data_node(const NodeId& id) const {
    const Node& n = node(id);
    if (!n.is_data()) {
        throw UnknownNode(id, "not a data node");
    }
    return static_cast<const DataNode&>(n);
}

const FunctionNode& CapabilityGraph::function_node(const NodeId& id) const {
    const Node& n = node(id);
    if (!n.is_function()) {
        throw UnknownNode(id, "not a function node");
    }
    return static_cast<const FunctionNode&>(n);
}

void CapabilityGraph::check_mutable() const {
    if (frozen_) {
        throw GraphFrozen(name_);
    }
}

DataId CapabilityGraph::add_data(DataId id, std::optional<Value> default_value, bool wait_inputs,
                                 std::string description) {
    check_mutable();
    if (id.empty()) {
        throw std::invalid_argument("Data node id must not be empty");
    }
    if (contains(id)) {
        throw DuplicateNodeId(id);
    }
    auto node = std::make_unique<DataNode>(id, std::move(default_value), wait_inputs, std::move(description));
    data_nodes_.push_back(node.get());
    node_map_[id] = node.get();
    all_nodes_.push_back(std::move(node));
    return id;
}

DataId CapabilityGraph::add_data(DataSpec spec) {
    return add_data(std::move(spec.id), std::move(spec.default_value), spec.wait_inputs,
                    std::move(spec.description));
}

DataNode* CapabilityGraph::ensure_data_node(const DataId& id) {
    Node* existing = find(id);
    if (existing) {
        if (!existing->is_data()) {
            throw UnknownNode(id, "not a data node");
        }
        return static_cast<DataNode*>(existing);
    }
    add_data(id);
    return static_cast<DataNode*>(find(id));
}

NodeId CapabilityGraph::unused_id(const std::string& base, const std::vector<DataId>& reserved) const {
    auto taken = [&](const NodeId& candidate) {
        return contains(candidate) || std::find(reserved.begin(), reserved.end(), candidate) != reserved.end();
    };
    if (!taken(base)) {
        return base;
    }
    for (size_t n = 0;; ++n) {
        NodeId candidate = base + "<" + std::to_string(n) + ">";
        if (!taken(candidate)) {
            return candidate;
        }
    }
}

// Everything register_function could reject, checked before the graph is touched
void CapabilityGraph::check_endpoints(const NodeId& id, const std::vector<DataId>& inputs,
                                      const std::vector<DataId>& outputs) const {
    if (contains(id)) {
        throw DuplicateNodeId(id);
    }
    for (const auto* ids : {&inputs, &outputs}) {
        for (const auto& endpoint : *ids) {
            if (endpoint.empty()) {
                throw std::invalid_argument("Function '" + id + "' has an empty data id");
            }
            if (endpoint == id) {
                throw DuplicateNodeId(id);
            }
            const Node* existing = find(endpoint);
            if (existing && !existing->is_data()) {
                throw UnknownNode(endpoint, "not a data node");
            }
        }
    }
}

void CapabilityGraph::add_edge(const NodeId& from, const NodeId& to) {
    auto& succ = successors_[from];
    if (std::find(succ.begin(), succ.end(), to) == succ.end()) {
        succ.push_back(to);
        predecessors_[to].push_back(from);
    }
}

NodeId CapabilityGraph::register_function(std::unique_ptr<FunctionNode> node) {
    check_mutable();
    if (node->weight < 0.0) {
        throw std::invalid_argument("Function '" + node->id + "' has a negative weight");
    }
    check_endpoints(node->id, node->inputs, node->outputs);

    // Unknown endpoints become plain data nodes
    for (const auto& id : node->inputs) ensure_data_node(id);
    for (const auto& id : node->outputs) ensure_data_node(id);

    node->order = function_nodes_.size();
    const FunctionNode* fn = node.get();
    const NodeId id = node->id;

    bool has_trigger = false;
    for (const auto& input : unique_ids(fn->inputs)) {
        add_edge(input, id);
        consumers_[input].push_back(fn);
        has_trigger = has_trigger || fn->triggered_by(input);
    }
    if (!has_trigger) {
        add_edge(START, id);
        consumers_[START].push_back(fn);
    }
    for (const auto& output : unique_ids(fn->outputs)) {
        add_edge(id, output);
        producers_[output].push_back(fn);
    }

    function_nodes_.push_back(fn);
    node_map_[id] = node.get();
    all_nodes_.push_back(std::move(node));
    return id;
}

NodeId CapabilityGraph::add_function(FunctionSpec spec) {
    NodeId id;
    if (spec.id.has_value()) {
        id = *spec.id;
        if (contains(id)) {
            throw DuplicateNodeId(id);
        }
    } else {
        // 派生 id 也不能与本次注册的端点同名
        std::vector<DataId> endpoints = spec.inputs;
        endpoints.insert(endpoints.end(), spec.outputs.begin(), spec.outputs.end());
        id = unused_id(spec.name.empty() ? std::string("unknown") : spec.name, endpoints);
    }
    auto node = std::make_unique<CallableNode>(id, std::move(spec.function), std::move(spec.inputs),
                                               std::move(spec.outputs), spec.weight,
                                               std::move(spec.input_domain), std::move(spec.description));
    return register_function(std::move(node));
}

NodeId CapabilityGraph::add_function(std::string name, std::vector<DataId> inputs,
                                     std::vector<DataId> outputs, FunctionCallable function,
                                     double weight, InputDomain input_domain) {
    FunctionSpec spec;
    spec.name = std::move(name);
    spec.function = std::move(function);
    spec.inputs = std::move(inputs);
    spec.outputs = std::move(outputs);
    spec.weight = weight;
    spec.input_domain = std::move(input_domain);
    return add_function(std::move(spec));
}

NodeId CapabilityGraph::add_sub_dispatcher(SubDispatcherSpec spec) {
    check_mutable();
    if (!spec.graph) {
        throw std::invalid_argument("add_sub_dispatcher: null child graph");
    }
    if (spec.graph.get() == this) {
        throw std::invalid_argument("add_sub_dispatcher: a graph cannot embed itself");
    }

    NodeId id;
    if (spec.id.has_value()) {
        id = *spec.id;
    } else {
        std::vector<DataId> endpoints;
        for (const auto& [parent_id, child_id] : spec.inputs) endpoints.push_back(parent_id);
        for (const auto& [child_id, parent_id] : spec.outputs) endpoints.push_back(parent_id);
        id = unused_id(spec.graph->name(), endpoints);
    }

    std::shared_ptr<const CapabilityGraph> child = spec.graph;
    const bool include_defaults = spec.include_defaults;
    auto node = std::make_unique<SubDispatcherNode>(id, std::move(spec.graph), std::move(spec.inputs),
                                                    std::move(spec.outputs), spec.weight,
                                                    std::move(spec.input_domain), std::move(spec.description));
    const RenameMap& input_renames = node->input_renames;

    // Parent-side defaults, applied once the binding is registered
    std::vector<std::pair<DataId, Value>> child_defaults;
    if (include_defaults) {
        for (const auto& [parent_id, child_id] : input_renames) {
            if (child_id == SINK || !child->contains(child_id)) continue;
            const Node& child_node = child->node(child_id);
            if (child_node.type != NodeType::DATA) continue;
            const auto& child_data = static_cast<const DataNode&>(child_node);
            if (child_data.default_value.has_value()) {
                child_defaults.emplace_back(parent_id, *child_data.default_value);
            }
        }
    }

    NodeId registered = register_function(std::move(node));
    for (auto& [parent_id, value] : child_defaults) {
        DataNode* parent = ensure_data_node(parent_id);
        if (!parent->default_value.has_value()) {
            parent->default_value = std::move(value);
        }
    }
    child->frozen_ = true;
    return registered;
}

std::vector<NodeId> CapabilityGraph::add_from_lists(std::vector<DataSpec> data_list,
                                                    std::vector<FunctionSpec> function_list) {
    std::vector<NodeId> ids;
    ids.reserve(data_list.size() + function_list.size());
    for (auto& spec : data_list) {
        ids.push_back(add_data(std::move(spec)));
    }
    for (auto& spec : function_list) {
        ids.push_back(add_function(std::move(spec)));
    }
    return ids;
}

void CapabilityGraph::set_default_value(const DataId& id, Value value) {
    check_mutable();
    Node* n = find(id);
    if (!n || n->type != NodeType::DATA) {
        throw UnknownNode(id, "not a data node");
    }
    static_cast<DataNode*>(n)->default_value = std::move(value);
}

const std::vector<NodeId>& CapabilityGraph::predecessors(const NodeId& id) const {
    if (!contains(id)) throw UnknownNode(id);
    auto it = predecessors_.find(id);
    return it == predecessors_.end() ? kNoIds : it->second;
}

const std::vector<NodeId>& CapabilityGraph::successors(const NodeId& id) const {
    if (!contains(id)) throw UnknownNode(id);
    auto it = successors_.find(id);
    return it == successors_.end() ? kNoIds : it->second;
}

const std::vector<const FunctionNode*>& CapabilityGraph::consumers(const DataId& id) const {
    auto it = consumers_.find(id);
    return it == consumers_.end() ? kNoFunctions : it->second;
}

const std::vector<const FunctionNode*>& CapabilityGraph::producers(const DataId& id) const {
    auto it = producers_.find(id);
    return it == producers_.end() ? kNoFunctions : it->second;
}

std::vector<Edge> CapabilityGraph::edges() const {
    std::vector<Edge> result;
    for (const auto& node : all_nodes_) {
        auto it = successors_.find(node->id);
        if (it == successors_.end()) continue;
        for (const auto& to : it->second) {
            result.emplace_back(node->id, to);
        }
    }
    return result;
}

Context CapabilityGraph::default_values() const {
    Context defaults = Context::object();
    for (const auto* data : data_nodes_) {
        if (data->default_value.has_value()) {
            defaults[data->id] = *data->default_value;
        }
    }
    return defaults;
}

std::vector<std::string> CapabilityGraph::validate() const {
    std::vector<std::string> issues;

    for (const auto* fn : function_nodes_) {
        if (fn->outputs.empty()) {
            issues.push_back("function '" + fn->id + "' has no outputs");
        }
        if (fn->type == NodeType::SUB_DISPATCHER) {
            const auto* sub = static_cast<const SubDispatcherNode*>(fn);
            for (const auto& [parent_id, child_id] : sub->input_renames) {
                if (child_id != SINK && !sub->graph->contains(child_id)) {
                    issues.push_back("dispatcher '" + fn->id + "' maps input '" + parent_id +
                                     "' to unknown child node '" + child_id + "'");
                }
            }
            for (const auto& [child_id, parent_id] : sub->output_renames) {
                if (!sub->graph->contains(child_id)) {
                    issues.push_back("dispatcher '" + fn->id + "' exports unknown child node '" +
                                     child_id + "'");
                }
            }
        }
    }

    for (const auto* data : data_nodes_) {
        if (data->default_value.has_value()) continue;
        if (consumers(data->id).empty() && producers(data->id).empty()) {
            issues.push_back("data node '" + data->id + "' is neither produced nor consumed");
        }
    }
    return issues;
}

} // namespace dispatchkit
