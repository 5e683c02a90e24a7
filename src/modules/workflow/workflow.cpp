// modules/workflow/workflow.cpp
#include "modules/workflow/workflow.h"
#include <algorithm>

namespace dispatchkit {

const char* to_string(WorkflowNodeType type) {
    switch (type) {
        case WorkflowNodeType::START: return "start";
        case WorkflowNodeType::SINK: return "sink";
        case WorkflowNodeType::DATA: return "data";
        case WorkflowNodeType::FUNCTION: return "function";
    }
    return "unknown";
}

Workflow::Workflow(std::string name, bool record_values)
    : name_(std::move(name)), record_values_(record_values) {}

WorkflowNode& Workflow::ensure_node(const NodeId& id, WorkflowNodeType type) {
    auto it = index_.find(id);
    if (it != index_.end()) {
        return nodes_[it->second];
    }
    WorkflowNode node;
    node.id = id;
    node.type = type;
    index_[id] = nodes_.size();
    nodes_.push_back(std::move(node));
    return nodes_.back();
}

void Workflow::add_edge(const NodeId& from, const NodeId& to, const Value& value) {
    WorkflowEdge edge;
    edge.from = from;
    edge.to = to;
    if (record_values_) {
        edge.value = value;
    }
    edges_.push_back(std::move(edge));
}

void Workflow::record_settlement(const DataId& data_id, const Value& value, const NodeId& via, double cost) {
    ensure_node(via, via == START ? WorkflowNodeType::START : WorkflowNodeType::FUNCTION);

    WorkflowNode& node = ensure_node(data_id, data_id == SINK ? WorkflowNodeType::SINK : WorkflowNodeType::DATA);
    if (data_id != SINK) {
        if (record_values_) {
            node.value = value;
        }
        node.cost = cost;
        node.via = via;
    }
    add_edge(via, data_id, value);
}

void Workflow::record_invocation(const NodeId& function_id, const Context& inputs_used,
                                 const Context& outputs_produced,
                                 std::shared_ptr<const Workflow> sub_workflow) {
    WorkflowNode& fn = ensure_node(function_id, WorkflowNodeType::FUNCTION);
    fn.status = "success";
    if (record_values_) {
        fn.value = outputs_produced;
    }
    fn.sub_workflow = std::move(sub_workflow);

    for (auto it = inputs_used.begin(); it != inputs_used.end(); ++it) {
        ensure_node(it.key(), WorkflowNodeType::DATA);
        add_edge(it.key(), function_id, it.value());
    }
    invocation_order_.push_back(function_id);
}

void Workflow::record_failure(const NodeId& function_id, const std::string& error) {
    WorkflowNode& fn = ensure_node(function_id, WorkflowNodeType::FUNCTION);
    fn.status = "failed";
    fn.error = error;
    failures_.emplace_back(function_id, error);
}

const WorkflowNode* Workflow::find_node(const NodeId& id) const {
    auto it = index_.find(id);
    return it == index_.end() ? nullptr : &nodes_[it->second];
}

bool Workflow::has_edge(const NodeId& from, const NodeId& to) const {
    return std::any_of(edges_.begin(), edges_.end(),
                       [&](const WorkflowEdge& e) { return e.from == from && e.to == to; });
}

std::optional<Value> Workflow::edge_value(const NodeId& from, const NodeId& to) const {
    for (const auto& e : edges_) {
        if (e.from == from && e.to == to) {
            return e.value;
        }
    }
    return std::nullopt;
}

bool Workflow::was_invoked(const NodeId& function_id) const {
    return std::find(invocation_order_.begin(), invocation_order_.end(), function_id) != invocation_order_.end();
}

nlohmann::json Workflow::to_json() const {
    nlohmann::json j;
    j["name"] = name_;

    nlohmann::json nodes = nlohmann::json::array();
    for (const auto& n : nodes_) {
        nlohmann::json nj;
        nj["id"] = n.id;
        nj["type"] = to_string(n.type);
        if (n.type == WorkflowNodeType::DATA) {
            nj["cost"] = n.cost;
            if (n.via) nj["via"] = *n.via;
        }
        if (n.value) nj["value"] = *n.value;
        if (n.type == WorkflowNodeType::FUNCTION) nj["status"] = n.status;
        if (n.error) nj["error"] = *n.error;
        if (n.sub_workflow) nj["workflow"] = n.sub_workflow->to_json();
        nodes.push_back(std::move(nj));
    }
    j["nodes"] = std::move(nodes);

    nlohmann::json edges = nlohmann::json::array();
    for (const auto& e : edges_) {
        nlohmann::json ej{{"from", e.from}, {"to", e.to}};
        if (e.value) ej["value"] = *e.value;
        edges.push_back(std::move(ej));
    }
    j["edges"] = std::move(edges);

    j["invocation_order"] = invocation_order_;

    nlohmann::json failures = nlohmann::json::array();
    for (const auto& [id, error] : failures_) {
        failures.push_back({{"function", id}, {"error", error}});
    }
    j["failures"] = std::move(failures);
    return j;
}

} // namespace dispatchkit
