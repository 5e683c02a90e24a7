// modules/workflow/workflow.h
#ifndef DISPATCHKIT_MODULES_WORKFLOW_WORKFLOW_H
#define DISPATCHKIT_MODULES_WORKFLOW_WORKFLOW_H

#include "dispatchkit/common/types.h"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace dispatchkit {

class Workflow;

enum class WorkflowNodeType : uint8_t {
    START,
    SINK,
    DATA,
    FUNCTION
};

const char* to_string(WorkflowNodeType type);

struct WorkflowNode {
    NodeId id;
    WorkflowNodeType type;
    std::optional<Value> value;      // data: settled value; functions: outputs produced
    double cost = 0.0;               // settlement cost (data nodes)
    std::optional<NodeId> via;       // producer of a data node; START for inputs and defaults
    std::string status = "visited";  // functions: "success" or "failed"
    std::optional<std::string> error;
    std::shared_ptr<const Workflow> sub_workflow; // nested run of a sub-dispatcher
};

struct WorkflowEdge {
    NodeId from;
    NodeId to;
    std::optional<Value> value; // the value that flowed, unless values are not recorded
};

// The visited subgraph of one dispatch run. Filled by the resolver, read-only afterwards.
class Workflow {
public:
    explicit Workflow(std::string name = {}, bool record_values = true);

    void record_settlement(const DataId& data_id, const Value& value, const NodeId& via, double cost = 0.0);
    void record_invocation(const NodeId& function_id,
                           const Context& inputs_used,
                           const Context& outputs_produced,
                           std::shared_ptr<const Workflow> sub_workflow = nullptr);
    void record_failure(const NodeId& function_id, const std::string& error);

    const std::string& name() const { return name_; }
    const std::vector<WorkflowNode>& nodes() const { return nodes_; }
    const std::vector<WorkflowEdge>& edges() const { return edges_; }
    // Successful invocations, in call order
    const std::vector<NodeId>& invocation_order() const { return invocation_order_; }
    const std::vector<std::pair<NodeId, std::string>>& failures() const { return failures_; }

    bool contains(const NodeId& id) const { return index_.count(id) > 0; }
    const WorkflowNode* find_node(const NodeId& id) const;
    bool has_edge(const NodeId& from, const NodeId& to) const;
    std::optional<Value> edge_value(const NodeId& from, const NodeId& to) const;
    bool was_invoked(const NodeId& function_id) const;

    nlohmann::json to_json() const;

private:
    std::string name_;
    bool record_values_;
    std::vector<WorkflowNode> nodes_;
    std::unordered_map<NodeId, size_t> index_;
    std::vector<WorkflowEdge> edges_;
    std::vector<NodeId> invocation_order_;
    std::vector<std::pair<NodeId, std::string>> failures_;

    WorkflowNode& ensure_node(const NodeId& id, WorkflowNodeType type);
    void add_edge(const NodeId& from, const NodeId& to, const Value& value);
};

} // namespace dispatchkit

#endif // DISPATCHKIT_MODULES_WORKFLOW_WORKFLOW_H
