// modules/resolver/resolution_session.h
#ifndef DISPATCHKIT_MODULES_RESOLVER_RESOLUTION_SESSION_H
#define DISPATCHKIT_MODULES_RESOLVER_RESOLUTION_SESSION_H

#include "core/types/node.h"
#include "modules/workflow/workflow.h"
#include <cstdint>
#include <memory>
#include <optional>
#include <queue>
#include <unordered_map>
#include <vector>

namespace dispatchkit {

class CapabilityGraph;

struct ResolverConfig {
    bool stop_on_outputs = true; // stop once every requested output is settled
    bool record_values = true;   // keep flowed values on workflow nodes and edges
};

struct DispatchResult {
    Context solution = Context::object();
    std::shared_ptr<const Workflow> workflow;
    std::vector<DataId> requested;

    // Requested ids absent from the solution
    std::vector<DataId> missing_outputs() const;
    bool success() const { return missing_outputs().empty(); }
};

// ResolutionSession 封装了单次 dispatch 的全部可变状态
class ResolutionSession {
public:
    ResolutionSession(const CapabilityGraph& graph,
                      const Context& inputs,
                      std::vector<DataId> outputs,
                      ResolverConfig config);

    DispatchResult run();

private:
    struct QueueEntry {
        double cost = 0.0;
        size_t rank = 0;   // 0 inputs, 1 defaults, 2 + registration order for functions
        uint64_t seq = 0;
        DataId data;
        const FunctionNode* producer = nullptr; // null: value carried by the entry
        Value value;
    };

    struct EntryAfter {
        bool operator()(const QueueEntry& a, const QueueEntry& b) const {
            if (a.cost != b.cost) return a.cost > b.cost;
            if (a.rank != b.rank) return a.rank > b.rank;
            return a.seq > b.seq;
        }
    };

    struct Settlement {
        Value value;
        double cost = 0.0;
        NodeId via;
    };

    struct FunctionState {
        size_t pending = 0;
        bool counted = false;
        bool triggered = false;
        bool discarded = false;
        bool invoked = false;
        bool deferred = false; // sub-dispatcher output popped before all mapped inputs settled
        bool released = false; // queue drained; runs with whatever inputs settled
        double cost = 0.0;
        std::optional<Invocation> result;
    };

    const CapabilityGraph& graph_;
    const Context& inputs_;
    std::vector<DataId> outputs_;
    ResolverConfig config_;

    std::priority_queue<QueueEntry, std::vector<QueueEntry>, EntryAfter> queue_;
    uint64_t next_seq_ = 0;
    std::unordered_map<DataId, Settlement> settled_;
    std::vector<DataId> settle_order_;
    std::unordered_map<NodeId, FunctionState> functions_;
    std::vector<DataId> fallback_defaults_;
    std::vector<const FunctionNode*> deferred_;
    double frontier_ = 0.0; // cost of the last popped entry
    std::shared_ptr<Workflow> workflow_;

    void seed();
    void push_value(const DataId& data, Value value, size_t rank);
    bool push_fallback_defaults();
    bool release_deferred();
    void settle(const QueueEntry& entry);
    void on_input_settled(const FunctionNode* fn, const DataId& data);
    void trigger(const FunctionNode* fn, FunctionState& state);
    void push_outputs(const FunctionNode* fn, const FunctionState& state);
    double input_cost(const FunctionNode* fn) const;
    bool has_unsettled_inputs(const FunctionNode* fn) const;
    bool ready_to_invoke(const QueueEntry& entry, FunctionState& state);
    bool eligible(const FunctionNode* fn) const;
    bool invoke(const FunctionNode* fn, FunctionState& state);
    Context settled_arguments(const FunctionNode* fn) const;
    bool requested_settled() const;
};

} // namespace dispatchkit

#endif // DISPATCHKIT_MODULES_RESOLVER_RESOLUTION_SESSION_H
