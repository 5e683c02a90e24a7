// modules/subdispatch/sub_dispatcher.h
#ifndef DISPATCHKIT_MODULES_SUBDISPATCH_SUB_DISPATCHER_H
#define DISPATCHKIT_MODULES_SUBDISPATCH_SUB_DISPATCHER_H

#include "core/types/node.h"
#include <memory>
#include <vector>

namespace dispatchkit {

class CapabilityGraph;

// A whole child graph seen by its parent as one function node.
// Inputs are the parent ids of `input_renames`; outputs are the parent ids of `output_renames`.
struct SubDispatcherNode : public FunctionNode {
    std::shared_ptr<const CapabilityGraph> graph;
    RenameMap input_renames;   // parent id -> child id | SINK
    RenameMap output_renames;  // child id -> parent id

    SubDispatcherNode(NodeId id,
                      std::shared_ptr<const CapabilityGraph> graph,
                      RenameMap input_renames,
                      RenameMap output_renames,
                      double weight = 0.0,
                      InputDomain input_domain = nullptr,
                      std::string description = {});

    bool waits_all_inputs() const override { return false; }
    // SINK-mapped inputs are visible to the input domain only
    bool triggered_by(const DataId& data_id) const override;

    // Renamed child inputs from the settled parent values
    Context child_inputs(const Context& arguments) const;
    std::vector<DataId> child_outputs() const;

    [[nodiscard]] Invocation invoke(const Context& arguments, const InvocationScope& scope) const override;

private:
    static std::vector<DataId> parent_outputs(const RenameMap& output_renames);
};

} // namespace dispatchkit

#endif // DISPATCHKIT_MODULES_SUBDISPATCH_SUB_DISPATCHER_H
