// dispatchkit/core/dispatcher.h
#ifndef DISPATCHKIT_CORE_DISPATCHER_H
#define DISPATCHKIT_CORE_DISPATCHER_H

#include "common/functions/registry.h"
#include "modules/graph/capability_graph.h"
#include "modules/resolver/resolver.h"
#include <memory>
#include <string>
#include <vector>

namespace dispatchkit {

// Entry point owning one named capability graph
class Dispatcher {
public:
    explicit Dispatcher(std::string name = "Dispatcher", std::string description = {});
    explicit Dispatcher(std::shared_ptr<CapabilityGraph> graph);

    // Main model of a YAML model document; functions are looked up in `registry`
    static std::unique_ptr<Dispatcher> from_yaml(const std::string& yaml_content, const FunctionRegistry& registry);
    static std::unique_ptr<Dispatcher> from_file(const std::string& file_path, const FunctionRegistry& registry);

    DataId add_data(DataId id,
                    std::optional<Value> default_value = std::nullopt,
                    bool wait_inputs = false,
                    std::string description = {});
    NodeId add_function(FunctionSpec spec);
    NodeId add_function(std::string name,
                        std::vector<DataId> inputs,
                        std::vector<DataId> outputs,
                        FunctionCallable function,
                        double weight = 0.0,
                        InputDomain input_domain = nullptr);
    NodeId add_sub_dispatcher(SubDispatcherSpec spec);
    // Embeds `child`'s graph and freezes it: further mutation of `child` throws GraphFrozen
    NodeId add_sub_dispatcher(const Dispatcher& child,
                              RenameMap inputs,
                              RenameMap outputs,
                              InputDomain input_domain = nullptr,
                              double weight = 0.0);
    std::vector<NodeId> add_from_lists(std::vector<DataSpec> data_list,
                                       std::vector<FunctionSpec> function_list = {});
    void set_default_value(const DataId& id, Value value);

    // Logs a warning for every requested output left unsettled
    DispatchResult dispatch(const Context& inputs = Context::object(),
                            const std::vector<DataId>& outputs = {},
                            Resolver::Config config = {}) const;

    const std::string& name() const { return graph_->name(); }
    const CapabilityGraph& graph() const { return *graph_; }
    std::shared_ptr<const CapabilityGraph> shared_graph() const { return graph_; }

private:
    std::shared_ptr<CapabilityGraph> graph_;
};

} // namespace dispatchkit

#endif // DISPATCHKIT_CORE_DISPATCHER_H
