// modules/resolver/resolver.cpp
#include "modules/resolver/resolver.h"
#include "modules/graph/capability_graph.h"
#include <stdexcept>

namespace dispatchkit {

Resolver::Resolver(Config config) : config_(config) {}

DispatchResult Resolver::dispatch(const CapabilityGraph& graph, const Context& inputs,
                                  const std::vector<DataId>& outputs) const {
    if (!inputs.is_object()) {
        throw std::invalid_argument("dispatch: inputs must be a JSON object");
    }
    ResolutionSession session(graph, inputs, outputs, config_);
    return session.run();
}

DispatchResult Resolver::dispatch(const std::shared_ptr<const CapabilityGraph>& graph,
                                  const Context& inputs, const std::vector<DataId>& outputs) const {
    if (!graph) {
        throw std::invalid_argument("dispatch: null graph handle");
    }
    return dispatch(*graph, inputs, outputs);
}

} // namespace dispatchkit
