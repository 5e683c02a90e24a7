// modules/resolver/resolver.h
#ifndef DISPATCHKIT_MODULES_RESOLVER_RESOLVER_H
#define DISPATCHKIT_MODULES_RESOLVER_RESOLVER_H

#include "modules/resolver/resolution_session.h"
#include <memory>
#include <vector>

namespace dispatchkit {

class CapabilityGraph;

// Weighted AND/OR best-first search over a capability graph.
// Stateless between calls: every dispatch runs in its own ResolutionSession,
// so concurrent dispatches against one graph are safe.
class Resolver {
public:
    using Config = ResolverConfig;

    explicit Resolver(Config config = {});

    // `inputs` must be a JSON object; an empty `outputs` computes everything reachable
    DispatchResult dispatch(const CapabilityGraph& graph,
                            const Context& inputs,
                            const std::vector<DataId>& outputs = {}) const;
    DispatchResult dispatch(const std::shared_ptr<const CapabilityGraph>& graph,
                            const Context& inputs,
                            const std::vector<DataId>& outputs = {}) const;

    const Config& config() const { return config_; }

private:
    Config config_;
};

} // namespace dispatchkit

#endif // DISPATCHKIT_MODULES_RESOLVER_RESOLVER_H
