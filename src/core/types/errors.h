#ifndef DISPATCHKIT_CORE_TYPES_ERRORS_H
#define DISPATCHKIT_CORE_TYPES_ERRORS_H

#include <stdexcept>
#include <string>

namespace dispatchkit {

struct DispatchError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Registration of a node whose id already exists in the graph
struct DuplicateNodeId : public DispatchError {
    explicit DuplicateNodeId(const std::string& id)
        : DispatchError("Duplicate node id: " + id), node_id(id) {}
    std::string node_id;
};

// Reference to an id that is not registered (or not of the required kind)
struct UnknownNode : public DispatchError {
    UnknownNode(const std::string& id, const std::string& detail = "unknown node")
        : DispatchError(detail + ": " + id), node_id(id) {}
    std::string node_id;
};

// Mutation of a graph already bound into a parent as a sub-dispatcher
struct GraphFrozen : public DispatchError {
    explicit GraphFrozen(const std::string& graph_name)
        : DispatchError("Graph '" + graph_name + "' is bound as a sub-dispatcher and can no longer change"),
          graph_name(graph_name) {}
    std::string graph_name;
};

// Raised around a failing callable; caught by the resolver and recorded in the workflow
struct CallableFailure : public DispatchError {
    CallableFailure(const std::string& function_id, const std::string& reason)
        : DispatchError("Function '" + function_id + "' failed: " + reason),
          function_id(function_id), reason(reason) {}
    std::string function_id;
    std::string reason;
};

// Malformed model document
struct ModelError : public DispatchError {
    using DispatchError::DispatchError;
};

} // namespace dispatchkit

#endif // DISPATCHKIT_CORE_TYPES_ERRORS_H
