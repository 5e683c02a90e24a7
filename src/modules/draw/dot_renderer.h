// modules/draw/dot_renderer.h
#ifndef DISPATCHKIT_MODULES_DRAW_DOT_RENDERER_H
#define DISPATCHKIT_MODULES_DRAW_DOT_RENDERER_H

#include "modules/graph/capability_graph.h"
#include "modules/workflow/workflow.h"
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include <unordered_map>

namespace dispatchkit {

// Replaces single underscores between words with spaces ("fuel_type" -> "fuel type");
// leading/trailing, doubled or parenthesised underscores are kept.
std::string replace_under_score(const std::string& label);

// Graphviz DOT export of capability graphs and workflows.
// Sub-dispatchers are expanded as gray `cluster_N` subgraphs.
class DotRenderer {
public:
    struct Options {
        std::string title = "Dispatcher";
        bool expand_sub_dispatchers = true;
    };

    DotRenderer();
    explicit DotRenderer(Options options);

    std::string render(const CapabilityGraph& graph) const;
    std::string render(const Workflow& workflow) const;

private:
    Options options_;

    struct Scope {
        std::string name; // DOT graph/subgraph name; prefix of node ids
        std::unordered_map<NodeId, std::string> ids;
        std::string id(const NodeId& node);
    };

    void write_graph(std::ostringstream& out, const CapabilityGraph& graph, const std::string& title,
                     Scope& scope, size_t& clusters, int depth) const;
    void write_workflow(std::ostringstream& out, const Workflow& workflow, const std::string& title,
                        Scope& scope, size_t& clusters, int depth) const;
};

// {name, nodes: [...], edges: [[from, to], ...]}; sub-dispatchers carry their child graph
nlohmann::json graph_to_json(const CapabilityGraph& graph);

} // namespace dispatchkit

#endif // DISPATCHKIT_MODULES_DRAW_DOT_RENDERER_H
