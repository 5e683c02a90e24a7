// modules/draw/dot_renderer.cpp
#include "modules/draw/dot_renderer.h"
#include "modules/subdispatch/sub_dispatcher.h"
#include <string_view>

namespace dispatchkit {

namespace {

bool keeps_underscore(char c) {
    return c == '(' || c == ')' || c == '_' || c == ' ';
}

std::string quote(std::string_view text) {
    std::string out = "\"";
    for (char c : text) {
        if (c == '"' || c == '\\') {
            out += '\\';
            out += c;
        } else if (c == '\n') {
            out += "\\n";
        } else {
            out += c;
        }
    }
    out += '"';
    return out;
}

std::string value_text(const Value& value) {
    return value.is_string() ? value.get<std::string>() : value.dump();
}

std::string indent(int depth) {
    return std::string(static_cast<size_t>(depth + 1) * 4, ' ');
}

} // namespace

std::string replace_under_score(const std::string& label) {
    std::string out = label;
    for (size_t i = 0; i < label.size(); ++i) {
        if (label[i] != '_') continue;
        bool prev_ok = i == 0 || !keeps_underscore(label[i - 1]);
        bool next_ok = i + 1 < label.size() && !keeps_underscore(label[i + 1]);
        if (prev_ok && next_ok) {
            out[i] = ' ';
        }
    }
    return out;
}

std::string DotRenderer::Scope::id(const NodeId& node) {
    auto it = ids.find(node);
    if (it != ids.end()) return it->second;
    std::string dot_id = name + "_" + std::to_string(ids.size());
    ids.emplace(node, dot_id);
    return dot_id;
}

DotRenderer::DotRenderer() : DotRenderer(Options{}) {}

DotRenderer::DotRenderer(Options options) : options_(std::move(options)) {}

std::string DotRenderer::render(const CapabilityGraph& graph) const {
    std::ostringstream out;
    Scope scope{"main", {}};
    size_t clusters = 0;
    out << "digraph main {\n";
    write_graph(out, graph, options_.title, scope, clusters, 0);
    out << "}\n";
    return out.str();
}

std::string DotRenderer::render(const Workflow& workflow) const {
    std::ostringstream out;
    Scope scope{"main", {}};
    size_t clusters = 0;
    out << "digraph main {\n";
    write_workflow(out, workflow, options_.title, scope, clusters, 0);
    out << "}\n";
    return out.str();
}

void DotRenderer::write_graph(std::ostringstream& out, const CapabilityGraph& graph, const std::string& title,
                              Scope& scope, size_t& clusters, int depth) const {
    const std::string pad = indent(depth);
    out << pad << "node [style=filled];\n";
    out << pad << scope.id(START) << " [label=\"start\" shape=triangle fillcolor=orange];\n";

    for (const auto* data : graph.data_nodes()) {
        std::string label = replace_under_score(data->id);
        if (data->default_value.has_value()) {
            label += "\n default = " + value_text(*data->default_value);
        }
        out << pad << scope.id(data->id) << " [label=" << quote(label) << " shape=oval fillcolor=cyan];\n";
    }
    if (!graph.predecessors(SINK).empty()) {
        out << pad << scope.id(SINK) << " [label=\"sink\" shape=oval fillcolor=cyan];\n";
    }

    for (const auto* fn : graph.function_nodes()) {
        const bool sub = fn->type == NodeType::SUB_DISPATCHER;
        if (sub && options_.expand_sub_dispatchers) {
            const auto* node = static_cast<const SubDispatcherNode*>(fn);
            Scope child{"cluster_" + std::to_string(clusters++), {}};
            out << pad << "subgraph " << child.name << " {\n";
            write_graph(out, *node->graph, title + ":" + fn->id, child, clusters, depth + 1);
            out << indent(depth + 1) << "style=filled;\n"
                << indent(depth + 1) << "fillcolor=gray;\n"
                << indent(depth + 1) << "color=black;\n";
            out << pad << "}\n";
        }
        out << pad << scope.id(fn->id) << " [label=" << quote(replace_under_score(fn->id)) << " shape=box "
            << (sub ? "color=black fillcolor=gray" : "fillcolor=springgreen") << "];\n";
    }

    for (const auto& [from, to] : graph.edges()) {
        out << pad << scope.id(from) << " -> " << scope.id(to) << ";\n";
    }

    out << pad << "label = " << quote(title) << ";\n";
    out << pad << "splines = ortho;\n";
}

void DotRenderer::write_workflow(std::ostringstream& out, const Workflow& workflow, const std::string& title,
                                 Scope& scope, size_t& clusters, int depth) const {
    const std::string pad = indent(depth);
    out << pad << "node [style=filled];\n";

    for (const auto& node : workflow.nodes()) {
        const std::string id = scope.id(node.id);
        switch (node.type) {
            case WorkflowNodeType::START:
                out << pad << id << " [label=\"start\" shape=triangle fillcolor=orange];\n";
                break;
            case WorkflowNodeType::SINK:
                out << pad << id << " [label=\"sink\" shape=oval fillcolor=cyan];\n";
                break;
            case WorkflowNodeType::DATA:
                out << pad << id << " [label=" << quote(replace_under_score(node.id))
                    << " shape=oval fillcolor=cyan];\n";
                break;
            case WorkflowNodeType::FUNCTION: {
                std::string style = "fillcolor=springgreen";
                if (node.status == "failed") {
                    style = "fillcolor=red";
                } else if (node.sub_workflow) {
                    style = "color=black fillcolor=gray";
                    if (options_.expand_sub_dispatchers) {
                        Scope child{"cluster_" + std::to_string(clusters++), {}};
                        out << pad << "subgraph " << child.name << " {\n";
                        write_workflow(out, *node.sub_workflow, title + ":" + node.id, child, clusters, depth + 1);
                        out << indent(depth + 1) << "style=filled;\n"
                            << indent(depth + 1) << "fillcolor=gray;\n"
                            << indent(depth + 1) << "color=black;\n";
                        out << pad << "}\n";
                    }
                }
                out << pad << id << " [label=" << quote(replace_under_score(node.id)) << " shape=box " << style
                    << "];\n";
                break;
            }
        }
    }

    for (const auto& edge : workflow.edges()) {
        out << pad << scope.id(edge.from) << " -> " << scope.id(edge.to);
        if (edge.value) {
            out << " [label=" << quote(value_text(*edge.value)) << "]";
        }
        out << ";\n";
    }

    out << pad << "label = " << quote(title) << ";\n";
    out << pad << "splines = ortho;\n";
}

nlohmann::json graph_to_json(const CapabilityGraph& graph) {
    nlohmann::json j;
    j["name"] = graph.name();
    if (!graph.description().empty()) j["description"] = graph.description();

    nlohmann::json nodes = nlohmann::json::array();
    for (const auto* data : graph.data_nodes()) {
        nlohmann::json nj{{"id", data->id}, {"type", to_string(data->type)}};
        if (data->default_value) nj["default"] = *data->default_value;
        if (data->wait_inputs) nj["wait_inputs"] = true;
        if (!data->description.empty()) nj["description"] = data->description;
        nodes.push_back(std::move(nj));
    }
    for (const auto* fn : graph.function_nodes()) {
        nlohmann::json nj{{"id", fn->id},
                          {"type", to_string(fn->type)},
                          {"inputs", fn->inputs},
                          {"outputs", fn->outputs},
                          {"weight", fn->weight}};
        if (fn->input_domain) nj["input_domain"] = true;
        if (!fn->description.empty()) nj["description"] = fn->description;
        if (fn->type == NodeType::SUB_DISPATCHER) {
            const auto* sub = static_cast<const SubDispatcherNode*>(fn);
            nj["input_renames"] = sub->input_renames;
            nj["output_renames"] = sub->output_renames;
            nj["graph"] = graph_to_json(*sub->graph);
        }
        nodes.push_back(std::move(nj));
    }
    j["nodes"] = std::move(nodes);

    nlohmann::json edges = nlohmann::json::array();
    for (const auto& [from, to] : graph.edges()) {
        edges.push_back({from, to});
    }
    j["edges"] = std::move(edges);
    return j;
}

} // namespace dispatchkit
