// tests/test_workflow.cpp
#include <catch2/catch_test_macros.hpp>
#include "modules/workflow/workflow.h"
#include <memory>

using namespace dispatchkit;

TEST_CASE("Settlements add typed nodes and labeled edges", "[workflow][record]") {
    Workflow workflow("engine");
    workflow.record_settlement("fuel_type", "diesel", START);
    workflow.record_settlement("full_load_curve", Value::array({1, 2}), "get_full_load", 20.0);

    REQUIRE(workflow.name() == "engine");
    REQUIRE(workflow.find_node(START)->type == WorkflowNodeType::START);
    REQUIRE(workflow.find_node("get_full_load")->type == WorkflowNodeType::FUNCTION);

    const WorkflowNode* curve = workflow.find_node("full_load_curve");
    REQUIRE(curve->type == WorkflowNodeType::DATA);
    REQUIRE(curve->cost == 20.0);
    REQUIRE(curve->via == "get_full_load");
    REQUIRE(curve->value.value() == Value::array({1, 2}));

    REQUIRE(workflow.has_edge(START, "fuel_type"));
    REQUIRE(workflow.edge_value(START, "fuel_type").value() == "diesel");
    REQUIRE_FALSE(workflow.has_edge("fuel_type", START));
    REQUIRE(workflow.find_node("missing") == nullptr);
}

TEST_CASE("Invocations record inputs, outputs and order", "[workflow][record]") {
    Workflow workflow;
    workflow.record_settlement("a", 1, START);
    workflow.record_invocation("f", {{"a", 1}}, {{"b", 2}});
    workflow.record_settlement("b", 2, "f");
    workflow.record_invocation("g", {{"b", 2}}, {{"c", 3}});

    REQUIRE(workflow.invocation_order() == std::vector<NodeId>{"f", "g"});
    REQUIRE(workflow.was_invoked("f"));
    REQUIRE(workflow.find_node("f")->status == "success");
    REQUIRE(workflow.find_node("f")->value.value() == Context{{"b", 2}});
    REQUIRE(workflow.edge_value("a", "f").value() == 1);
    REQUIRE(workflow.has_edge("f", "b"));
}

TEST_CASE("Failures are kept apart from invocations", "[workflow][failure]") {
    Workflow workflow;
    workflow.record_failure("calibrate", "singular matrix");

    REQUIRE_FALSE(workflow.was_invoked("calibrate"));
    REQUIRE(workflow.find_node("calibrate")->status == "failed");
    REQUIRE(workflow.find_node("calibrate")->error.value() == "singular matrix");
    REQUIRE(workflow.failures().size() == 1);
}

TEST_CASE("SINK settlements are typed but carry no cost", "[workflow][sink]") {
    Workflow workflow;
    workflow.record_settlement(SINK, "dropped", "log_it", 4.0);

    const WorkflowNode* sink = workflow.find_node(SINK);
    REQUIRE(sink->type == WorkflowNodeType::SINK);
    REQUIRE_FALSE(sink->via.has_value());
    REQUIRE(workflow.has_edge("log_it", SINK));
}

TEST_CASE("Values are dropped when not recorded", "[workflow][values]") {
    Workflow workflow("quiet", false);
    workflow.record_settlement("a", 1, START);
    workflow.record_invocation("f", {{"a", 1}}, {{"b", 2}});

    REQUIRE_FALSE(workflow.find_node("a")->value.has_value());
    REQUIRE_FALSE(workflow.find_node("f")->value.has_value());
    REQUIRE(workflow.has_edge("a", "f"));
    REQUIRE_FALSE(workflow.edge_value("a", "f").has_value());
}

TEST_CASE("to_json serializes nodes, edges, order, failures and nested workflows", "[workflow][json]") {
    auto child = std::make_shared<Workflow>("nedc");
    child->record_settlement("times", Value::array({0, 1}), START);

    Workflow workflow("cycle");
    workflow.record_settlement("cycle_type", "NEDC", START);
    workflow.record_invocation("nedc_cycle", {{"cycle_type", "NEDC"}}, {{"times", {0, 1}}}, child);
    workflow.record_failure("wltp_cycle", "boom");

    nlohmann::json j = workflow.to_json();
    REQUIRE(j["name"] == "cycle");
    REQUIRE(j["invocation_order"] == nlohmann::json::array({"nedc_cycle"}));
    REQUIRE(j["failures"][0]["function"] == "wltp_cycle");
    REQUIRE(j["failures"][0]["error"] == "boom");

    bool found_nested = false;
    for (const auto& node : j["nodes"]) {
        if (node["id"] == "nedc_cycle") {
            REQUIRE(node["type"] == "function");
            REQUIRE(node["status"] == "success");
            REQUIRE(node["workflow"]["name"] == "nedc");
            found_nested = true;
        }
        if (node["id"] == "cycle_type") {
            REQUIRE(node["via"] == START);
            REQUIRE(node["value"] == "NEDC");
        }
    }
    REQUIRE(found_nested);
    REQUIRE(j["edges"].size() == 2);
}
