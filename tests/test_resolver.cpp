// tests/test_resolver.cpp
#include <catch2/catch_test_macros.hpp>
#include "modules/graph/capability_graph.h"
#include "modules/resolver/resolver.h"
#include <map>
#include <memory>
#include <stdexcept>
#include <string>

using namespace dispatchkit;

namespace {

// Counts calls per function name
struct CallLog {
    std::map<std::string, int> calls;

    FunctionCallable constant(const std::string& name, Value value) {
        return [this, name, value](const std::vector<Value>&) -> std::vector<Value> {
            ++calls[name];
            return {value};
        };
    }

    FunctionCallable add(const std::string& name, int delta) {
        return [this, name, delta](const std::vector<Value>& args) -> std::vector<Value> {
            ++calls[name];
            return {args.at(0).get<int>() + delta};
        };
    }
};

FunctionCallable increment(int delta) {
    return [delta](const std::vector<Value>& args) -> std::vector<Value> {
        return {args.at(0).get<int>() + delta};
    };
}

FunctionCallable failing(const std::string& message) {
    return [message](const std::vector<Value>&) -> std::vector<Value> {
        throw std::runtime_error(message);
    };
}

} // namespace

TEST_CASE("Cheaper producer wins and the other one is never invoked", "[resolver][weight]") {
    CallLog log;
    CapabilityGraph graph;
    graph.add_function("f1", {"a"}, {"b"}, log.add("f1", 1), 0.0);
    graph.add_function("f2", {"a"}, {"b"}, log.add("f2", 100), 10.0);

    Resolver resolver;
    auto result = resolver.dispatch(graph, {{"a", 1}}, {"b"});

    REQUIRE(result.solution["b"] == 2);
    REQUIRE(log.calls["f1"] == 1);
    REQUIRE(log.calls.count("f2") == 0);
    REQUIRE(result.workflow->was_invoked("f1"));
    REQUIRE_FALSE(result.workflow->contains("f2"));
    REQUIRE(result.workflow->has_edge("f1", "b"));
}

TEST_CASE("Weight monotonicity holds regardless of registration order", "[resolver][weight]") {
    CallLog log;
    CapabilityGraph graph;
    graph.add_function("heavy", {"a"}, {"b"}, log.add("heavy", 5), 5.0);
    graph.add_function("light", {"a"}, {"b"}, log.add("light", 1), 1.0);

    auto result = Resolver().dispatch(graph, {{"a", 0}}, {"b"});

    REQUIRE(result.solution["b"] == 1);
    REQUIRE(log.calls.count("heavy") == 0);
    REQUIRE(result.workflow->find_node("b")->via == "light");
}

TEST_CASE("Equal costs fall back to registration order", "[resolver][weight]") {
    CallLog log;
    CapabilityGraph graph;
    graph.add_function("first", {"a"}, {"b"}, log.add("first", 1));
    graph.add_function("second", {"a"}, {"b"}, log.add("second", 2));

    auto result = Resolver().dispatch(graph, {{"a", 0}}, {"b"});

    REQUIRE(result.solution["b"] == 1);
    REQUIRE(log.calls.count("second") == 0);
}

TEST_CASE("Default value of an unproduced node is used when no input is given", "[resolver][defaults]") {
    CapabilityGraph graph;
    graph.add_data("x", 100);

    auto result = Resolver().dispatch(graph, Context::object(), {"x"});

    REQUIRE(result.solution == Context{{"x", 100}});
    REQUIRE(result.workflow->has_edge(START, "x"));
    REQUIRE(result.success());
}

TEST_CASE("An explicit input overrides a default", "[resolver][defaults]") {
    CapabilityGraph graph;
    graph.add_data("x", 100);

    auto result = Resolver().dispatch(graph, {{"x", 7}}, {"x"});

    REQUIRE(result.solution["x"] == 7);
}

TEST_CASE("Defaulted node with a producer prefers the producer", "[resolver][defaults]") {
    CallLog log;
    CapabilityGraph graph;
    graph.add_data("speed", 5);
    graph.add_function("measure", {"sensor"}, {"speed"}, log.add("measure", 0));

    SECTION("producer fires") {
        auto result = Resolver().dispatch(graph, {{"sensor", 7}}, {"speed"});
        REQUIRE(result.solution["speed"] == 7);
        REQUIRE(result.workflow->find_node("speed")->via == "measure");
    }

    SECTION("producer never becomes eligible") {
        auto result = Resolver().dispatch(graph, Context::object(), {"speed"});
        REQUIRE(result.solution["speed"] == 5);
        REQUIRE(result.workflow->find_node("speed")->via == START);
        REQUIRE(log.calls.count("measure") == 0);
    }
}

TEST_CASE("wait_inputs defers a default behind every producer", "[resolver][defaults]") {
    CallLog log;
    CapabilityGraph graph;
    graph.add_function("from_x", {"x"}, {"out"}, log.add("from_x", 1), 0.0);
    graph.add_function("from_z", {"z"}, {"out"}, log.add("from_z", 10), 10.0);

    SECTION("eager default") {
        graph.set_default_value("x", 1);
        auto result = Resolver().dispatch(graph, {{"z", 0}}, {"out"});
        REQUIRE(result.solution["out"] == 2);
    }

    SECTION("deferred default") {
        CapabilityGraph waiting;
        waiting.add_data("x", 1, true);
        waiting.add_function("from_x", {"x"}, {"out"}, log.add("from_x", 1), 0.0);
        waiting.add_function("from_z", {"z"}, {"out"}, log.add("from_z", 10), 10.0);

        auto result = Resolver().dispatch(waiting, {{"z", 0}}, {"out"});
        REQUIRE(result.solution["out"] == 10);
        REQUIRE(log.calls.count("from_x") == 0);
    }
}

TEST_CASE("Input domain gates a function out of the run", "[resolver][domain]") {
    CallLog log;
    CapabilityGraph graph;
    graph.add_function("only_a", {"mode"}, {"out"}, log.constant("only_a", "done"), 0.0,
                       [](const Context& inputs) { return inputs.value("mode", "") == "A"; });

    SECTION("domain rejects") {
        auto result = Resolver().dispatch(graph, {{"mode", "B"}}, {"out"});
        REQUIRE_FALSE(result.solution.contains("out"));
        REQUIRE_FALSE(result.workflow->contains("only_a"));
        REQUIRE(log.calls.count("only_a") == 0);
        REQUIRE(result.missing_outputs() == std::vector<DataId>{"out"});
    }

    SECTION("domain accepts") {
        auto result = Resolver().dispatch(graph, {{"mode", "A"}}, {"out"});
        REQUIRE(result.solution["out"] == "done");
    }
}

TEST_CASE("A throwing input domain counts as not eligible", "[resolver][domain]") {
    CapabilityGraph graph;
    graph.add_function("guarded", {"a"}, {"b"}, [](const std::vector<Value>& args) -> std::vector<Value> {
        return {args[0]};
    }, 0.0, [](const Context&) -> bool { throw std::runtime_error("bad domain"); });

    auto result = Resolver().dispatch(graph, {{"a", 1}}, {"b"});

    REQUIRE_FALSE(result.solution.contains("b"));
    REQUIRE(result.workflow->failures().empty());
}

TEST_CASE("A domain throwing a non-standard exception counts as not eligible", "[resolver][domain]") {
    CapabilityGraph graph;
    graph.add_function("guarded", {"a"}, {"b"}, increment(1), 0.0, [](const Context&) -> bool { throw 42; });
    graph.add_function("fallback", {"a"}, {"b"}, increment(2), 3.0);

    DispatchResult result;
    REQUIRE_NOTHROW(result = Resolver().dispatch(graph, {{"a", 1}}, {"b"}));
    REQUIRE(result.solution["b"] == 3);
    REQUIRE(result.workflow->failures().empty());
}

TEST_CASE("Functions off the cheapest path are never invoked", "[resolver][lazy]") {
    CallLog log;
    CapabilityGraph graph;
    graph.add_function("f", {"a"}, {"b"}, log.add("f", 1));
    graph.add_function("g", {"b"}, {"c"}, log.add("g", 1));
    graph.add_function("h", {"a"}, {"d"}, log.add("h", 1), 10.0);

    auto result = Resolver().dispatch(graph, {{"a", 1}}, {"c"});

    REQUIRE(result.solution["c"] == 3);
    REQUIRE(log.calls["f"] == 1);
    REQUIRE(log.calls["g"] == 1);
    REQUIRE(log.calls.count("h") == 0);
    REQUIRE(result.workflow->invocation_order() == std::vector<NodeId>{"f", "g"});
}

TEST_CASE("Without stop_on_outputs everything reachable is computed", "[resolver][lazy]") {
    CallLog log;
    CapabilityGraph graph;
    graph.add_function("f", {"a"}, {"b"}, log.add("f", 1));
    graph.add_function("h", {"a"}, {"d"}, log.add("h", 1), 10.0);

    Resolver::Config config;
    config.stop_on_outputs = false;
    auto result = Resolver(config).dispatch(graph, {{"a", 1}}, {"b"});

    REQUIRE(result.solution["b"] == 2);
    REQUIRE(result.solution["d"] == 2);
}

TEST_CASE("No requested outputs computes everything reachable", "[resolver][lazy]") {
    CallLog log;
    CapabilityGraph chain;
    chain.add_function("f", {"a"}, {"b"}, log.add("f", 1));
    chain.add_function("g", {"b"}, {"c"}, log.add("g", 1));

    auto result = Resolver().dispatch(chain, {{"a", 1}});

    REQUIRE(result.solution == Context{{"a", 1}, {"b", 2}, {"c", 3}});
    REQUIRE(result.success());
}

TEST_CASE("AND semantics: a function waits for all of its inputs", "[resolver][and]") {
    CallLog log;
    CapabilityGraph graph;
    graph.add_function("sum", {"a", "b"}, {"c"}, [&log](const std::vector<Value>& args) -> std::vector<Value> {
        ++log.calls["sum"];
        return {args[0].get<int>() + args[1].get<int>()};
    });

    SECTION("one input missing") {
        auto result = Resolver().dispatch(graph, {{"a", 1}}, {"c"});
        REQUIRE_FALSE(result.solution.contains("c"));
        REQUIRE(log.calls.count("sum") == 0);
    }

    SECTION("both inputs present") {
        auto result = Resolver().dispatch(graph, {{"a", 1}, {"b", 2}}, {"c"});
        REQUIRE(result.solution["c"] == 3);
        REQUIRE(result.workflow->edge_value("a", "sum").value() == 1);
        REQUIRE(result.workflow->edge_value("b", "sum").value() == 2);
    }
}

TEST_CASE("Costs aggregate with max over the inputs", "[resolver][cost]") {
    CapabilityGraph graph;
    graph.add_function("g", {"a"}, {"b"}, increment(0), 3.0);
    graph.add_function("f", {"a", "b"}, {"c"}, [](const std::vector<Value>& args) -> std::vector<Value> {
        return {args[0].get<int>() + args[1].get<int>()};
    }, 1.0);

    auto result = Resolver().dispatch(graph, {{"a", 2}}, {"c"});

    REQUIRE(result.solution["c"] == 4);
    REQUIRE(result.workflow->find_node("b")->cost == 3.0);
    REQUIRE(result.workflow->find_node("c")->cost == 4.0);
}

TEST_CASE("Zero-input functions are wired from START", "[resolver][start]") {
    CapabilityGraph graph;
    graph.add_function("constant", {}, {"k"}, [](const std::vector<Value>&) -> std::vector<Value> {
        return {42};
    });

    auto result = Resolver().dispatch(graph, Context::object(), {"k"});

    REQUIRE(result.solution["k"] == 42);
    REQUIRE(result.workflow->has_edge("constant", "k"));
    REQUIRE_FALSE(result.solution.contains(START));
}

TEST_CASE("Sibling outputs come from a single invocation", "[resolver][outputs]") {
    int calls = 0;
    CapabilityGraph graph;
    graph.add_function("split", {"a"}, {"b", "c"}, [&calls](const std::vector<Value>& args) -> std::vector<Value> {
        ++calls;
        int a = args[0].get<int>();
        return {a + 1, a - 1};
    });

    auto result = Resolver().dispatch(graph, {{"a", 3}}, {"b", "c"});

    REQUIRE(calls == 1);
    REQUIRE(result.solution["b"] == 4);
    REQUIRE(result.solution["c"] == 2);
    REQUIRE(result.workflow->find_node("b")->cost == result.workflow->find_node("c")->cost);
}

TEST_CASE("SINK outputs are recorded but never settled", "[resolver][sink]") {
    CapabilityGraph graph;
    graph.add_function("f", {"a"}, {"b", SINK}, [](const std::vector<Value>& args) -> std::vector<Value> {
        return {args[0], "discarded"};
    });

    auto result = Resolver().dispatch(graph, {{"a", 1}}, {"b"});

    REQUIRE(result.solution == Context{{"a", 1}, {"b", 1}});
    REQUIRE(result.workflow->has_edge("f", SINK));
    REQUIRE(result.workflow->find_node(SINK)->type == WorkflowNodeType::SINK);
}

TEST_CASE("A failing cheaper producer yields to a more expensive one", "[resolver][failure]") {
    CallLog log;
    CapabilityGraph graph;
    graph.add_function("cheap", {"a"}, {"b"}, failing("sensor offline"), 1.0);
    graph.add_function("expensive", {"a"}, {"b"}, log.constant("expensive", 2), 5.0);

    auto result = Resolver().dispatch(graph, {{"a", 1}}, {"b"});

    REQUIRE(result.solution["b"] == 2);
    REQUIRE(result.workflow->failures().size() == 1);
    REQUIRE(result.workflow->failures()[0].first == "cheap");
    REQUIRE(result.workflow->failures()[0].second == "sensor offline");
    REQUIRE(result.workflow->find_node("cheap")->status == "failed");
    REQUIRE_FALSE(result.workflow->was_invoked("cheap"));
    REQUIRE(result.workflow->was_invoked("expensive"));
}

TEST_CASE("A failure with no alternative leaves the output missing", "[resolver][failure]") {
    CapabilityGraph graph;
    graph.add_function("broken", {"a"}, {"b"}, failing("boom"));

    DispatchResult result;
    REQUIRE_NOTHROW(result = Resolver().dispatch(graph, {{"a", 1}}, {"b"}));
    REQUIRE_FALSE(result.solution.contains("b"));
    REQUIRE(result.missing_outputs() == std::vector<DataId>{"b"});
    REQUIRE_FALSE(result.success());
}

TEST_CASE("A callable throwing a non-standard exception is a recorded failure", "[resolver][failure]") {
    CapabilityGraph graph;
    graph.add_function("odd", {"a"}, {"b"}, [](const std::vector<Value>&) -> std::vector<Value> { throw 42; });
    graph.add_function("plain", {"a"}, {"b"}, increment(1), 4.0);

    DispatchResult result;
    REQUIRE_NOTHROW(result = Resolver().dispatch(graph, {{"a", 1}}, {"b"}));
    REQUIRE(result.solution["b"] == 2);
    REQUIRE(result.workflow->failures().size() == 1);
    REQUIRE(result.workflow->failures()[0].first == "odd");
    REQUIRE(result.workflow->failures()[0].second == "unknown error");
    REQUIRE(result.workflow->find_node("odd")->status == "failed");
}

TEST_CASE("Wrong number of results is a recorded failure", "[resolver][failure]") {
    CapabilityGraph graph;
    graph.add_function("pair", {"a"}, {"b"}, [](const std::vector<Value>& args) -> std::vector<Value> {
        return {args[0], args[0]};
    });

    auto result = Resolver().dispatch(graph, {{"a", 1}}, {"b"});

    REQUIRE_FALSE(result.solution.contains("b"));
    REQUIRE(result.workflow->failures().size() == 1);
    REQUIRE(result.workflow->failures()[0].second.find("returned 2 values, expected 1") != std::string::npos);
}

TEST_CASE("Cyclic graphs terminate", "[resolver][cycle]") {
    CapabilityGraph graph;
    graph.add_function("forward", {"a"}, {"b"}, increment(1));
    graph.add_function("backward", {"b"}, {"a"}, increment(-1));

    auto result = Resolver().dispatch(graph, {{"a", 1}});

    REQUIRE(result.solution == Context{{"a", 1}, {"b", 2}});
    REQUIRE_FALSE(result.workflow->was_invoked("backward"));
}

TEST_CASE("Identical runs produce identical results", "[resolver][determinism]") {
    CapabilityGraph graph;
    graph.add_data("k", 2);
    graph.add_function("f", {"a", "k"}, {"b"}, [](const std::vector<Value>& args) -> std::vector<Value> {
        return {args[0].get<int>() * args[1].get<int>()};
    });
    graph.add_function("g", {"a"}, {"b"}, increment(0));
    graph.add_function("h", {"b"}, {"c", "d"}, [](const std::vector<Value>& args) -> std::vector<Value> {
        return {args[0], args[0]};
    }, 2.0);

    Resolver resolver;
    auto first = resolver.dispatch(graph, {{"a", 3}}, {"c", "d"});
    auto second = resolver.dispatch(graph, {{"a", 3}}, {"c", "d"});

    REQUIRE(first.solution == second.solution);
    REQUIRE(first.workflow->invocation_order() == second.workflow->invocation_order());
    REQUIRE(first.workflow->to_json() == second.workflow->to_json());
}

TEST_CASE("Values can be left out of the workflow", "[resolver][config]") {
    CapabilityGraph graph;
    graph.add_function("f", {"a"}, {"b"}, increment(1));

    Resolver::Config config;
    config.record_values = false;
    auto result = Resolver(config).dispatch(graph, {{"a", 1}}, {"b"});

    REQUIRE(result.solution["b"] == 2);
    REQUIRE(result.workflow->has_edge("a", "f"));
    REQUIRE_FALSE(result.workflow->edge_value("a", "f").has_value());
    REQUIRE_FALSE(result.workflow->find_node("b")->value.has_value());
}

TEST_CASE("Structural misuse is rejected", "[resolver][errors]") {
    CapabilityGraph graph;
    Resolver resolver;

    REQUIRE_THROWS_AS(resolver.dispatch(std::shared_ptr<const CapabilityGraph>{}, Context::object()),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(resolver.dispatch(graph, Value::array({1, 2})), std::invalid_argument);
}

TEST_CASE("Unknown input ids are ignored", "[resolver][inputs]") {
    CapabilityGraph graph;
    graph.add_data("a");

    auto result = Resolver().dispatch(graph, {{"a", 1}, {"stray", 2}});

    REQUIRE(result.solution == Context{{"a", 1}});
}
