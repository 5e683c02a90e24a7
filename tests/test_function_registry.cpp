// tests/test_function_registry.cpp
#include <catch2/catch_test_macros.hpp>
#include "common/functions/registry.h"
#include "common/utils/template_renderer.h"
#include "modules/loader/model_loader.h"
#include <stdexcept>

using namespace dispatchkit;

TEST_CASE("Builtin functions are registered on construction", "[registry][builtin]") {
    FunctionRegistry registry;
    REQUIRE(registry.list_functions() == std::vector<std::string>{"bypass", "combine", "summation"});

    REQUIRE(registry.call("bypass", {1, "two"}) == std::vector<Value>{1, "two"});
    REQUIRE(registry.call("summation", {1, 2, 3}) == std::vector<Value>{6});
    REQUIRE(registry.call("summation", {1, 0.5}) == std::vector<Value>{1.5});
    REQUIRE(registry.call("combine", {1, 2}) == std::vector<Value>{Value::array({1, 2})});
    REQUIRE_THROWS_AS(registry.call("summation", {1, "x"}), std::invalid_argument);
}

TEST_CASE("Custom functions can be registered and looked up", "[registry][custom]") {
    FunctionRegistry registry;
    registry.register_function("calculate_engine_max_torque", [](const std::vector<Value>& args) -> std::vector<Value> {
        return {args[0].get<double>() / args[1].get<double>()};
    });

    REQUIRE(registry.has_function("calculate_engine_max_torque"));
    REQUIRE(registry.call("calculate_engine_max_torque", {100.0, 4.0}) == std::vector<Value>{25.0});
    REQUIRE_FALSE(registry.has_function("missing"));
    REQUIRE_THROWS_AS(registry.get("missing"), std::out_of_range);
}

TEST_CASE("Expressions render against a scope", "[renderer][render]") {
    ExpressionRenderer renderer;
    Context ctx = {{"name", "NEDC"}, {"n", 3}};

    REQUIRE(renderer.render("cycle {{ name }}", ctx) == "cycle NEDC");
    REQUIRE(renderer.render_value("{{ n * 2 }}", ctx) == 6);
    REQUIRE(renderer.render_value(" {{ name }} ", ctx) == "NEDC");
    REQUIRE(renderer.render_value("[{{ n }}, {{ n }}]", ctx) == Value::array({3, 3}));
    REQUIRE_THROWS_AS(renderer.render("{{ missing }}", ctx), std::runtime_error);
}

TEST_CASE("Includes are disabled in expressions", "[renderer][security]") {
    ExpressionRenderer renderer;
    REQUIRE_THROWS_AS(renderer.render("{% include \"secrets.txt\" %}", Context::object()),
                      std::runtime_error);
}

TEST_CASE("Conditions accept booleans and numbers only", "[renderer][condition]") {
    ExpressionRenderer& renderer = ExpressionRenderer::thread_instance();
    Context ctx = {{"cycle_type", "WLTP"}, {"count", 0}};

    REQUIRE(renderer.evaluate_condition("{{ cycle_type == \"WLTP\" }}", ctx));
    REQUIRE_FALSE(renderer.evaluate_condition("{{ cycle_type == \"NEDC\" }}", ctx));
    REQUIRE_FALSE(renderer.evaluate_condition("{{ count }}", ctx));
    REQUIRE(renderer.evaluate_condition("{{ count + 1 }}", ctx));
    REQUIRE_THROWS_AS(renderer.evaluate_condition("{{ cycle_type }}", ctx), std::runtime_error);
}

TEST_CASE("Expression helpers wrap templates as callables and domains", "[renderer][loader]") {
    FunctionCallable scale = make_expression_function("{{ times * 2 }}", {"times"}, 1);
    REQUIRE(scale({Value(21)}) == std::vector<Value>{42});

    FunctionCallable pair = make_expression_function("[{{ a }}, {{ b }}]", {"a", "b"}, 2);
    REQUIRE(pair({Value(1), Value(2)}) == std::vector<Value>{1, 2});
    REQUIRE_THROWS_AS(make_expression_function("{{ a }}", {"a"}, 2)({Value(1)}), std::runtime_error);

    InputDomain is_nedc = make_expression_domain("{{ cycle_type == \"NEDC\" }}");
    REQUIRE(is_nedc({{"cycle_type", "NEDC"}}));
    REQUIRE_FALSE(is_nedc({{"cycle_type", "WLTP"}}));
}
