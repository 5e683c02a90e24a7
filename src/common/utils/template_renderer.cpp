// common/utils/template_renderer.cpp
#include "template_renderer.h"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <stdexcept>

namespace dispatchkit {

namespace {

std::string trimmed(const std::string& s) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    auto begin = std::find_if_not(s.begin(), s.end(), is_space);
    auto end = std::find_if_not(s.rbegin(), s.rend(), is_space).base();
    return begin < end ? std::string(begin, end) : std::string{};
}

} // namespace

ExpressionRenderer::ExpressionRenderer() {
    env_.set_include_callback([](const std::filesystem::path&, const std::string& name) -> inja::Template {
        throw inja::InjaError("render_error", "include of '" + name + "' is not allowed in model expressions",
                              inja::SourceLocation{});
    });
}

ExpressionRenderer& ExpressionRenderer::thread_instance() {
    thread_local ExpressionRenderer renderer;
    return renderer;
}

std::string ExpressionRenderer::render(std::string_view expression, const Context& scope) {
    try {
        return env_.render(expression, scope);
    } catch (const inja::InjaError& e) {
        throw std::runtime_error("expression '" + std::string(expression) + "': " + e.message);
    }
}

Value ExpressionRenderer::render_value(std::string_view expression, const Context& scope) {
    std::string text = trimmed(render(expression, scope));
    Value parsed = Value::parse(text, nullptr, false);
    return parsed.is_discarded() ? Value(text) : parsed;
}

bool ExpressionRenderer::evaluate_condition(std::string_view expression, const Context& scope) {
    Value value = render_value(expression, scope);
    if (value.is_boolean()) {
        return value.get<bool>();
    }
    if (value.is_number()) {
        return value.get<double>() != 0.0;
    }
    throw std::runtime_error("expression '" + std::string(expression) + "' did not render a boolean: " +
                             value.dump());
}

} // namespace dispatchkit
