// common/functions/registry.cpp
#include "common/functions/registry.h"
#include <algorithm>
#include <stdexcept>

namespace dispatchkit {

FunctionRegistry::FunctionRegistry() {
    register_builtin_functions();
}

void FunctionRegistry::register_builtin_functions() {
    // One output per input, unchanged
    register_function("bypass", [](const std::vector<Value>& args) -> std::vector<Value> {
        return args;
    });

    register_function("summation", [](const std::vector<Value>& args) -> std::vector<Value> {
        bool all_integers = true;
        double total = 0.0;
        long long int_total = 0;
        for (const auto& arg : args) {
            if (!arg.is_number()) {
                throw std::invalid_argument("summation: non-numeric argument " + arg.dump());
            }
            if (arg.is_number_integer()) {
                int_total += arg.get<long long>();
            } else {
                all_integers = false;
            }
            total += arg.get<double>();
        }
        if (all_integers) {
            return {Value(int_total)};
        }
        return {Value(total)};
    });

    // All inputs as a single array output
    register_function("combine", [](const std::vector<Value>& args) -> std::vector<Value> {
        Value out = Value::array();
        for (const auto& arg : args) {
            out.push_back(arg);
        }
        return {out};
    });
}

bool FunctionRegistry::has_function(const std::string& name) const {
    return functions_.count(name) > 0;
}

const FunctionCallable& FunctionRegistry::get(const std::string& name) const {
    auto it = functions_.find(name);
    if (it == functions_.end()) {
        throw std::out_of_range("Function not found: " + name);
    }
    return it->second;
}

std::vector<Value> FunctionRegistry::call(const std::string& name, const std::vector<Value>& args) const {
    return get(name)(args);
}

std::vector<std::string> FunctionRegistry::list_functions() const {
    std::vector<std::string> names;
    names.reserve(functions_.size());
    for (const auto& [name, _] : functions_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

} // namespace dispatchkit
