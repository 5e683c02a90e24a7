// common/functions/registry.h
#ifndef DISPATCHKIT_COMMON_FUNCTIONS_REGISTRY_H
#define DISPATCHKIT_COMMON_FUNCTIONS_REGISTRY_H

#include "dispatchkit/common/types.h"
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace dispatchkit {

// Name -> callable table that model files refer to with `function: <name>`
class FunctionRegistry {
public:
    FunctionRegistry(); // 构造时注册内置函数 (bypass, summation, combine)

    template<typename Func>
    void register_function(std::string name, Func&& func) {
        functions_[std::move(name)] = FunctionCallable(std::forward<Func>(func));
    }

    bool has_function(const std::string& name) const;
    // Throws std::out_of_range for an unknown name
    const FunctionCallable& get(const std::string& name) const;
    std::vector<Value> call(const std::string& name, const std::vector<Value>& args) const;
    // Sorted by name
    std::vector<std::string> list_functions() const;

private:
    void register_builtin_functions();
    std::unordered_map<std::string, FunctionCallable> functions_;
};

} // namespace dispatchkit

#endif // DISPATCHKIT_COMMON_FUNCTIONS_REGISTRY_H
