#ifndef DISPATCHKIT_COMMON_TYPES_H
#define DISPATCHKIT_COMMON_TYPES_H

#include <string>
#include <vector>
#include <map>
#include <functional>
#include <nlohmann/json.hpp>

namespace dispatchkit {

// 使用 nlohmann::json 作为统一的数据类型
using Value = nlohmann::json;
using Context = nlohmann::json; // always an object: data id -> value

using NodeId = std::string;
using DataId = std::string;

// Sentinel data nodes present in every graph
inline const NodeId START = "__start__";
inline const NodeId SINK = "__sink__";

// Positional callable: one argument per declared input, one result per declared output
using FunctionCallable = std::function<std::vector<Value>(const std::vector<Value>&)>;

// Eligibility predicate, evaluated against the raw inputs of a dispatch call
using InputDomain = std::function<bool(const Context&)>;

// parent id -> child id (inputs) or child id -> parent id (outputs)
using RenameMap = std::map<DataId, DataId>;

} // namespace dispatchkit

#endif // DISPATCHKIT_COMMON_TYPES_H
