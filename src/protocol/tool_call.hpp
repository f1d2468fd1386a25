#pragma once

#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace callplan::protocol {

enum class DependencyType {
    None,
    Resource,  // both calls touch an overlapping resource, one of them writes
    Order,     // earlier call changes ambient state the later one may rely on
    Data       // later call's arguments reference the earlier call's id
};

// One pending tool invocation from the agent. depends_on and
// dependency_types are filled in by DependencyGraphBuilder; they are empty
// at construction and their keys always match one to one.
struct ToolCall {
    std::string call_id;
    std::string tool_name;
    nlohmann::ordered_json arguments = nlohmann::ordered_json::object();
    std::vector<std::string> depends_on;
    std::unordered_map<std::string, DependencyType> dependency_types;

    ToolCall() = default;
    ToolCall(std::string id, std::string name,
             nlohmann::ordered_json args = nlohmann::ordered_json::object())
        : call_id(std::move(id)),
          tool_name(std::move(name)),
          arguments(std::move(args)) {}

    bool depends_on_call(const std::string& other_id) const {
        return dependency_types.count(other_id) > 0;
    }

    // Records an edge once; a repeated id keeps its first type.
    bool add_dependency(const std::string& other_id, const DependencyType type) {
        if (depends_on_call(other_id)) {
            return false;
        }
        depends_on.push_back(other_id);
        dependency_types.emplace(other_id, type);
        return true;
    }
};

// Calls that may run concurrently. Pointers refer into the analyzed batch.
using CallGroup = std::vector<const ToolCall*>;

// call_id -> ids it depends on, in detection order.
using DependencyMap = std::unordered_map<std::string, std::vector<std::string>>;

inline std::string to_string(const DependencyType type) {
    switch (type) {
        case DependencyType::None:
            return "none";
        case DependencyType::Resource:
            return "resource";
        case DependencyType::Order:
            return "order";
        case DependencyType::Data:
            return "data";
        default:
            return "unknown";
    }
}

}  // namespace callplan::protocol
