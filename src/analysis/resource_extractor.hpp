#pragma once

#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "protocol/tool_call.hpp"

namespace callplan::analysis {

// Pulls a resource identifier (usually a path) out of a tool's arguments.
using ResourceExtractor =
    std::function<std::optional<std::string>(const nlohmann::ordered_json&)>;

// Two-tier lookup: extractors registered on this instance take precedence
// over the built-in table. Registrations are never shared between instances.
class ResourceExtractorRegistry {
public:
    // Replaces any earlier registration or built-in entry for tool_name.
    void register_extractor(const std::string& tool_name, ResourceExtractor extractor);

    bool has_extractor(const std::string& tool_name) const;

    // std::nullopt when no extractor exists or it yields nothing usable.
    std::optional<std::string> extract(const protocol::ToolCall& call) const;

    std::vector<std::string> list_builtin_tools() const;

    // Returns the first non-empty string argument among keys.
    static std::optional<std::string> first_string_argument(
        const nlohmann::ordered_json& arguments,
        const std::vector<std::string>& keys);

private:
    std::unordered_map<std::string, ResourceExtractor> overrides_;
};

}  // namespace callplan::analysis
