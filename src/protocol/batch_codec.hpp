#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/plan_errors.hpp"
#include "protocol/tool_call.hpp"

namespace callplan::protocol {

// Accepts a JSON array of tool calls, or an object holding one under
// "tool_calls". Each entry is {"id", "name", "arguments"} or the
// {"id", "function": {"name", "arguments"}} shape; "arguments" may be an
// object or a JSON-encoded string. Duplicate ids are rejected.
core::errors::Result<std::vector<ToolCall>> decode_batch(const std::string& json_text);

core::errors::Result<std::vector<ToolCall>> load_batch(const std::filesystem::path& path);

nlohmann::json encode_plan(const std::string& batch_id,
                           const std::vector<CallGroup>& groups);

nlohmann::json encode_graph(const DependencyMap& graph);

}  // namespace callplan::protocol
