#include "protocol/batch_codec.hpp"

#include <fstream>
#include <map>
#include <sstream>
#include <unordered_set>
#include <utility>

namespace callplan::protocol {

using core::errors::ErrorCategory;
using core::errors::PlanError;
using nlohmann::json;
using nlohmann::ordered_json;

namespace {

PlanError batch_error(const std::string& message, const std::string& code) {
    return PlanError{ErrorCategory::Input, message, code};
}

core::errors::Result<ToolCall> decode_call(const ordered_json& entry, const std::size_t index) {
    const std::string where = "tool call #" + std::to_string(index);
    if (!entry.is_object()) {
        return batch_error(where + " is not an object.", "invalid_tool_call");
    }

    const ordered_json* source = &entry;
    if (entry.contains("function") && entry.at("function").is_object()) {
        source = &entry.at("function");
    }

    const auto id_it = entry.find("id");
    if (id_it == entry.end() || !id_it->is_string() || id_it->get<std::string>().empty()) {
        return batch_error(where + " has no string \"id\".", "missing_call_id");
    }

    const auto name_it = source->find("name");
    if (name_it == source->end() || !name_it->is_string() ||
        name_it->get<std::string>().empty()) {
        return batch_error(where + " has no string \"name\".", "missing_tool_name");
    }

    ordered_json arguments = ordered_json::object();
    const auto args_it = source->find("arguments");
    if (args_it != source->end() && !args_it->is_null()) {
        if (args_it->is_string()) {
            try {
                arguments = ordered_json::parse(args_it->get<std::string>());
            } catch (const json::parse_error& e) {
                return batch_error(where + " has unparsable arguments: " + e.what(),
                                   "invalid_arguments");
            }
        } else {
            arguments = *args_it;
        }
        if (!arguments.is_object()) {
            return batch_error(where + " arguments must be an object.",
                               "invalid_arguments");
        }
    }

    return ToolCall(id_it->get<std::string>(), name_it->get<std::string>(),
                    std::move(arguments));
}

}  // namespace

core::errors::Result<std::vector<ToolCall>> decode_batch(const std::string& json_text) {
    ordered_json root;
    try {
        root = ordered_json::parse(json_text);
    } catch (const json::parse_error& e) {
        return batch_error(std::string("Batch is not valid JSON: ") + e.what(),
                           "batch_parse_failed");
    }

    if (root.is_object() && root.contains("tool_calls")) {
        root = root.at("tool_calls");
    }
    if (!root.is_array()) {
        return batch_error("Batch must be a JSON array of tool calls.", "invalid_batch");
    }

    std::vector<ToolCall> calls;
    calls.reserve(root.size());
    std::unordered_set<std::string> seen;
    for (std::size_t i = 0; i < root.size(); ++i) {
        auto decoded = decode_call(root.at(i), i);
        if (core::errors::is_error(decoded)) {
            return core::errors::get_error(decoded);
        }
        auto call = std::get<ToolCall>(std::move(decoded));
        if (!seen.insert(call.call_id).second) {
            return batch_error("Duplicate call id: " + call.call_id, "duplicate_call_id");
        }
        calls.push_back(std::move(call));
    }
    return calls;
}

core::errors::Result<std::vector<ToolCall>> load_batch(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return batch_error("Unable to open batch file: " + path.string(), "batch_open_failed");
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return decode_batch(buffer.str());
}

json encode_plan(const std::string& batch_id, const std::vector<CallGroup>& groups) {
    json payload;
    payload["batch_id"] = batch_id;
    payload["group_count"] = groups.size();
    payload["groups"] = json::array();
    for (const auto& group : groups) {
        json entries = json::array();
        for (const ToolCall* call : group) {
            json deps = json::array();
            for (const auto& dep : call->depends_on) {
                const auto type_it = call->dependency_types.find(dep);
                deps.push_back({{"id", dep},
                                {"type", type_it == call->dependency_types.end()
                                             ? std::string("unknown")
                                             : to_string(type_it->second)}});
            }
            entries.push_back({{"id", call->call_id},
                               {"name", call->tool_name},
                               {"depends_on", deps}});
        }
        payload["groups"].push_back(std::move(entries));
    }
    return payload;
}

json encode_graph(const DependencyMap& graph) {
    // std::map keeps the output stable across runs.
    const std::map<std::string, std::vector<std::string>> sorted(graph.begin(), graph.end());
    json payload = json::object();
    for (const auto& [id, deps] : sorted) {
        payload[id] = deps;
    }
    return payload;
}

}  // namespace callplan::protocol
