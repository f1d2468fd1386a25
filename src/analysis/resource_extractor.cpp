#include "analysis/resource_extractor.hpp"

#include <algorithm>
#include <utility>

namespace callplan::analysis {

namespace {

const std::vector<std::string>& file_keys() {
    static const std::vector<std::string> keys = {"path", "file_path", "filepath",
                                                  "filename", "target"};
    return keys;
}

const std::vector<std::string>& rename_keys() {
    static const std::vector<std::string> keys = {"source", "src", "old_path",
                                                  "from", "path", "file_path"};
    return keys;
}

const std::vector<std::string>& directory_keys() {
    static const std::vector<std::string> keys = {"path", "directory", "dir_path",
                                                  "dir", "folder"};
    return keys;
}

const std::vector<std::string>& search_keys() {
    static const std::vector<std::string> keys = {"path", "directory", "scope",
                                                  "dir_path", "root"};
    return keys;
}

ResourceExtractor keyed_extractor(const std::vector<std::string>& keys) {
    return [&keys](const nlohmann::ordered_json& arguments) {
        return ResourceExtractorRegistry::first_string_argument(arguments, keys);
    };
}

const std::unordered_map<std::string, ResourceExtractor>& builtin_extractors() {
    static const std::unordered_map<std::string, ResourceExtractor> table = {
        {"read_file", keyed_extractor(file_keys())},
        {"write_file", keyed_extractor(file_keys())},
        {"edit_file", keyed_extractor(file_keys())},
        {"delete_file", keyed_extractor(file_keys())},
        {"create_file", keyed_extractor(file_keys())},
        {"rename_file", keyed_extractor(rename_keys())},
        {"move_file", keyed_extractor(rename_keys())},
        {"list_directory", keyed_extractor(directory_keys())},
        {"create_directory", keyed_extractor(directory_keys())},
        {"grep", keyed_extractor(search_keys())},
        {"search_files", keyed_extractor(search_keys())},
    };
    return table;
}

}  // namespace

std::optional<std::string> ResourceExtractorRegistry::first_string_argument(
    const nlohmann::ordered_json& arguments, const std::vector<std::string>& keys) {
    if (!arguments.is_object()) {
        return std::nullopt;
    }
    for (const auto& key : keys) {
        const auto it = arguments.find(key);
        if (it == arguments.end() || !it->is_string()) {
            continue;
        }
        auto value = it->get<std::string>();
        if (!value.empty()) {
            return value;
        }
    }
    return std::nullopt;
}

void ResourceExtractorRegistry::register_extractor(const std::string& tool_name,
                                                   ResourceExtractor extractor) {
    overrides_[tool_name] = std::move(extractor);
}

bool ResourceExtractorRegistry::has_extractor(const std::string& tool_name) const {
    return overrides_.count(tool_name) > 0 || builtin_extractors().count(tool_name) > 0;
}

std::optional<std::string> ResourceExtractorRegistry::extract(
    const protocol::ToolCall& call) const {
    const ResourceExtractor* extractor = nullptr;
    if (const auto it = overrides_.find(call.tool_name); it != overrides_.end()) {
        extractor = &it->second;
    } else if (const auto builtin = builtin_extractors().find(call.tool_name);
               builtin != builtin_extractors().end()) {
        extractor = &builtin->second;
    }

    if (extractor == nullptr || !*extractor) {
        return std::nullopt;
    }

    auto resource = (*extractor)(call.arguments);
    if (!resource.has_value() || resource->empty()) {
        return std::nullopt;
    }
    return resource;
}

std::vector<std::string> ResourceExtractorRegistry::list_builtin_tools() const {
    std::vector<std::string> names;
    names.reserve(builtin_extractors().size());
    for (const auto& [name, _] : builtin_extractors()) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

}  // namespace callplan::analysis
