#include "core/config/classifier_config.hpp"

#include <fstream>
#include <optional>
#include <sstream>
#include <system_error>
#include <utility>
#include <nlohmann/json.hpp>

namespace callplan::core::config {

using errors::ErrorCategory;
using errors::PlanError;
using nlohmann::json;

namespace {

PlanError invalid_field(const std::string& key, const std::string& expected) {
    return PlanError{ErrorCategory::Config,
                     "Config field '" + key + "' must be " + expected + ".",
                     "config_invalid_field"};
}

// Reads an array of strings into any container with insert(end, value).
template <typename Container>
std::optional<PlanError> read_string_list(const json& root, const std::string& key,
                                          Container& out) {
    if (!root.contains(key)) {
        return std::nullopt;
    }
    const auto& node = root.at(key);
    if (!node.is_array()) {
        return invalid_field(key, "an array of strings");
    }

    Container values;
    for (const auto& item : node) {
        if (!item.is_string()) {
            return invalid_field(key, "an array of strings");
        }
        values.insert(values.end(), item.get<std::string>());
    }
    out = std::move(values);
    return std::nullopt;
}

}  // namespace

errors::Result<ClassifierConfig> parse_classifier_config(const std::string& json_text) {
    json root;
    try {
        root = json::parse(json_text);
    } catch (const json::parse_error& e) {
        return PlanError{ErrorCategory::Config,
                         std::string("Config is not valid JSON: ") + e.what(),
                         "config_parse_failed"};
    }

    if (!root.is_object()) {
        return PlanError{ErrorCategory::Config, "Config root must be a JSON object.",
                         "config_invalid_root"};
    }

    ClassifierConfig config;
    std::optional<PlanError> err;
    if ((err = read_string_list(root, "write_tools", config.write_tools)) ||
        (err = read_string_list(root, "read_tools", config.read_tools)) ||
        (err = read_string_list(root, "directory_tools", config.directory_tools)) ||
        (err = read_string_list(root, "shell_tools", config.shell_tools)) ||
        (err = read_string_list(root, "service_tools", config.service_tools)) ||
        (err = read_string_list(root, "command_keys", config.command_keys)) ||
        (err = read_string_list(root, "mutating_verbs", config.mutating_verbs))) {
        return *err;
    }

    if (root.contains("conservative_unknown_resources")) {
        const auto& flag = root.at("conservative_unknown_resources");
        if (!flag.is_boolean()) {
            return invalid_field("conservative_unknown_resources", "a boolean");
        }
        config.conservative_unknown_resources = flag.get<bool>();
    }

    return config;
}

errors::Result<ClassifierConfig> load_classifier_config(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec) || ec) {
        return PlanError{ErrorCategory::Config,
                         "Config file not found: " + path.string(),
                         "config_not_found",
                         "Pass an existing JSON file to --config."};
    }

    std::ifstream in(path);
    if (!in.is_open()) {
        return PlanError{ErrorCategory::Config,
                         "Unable to open config file: " + path.string(),
                         "config_open_failed"};
    }

    std::stringstream buffer;
    buffer << in.rdbuf();
    return parse_classifier_config(buffer.str());
}

}  // namespace callplan::core::config
