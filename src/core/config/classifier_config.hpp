#pragma once

#include <filesystem>
#include <string>
#include <unordered_set>
#include <vector>
#include "core/errors/plan_errors.hpp"

namespace callplan::core::config {

// Tool classification tables used by the dependency rules. Every table has
// a built-in default; a config file replaces whole tables.
struct ClassifierConfig {
    std::unordered_set<std::string> write_tools = {
        "write_file", "edit_file", "delete_file", "create_file",
        "rename_file", "move_file", "apply_patch"};

    std::unordered_set<std::string> read_tools = {
        "read_file", "list_directory", "grep", "search_files"};

    // State tools are the union of the next three tables.
    std::unordered_set<std::string> directory_tools = {
        "create_directory"};

    std::unordered_set<std::string> shell_tools = {
        "execute_command", "run_command", "run_shell", "bash", "shell"};

    std::unordered_set<std::string> service_tools = {
        "manage_service", "start_service", "stop_service",
        "restart_service"};

    // Argument keys that carry the command line of a shell tool.
    std::vector<std::string> command_keys = {"command", "cmd", "script"};

    std::unordered_set<std::string> mutating_verbs = {
        "mkdir", "rm", "rmdir", "mv", "cp", "touch", "ln", "chmod", "chown",
        "tee", "git", "npm", "yarn", "pnpm", "pip", "pip3", "apt", "apt-get",
        "systemctl", "docker"};

    // When set, a call whose resource cannot be resolved is ordered after
    // every preceding write tool instead of being assumed independent.
    bool conservative_unknown_resources = false;

    bool is_write_tool(const std::string& tool_name) const {
        return write_tools.count(tool_name) > 0;
    }

    bool is_read_tool(const std::string& tool_name) const {
        return read_tools.count(tool_name) > 0;
    }

    bool is_state_tool(const std::string& tool_name) const {
        return directory_tools.count(tool_name) > 0 ||
               shell_tools.count(tool_name) > 0 ||
               service_tools.count(tool_name) > 0;
    }
};

errors::Result<ClassifierConfig> parse_classifier_config(const std::string& json_text);

errors::Result<ClassifierConfig> load_classifier_config(const std::filesystem::path& path);

}  // namespace callplan::core::config
