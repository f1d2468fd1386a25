#include "analysis/dependency_rules.hpp"

#include <algorithm>
#include <cctype>
#include "analysis/resource_extractor.hpp"
#include "analysis/resource_overlap.hpp"

namespace callplan::analysis {

using protocol::DependencyType;

namespace {

constexpr RuleMatch kNoMatch{DependencyType::None, false};

bool both_overlap(const RuleContext& ctx) {
    return ctx.earlier_resource.has_value() && ctx.later_resource.has_value() &&
           resources_overlap(*ctx.earlier_resource, *ctx.later_resource);
}

bool is_command_delimiter(const char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0 || c == ';' || c == '&' ||
           c == '|' || c == '(' || c == ')' || c == '`' || c == '"' || c == '\'';
}

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return value;
}

// "/usr/bin/git" -> "git"
std::string command_basename(const std::string& word) {
    const auto slash = word.find_last_of('/');
    if (slash == std::string::npos) {
        return word;
    }
    return word.substr(slash + 1);
}

}  // namespace

bool command_mutates_state(const std::string& command,
                           const core::config::ClassifierConfig& config) {
    if (command.find('>') != std::string::npos) {
        return true;
    }

    std::string word;
    auto check_word = [&config, &word]() {
        const bool hit = !word.empty() &&
                         config.mutating_verbs.count(command_basename(lowercase(word))) > 0;
        word.clear();
        return hit;
    };

    for (const char c : command) {
        if (is_command_delimiter(c)) {
            if (check_word()) {
                return true;
            }
            continue;
        }
        word.push_back(c);
    }
    return check_word();
}

bool arguments_reference(const nlohmann::ordered_json& value, const std::string& needle) {
    if (needle.empty()) {
        return false;
    }
    if (value.is_string()) {
        return value.get_ref<const std::string&>().find(needle) != std::string::npos;
    }
    if (value.is_array() || value.is_object()) {
        for (const auto& item : value) {
            if (arguments_reference(item, needle)) {
                return true;
            }
        }
        return false;
    }
    if (value.is_null()) {
        return false;
    }
    return value.dump().find(needle) != std::string::npos;
}

RuleMatch write_then_access_rule(const RuleContext& ctx) {
    if (!ctx.config.is_write_tool(ctx.earlier.tool_name)) {
        return kNoMatch;
    }
    if (both_overlap(ctx)) {
        return {DependencyType::Resource, true};
    }
    if (ctx.config.conservative_unknown_resources &&
        (!ctx.earlier_resource.has_value() || !ctx.later_resource.has_value())) {
        return {DependencyType::Resource, true};
    }
    return kNoMatch;
}

RuleMatch read_then_write_rule(const RuleContext& ctx) {
    if (ctx.config.is_read_tool(ctx.earlier.tool_name) &&
        ctx.config.is_write_tool(ctx.later.tool_name) && both_overlap(ctx)) {
        return {DependencyType::Resource, true};
    }
    return kNoMatch;
}

RuleMatch state_change_rule(const RuleContext& ctx) {
    const auto& config = ctx.config;
    const auto& tool = ctx.earlier.tool_name;
    if (!config.is_state_tool(tool)) {
        return kNoMatch;
    }

    if (config.service_tools.count(tool) > 0) {
        return {DependencyType::Order, true};
    }

    if (config.directory_tools.count(tool) > 0) {
        if (ctx.earlier_resource.has_value() && ctx.later_resource.has_value() &&
            resource_within(*ctx.earlier_resource, *ctx.later_resource)) {
            return {DependencyType::Order, true};
        }
        return kNoMatch;
    }

    const auto command =
        ResourceExtractorRegistry::first_string_argument(ctx.earlier.arguments,
                                                         config.command_keys);
    if (command.has_value() && command_mutates_state(*command, config)) {
        return {DependencyType::Order, true};
    }
    return kNoMatch;
}

RuleMatch textual_reference_rule(const RuleContext& ctx) {
    if (arguments_reference(ctx.later.arguments, ctx.earlier.call_id)) {
        return {DependencyType::Data, true};
    }
    return kNoMatch;
}

const std::vector<DependencyRule>& default_rules() {
    static const std::vector<DependencyRule> rules = {
        &write_then_access_rule,
        &read_then_write_rule,
        &state_change_rule,
        &textual_reference_rule,
    };
    return rules;
}

}  // namespace callplan::analysis
