#pragma once

#include <optional>
#include <string>
#include <vector>
#include "core/config/classifier_config.hpp"
#include "protocol/tool_call.hpp"

namespace callplan::analysis {

// Inputs shared by every rule for one ordered pair (earlier, later).
struct RuleContext {
    const protocol::ToolCall& earlier;
    const protocol::ToolCall& later;
    const std::optional<std::string>& earlier_resource;
    const std::optional<std::string>& later_resource;
    const core::config::ClassifierConfig& config;
};

struct RuleMatch {
    protocol::DependencyType type = protocol::DependencyType::None;
    bool matched = false;
};

using DependencyRule = RuleMatch (*)(const RuleContext&);

// Earlier call writes a resource the later call touches.
RuleMatch write_then_access_rule(const RuleContext& ctx);

// Earlier call reads a resource the later call writes.
RuleMatch read_then_write_rule(const RuleContext& ctx);

// Earlier call changes ambient state (shell, service, new directory).
RuleMatch state_change_rule(const RuleContext& ctx);

// Later call's arguments mention the earlier call's id.
RuleMatch textual_reference_rule(const RuleContext& ctx);

// The rules above in evaluation order; the first match wins.
const std::vector<DependencyRule>& default_rules();

bool command_mutates_state(const std::string& command,
                           const core::config::ClassifierConfig& config);

bool arguments_reference(const nlohmann::ordered_json& value, const std::string& needle);

}  // namespace callplan::analysis
