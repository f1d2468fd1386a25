#pragma once

#include <string>
#include <vector>
#include "analysis/dependency_rules.hpp"
#include "analysis/resource_extractor.hpp"
#include "core/config/classifier_config.hpp"
#include "protocol/tool_call.hpp"

namespace callplan::analysis {

// Decides whether a later call must wait for an earlier one. Owns the
// classification tables and the extractor registry used for that decision.
class DependencyClassifier {
public:
    explicit DependencyClassifier(core::config::ClassifierConfig config = {},
                                  ResourceExtractorRegistry extractors = {});

    // `earlier` precedes `later` in the batch. Evaluates default_rules() in
    // order and returns the type of the first rule that matches.
    protocol::DependencyType classify(const protocol::ToolCall& earlier,
                                      const protocol::ToolCall& later) const;

    void register_extractor(const std::string& tool_name, ResourceExtractor extractor);

    const core::config::ClassifierConfig& config() const { return config_; }
    const ResourceExtractorRegistry& extractors() const { return extractors_; }

private:
    core::config::ClassifierConfig config_;
    ResourceExtractorRegistry extractors_;
};

}  // namespace callplan::analysis
