#include "analysis/dependency_classifier.hpp"

#include <utility>

namespace callplan::analysis {

using protocol::DependencyType;
using protocol::ToolCall;

DependencyClassifier::DependencyClassifier(core::config::ClassifierConfig config,
                                           ResourceExtractorRegistry extractors)
    : config_(std::move(config)), extractors_(std::move(extractors)) {}

void DependencyClassifier::register_extractor(const std::string& tool_name,
                                              ResourceExtractor extractor) {
    extractors_.register_extractor(tool_name, std::move(extractor));
}

DependencyType DependencyClassifier::classify(const ToolCall& earlier,
                                              const ToolCall& later) const {
    const auto earlier_resource = extractors_.extract(earlier);
    const auto later_resource = extractors_.extract(later);
    const RuleContext ctx{earlier, later, earlier_resource, later_resource, config_};

    for (const auto rule : default_rules()) {
        const RuleMatch match = rule(ctx);
        if (match.matched) {
            return match.type;
        }
    }
    return DependencyType::None;
}

}  // namespace callplan::analysis
