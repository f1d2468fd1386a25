#pragma once

#include <string>
#include <vector>
#include "analysis/dependency_classifier.hpp"
#include "protocol/tool_call.hpp"

namespace callplan::analysis {

class DependencyGraphBuilder {
public:
    explicit DependencyGraphBuilder(DependencyClassifier classifier = DependencyClassifier{});

    // Classifies every pair (i, j) with i < j and records each detected edge
    // on calls[j] in place. Edges already present are kept and never
    // duplicated, so repeated calls on the same batch are safe.
    protocol::DependencyMap analyze(std::vector<protocol::ToolCall>& calls) const;

    void register_extractor(const std::string& tool_name, ResourceExtractor extractor);

    const DependencyClassifier& classifier() const { return classifier_; }

private:
    DependencyClassifier classifier_;
};

}  // namespace callplan::analysis
