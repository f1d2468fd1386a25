#include "analysis/dependency_graph.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace callplan::analysis {

using protocol::DependencyMap;
using protocol::DependencyType;
using protocol::ToolCall;

DependencyGraphBuilder::DependencyGraphBuilder(DependencyClassifier classifier)
    : classifier_(std::move(classifier)) {}

void DependencyGraphBuilder::register_extractor(const std::string& tool_name,
                                                ResourceExtractor extractor) {
    classifier_.register_extractor(tool_name, std::move(extractor));
}

DependencyMap DependencyGraphBuilder::analyze(std::vector<ToolCall>& calls) const {
    for (std::size_t j = 1; j < calls.size(); ++j) {
        for (std::size_t i = 0; i < j; ++i) {
            const DependencyType type = classifier_.classify(calls[i], calls[j]);
            if (type == DependencyType::None) {
                continue;
            }
            if (calls[j].add_dependency(calls[i].call_id, type)) {
                CALLPLAN_LOG_DEBUG(calls[j].call_id + " (" + calls[j].tool_name +
                                   ") depends on " + calls[i].call_id + " (" +
                                   calls[i].tool_name + "): " + protocol::to_string(type));
            }
        }
    }

    DependencyMap graph;
    for (const auto& call : calls) {
        graph[call.call_id] = call.depends_on;
    }
    return graph;
}

}  // namespace callplan::analysis
