#include "scheduling/parallel_grouper.hpp"

#include <unordered_set>
#include <utility>
#include "core/logging/logger.hpp"

namespace callplan::scheduling {

using protocol::CallGroup;
using protocol::DependencyType;
using protocol::ToolCall;

ParallelGrouper::ParallelGrouper(analysis::DependencyGraphBuilder builder)
    : builder_(std::move(builder)) {}

void ParallelGrouper::register_extractor(const std::string& tool_name,
                                         analysis::ResourceExtractor extractor) {
    builder_.register_extractor(tool_name, std::move(extractor));
}

bool ParallelGrouper::can_parallelize(const ToolCall& earlier, const ToolCall& later) const {
    return builder_.classifier().classify(earlier, later) == DependencyType::None;
}

std::vector<CallGroup> ParallelGrouper::group(std::vector<ToolCall>& calls) const {
    builder_.analyze(calls);

    std::vector<CallGroup> groups;
    std::vector<const ToolCall*> remaining;
    remaining.reserve(calls.size());
    for (const auto& call : calls) {
        remaining.push_back(&call);
    }
    std::unordered_set<std::string> completed;

    // Each pass schedules at least one call, so calls.size() passes suffice.
    for (std::size_t pass = 0; pass < calls.size() && !remaining.empty(); ++pass) {
        CallGroup ready;
        std::vector<const ToolCall*> blocked;
        for (const ToolCall* call : remaining) {
            bool satisfied = true;
            for (const auto& dep : call->depends_on) {
                if (completed.count(dep) == 0) {
                    satisfied = false;
                    break;
                }
            }
            if (satisfied) {
                ready.push_back(call);
            } else {
                blocked.push_back(call);
            }
        }

        if (ready.empty()) {
            break;
        }
        for (const ToolCall* call : ready) {
            completed.insert(call->call_id);
        }
        groups.push_back(std::move(ready));
        remaining = std::move(blocked);
    }

    if (!remaining.empty()) {
        std::string names;
        for (const ToolCall* call : remaining) {
            names += (names.empty() ? "" : ", ") + call->tool_name;
        }
        CALLPLAN_LOG_ERROR("Dependency cycle among " + std::to_string(remaining.size()) +
                           " calls [" + names + "]; scheduling them sequentially");
        for (const ToolCall* call : remaining) {
            groups.push_back(CallGroup{call});
        }
    }

    CALLPLAN_LOG_DEBUG("Planned " + std::to_string(calls.size()) + " calls into " +
                       std::to_string(groups.size()) + " groups");
    return groups;
}

}  // namespace callplan::scheduling
