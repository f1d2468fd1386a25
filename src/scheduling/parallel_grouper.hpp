#pragma once

#include <string>
#include <vector>
#include "analysis/dependency_graph.hpp"
#include "protocol/tool_call.hpp"

namespace callplan::scheduling {

// Splits a batch into ordered groups of calls that may run concurrently.
// Group k+1 must not start before every call of group k has finished.
class ParallelGrouper {
public:
    explicit ParallelGrouper(
        analysis::DependencyGraphBuilder builder = analysis::DependencyGraphBuilder{});

    // Runs analyze() on the batch, then peels off layers of calls whose
    // dependencies are all scheduled. If a cycle blocks progress the
    // remaining calls are emitted one per group in batch order.
    // Returned pointers refer into `calls` and stay valid while it is unmodified.
    std::vector<protocol::CallGroup> group(std::vector<protocol::ToolCall>& calls) const;

    // True when `later` need not wait for `earlier`.
    bool can_parallelize(const protocol::ToolCall& earlier,
                         const protocol::ToolCall& later) const;

    void register_extractor(const std::string& tool_name,
                            analysis::ResourceExtractor extractor);

    const analysis::DependencyGraphBuilder& builder() const { return builder_; }

private:
    analysis::DependencyGraphBuilder builder_;
};

}  // namespace callplan::scheduling
