#include <iostream>
#include <string>
#include <vector>
#include "app/cli_parser.hpp"
#include "core/config/batch_id.hpp"
#include "core/config/classifier_config.hpp"
#include "core/errors/plan_errors.hpp"
#include "core/logging/logger.hpp"
#include "protocol/batch_codec.hpp"
#include "protocol/tool_call.hpp"
#include "scheduling/parallel_grouper.hpp"
#include "session/plan_writer.hpp"

int main(int argc, char* argv[]) {
    // 1. Tag every log line of this invocation with a batch ID
    const std::string batch_id = callplan::core::config::generate_batch_id();
    callplan::core::logging::Logger::get().set_batch_id(batch_id);

    // 2. Parse CLI input and return normalized input errors
    auto parsed = callplan::app::cli::parse_and_validate(argc, argv);
    if (callplan::core::errors::is_error(parsed)) {
        const auto& err = callplan::core::errors::get_error(parsed);
        CALLPLAN_LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            CALLPLAN_LOG_INFO("Hint: " + err.hint);
        }
        return 2;
    }
    const auto& req = callplan::core::errors::get_value(parsed);
    if (req.verbose) {
        callplan::core::logging::Logger::get().set_min_level(
            callplan::core::logging::LogLevel::DEBUG);
    }

    // 3. Classification tables: built-in defaults unless a config file is given
    callplan::core::config::ClassifierConfig config;
    if (req.config_file.has_value()) {
        auto loaded = callplan::core::config::load_classifier_config(req.config_file.value());
        if (callplan::core::errors::is_error(loaded)) {
            const auto& err = callplan::core::errors::get_error(loaded);
            CALLPLAN_LOG_ERROR("Config error [" + err.code + "]: " + err.message);
            return 3;
        }
        config = callplan::core::errors::get_value(loaded);
        CALLPLAN_LOG_DEBUG("Loaded classifier config from " + req.config_file->string());
    }

    auto batch_result = callplan::protocol::load_batch(req.batch_file);
    if (callplan::core::errors::is_error(batch_result)) {
        const auto& err = callplan::core::errors::get_error(batch_result);
        CALLPLAN_LOG_ERROR("Batch error [" + err.code + "]: " + err.message);
        return 4;
    }
    std::vector<callplan::protocol::ToolCall> calls =
        callplan::core::errors::get_value(batch_result);
    CALLPLAN_LOG_INFO("Planning " + std::to_string(calls.size()) + " tool calls");

    // 4. Analyze and group
    callplan::scheduling::ParallelGrouper grouper{callplan::analysis::DependencyGraphBuilder{
        callplan::analysis::DependencyClassifier{config}}};
    const auto groups = grouper.group(calls);
    const auto graph = grouper.builder().analyze(calls);

    auto plan = callplan::protocol::encode_plan(batch_id, groups);
    plan["edges"] = callplan::protocol::encode_graph(graph);
    std::cout << plan.dump(2) << std::endl;

    if (req.output_dir.has_value()) {
        callplan::session::PlanWriter writer(req.output_dir.value());
        auto written = writer.write_plan(batch_id, plan);
        if (callplan::core::errors::is_error(written)) {
            const auto& err = callplan::core::errors::get_error(written);
            CALLPLAN_LOG_ERROR("Failed to write plan [" + err.code + "]: " + err.message);
            return 6;
        }
        CALLPLAN_LOG_INFO("Plan written to " + callplan::core::errors::get_value(written).string());
    }

    CALLPLAN_LOG_INFO("Planned " + std::to_string(calls.size()) + " calls into " +
                      std::to_string(groups.size()) + " groups");
    return 0;
}
