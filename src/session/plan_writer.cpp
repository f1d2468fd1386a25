#include "session/plan_writer.hpp"

#include <fstream>
#include <system_error>
#include <utility>

namespace callplan::session {

using core::errors::ErrorCategory;
using core::errors::PlanError;

PlanWriter::PlanWriter(std::filesystem::path output_dir)
    : output_dir_(std::move(output_dir)) {}

core::errors::Result<std::filesystem::path> PlanWriter::plan_path(
    const std::string& batch_id) const {
    if (batch_id.empty()) {
        return PlanError{ErrorCategory::Input, "Batch ID cannot be empty.",
                         "invalid_batch_id"};
    }
    if (batch_id.find('/') != std::string::npos ||
        batch_id.find('\\') != std::string::npos) {
        return PlanError{ErrorCategory::Input,
                         "Batch ID must not contain path separators: " + batch_id,
                         "invalid_batch_id"};
    }

    std::error_code ec;
    std::filesystem::create_directories(output_dir_, ec);
    if (ec) {
        return PlanError{ErrorCategory::Internal,
                         "Unable to create output directory: " + output_dir_.string(),
                         "output_dir_create_failed"};
    }
    if (!std::filesystem::is_directory(output_dir_, ec) || ec) {
        return PlanError{ErrorCategory::Input,
                         "Output path is not a directory: " + output_dir_.string(),
                         "invalid_output_dir"};
    }

    return output_dir_ / (batch_id + ".json");
}

core::errors::Result<std::filesystem::path> PlanWriter::write_plan(
    const std::string& batch_id, const nlohmann::json& plan) const {
    auto path_result = plan_path(batch_id);
    if (core::errors::is_error(path_result)) {
        return core::errors::get_error(path_result);
    }
    const auto path = core::errors::get_value(path_result);

    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        return PlanError{ErrorCategory::Internal,
                         "Unable to open plan file: " + path.string(),
                         "plan_open_failed"};
    }

    out << plan.dump(2) << "\n";
    if (!out.good()) {
        return PlanError{ErrorCategory::Internal,
                         "Unable to write plan file: " + path.string(),
                         "plan_write_failed"};
    }

    return path;
}

}  // namespace callplan::session
