#pragma once

#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/plan_errors.hpp"

namespace callplan::session {

// Persists encoded plans as <output_dir>/<batch_id>.json.
class PlanWriter {
public:
    explicit PlanWriter(std::filesystem::path output_dir);

    core::errors::Result<std::filesystem::path> write_plan(
        const std::string& batch_id, const nlohmann::json& plan) const;

    core::errors::Result<std::filesystem::path> plan_path(
        const std::string& batch_id) const;

private:
    std::filesystem::path output_dir_;
};

}  // namespace callplan::session
