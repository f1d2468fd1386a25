#pragma once
#include <filesystem>
#include <optional>

namespace callplan::protocol {

    // Validated CLI input for a single planning run
    struct PlanRequest {
        std::filesystem::path batch_file;
        std::optional<std::filesystem::path> config_file;
        std::optional<std::filesystem::path> output_dir;
        bool verbose = false;
    };

} // namespace callplan::protocol
