#include "cli_parser.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace callplan::app::cli {

    using namespace callplan::core::errors;
    using callplan::protocol::PlanRequest;

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> batch;
        std::optional<std::string> config;
        std::optional<std::string> output_dir;
        bool verbose = false;
    };

    namespace {

    std::optional<PlanError> require_file(const std::string& flag, const std::string& value) {
        std::error_code ec;
        const bool is_file = std::filesystem::is_regular_file(value, ec);
        if (ec || !is_file) {
            return PlanError{ErrorCategory::Input, flag + " file does not exist: " + value, "invalid_path"};
        }
        return std::nullopt;
    }

    } // namespace

    Result<PlanRequest> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return PlanError{ErrorCategory::Input, "No command provided.", "missing_command", "Usage: callplan plan --batch calls.json"};
        }

        std::string command = argv[1];
        if (command != "plan") {
            return PlanError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command", "Currently only the 'plan' command is supported."};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Start at 2 to skip program name and 'plan' command
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--batch") {
                if (i + 1 < args.size()) raw.batch = args[++i];
                else return PlanError{ErrorCategory::Input, "Missing value for --batch", "missing_value"};
            } else if (args[i] == "--config") {
                if (i + 1 < args.size()) raw.config = args[++i];
                else return PlanError{ErrorCategory::Input, "Missing value for --config", "missing_value"};
            } else if (args[i] == "--output-dir") {
                if (i + 1 < args.size()) raw.output_dir = args[++i];
                else return PlanError{ErrorCategory::Input, "Missing value for --output-dir", "missing_value"};
            } else if (args[i] == "--verbose") {
                raw.verbose = true;
            } else {
                return PlanError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument"};
            }
        }

        // 3. Validator Phase
        PlanRequest req;
        req.verbose = raw.verbose;

        if (!raw.batch.has_value()) {
            return PlanError{ErrorCategory::Input, "Must provide --batch", "missing_required_flag", "Pass a JSON file holding the tool-call batch."};
        }
        if (auto err = require_file("--batch", raw.batch.value())) {
            return *err;
        }
        req.batch_file = std::filesystem::path(raw.batch.value());

        if (raw.config) {
            if (auto err = require_file("--config", raw.config.value())) {
                return *err;
            }
            req.config_file = std::filesystem::path(raw.config.value());
        }

        if (raw.output_dir) {
            std::error_code ec;
            const bool exists = std::filesystem::exists(raw.output_dir.value(), ec);
            if (!ec && exists && !std::filesystem::is_directory(raw.output_dir.value(), ec)) {
                return PlanError{ErrorCategory::Input, "--output-dir exists but is not a directory", "invalid_path"};
            }
            req.output_dir = std::filesystem::path(raw.output_dir.value());
        }

        return req;
    }

} // namespace callplan::app::cli
