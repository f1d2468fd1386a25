#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "app/cli_parser.hpp"
#include "core/config/batch_id.hpp"
#include "core/errors/plan_errors.hpp"

namespace {

using callplan::app::cli::parse_and_validate;
using callplan::core::errors::ErrorCategory;
using callplan::core::errors::get_error;
using callplan::core::errors::get_value;
using callplan::core::errors::is_error;
using callplan::protocol::PlanRequest;

callplan::core::errors::Result<PlanRequest> parse_tokens(
    const std::vector<std::string>& tokens) {
    std::vector<std::string> owned_args;
    owned_args.reserve(tokens.size() + 1);
    owned_args.emplace_back("callplan");
    for (const auto& token : tokens) {
        owned_args.push_back(token);
    }

    std::vector<char*> argv;
    argv.reserve(owned_args.size());
    for (auto& arg : owned_args) {
        argv.push_back(arg.data());
    }

    return parse_and_validate(static_cast<int>(argv.size()), argv.data());
}

class TempFile {
public:
    explicit TempFile(const std::string& contents) {
        path_ = std::filesystem::current_path() /
                (".tmp_cli_" + callplan::core::config::generate_batch_id() + ".json");
        std::ofstream out(path_);
        out << contents;
    }

    ~TempFile() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    std::string str() const { return path_.string(); }

private:
    std::filesystem::path path_;
};

TEST(CliParserTest, FailsWhenCommandMissing) {
    auto result = parse_tokens({});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Input);
    EXPECT_EQ(get_error(result).code, "missing_command");
}

TEST(CliParserTest, FailsWhenCommandUnknown) {
    auto result = parse_tokens({"run"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_command");
}

TEST(CliParserTest, FailsWhenBatchMissing) {
    auto result = parse_tokens({"plan"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_required_flag");
}

TEST(CliParserTest, FailsWhenFlagHasNoValue) {
    auto result = parse_tokens({"plan", "--batch"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_value");
}

TEST(CliParserTest, FailsOnUnknownArgument) {
    auto result = parse_tokens({"plan", "--parallel"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_argument");
}

TEST(CliParserTest, FailsWhenBatchFileMissing) {
    const auto missing =
        std::filesystem::current_path() / "__definitely_missing_cli_batch__.json";
    auto result = parse_tokens({"plan", "--batch", missing.string()});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_path");
}

TEST(CliParserTest, FailsWhenConfigFileMissing) {
    TempFile batch("[]");
    auto result = parse_tokens(
        {"plan", "--batch", batch.str(), "--config", "__missing_config__.json"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_path");
}

TEST(CliParserTest, FailsWhenOutputDirIsAFile) {
    TempFile batch("[]");
    auto result = parse_tokens({"plan", "--batch", batch.str(), "--output-dir", batch.str()});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_path");
}

TEST(CliParserTest, ParsesValidPlanRequest) {
    TempFile batch("[]");
    TempFile config("{}");
    auto result = parse_tokens({"plan", "--batch", batch.str(), "--config", config.str(),
                                "--output-dir", "plans", "--verbose"});
    ASSERT_FALSE(is_error(result));

    const auto& req = get_value(result);
    EXPECT_EQ(req.batch_file.string(), batch.str());
    ASSERT_TRUE(req.config_file.has_value());
    EXPECT_EQ(req.config_file->string(), config.str());
    ASSERT_TRUE(req.output_dir.has_value());
    EXPECT_EQ(req.output_dir->string(), "plans");
    EXPECT_TRUE(req.verbose);
}

TEST(CliParserTest, OptionalFlagsDefaultToUnset) {
    TempFile batch("[]");
    auto result = parse_tokens({"plan", "--batch", batch.str()});
    ASSERT_FALSE(is_error(result));

    const auto& req = get_value(result);
    EXPECT_FALSE(req.config_file.has_value());
    EXPECT_FALSE(req.output_dir.has_value());
    EXPECT_FALSE(req.verbose);
}

}  // namespace
