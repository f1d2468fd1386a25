#include <filesystem>
#include <fstream>
#include <string>
#include <gtest/gtest.h>
#include "core/config/batch_id.hpp"
#include "core/config/classifier_config.hpp"
#include "core/errors/plan_errors.hpp"

namespace {

using callplan::core::config::ClassifierConfig;
using callplan::core::config::load_classifier_config;
using callplan::core::config::parse_classifier_config;
using callplan::core::errors::ErrorCategory;
using callplan::core::errors::get_error;
using callplan::core::errors::get_value;
using callplan::core::errors::is_error;

TEST(ClassifierConfigTest, DefaultsClassifyBuiltinTools) {
    ClassifierConfig config;
    EXPECT_TRUE(config.is_write_tool("edit_file"));
    EXPECT_TRUE(config.is_read_tool("read_file"));
    EXPECT_TRUE(config.is_state_tool("create_directory"));
    EXPECT_TRUE(config.is_state_tool("execute_command"));
    EXPECT_TRUE(config.is_state_tool("restart_service"));
    EXPECT_FALSE(config.is_write_tool("create_directory"));
    EXPECT_FALSE(config.is_state_tool("read_file"));
    EXPECT_FALSE(config.conservative_unknown_resources);
}

TEST(ClassifierConfigTest, EmptyObjectKeepsDefaults) {
    auto result = parse_classifier_config("{}");
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).write_tools, ClassifierConfig{}.write_tools);
}

TEST(ClassifierConfigTest, ReplacesListedTables) {
    auto result = parse_classifier_config(R"({
        "write_tools": ["kv_set", "kv_delete"],
        "mutating_verbs": ["terraform"],
        "conservative_unknown_resources": true,
        "unrelated": 7
    })");
    ASSERT_FALSE(is_error(result));

    const auto& config = get_value(result);
    EXPECT_TRUE(config.is_write_tool("kv_set"));
    EXPECT_FALSE(config.is_write_tool("write_file"));
    EXPECT_EQ(config.mutating_verbs.size(), 1u);
    EXPECT_TRUE(config.conservative_unknown_resources);
    EXPECT_TRUE(config.is_read_tool("read_file"));
}

TEST(ClassifierConfigTest, RejectsInvalidJson) {
    auto result = parse_classifier_config("{ not json");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Config);
    EXPECT_EQ(get_error(result).code, "config_parse_failed");
}

TEST(ClassifierConfigTest, RejectsNonObjectRoot) {
    auto result = parse_classifier_config("[]");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "config_invalid_root");
}

TEST(ClassifierConfigTest, RejectsWrongFieldTypes) {
    auto not_array = parse_classifier_config(R"({"read_tools": "read_file"})");
    ASSERT_TRUE(is_error(not_array));
    EXPECT_EQ(get_error(not_array).code, "config_invalid_field");

    auto not_string = parse_classifier_config(R"({"command_keys": ["cmd", 3]})");
    ASSERT_TRUE(is_error(not_string));
    EXPECT_EQ(get_error(not_string).code, "config_invalid_field");

    auto not_bool = parse_classifier_config(R"({"conservative_unknown_resources": "yes"})");
    ASSERT_TRUE(is_error(not_bool));
    EXPECT_EQ(get_error(not_bool).code, "config_invalid_field");
}

TEST(ClassifierConfigTest, LoadsFromFile) {
    const auto path = std::filesystem::current_path() /
                      (".tmp_config_" + callplan::core::config::generate_batch_id() + ".json");
    {
        std::ofstream out(path);
        out << R"({"shell_tools": ["sh"]})";
    }

    auto result = load_classifier_config(path);
    std::error_code ec;
    std::filesystem::remove(path, ec);

    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(get_value(result).is_state_tool("sh"));
    EXPECT_FALSE(get_value(result).is_state_tool("bash"));
}

TEST(ClassifierConfigTest, MissingFileIsConfigError) {
    auto result = load_classifier_config("__missing_classifier_config__.json");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Config);
    EXPECT_EQ(get_error(result).code, "config_not_found");
    EXPECT_FALSE(get_error(result).hint.empty());
}

}  // namespace
