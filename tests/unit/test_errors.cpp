#include <gtest/gtest.h>
#include "core/errors/plan_errors.hpp"

using namespace callplan::core::errors;

// A dummy function to simulate a batch that fails to load
Result<std::string> simulate_load_batch(bool should_fail) {
    if (should_fail) {
        return PlanError{ErrorCategory::Input, "Batch file not found"};
    }
    return std::string("[]");
}

TEST(ErrorModelTest, HandlesSuccess) {
    auto result = simulate_load_batch(false);

    EXPECT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), "[]");
}

TEST(ErrorModelTest, HandlesFailure) {
    auto result = simulate_load_batch(true);

    EXPECT_TRUE(is_error(result));

    auto error = get_error(result);
    EXPECT_EQ(error.category, ErrorCategory::Input);
    EXPECT_EQ(error.message, "Batch file not found");
    EXPECT_EQ(error.code, "unknown_error");
}

TEST(ErrorModelTest, NamesCategories) {
    EXPECT_EQ(to_string(ErrorCategory::Input), "input");
    EXPECT_EQ(to_string(ErrorCategory::Config), "config");
    EXPECT_EQ(to_string(ErrorCategory::Internal), "internal");
}
