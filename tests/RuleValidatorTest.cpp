/**
 * @file RuleValidatorTest.cpp
 * @brief Runtime B3/S23 self-check.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include <gtest/gtest.h>

#include "RuleValidator.h"

TEST(RuleValidatorTest, PassesOnCorrectEngineAndLeavesItEmpty) {
    GridSimulationEngine e(10, 10);
    e.randomSeed(0.5);
    ValidationResult r = validateRuntime(e);
    EXPECT_TRUE(r.valid) << r.error;
    EXPECT_TRUE(r.error.empty());
    EXPECT_EQ(e.countAliveCells(), 0);
    EXPECT_EQ(e.generation(), 0u);
}

TEST(RuleValidatorTest, RejectsGridTooSmall) {
    GridSimulationEngine e(6, 10);
    ValidationResult r = validateRuntime(e);
    EXPECT_FALSE(r.valid);
    EXPECT_FALSE(r.error.empty());
}
