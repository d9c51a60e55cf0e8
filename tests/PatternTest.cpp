/**
 * @file PatternTest.cpp
 * @brief Pattern construction and geometric transforms.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include <gtest/gtest.h>

#include "ArcadeConfig.h"
#include "Pattern.h"

namespace {

Pattern lShape() {
    return Pattern::fromRows("L", {
        "O..",
        "OOO",
    }, 1, PatternCategory::StillLife);
}

} // namespace

TEST(PatternTest, FromRowsReadsAliveGlyphs) {
    Pattern p = Pattern::fromRows("MIX", {"O*1", ".x0"}, 3, PatternCategory::Oscillator, SizeClass::Tiny);
    EXPECT_EQ(p.name(), "MIX");
    EXPECT_EQ(p.width(), 3);
    EXPECT_EQ(p.height(), 2);
    EXPECT_EQ(p.period(), 3);
    EXPECT_EQ(p.category(), PatternCategory::Oscillator);
    EXPECT_EQ(p.sizeClass(), SizeClass::Tiny);
    EXPECT_EQ(p.liveCount(), 3);
    EXPECT_TRUE(p.cell(0, 0));
    EXPECT_TRUE(p.cell(2, 0));
    EXPECT_FALSE(p.cell(1, 1));
}

TEST(PatternTest, CellOutsideMatrixIsDead) {
    Pattern p = lShape();
    EXPECT_FALSE(p.cell(-1, 0));
    EXPECT_FALSE(p.cell(3, 1));
    EXPECT_FALSE(p.cell(0, 2));
}

TEST(PatternTest, RejectsMalformedInput) {
    EXPECT_THROW(Pattern("E", 0, 3, {}, 1, PatternCategory::StillLife), ConfigError);
    EXPECT_THROW(Pattern("S", 2, 2, {1, 0, 1}, 1, PatternCategory::StillLife), ConfigError);
    EXPECT_THROW(Pattern("P", 1, 1, {1}, 0, PatternCategory::StillLife), ConfigError);
    EXPECT_THROW(Pattern::fromRows("R", {"OO", "O"}, 1, PatternCategory::StillLife), ConfigError);
    EXPECT_THROW(Pattern::fromRows("N", {}, 1, PatternCategory::StillLife), ConfigError);
}

TEST(PatternTest, Rotate90IsClockwise) {
    Pattern r = rotate90(lShape());
    EXPECT_EQ(r.width(), 2);
    EXPECT_EQ(r.height(), 3);
    Pattern expected = Pattern::fromRows("L", {
        "OO",
        "O.",
        "O.",
    }, 1, PatternCategory::StillLife);
    EXPECT_TRUE(r.sameCells(expected));
    EXPECT_EQ(r.name(), "L");
}

TEST(PatternTest, FourRotationsAreIdentity) {
    Pattern p = lShape();
    Pattern r = rotate90(rotate90(rotate90(rotate90(p))));
    EXPECT_TRUE(r.sameCells(p));
}

TEST(PatternTest, FlipsMirrorRowsAndColumns) {
    Pattern h = flipHorizontal(lShape());
    EXPECT_TRUE(h.sameCells(Pattern::fromRows("x", {"..O", "OOO"}, 1, PatternCategory::StillLife)));
    Pattern v = flipVertical(lShape());
    EXPECT_TRUE(v.sameCells(Pattern::fromRows("x", {"OOO", "O.."}, 1, PatternCategory::StillLife)));
    EXPECT_TRUE(flipHorizontal(h).sameCells(lShape()));
}

TEST(PatternTest, WithNameKeepsCellsAndMetadata) {
    Pattern p = Pattern::fromRows("A", {"OO"}, 2, PatternCategory::Oscillator, SizeClass::Large);
    Pattern q = p.withName("B");
    EXPECT_EQ(q.name(), "B");
    EXPECT_TRUE(q.sameCells(p));
    EXPECT_EQ(q.period(), 2);
    EXPECT_EQ(q.sizeClass(), SizeClass::Large);
}

TEST(PatternTest, EnumNames) {
    EXPECT_STREQ(categoryName(PatternCategory::StillLife), "still-life");
    EXPECT_STREQ(categoryName(PatternCategory::Methuselah), "methuselah");
    EXPECT_STREQ(sizeClassName(SizeClass::Medium), "medium");
}
