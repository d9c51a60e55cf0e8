/**
 * @file LoopPatternTest.cpp
 * @brief Period resets of loop-mode entities and runtime speed changes.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include <gtest/gtest.h>

#include <random>
#include <string>

#include "LoopPattern.h"

namespace {

RenderedEntity makeLoop(const std::string& name, double fps) {
    std::mt19937 rng(11);
    RendererConfig c = RendererConfig::loopPattern(name, fps);
    c.verbosity = Verbosity::Quiet;
    return createPatternRenderer(c, rng);
}

} // namespace

TEST(LoopPatternTest, BlinkerResetsEveryTwoGenerations) {
    RenderedEntity r = makeLoop("BLINKER", 10.0);
    const auto initial = r.engine.snapshot();

    r.engine.update();
    EXPECT_FALSE(updateLoopPattern(r));
    EXPECT_EQ(r.loop->resetCounter, 1);
    EXPECT_NE(r.engine.snapshot(), initial);

    r.engine.update();
    EXPECT_TRUE(updateLoopPattern(r));
    EXPECT_EQ(r.engine.snapshot(), initial);
    EXPECT_EQ(r.engine.generation(), 0u);
    EXPECT_EQ(r.loop->resetCounter, 0);
    EXPECT_EQ(r.loop->lastGeneration, 0u);
    EXPECT_EQ(r.loop->resets, 1u);
}

TEST(LoopPatternTest, GliderReturnsToItsStartEveryPeriod) {
    // The glider drifts toward the grid edge; only the reset brings it back.
    RenderedEntity r = makeLoop("GLIDER", 10.0);
    const auto initial = r.engine.snapshot();
    for (int cycle = 0; cycle < 3; ++cycle) {
        for (int g = 0; g < 3; ++g) {
            r.engine.update();
            EXPECT_FALSE(updateLoopPattern(r));
        }
        r.engine.update();
        EXPECT_TRUE(updateLoopPattern(r));
        EXPECT_EQ(r.engine.snapshot(), initial) << "cycle " << cycle;
    }
    EXPECT_EQ(r.loop->resets, 3u);
}

TEST(LoopPatternTest, NoGenerationMeansNoCount) {
    RenderedEntity r = makeLoop("BLINKER", 10.0);
    for (int i = 0; i < 10; ++i) EXPECT_FALSE(updateLoopPattern(r));
    EXPECT_EQ(r.loop->resetCounter, 0);
}

TEST(LoopPatternTest, ResetsAreExactUnderFractionalThrottle) {
    // 25 fps is 2.4 host frames per generation: 24 frames give 10 generations, 5 blinker periods.
    RenderedEntity r = makeLoop("BLINKER", 25.0);
    const auto initial = r.engine.snapshot();
    int resets = 0;
    for (int frame = 0; frame < 24; ++frame) {
        r.engine.updateThrottled();
        if (updateLoopPattern(r)) ++resets;
    }
    EXPECT_EQ(resets, 5);
    EXPECT_EQ(r.engine.snapshot(), initial);
}

TEST(LoopPatternTest, ResetsAreExactAtHostRate) {
    RenderedEntity r = makeLoop("GLIDER", 60.0);
    const auto initial = r.engine.snapshot();
    for (int frame = 0; frame < 8; ++frame) {
        ASSERT_TRUE(r.engine.updateThrottled());
        updateLoopPattern(r);
    }
    EXPECT_EQ(r.loop->resets, 2u);
    EXPECT_EQ(r.engine.snapshot(), initial);
}

TEST(LoopPatternTest, ExternalClearResyncsCounter) {
    RenderedEntity r = makeLoop("GLIDER", 10.0);
    r.engine.update();
    r.engine.update();
    EXPECT_FALSE(updateLoopPattern(r));
    EXPECT_EQ(r.loop->resetCounter, 2);

    r.engine.clearGrid();
    EXPECT_FALSE(updateLoopPattern(r));
    EXPECT_EQ(r.loop->resetCounter, 0);
    EXPECT_EQ(r.loop->lastGeneration, 0u);
}

TEST(LoopPatternTest, ResetLoopPatternRestoresImmediately) {
    RenderedEntity r = makeLoop("PULSAR", 10.0);
    const auto initial = r.engine.snapshot();
    r.engine.update();
    resetLoopPattern(r);
    EXPECT_EQ(r.engine.snapshot(), initial);
    EXPECT_EQ(r.loop->resets, 1u);
}

TEST(LoopPatternTest, SpeedChangeIsClampedAndApplied) {
    RenderedEntity r = makeLoop("BLINKER", 10.0);
    updateLoopPattern(r, 30.0);
    EXPECT_DOUBLE_EQ(r.engine.updateRateFPS(), 30.0);
    EXPECT_DOUBLE_EQ(r.engine.framesPerUpdate(), 2.0);

    updateLoopPattern(r, 500.0);
    EXPECT_DOUBLE_EQ(r.engine.updateRateFPS(), arcade_config::MaxLoopUpdateRate);

    updateLoopPattern(r, 0.0);
    EXPECT_DOUBLE_EQ(r.engine.updateRateFPS(), arcade_config::MinLoopUpdateRate);
}

TEST(LoopPatternTest, StaticEntitiesAreIgnored) {
    std::mt19937 rng(12);
    RendererConfig c = RendererConfig::staticPattern("BLINKER", 0);
    c.verbosity = Verbosity::Quiet;
    RenderedEntity r = createPatternRenderer(c, rng);
    const auto before = r.engine.snapshot();
    EXPECT_FALSE(updateLoopPattern(r, 30.0));
    EXPECT_DOUBLE_EQ(r.engine.updateRateFPS(), 0.0);
    resetLoopPattern(r);
    EXPECT_EQ(r.engine.snapshot(), before);
}
