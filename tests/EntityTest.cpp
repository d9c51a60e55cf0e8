/**
 * @file EntityTest.cpp
 * @brief SimulationHandle dispatch across the three simulation flavours.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include <gtest/gtest.h>

#include <random>

#include "Entity.h"

TEST(EntityTest, EntityWithoutSimulation) {
    Entity e;
    e.name = "marker";
    EXPECT_FALSE(e.hasSimulation());
    EXPECT_EQ(e.cellSize, arcade_config::DefaultCellSize);
}

TEST(EntityTest, PlainEngineHandle) {
    SimulationHandle h(GridSimulationEngine(6, 6, 60.0));
    EXPECT_EQ(h.kind(), SimulationHandle::Kind::Engine);
    EXPECT_EQ(h.overlay(), nullptr);
    EXPECT_EQ(h.rendered(), nullptr);
    EXPECT_EQ(h.engine().cols(), 6);
    EXPECT_TRUE(h.step());
    EXPECT_EQ(h.engine().generation(), 1u);
}

TEST(EntityTest, MaskedHandleAppliesMask) {
    SimulationHandle h(CircularMaskOverlay(10, 10, 60.0, 0.8, 1));
    EXPECT_EQ(h.kind(), SimulationHandle::Kind::Masked);
    ASSERT_NE(h.overlay(), nullptr);
    h.engine().setCell(0, 0, true);
    h.engine().setCell(1, 0, true);
    h.engine().setCell(0, 1, true);
    h.engine().setCell(1, 1, true);
    EXPECT_TRUE(h.step());
    EXPECT_EQ(h.overlay()->maskApplications(), 1u);
    EXPECT_EQ(h.engine().countAliveCells(), 0);
}

TEST(EntityTest, StaticRenderedHandleNeverSteps) {
    std::mt19937 rng(21);
    RendererConfig c = RendererConfig::staticPattern("BEACON", 1);
    c.verbosity = Verbosity::Quiet;
    SimulationHandle h(createPatternRenderer(c, rng));
    EXPECT_EQ(h.kind(), SimulationHandle::Kind::Rendered);
    ASSERT_NE(h.rendered(), nullptr);
    const auto before = h.engine().snapshot();
    for (int i = 0; i < 20; ++i) EXPECT_FALSE(h.step());
    EXPECT_EQ(h.engine().snapshot(), before);
}

TEST(EntityTest, LoopRenderedHandleResetsItself) {
    std::mt19937 rng(22);
    RendererConfig c = RendererConfig::loopPattern("BLINKER", 60.0);
    c.verbosity = Verbosity::Quiet;
    Entity e;
    e.name = "blinker";
    e.sim.emplace(createPatternRenderer(c, rng));
    const auto initial = e.sim->engine().snapshot();

    EXPECT_TRUE(e.sim->step());
    EXPECT_TRUE(e.sim->step());
    const RenderedEntity* r = e.sim->rendered();
    ASSERT_NE(r, nullptr);
    EXPECT_EQ(r->loop->resets, 1u);
    EXPECT_EQ(e.sim->engine().snapshot(), initial);
}

TEST(EntityTest, KindNames) {
    EXPECT_STREQ(kindName(SimulationHandle::Kind::Engine), "engine");
    EXPECT_STREQ(kindName(SimulationHandle::Kind::Masked), "masked");
    EXPECT_STREQ(kindName(SimulationHandle::Kind::Rendered), "rendered");
}
