/**
 * @file LifeForceTest.cpp
 * @brief Density helpers: life force injection, density maintenance and radial seeding.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include <gtest/gtest.h>

#include <cstdlib>

#include "LifeForce.h"

namespace {

bool onlyAdded(const GridSimulationEngine::Buffer& before, const GridSimulationEngine::Buffer& after) {
    for (size_t i = 0; i < before.size(); ++i) {
        if (before[i] && !after[i]) return false;
    }
    return true;
}

} // namespace

TEST(LifeForceTest, InjectsIntoSparseGrid) {
    GridSimulationEngine e(20, 20);
    e.seedRng(3);
    e.setCell(0, 0, true);
    const auto before = e.snapshot();
    int revived = applyLifeForce(e);
    EXPECT_GT(revived, 0);
    EXPECT_EQ(e.countAliveCells(), 1 + revived);
    EXPECT_TRUE(onlyAdded(before, e.snapshot()));
    // At most floor(400 * (0.25 + 0.10)) attempts.
    EXPECT_LE(revived, 140);
}

TEST(LifeForceTest, InjectionStaysNearCentre) {
    GridSimulationEngine e(20, 20);
    e.seedRng(4);
    LifeForceConfig cfg;
    cfg.radiusFactor = 0.3;
    applyLifeForce(e, cfg);
    // 0.3 of the centre-to-corner distance (about 14.1) keeps every cell within about 4.3 cells.
    for (int y = 0; y < 20; ++y) {
        for (int x = 0; x < 20; ++x) {
            if (!e.getCell(x, y)) continue;
            EXPECT_LE(std::abs(x - 10), 5) << x << "," << y;
            EXPECT_LE(std::abs(y - 10), 5) << x << "," << y;
        }
    }
}

TEST(LifeForceTest, NoOpAboveFloor) {
    GridSimulationEngine e(10, 10);
    e.seedRng(5);
    e.randomSeed(1.0);
    EXPECT_EQ(applyLifeForce(e), 0);
    EXPECT_EQ(e.countAliveCells(), 100);
}

TEST(LifeForceTest, RejectsOutOfRangeConfig) {
    GridSimulationEngine e(10, 10);
    LifeForceConfig cfg;
    cfg.floor = 1.5;
    EXPECT_THROW(applyLifeForce(e, cfg), ConfigError);
    cfg = LifeForceConfig{};
    cfg.radiusFactor = -0.1;
    EXPECT_THROW(applyLifeForce(e, cfg), ConfigError);
}

TEST(LifeForceTest, MaintainDensityReachesTargetExactly) {
    GridSimulationEngine e(10, 10);
    e.seedRng(6);
    e.setCell(3, 3, true);
    const auto before = e.snapshot();
    EXPECT_EQ(maintainDensity(e, 0.6), 59);
    EXPECT_EQ(e.countAliveCells(), 60);
    EXPECT_GE(e.getDensity(), 0.6);
    EXPECT_TRUE(onlyAdded(before, e.snapshot()));
}

TEST(LifeForceTest, MaintainDensityIsIdempotent) {
    GridSimulationEngine e(8, 4);
    e.seedRng(7);
    maintainDensity(e, 0.75);
    const auto after = e.snapshot();
    EXPECT_EQ(maintainDensity(e, 0.75), 0);
    EXPECT_EQ(e.snapshot(), after);
    EXPECT_EQ(e.countAliveCells(), 24);
}

TEST(LifeForceTest, MaintainDensityRejectsBadTarget) {
    GridSimulationEngine e(4, 4);
    EXPECT_THROW(maintainDensity(e, 1.2), ConfigError);
    EXPECT_THROW(maintainDensity(e, -0.1), ConfigError);
}

TEST(LifeForceTest, EntityWithoutSimulationIsNoOp) {
    Entity bare;
    EXPECT_EQ(applyLifeForce(bare), 0);
    EXPECT_EQ(maintainDensity(bare), 0);

    Entity withEngine;
    withEngine.sim.emplace(GridSimulationEngine(5, 5));
    withEngine.sim->engine().seedRng(8);
    EXPECT_EQ(maintainDensity(withEngine, 0.4), 10);
}

TEST(LifeForceTest, RadialSeedExtremes) {
    GridSimulationEngine full(6, 6);
    full.seedRng(9);
    seedRadialDensity(full, 1.0, 1.0);
    EXPECT_EQ(full.countAliveCells(), 36);

    GridSimulationEngine none(6, 6);
    none.seedRng(9);
    seedRadialDensity(none, 0.0, 0.0);
    EXPECT_EQ(none.countAliveCells(), 0);

    EXPECT_THROW(seedRadialDensity(none, 2.0, 0.0), ConfigError);
}

TEST(LifeForceTest, RadialSeedFavoursTheCentre) {
    GridSimulationEngine e(40, 40);
    e.seedRng(10);
    seedRadialDensity(e, 1.0, 0.0);
    EXPECT_TRUE(e.getCell(20, 20));
    auto corner = e.getRegion(0, 0, 4, 4);
    auto centre = e.getRegion(18, 18, 4, 4);
    int cornerAlive = 0, centreAlive = 0;
    for (auto c : corner) cornerAlive += c;
    for (auto c : centre) centreAlive += c;
    EXPECT_GT(centreAlive, cornerAlive);
}
