/**
 * @file LifeForce.h
 * @brief Stateless density helpers applied by callers after a throttled update.
 *
 * They only ever add cells and do nothing once the grid already meets its threshold, so they
 * can run every frame. Randomness comes from the engine being modified.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include "ArcadeConfig.h"
#include "Entity.h"
#include "GridSimulationEngine.h"

/** @brief Tuning for applyLifeForce(). */
struct LifeForceConfig {
    double floor{arcade_config::LifeForceFloor};                 /**< act only below this density */
    double baseInjection{arcade_config::LifeForceBaseInjection}; /**< share of cells injected at any deficit */
    double deficitInjection{arcade_config::LifeForceDeficitInjection}; /**< extra share at full deficit */
    double radiusFactor{arcade_config::LifeForceRadiusFactor};   /**< share of centre-to-corner distance */
};

/**
 * @brief Keep an always-visible entity from dying out: below the floor, inject
 *        floor(total * (base + deficitRatio * deficit)) centre-biased random cells.
 * @return number of cells that went from dead to alive.
 * @throws ConfigError if a config value is outside [0,1].
 */
int applyLifeForce(GridSimulationEngine& engine, const LifeForceConfig& config = LifeForceConfig{});
/** @brief Entity form; no-op (0) when the entity has no simulation. */
int applyLifeForce(Entity& entity, const LifeForceConfig& config = LifeForceConfig{});

/**
 * @brief Cosmetic stabiliser for entities that must not visibly evolve (e.g. projectiles): revive
 *        uniformly random dead cells until the density reaches @p targetDensity.
 * @return number of cells revived.
 * @throws ConfigError if @p targetDensity is outside [0,1].
 */
int maintainDensity(GridSimulationEngine& engine, double targetDensity = arcade_config::MaintainDensityTarget);
/** @brief Entity form; no-op (0) when the entity has no simulation. */
int maintainDensity(Entity& entity, double targetDensity = arcade_config::MaintainDensityTarget);

/**
 * @brief Seed cells with a probability falling linearly from @p centerDensity at the centre to
 *        @p edgeDensity at the corners. Adds cells only.
 * @throws ConfigError if a density is outside [0,1].
 */
void seedRadialDensity(GridSimulationEngine& engine,
                       double centerDensity = arcade_config::RadialCenterDensity,
                       double edgeDensity = arcade_config::RadialEdgeDensity);
