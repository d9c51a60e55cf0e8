/**
 * @file CircularMaskOverlay.h
 * @brief Declares CircularMaskOverlay: an engine wrapper that periodically prunes cells outside
 *        a circle so sprites keep an organic, roughly round silhouette.
 *
 * Between prunings the pattern evolves freely and grows irregular edges; every maskInterval
 * generations it snaps back inside the circle, which reads on screen as a slow "breathing".
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include "ArcadeConfig.h"
#include "GridSimulationEngine.h"

/**
 * @class CircularMaskOverlay
 * @brief Owns a GridSimulationEngine and applies the circular mask after each generation whose
 *        number is a multiple of maskInterval. The mask only kills cells.
 */
class CircularMaskOverlay {
public:
    /**
     * @param maskRadiusFactor radius as a share of half the minor grid dimension.
     * @param maskInterval prune every N generations.
     * @throws ConfigError on non-positive dimensions, radius factor <= 0 or interval < 1.
     */
    CircularMaskOverlay(int cols, int rows,
                        double updateRateFPS = arcade_config::DefaultUpdateRateFPS,
                        double maskRadiusFactor = arcade_config::MaskRadiusFactor,
                        int maskInterval = arcade_config::MaskInterval);

    /** @brief One generation, then the mask when generation % maskInterval == 0. */
    void update();
    /** @brief Throttled variant of update(); returns whether a generation was produced. */
    bool updateThrottled();
    /** @brief Kill every live cell farther than maskRadius from the centre. */
    void applyCircularMask();
    /** @brief Whether (x,y) lies inside the circle. */
    bool insideMask(int x, int y) const;

    GridSimulationEngine& engine() { return eng; }
    const GridSimulationEngine& engine() const { return eng; }

    double centerX() const { return cx; }
    double centerY() const { return cy; }
    double maskRadius() const { return radius; }
    int maskInterval() const { return interval; }
    /** @brief Number of times the mask has run (including direct applyCircularMask calls). */
    uint64_t maskApplications() const { return applications; }

private:
    void afterGeneration();

    GridSimulationEngine eng; /**< wrapped engine */
    double cx;                /**< cols / 2 */
    double cy;                /**< rows / 2 */
    double radius;            /**< min(cols, rows) / 2 * factor */
    int interval;             /**< generations between prunings */
    uint64_t applications{0};
};
