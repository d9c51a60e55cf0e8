/**
 * @file GridSimulationEngine.h
 * @brief Declares GridSimulationEngine: a fixed-size, double-buffered B3/S23 grid with a
 *        frame-decoupled throttle and a freeze switch.
 *
 * Cells outside the grid read as dead and ignore writes, so the grid behaves as if embedded
 * in an infinite dead plane. Neighbour counting and pattern stamping rely on that.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <cstdint>
#include <random>
#include <vector>

#include "ArcadeConfig.h"

class Pattern;

/**
 * @class GridSimulationEngine
 * @brief Owns one cols x rows grid, its generation counter and its throttle state.
 *
 * Responsibilities:
 * - Cell access (bounds-tolerant) and pattern stamping
 * - One-generation evolution into the back buffer followed by a buffer swap
 * - Throttled evolution driven by a host frame clock (HostFrameRate)
 * - Freeze/unfreeze for static snapshots
 *
 * Not thread-safe: an engine belongs to exactly one entity and is mutated once per frame.
 */
class GridSimulationEngine {
public:
    using Buffer = std::vector<uint8_t>; /**< row-major cells, 0 dead / 1 alive */

    /**
     * @brief Allocate two all-dead buffers of @p cols x @p rows.
     * @param updateRateFPS generations per second of host time; <= 0 disables throttled advancement.
     * @throws ConfigError when either dimension is not positive.
     */
    GridSimulationEngine(int cols, int rows,
                         double updateRateFPS = arcade_config::DefaultUpdateRateFPS);

    int cols() const { return w; }
    int rows() const { return h; }
    /** @brief Number of evolution steps since construction or the last clearGrid/randomSeed. */
    uint64_t generation() const { return gen; }

    // Cell access
    /** @brief Set one cell in the current buffer; out-of-range writes are ignored. */
    void setCell(int x, int y, bool alive);
    /** @brief Read one cell of the current buffer; out-of-range reads are dead. */
    bool getCell(int x, int y) const {
        if (!inBounds(x, y)) return false;
        return current[static_cast<size_t>(y * w + x)] != 0;
    }
    bool inBounds(int x, int y) const { return x >= 0 && y >= 0 && x < w && y < h; }

    /** @brief Stamp @p pattern with its top-left at (@p originX, @p originY); dead pattern cells
     *         overwrite, cells falling outside the grid are clipped. */
    void setPattern(const Pattern& pattern, int originX = 0, int originY = 0);
    /** @brief Kill every cell in both buffers and reset the generation counter. */
    void clearGrid();
    /** @brief Make each cell alive with probability @p density (clamped to [0,1]); resets generation. */
    void randomSeed(double density = arcade_config::RandomSeedDensity);

    // Rule
    /** @brief Live cells among the 8 Moore neighbours of (x,y) in @p buffer; outside cells are dead. */
    int countLiveNeighbors(const Buffer& buffer, int x, int y) const;
    /** @brief B3/S23: alive survives on 2 or 3, dead is born on exactly 3. */
    static bool applyRule(bool alive, int neighbors) {
        return alive ? (neighbors == 2 || neighbors == 3) : neighbors == 3;
    }

    // Evolution
    /** @brief Advance exactly one generation (read current, write next, swap, ++generation). */
    void update();
    /**
     * @brief Called once per host frame. Adds one frame to the accumulator and, once it reaches
     *        framesPerUpdate, subtracts framesPerUpdate and runs update().
     * @return true when a generation was produced. Always false while frozen.
     */
    bool updateThrottled();

    // Throttle
    double updateRateFPS() const { return rateFPS; }
    /** @brief Host frames per generation (HostFrameRate / rate); infinite when the rate is <= 0. */
    double framesPerUpdate() const { return framesPer; }
    /** @brief Change the rate; recomputes framesPerUpdate and empties the accumulator. */
    void setUpdateRateFPS(double fps);

    // Freeze
    void freeze() { frozen = true; }
    void unfreeze() { frozen = false; }
    bool isFrozen() const { return frozen; }

    // Queries
    int countAliveCells() const;
    /** @brief Alive cells divided by total cells, in [0,1]. */
    double getDensity() const;
    /** @brief Copy of the current buffer. */
    Buffer snapshot() const { return current; }
    /** @brief Copy of a width x height rectangle at (x,y), row-major; outside cells are dead. */
    Buffer getRegion(int x, int y, int width, int height) const;
    /** @brief Read-only view of the current generation for renderers. */
    const Buffer& cells() const { return current; }

    // Randomness (each engine owns its generator so entities stay independent)
    std::mt19937& rng() { return prng; }
    void seedRng(uint32_t seed) { prng.seed(seed); }
    /** @brief Uniform real in [0,1). */
    double rand01();
    /** @brief Uniform integer in [lo,hi]. */
    int randInt(int lo, int hi);

private:
    int w, h;          /**< grid dimensions, fixed at construction */
    Buffer current;    /**< authoritative generation */
    Buffer next;       /**< scratch for the generation being computed */
    uint64_t gen{0};   /**< generation counter */
    bool frozen{false};

    double rateFPS;          /**< requested generations per second */
    double framesPer;        /**< host frames per generation */
    double accumulator{0.0}; /**< fractional frames carried between updates */

    std::mt19937 prng;       /**< engine PRNG */
};
