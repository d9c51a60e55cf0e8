/**
 * @file GridSimulationEngine.cpp
 * @brief Double-buffered B3/S23 evolution, throttling and grid queries.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "GridSimulationEngine.h"
#include "Pattern.h"

#include <algorithm>
#include <limits>
#include <string>
#include <utility>

namespace {
/** @brief Compute flattened index into a row-major buffer for (x,y) in a width w grid. */
inline size_t idx(int x, int y, int w) { return static_cast<size_t>(y * w + x); }

double framesFor(double fps) {
    if (!(fps > 0.0)) return std::numeric_limits<double>::infinity();
    return arcade_config::HostFrameRate / fps;
}
}

/** @copydoc GridSimulationEngine::GridSimulationEngine */
GridSimulationEngine::GridSimulationEngine(int cols, int rows, double updateRateFPS)
    : w(cols), h(rows), rateFPS(updateRateFPS), framesPer(framesFor(updateRateFPS)),
      prng(std::random_device{}()) {
    if (cols <= 0 || rows <= 0) {
        throw ConfigError("grid dimensions must be positive, got " +
                          std::to_string(cols) + "x" + std::to_string(rows));
    }
    current.assign(static_cast<size_t>(w) * static_cast<size_t>(h), 0);
    next.assign(current.size(), 0);
}

/** @copydoc GridSimulationEngine::setCell */
void GridSimulationEngine::setCell(int x, int y, bool alive) {
    if (!inBounds(x, y)) return;
    current[idx(x, y, w)] = alive ? 1 : 0;
}

/** @copydoc GridSimulationEngine::setPattern */
void GridSimulationEngine::setPattern(const Pattern& pattern, int originX, int originY) {
    for (int row = 0; row < pattern.height(); ++row) {
        for (int col = 0; col < pattern.width(); ++col) {
            setCell(originX + col, originY + row, pattern.cell(col, row));
        }
    }
}

/** @copydoc GridSimulationEngine::clearGrid */
void GridSimulationEngine::clearGrid() {
    std::fill(current.begin(), current.end(), static_cast<uint8_t>(0));
    std::fill(next.begin(), next.end(), static_cast<uint8_t>(0));
    gen = 0;
}

/** @copydoc GridSimulationEngine::randomSeed */
void GridSimulationEngine::randomSeed(double density) {
    density = std::clamp(density, 0.0, 1.0);
    for (auto& c : current) c = (rand01() < density) ? 1 : 0;
    gen = 0;
}

/** @copydoc GridSimulationEngine::countLiveNeighbors */
int GridSimulationEngine::countLiveNeighbors(const Buffer& buffer, int x, int y) const {
    int count = 0;
    for (int dy = -1; dy <= 1; ++dy) {
        for (int dx = -1; dx <= 1; ++dx) {
            if (dx == 0 && dy == 0) continue;
            int nx = x + dx, ny = y + dy;
            if (!inBounds(nx, ny)) continue; // fixed boundary: outside is dead
            count += buffer[idx(nx, ny, w)];
        }
    }
    return count;
}

/** @copydoc GridSimulationEngine::update */
void GridSimulationEngine::update() {
    // Never write into current while it is being read: in-place updates corrupt neighbour counts.
    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            bool alive = current[idx(x, y, w)] != 0;
            next[idx(x, y, w)] = applyRule(alive, countLiveNeighbors(current, x, y)) ? 1 : 0;
        }
    }
    current.swap(next);
    ++gen;
}

/** @copydoc GridSimulationEngine::updateThrottled */
bool GridSimulationEngine::updateThrottled() {
    if (frozen) return false;
    // Carry the remainder so fractional intervals (e.g. 2.4 frames) average out exactly.
    accumulator += 1.0;
    if (accumulator >= framesPer) {
        accumulator -= framesPer;
        update();
        return true;
    }
    return false;
}

/** @copydoc GridSimulationEngine::setUpdateRateFPS */
void GridSimulationEngine::setUpdateRateFPS(double fps) {
    rateFPS = fps;
    framesPer = framesFor(fps);
    accumulator = 0.0;
}

/** @copydoc GridSimulationEngine::countAliveCells */
int GridSimulationEngine::countAliveCells() const {
    return static_cast<int>(std::count(current.begin(), current.end(), static_cast<uint8_t>(1)));
}

/** @copydoc GridSimulationEngine::getDensity */
double GridSimulationEngine::getDensity() const {
    return static_cast<double>(countAliveCells()) / static_cast<double>(current.size());
}

/** @copydoc GridSimulationEngine::getRegion */
GridSimulationEngine::Buffer GridSimulationEngine::getRegion(int x, int y, int width, int height) const {
    if (width <= 0 || height <= 0) return {};
    Buffer out(static_cast<size_t>(width) * static_cast<size_t>(height), 0);
    for (int ry = 0; ry < height; ++ry) {
        for (int rx = 0; rx < width; ++rx) {
            out[idx(rx, ry, width)] = getCell(x + rx, y + ry) ? 1 : 0;
        }
    }
    return out;
}

/** @copydoc GridSimulationEngine::rand01 */
double GridSimulationEngine::rand01() {
    std::uniform_real_distribution<double> d(0.0, 1.0);
    return d(prng);
}

/** @copydoc GridSimulationEngine::randInt */
int GridSimulationEngine::randInt(int lo, int hi) {
    std::uniform_int_distribution<int> d(lo, hi);
    return d(prng);
}
