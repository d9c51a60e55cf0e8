/**
 * @file CircularMaskOverlay.cpp
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "CircularMaskOverlay.h"

#include <algorithm>
#include <cmath>
#include <string>

/** @copydoc CircularMaskOverlay::CircularMaskOverlay */
CircularMaskOverlay::CircularMaskOverlay(int cols, int rows, double updateRateFPS,
                                         double maskRadiusFactor, int maskInterval)
    : eng(cols, rows, updateRateFPS),
      cx(cols / 2.0), cy(rows / 2.0),
      radius(std::min(cols, rows) / 2.0 * maskRadiusFactor),
      interval(maskInterval) {
    if (!(maskRadiusFactor > 0.0)) {
        throw ConfigError("mask radius factor must be positive");
    }
    if (maskInterval < 1) {
        throw ConfigError("mask interval must be >= 1, got " + std::to_string(maskInterval));
    }
}

void CircularMaskOverlay::afterGeneration() {
    if (eng.generation() % static_cast<uint64_t>(interval) == 0) applyCircularMask();
}

/** @copydoc CircularMaskOverlay::update */
void CircularMaskOverlay::update() {
    eng.update();
    afterGeneration();
}

/** @copydoc CircularMaskOverlay::updateThrottled */
bool CircularMaskOverlay::updateThrottled() {
    if (!eng.updateThrottled()) return false;
    afterGeneration();
    return true;
}

/** @copydoc CircularMaskOverlay::insideMask */
bool CircularMaskOverlay::insideMask(int x, int y) const {
    double dx = x - cx;
    double dy = y - cy;
    return std::sqrt(dx * dx + dy * dy) <= radius;
}

/** @copydoc CircularMaskOverlay::applyCircularMask */
void CircularMaskOverlay::applyCircularMask() {
    for (int y = 0; y < eng.rows(); ++y) {
        for (int x = 0; x < eng.cols(); ++x) {
            if (!insideMask(x, y) && eng.getCell(x, y)) eng.setCell(x, y, false);
        }
    }
    ++applications;
}
