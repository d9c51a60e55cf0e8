/**
 * @file LifeForce.cpp
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "LifeForce.h"

#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

namespace {
constexpr double Pi = 3.14159265358979323846;

void requireUnit(double v, const char* what) {
    if (!(v >= 0.0 && v <= 1.0)) {
        throw ConfigError(std::string(what) + " must be within [0,1], got " + std::to_string(v));
    }
}
}

/** @copydoc applyLifeForce(GridSimulationEngine&, const LifeForceConfig&) */
int applyLifeForce(GridSimulationEngine& engine, const LifeForceConfig& config) {
    requireUnit(config.floor, "life force floor");
    requireUnit(config.baseInjection, "life force base injection");
    requireUnit(config.deficitInjection, "life force deficit injection");
    requireUnit(config.radiusFactor, "life force radius factor");

    const int total = engine.cols() * engine.rows();
    const double density = engine.getDensity();
    if (density >= config.floor || config.floor <= 0.0) return 0;

    const double deficitRatio = std::max(0.0, config.floor - density) / config.floor;
    const double injectionRate = config.baseInjection + deficitRatio * config.deficitInjection;
    const int attempts = static_cast<int>(std::floor(total * injectionRate));

    // Polar sampling concentrates injections around the centre.
    const double cx = engine.cols() / 2.0;
    const double cy = engine.rows() / 2.0;
    const double maxRadius = std::sqrt(cx * cx + cy * cy);
    int revived = 0;
    for (int i = 0; i < attempts; ++i) {
        double angle = engine.rand01() * 2.0 * Pi;
        double radius = engine.rand01() * maxRadius * config.radiusFactor;
        int x = static_cast<int>(std::floor(cx + std::cos(angle) * radius));
        int y = static_cast<int>(std::floor(cy + std::sin(angle) * radius));
        if (!engine.inBounds(x, y) || engine.getCell(x, y)) continue;
        engine.setCell(x, y, true);
        ++revived;
    }
    return revived;
}

int applyLifeForce(Entity& entity, const LifeForceConfig& config) {
    if (!entity.sim) return 0;
    return applyLifeForce(entity.sim->engine(), config);
}

/** @copydoc maintainDensity(GridSimulationEngine&, double) */
int maintainDensity(GridSimulationEngine& engine, double targetDensity) {
    requireUnit(targetDensity, "target density");
    const int total = engine.cols() * engine.rows();
    int alive = engine.countAliveCells();
    if (static_cast<double>(alive) / total >= targetDensity) return 0;

    std::vector<int> dead;
    dead.reserve(static_cast<size_t>(total - alive));
    for (int y = 0; y < engine.rows(); ++y) {
        for (int x = 0; x < engine.cols(); ++x) {
            if (!engine.getCell(x, y)) dead.push_back(y * engine.cols() + x);
        }
    }
    std::shuffle(dead.begin(), dead.end(), engine.rng());

    int revived = 0;
    for (int cell : dead) {
        if (static_cast<double>(alive) / total >= targetDensity) break;
        engine.setCell(cell % engine.cols(), cell / engine.cols(), true);
        ++alive;
        ++revived;
    }
    return revived;
}

int maintainDensity(Entity& entity, double targetDensity) {
    if (!entity.sim) return 0;
    return maintainDensity(entity.sim->engine(), targetDensity);
}

/** @copydoc seedRadialDensity */
void seedRadialDensity(GridSimulationEngine& engine, double centerDensity, double edgeDensity) {
    requireUnit(centerDensity, "center density");
    requireUnit(edgeDensity, "edge density");
    const double cx = engine.cols() / 2.0;
    const double cy = engine.rows() / 2.0;
    const double maxDistance = std::sqrt(cx * cx + cy * cy);
    for (int y = 0; y < engine.rows(); ++y) {
        for (int x = 0; x < engine.cols(); ++x) {
            double dx = x - cx;
            double dy = y - cy;
            double t = std::sqrt(dx * dx + dy * dy) / maxDistance;
            double p = centerDensity + (edgeDensity - centerDensity) * t;
            if (engine.rand01() < p) engine.setCell(x, y, true);
        }
    }
}
