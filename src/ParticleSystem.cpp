/**
 * @file ParticleSystem.cpp
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "ParticleSystem.h"
#include "LifeForce.h"
#include "LoopPattern.h"

#include <algorithm>
#include <string>

void ParticleSystem::spawnExplosion(double x, double y, int count, std::mt19937& rng,
                                    int gridSize, double centerDensity, double updateRateFPS) {
    std::uniform_real_distribution<double> jitter(-20.0, 20.0);
    std::uniform_real_distribution<double> speed(-4.0, 4.0);
    for (int i = 0; i < count; ++i) {
        GridSimulationEngine engine(gridSize, gridSize, updateRateFPS);
        engine.seedRng(rng());
        seedRadialDensity(engine, centerDensity, 0.0);

        Particle p;
        p.entity.name = "particle";
        p.entity.x = x + jitter(rng);
        p.entity.y = y + jitter(rng);
        p.entity.sim.emplace(std::move(engine));
        p.vx = speed(rng);
        p.vy = speed(rng);
        items.push_back(std::move(p));
    }
    logVerbose(verbosity, "explosion: " + std::to_string(count) + " particles");
}

size_t ParticleSystem::update(double loopUpdateRate) {
    for (auto& p : items) {
        if (p.entity.sim) {
            RenderedEntity* r = p.entity.sim->rendered();
            if (r && r->isLoop()) {
                r->engine.updateThrottled();
                updateLoopPattern(*r, loopUpdateRate, verbosity);
            } else {
                p.entity.sim->step(verbosity);
            }
        }
        p.entity.x += p.vx;
        p.entity.y += p.vy;
        if (p.lifetime) {
            if (--*p.lifetime <= 0) p.dead = true;
        } else {
            p.alpha -= FadePerFrame;
            if (p.alpha <= 0) p.dead = true;
        }
    }
    const size_t before = items.size();
    items.erase(std::remove_if(items.begin(), items.end(), [](const Particle& p) { return p.dead; }),
                items.end());
    return before - items.size();
}
