/**
 * @file ParticleSystem.h
 * @brief Explosion particles: small simulated grids that drift, fade and expire.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <optional>
#include <random>
#include <utility>
#include <vector>

#include "ArcadeConfig.h"
#include "Entity.h"
#include "Logger.h"

/**
 * @struct Particle
 * @brief One particle. With a lifetime it expires when the count reaches zero; otherwise it fades
 *        by FadePerFrame alpha per frame and expires at zero alpha.
 */
struct Particle {
    Entity entity;
    double vx{0.0};
    double vy{0.0};
    int alpha{255};
    std::optional<int> lifetime;  /**< frames left, when lifetime-based */
    bool dead{false};
};

/**
 * @class ParticleSystem
 * @brief Owns particles and advances them once per host frame.
 */
class ParticleSystem {
public:
    static constexpr int FadePerFrame = 4;

    explicit ParticleSystem(Verbosity v = Verbosity::Quiet) : verbosity(v) {}

    /** @brief Take ownership of @p p. */
    void add(Particle p) { items.push_back(std::move(p)); }

    /**
     * @brief Burst of @p count particles around (x,y): each a @p gridSize square engine seeded
     *        with a radial density falling from @p centerDensity to empty edges.
     */
    void spawnExplosion(double x, double y, int count, std::mt19937& rng,
                        int gridSize = 3, double centerDensity = 0.8,
                        double updateRateFPS = arcade_config::ExplosionUpdateRate);

    /**
     * @brief Step every particle's simulation, move it, fade or count down, then drop dead
     *        particles. Loop-mode particles are retuned to @p loopUpdateRate (clamped to
     *        [MinLoopUpdateRate, MaxLoopUpdateRate]) before their reset check.
     * @return number of particles removed this frame.
     */
    size_t update(double loopUpdateRate = arcade_config::ExplosionUpdateRate);

    const std::vector<Particle>& particles() const { return items; }
    size_t size() const { return items.size(); }
    bool empty() const { return items.empty(); }
    void clear() { items.clear(); }

private:
    std::vector<Particle> items;
    Verbosity verbosity;
};
