/**
 * @file Showcase.h
 * @brief The scene shown by the arcade terminal program: background, pattern entities, a masked
 *        player kept alive by life force, a density-held bullet and explosion particles.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <cstdint>
#include <random>
#include <string>
#include <vector>

#include "ArcadeConfig.h"
#include "Entity.h"
#include "GridSimulationEngine.h"
#include "ParticleSystem.h"
#include "TerminalView.h"

/**
 * @class Showcase
 * @brief Owns every simulated object of the demo and advances them one host frame at a time.
 */
class Showcase {
public:
    /** @brief Build the scene for a @p width x @p height character area. */
    Showcase(int width, int height, const DemoOptions& options);

    /** @brief Rebuild every entity (new random choices) and reseed the background. */
    void respawn();
    /** @brief Burst of particles at the player's position. */
    void explode();
    /** @brief Advance one host frame; does nothing while paused. */
    void frame();
    /** @brief Draw the whole scene and the status line. */
    void draw(TerminalView& view) const;

    void setRunning(bool on) { running = on; }
    bool isRunning() const { return running; }
    void toggleRunning() { running = !running; }

    /** @brief Change the loop entity rate; clamped by updateLoopPattern on the next frame. */
    void setLoopRate(double fps) { loopRate = fps; }
    double getLoopRate() const { return loopRate; }

    std::string statusLine() const;

private:
    void buildPatterns();
    void buildPlayer();
    void buildBullet();

    int w, h;                 /**< scene size in characters */
    DemoOptions opts;
    std::mt19937 prng;        /**< scene PRNG; seeds every entity */
    bool running{false};
    double loopRate;
    uint64_t frames{0};

    GridSimulationEngine background;
    std::vector<Entity> statics;   /**< frozen pattern entities */
    Entity looper;                 /**< loop-mode pattern entity */
    Entity player;                 /**< circular-mask sprite with life force */
    Entity bullet;                 /**< density-held projectile */
    double playerVx{0.5};
    ParticleSystem particles;
};
