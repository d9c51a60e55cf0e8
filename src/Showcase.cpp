/**
 * @file Showcase.cpp
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "Showcase.h"
#include "CircularMaskOverlay.h"
#include "LifeForce.h"
#include "LoopPattern.h"
#include "Logger.h"
#include "PatternRenderer.h"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace {
constexpr int PlayerGrid = 10;
constexpr int BulletCols = 2;
constexpr int BulletRows = 4;
constexpr double BulletDensity = 0.75;
constexpr int BulletTopUpFrames = 5; /**< frames between bullet density top-ups */
constexpr double BulletSpeed = 0.6;  /**< rows per frame */
}

/** @copydoc Showcase::Showcase */
Showcase::Showcase(int width, int height, const DemoOptions& options)
    : w(std::max(1, width)), h(std::max(1, height)), opts(options),
      prng(options.hasSeed ? options.seed : std::random_device{}()),
      loopRate(options.loopRate),
      background(w, h, arcade_config::BackgroundUpdateRate),
      particles(options.verbosity) {
    respawn();
}

void Showcase::respawn() {
    background.seedRng(prng());
    background.randomSeed(arcade_config::RandomSeedDensity / 3.0);
    particles.clear();
    buildPatterns();
    buildPlayer();
    buildBullet();
    Logger::info("showcase respawned: " + std::to_string(statics.size()) + " static entities");
}

void Showcase::buildPatterns() {
    statics.clear();
    RendererConfig fixed = RendererConfig::staticPattern("BLINKER", 1);
    fixed.cellSize = 1;
    fixed.verbosity = opts.verbosity;

    RendererConfig pick;
    pick.mode = RenderMode::Static;
    pick.patterns = {"TOAD", "BEACON", "GLIDER", "LIGHTWEIGHT_SPACESHIP"};
    pick.cellSize = 1;
    pick.verbosity = opts.verbosity;

    RendererConfig ship = RendererConfig::staticPattern("COPPERHEAD");
    ship.cellSize = 1;
    ship.verbosity = opts.verbosity;

    int x = 1;
    for (const RendererConfig* cfg : {&fixed, &pick, &ship}) {
        Entity e;
        RenderedEntity r = createPatternRenderer(*cfg, prng);
        e.name = r.metadata.pattern;
        e.cellSize = 1;
        e.x = x;
        e.y = 1;
        x += r.dimensions.width + 2;
        e.sim.emplace(std::move(r));
        statics.push_back(std::move(e));
    }

    RendererConfig loop = RendererConfig::loopPattern("PULSAR", loopRate);
    loop.cellSize = 1;
    loop.verbosity = opts.verbosity;
    RenderedEntity r = createPatternRenderer(loop, prng);
    looper = Entity{};
    looper.name = r.metadata.pattern;
    looper.cellSize = 1;
    looper.x = std::max(0, w - r.dimensions.width - 1);
    looper.y = 1;
    looper.sim.emplace(std::move(r));
}

void Showcase::buildPlayer() {
    CircularMaskOverlay overlay(PlayerGrid, PlayerGrid, opts.spriteRate);
    overlay.engine().seedRng(prng());
    seedRadialDensity(overlay.engine(), 0.85, 0.0);
    player = Entity{};
    player.name = "player";
    player.cellSize = 1;
    player.x = (w - PlayerGrid) / 2.0;
    player.y = std::max(0, h - PlayerGrid - 1);
    player.sim.emplace(std::move(overlay));
}

void Showcase::buildBullet() {
    GridSimulationEngine engine(BulletCols, BulletRows, opts.spriteRate);
    engine.seedRng(prng());
    maintainDensity(engine, BulletDensity);
    bullet = Entity{};
    bullet.name = "bullet";
    bullet.cellSize = 1;
    bullet.x = player.x + PlayerGrid / 2.0 - 1.0;
    bullet.y = player.y - BulletRows;
    bullet.sim.emplace(std::move(engine));
}

/** @copydoc Showcase::frame */
void Showcase::frame() {
    if (!running) return;
    ++frames;

    background.updateThrottled();
    if (background.getDensity() < 0.01) background.randomSeed(arcade_config::RandomSeedDensity / 3.0);

    for (auto& e : statics) e.sim->step(opts.verbosity); // frozen: no-op

    if (auto* r = looper.sim->rendered()) {
        r->engine.updateThrottled();
        updateLoopPattern(*r, loopRate, opts.verbosity);
    }

    player.sim->step(opts.verbosity);
    applyLifeForce(player);
    player.x += playerVx;
    if (player.x < 0.0 || player.x > w - PlayerGrid) {
        playerVx = -playerVx;
        player.x = std::clamp(player.x, 0.0, static_cast<double>(std::max(0, w - PlayerGrid)));
    }

    bullet.sim->step(opts.verbosity);
    if (frames % BulletTopUpFrames == 0) maintainDensity(bullet, BulletDensity);
    bullet.y -= BulletSpeed;
    if (bullet.y + BulletRows < 0.0) {
        bullet.x = player.x + PlayerGrid / 2.0 - 1.0;
        bullet.y = player.y - BulletRows;
    }

    particles.update();
}

/** @copydoc Showcase::draw */
void Showcase::draw(TerminalView& view) const {
    view.clear();
    view.drawEngine(background, 0, 0, 5, '.');
    for (const auto& e : statics) {
        view.drawEntity(e, TerminalView::colorPairForDensity(e.sim->engine().getDensity()), '#');
    }
    view.drawEntity(looper, 6, 'o');
    view.drawEntity(player, 3, '@');
    view.drawEntity(bullet, 4, '|');
    for (const auto& p : particles.particles()) view.drawEntity(p.entity, 7, '*');
    view.drawStatusLine(statusLine());
}

void Showcase::explode() {
    particles.spawnExplosion(player.x + PlayerGrid / 2.0, player.y + PlayerGrid / 2.0, 10, prng);
}

std::string Showcase::statusLine() const {
    const auto& pe = player.sim->engine();
    std::ostringstream oss;
    oss << (running ? "RUNNING" : "PAUSED ")
        << " | player gen " << pe.generation()
        << " dens " << std::fixed << std::setprecision(2) << pe.getDensity()
        << " | loop " << std::setprecision(1) << loopRate << "fps"
        << " | particles " << particles.size()
        << " | [s]tart [p]ause [r]espawn [e]xplode [+/-] rate [q]uit";
    return oss.str();
}
