/**
 * @file PatternRenderer.cpp
 * @brief Static (phase-frozen) and loop (self-resetting) entity construction.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "PatternRenderer.h"
#include "PatternLibrary.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>

namespace {

void fail(Verbosity v, const std::string& msg) {
    if (v != Verbosity::Quiet) Logger::error("PatternRenderer: " + msg);
    throw ConfigError(msg);
}

Dimensions dimensionsFor(int gridSize, int cellSize, double hitboxFactor) {
    Dimensions d;
    d.gridSize = gridSize;
    d.cellSize = cellSize;
    d.width = gridSize * cellSize;
    d.height = gridSize * cellSize;
    d.hitboxRadius = static_cast<double>(d.width) * hitboxFactor;
    return d;
}

/**
 * Static mode:
 * 1. evolve the pattern centred in a padded scratch grid (padding keeps edge cells from seeing
 *    the dead boundary as neighbours),
 * 2. copy the evolved scratch grid centred into a square grid,
 * 3. freeze it.
 */
RenderedEntity buildStatic(const Pattern& pattern, int phase, const RendererConfig& config, std::mt19937& rng) {
    const int paddedW = paddedExtent(pattern.width(), config.paddingFactor);
    const int paddedH = paddedExtent(pattern.height(), config.paddingFactor);

    GridSimulationEngine scratch(paddedW, paddedH, 0.0);
    scratch.setPattern(pattern, (paddedW - pattern.width()) / 2, (paddedH - pattern.height()) / 2);
    for (int i = 0; i < phase; ++i) scratch.update();
    const auto evolved = scratch.snapshot();

    const int gridSize = std::max(paddedW, paddedH);
    RenderedEntity out{GridSimulationEngine(gridSize, gridSize, 0.0), {}, {}, std::nullopt};
    out.engine.seedRng(rng());
    const int offX = (gridSize - paddedW) / 2;
    const int offY = (gridSize - paddedH) / 2;
    for (int y = 0; y < paddedH; ++y) {
        for (int x = 0; x < paddedW; ++x) {
            if (evolved[static_cast<size_t>(y * paddedW + x)]) out.engine.setCell(offX + x, offY + y, true);
        }
    }
    out.engine.freeze();

    out.dimensions = dimensionsFor(gridSize, config.cellSize, config.hitboxFactor);
    out.metadata.pattern = pattern.name();
    out.metadata.mode = RenderMode::Static;
    out.metadata.phase = phase;
    out.metadata.period = pattern.period();
    out.metadata.category = pattern.category();

    std::ostringstream oss;
    oss << "static " << pattern.name() << " phase " << phase << "/" << (pattern.period() - 1)
        << ", " << out.dimensions.width << "x" << out.dimensions.height << "px";
    logVerbose(config.verbosity, oss.str());
    return out;
}

/**
 * Loop mode: stamp the pattern centred in a square padded grid, leave it running at the
 * configured rate and attach the LoopState that updateLoopPattern() uses for periodic resets.
 */
RenderedEntity buildLoop(const Pattern& pattern, const RendererConfig& config, std::mt19937& rng) {
    if (pattern.period() == 1) {
        logWarning(config.verbosity, "PatternRenderer: " + pattern.name() +
                                     " has period 1, loop mode will show no animation");
    }
    const int paddedW = paddedExtent(pattern.width(), config.paddingFactor);
    const int paddedH = paddedExtent(pattern.height(), config.paddingFactor);
    const int gridSize = std::max(paddedW, paddedH);

    RenderedEntity out{GridSimulationEngine(gridSize, gridSize, config.updateRateFPS), {}, {}, std::nullopt};
    out.engine.seedRng(rng());
    const int offX = (gridSize - pattern.width()) / 2;
    const int offY = (gridSize - pattern.height()) / 2;
    out.engine.setPattern(pattern, offX, offY);
    out.engine.unfreeze();

    LoopState loop{pattern, offX, offY, pattern.period(), 0, out.engine.generation(), 0};
    out.loop = std::move(loop);

    out.dimensions = dimensionsFor(gridSize, config.cellSize, config.hitboxFactor);
    out.metadata.pattern = pattern.name();
    out.metadata.mode = RenderMode::Loop;
    out.metadata.phase = std::nullopt;
    out.metadata.period = pattern.period();
    out.metadata.category = pattern.category();

    std::ostringstream oss;
    oss << "loop " << pattern.name() << " period " << pattern.period() << ", "
        << out.dimensions.width << "x" << out.dimensions.height << "px, " << config.updateRateFPS << "fps";
    logVerbose(config.verbosity, oss.str());
    return out;
}

} // namespace

const char* renderModeName(RenderMode m) {
    switch (m) {
        case RenderMode::Static: return "static";
        case RenderMode::Loop: return "loop";
    }
    return "unknown";
}

RenderMode renderModeFromName(const std::string& name) {
    std::string v(name);
    for (auto& c : v) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (v == "static") return RenderMode::Static;
    if (v == "loop") return RenderMode::Loop;
    throw ConfigError("invalid render mode: " + name + " (expected static or loop)");
}

RendererConfig RendererConfig::staticPattern(const std::string& name, std::optional<int> phase) {
    RendererConfig c;
    c.mode = RenderMode::Static;
    c.patterns = {name};
    c.phase = phase;
    return c;
}

RendererConfig RendererConfig::loopPattern(const std::string& name, double updateRateFPS) {
    RendererConfig c;
    c.mode = RenderMode::Loop;
    c.patterns = {name};
    c.updateRateFPS = updateRateFPS;
    return c;
}

int paddedExtent(int size, double paddingFactor) {
    return static_cast<int>(std::ceil(size * paddingFactor));
}

void validateRendererConfig(const RendererConfig& config) {
    const Verbosity v = config.verbosity;
    if (config.mode != RenderMode::Static && config.mode != RenderMode::Loop) {
        fail(v, "invalid render mode " + std::to_string(static_cast<int>(config.mode)) +
                ", must be static or loop");
    }
    if (config.patterns.empty()) fail(v, "at least one pattern name is required");
    const auto& lib = PatternLibrary::standard();
    for (const auto& name : config.patterns) {
        if (!lib.contains(name)) fail(v, "unknown pattern: " + name);
    }
    if (config.mode == RenderMode::Static && config.phase && *config.phase < 0) {
        fail(v, "phase must be >= 0, got " + std::to_string(*config.phase));
    }
    if (config.cellSize <= 0) fail(v, "cellSize must be positive, got " + std::to_string(config.cellSize));
    if (!(config.updateRateFPS > 0.0)) {
        fail(v, "updateRateFPS must be positive");
    }
    if (!(config.paddingFactor >= 1.0)) fail(v, "paddingFactor must be >= 1");
    if (!(config.hitboxFactor > 0.0)) fail(v, "hitboxFactor must be positive");
}

RenderedEntity createPatternRenderer(const RendererConfig& config, std::mt19937& rng) {
    validateRendererConfig(config);

    const auto& lib = PatternLibrary::standard();
    std::string name = config.patterns.front();
    if (config.patterns.size() > 1) {
        std::uniform_int_distribution<size_t> pick(0, config.patterns.size() - 1);
        name = config.patterns[pick(rng)];
    }
    const Pattern& pattern = lib.at(name);

    if (config.mode == RenderMode::Loop) return buildLoop(pattern, config, rng);

    int phase = 0;
    if (config.phase) {
        phase = std::min(*config.phase, pattern.period() - 1);
    } else {
        std::uniform_int_distribution<int> pickPhase(0, pattern.period() - 1);
        phase = pickPhase(rng);
    }
    return buildStatic(pattern, phase, config, rng);
}

RenderedEntity createPatternRenderer(const RendererConfig& config) {
    std::mt19937 rng(std::random_device{}());
    return createPatternRenderer(config, rng);
}

Dimensions patternDimensions(const std::string& name, int cellSize, double paddingFactor, double hitboxFactor) {
    const Pattern& p = PatternLibrary::standard().at(name);
    if (cellSize <= 0) throw ConfigError("cellSize must be positive");
    if (!(paddingFactor >= 1.0)) throw ConfigError("paddingFactor must be >= 1");
    const int gridSize = std::max(paddedExtent(p.width(), paddingFactor), paddedExtent(p.height(), paddingFactor));
    return dimensionsFor(gridSize, cellSize, hitboxFactor);
}
