/**
 * @file PatternRenderer.h
 * @brief Declares the factory that turns a catalog pattern into a ready-to-draw engine, either
 *        frozen at an exact evolutionary phase or running as a self-resetting loop.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "ArcadeConfig.h"
#include "GridSimulationEngine.h"
#include "Logger.h"
#include "Pattern.h"

/** @brief Static = frozen snapshot at one phase; Loop = animated with a reset every period. */
enum class RenderMode { Static, Loop };

/** @brief "static" or "loop". */
const char* renderModeName(RenderMode m);
/** @brief Parse "static"/"loop" (case-insensitive). @throws ConfigError for anything else. */
RenderMode renderModeFromName(const std::string& name);

/**
 * @struct RendererConfig
 * @brief Input to createPatternRenderer. With several names one is chosen uniformly at random.
 */
struct RendererConfig {
    RenderMode mode{RenderMode::Static};
    std::vector<std::string> patterns;                      /**< one or more catalog names */
    std::optional<int> phase;                               /**< static mode; random in [0, period) when empty */
    int cellSize{arcade_config::DefaultCellSize};           /**< pixels per cell */
    double updateRateFPS{arcade_config::LoopUpdateRate};    /**< loop mode generations per second */
    double paddingFactor{arcade_config::PaddingFactor};     /**< bounding box growth per axis (>= 1) */
    double hitboxFactor{arcade_config::HitboxFactor};       /**< hitbox radius as share of pixel width */
    Verbosity verbosity{Verbosity::Normal};

    static RendererConfig staticPattern(const std::string& name, std::optional<int> phase = std::nullopt);
    static RendererConfig loopPattern(const std::string& name,
                                      double updateRateFPS = arcade_config::LoopUpdateRate);
};

/** @brief Placement/size data a caller needs to position and collide a rendered entity. */
struct Dimensions {
    int gridSize{0};          /**< grid is gridSize x gridSize cells */
    int cellSize{0};          /**< pixels per cell */
    int width{0};             /**< gridSize * cellSize */
    int height{0};            /**< gridSize * cellSize */
    double hitboxRadius{0.0}; /**< suggested collision radius in pixels */
};

/** @brief Description of what was rendered. */
struct RenderMetadata {
    std::string pattern;            /**< catalog name actually used */
    RenderMode mode{RenderMode::Static};
    std::optional<int> phase;       /**< applied phase; empty in loop mode */
    int period{1};
    PatternCategory category{PatternCategory::StillLife};
};

/**
 * @struct LoopState
 * @brief Reset bookkeeping for loop-mode entities, driven by updateLoopPattern().
 */
struct LoopState {
    Pattern pattern;              /**< the original, re-stamped verbatim on every reset */
    int offsetX{0};               /**< stamp column */
    int offsetY{0};               /**< stamp row */
    int period{1};
    int resetCounter{0};          /**< generations seen since the last reset */
    uint64_t lastGeneration{0};   /**< engine generation at the last check */
    uint64_t resets{0};           /**< completed resets */
};

/**
 * @struct RenderedEntity
 * @brief The factory result: engine + dimensions + metadata, the same shape in both modes.
 */
struct RenderedEntity {
    GridSimulationEngine engine;
    Dimensions dimensions;
    RenderMetadata metadata;
    std::optional<LoopState> loop; /**< present only in loop mode */

    bool isLoop() const { return loop.has_value(); }
};

/** @brief Throw ConfigError if @p config is unusable (mode, names, phase, cellSize, rate, factors). */
void validateRendererConfig(const RendererConfig& config);

/**
 * @brief Build an entity from @p config, drawing every random choice from @p rng.
 * @throws ConfigError on invalid configuration.
 */
RenderedEntity createPatternRenderer(const RendererConfig& config, std::mt19937& rng);
/** @brief As above with a freshly seeded generator. */
RenderedEntity createPatternRenderer(const RendererConfig& config);

/** @brief Dimensions a pattern would get, without building an engine. @throws ConfigError. */
Dimensions patternDimensions(const std::string& name,
                             int cellSize = arcade_config::DefaultCellSize,
                             double paddingFactor = arcade_config::PaddingFactor,
                             double hitboxFactor = arcade_config::HitboxFactor);

/** @brief Padded extent of @p size cells: ceil(size * paddingFactor). */
int paddedExtent(int size, double paddingFactor);
