/**
 * @file ArcadeConfig.h
 * @brief Named tuning constants shared by the simulation core, the configuration error type,
 *        and the option set of the terminal showcase.
 *
 * The padding, hitbox and mask factors are visual tuning values. Every factory or helper that
 * uses one takes it through its own config struct, defaulted from here, so callers can override.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

#include "Logger.h"

/**
 * @class ConfigError
 * @brief Raised synchronously for caller mistakes: bad dimensions, unknown pattern, bad rates.
 */
class ConfigError : public std::invalid_argument {
public:
    explicit ConfigError(const std::string& what) : std::invalid_argument(what) {}
};

namespace arcade_config {

// Frame clock
constexpr double HostFrameRate = 60.0;        /**< host render loop rate all throttles are relative to */
constexpr double DefaultUpdateRateFPS = 10.0; /**< engine rate when the caller gives none */
constexpr double BackgroundUpdateRate = 10.0;
constexpr double SpriteUpdateRate = 12.0;
constexpr double ExplosionUpdateRate = 30.0;
constexpr double LoopUpdateRate = 10.0;
constexpr double MinLoopUpdateRate = 0.5;     /**< clamp applied when a loop entity is retuned */
constexpr double MaxLoopUpdateRate = 60.0;

// Density
constexpr double RandomSeedDensity = 0.3;
constexpr double LifeForceFloor = 0.45;           /**< life force kicks in below this density */
constexpr double LifeForceBaseInjection = 0.25;   /**< fraction of cells injected at zero deficit */
constexpr double LifeForceDeficitInjection = 0.10;/**< extra fraction added at full deficit */
constexpr double LifeForceRadiusFactor = 0.7;     /**< share of centre-to-corner distance used for injection */
constexpr double MaintainDensityTarget = 0.6;
constexpr double RadialCenterDensity = 0.7;
constexpr double RadialEdgeDensity = 0.1;

// Pattern rendering
constexpr double PaddingFactor = 1.2;   /**< bounding box growth for static/loop grids (20% per axis) */
constexpr double HitboxFactor = 0.6;    /**< suggested hitbox radius as share of pixel width */
constexpr int DefaultCellSize = 30;

// Circular mask
constexpr double MaskRadiusFactor = 0.8; /**< share of half the minor grid dimension */
constexpr int MaskInterval = 6;          /**< prune every N generations */

} // namespace arcade_config

/**
 * @struct DemoOptions
 * @brief Settings for the terminal showcase: defaults, then environment, then argv overrides.
 */
struct DemoOptions {
    double spriteRate{arcade_config::SpriteUpdateRate};  /**< engine rate of the player/bullet sprites */
    double loopRate{arcade_config::LoopUpdateRate};      /**< loop-mode entity rate */
    uint32_t seed{0};                                    /**< PRNG seed; 0 means random */
    bool hasSeed{false};
    Verbosity verbosity{Verbosity::Normal};

    /** @brief Apply ARCADE_RATE, ARCADE_LOOP_RATE and ARCADE_SEED when set and parseable. */
    void applyEnvironment();
    /** @brief Apply -r/--rate, -l/--loop-rate, -s/--seed, -v/--verbose (both "--opt v" and "--opt=v"). */
    void applyArgs(int argc, char** argv);
    /** @brief Reset out-of-range values to their defaults. */
    void validate();
};

/** @brief Parse a finite double; false on null, empty or trailing garbage. */
bool parseDouble(const char* s, double& out);
/** @brief Parse an unsigned 32-bit integer; false on null, empty, negative or trailing garbage. */
bool parseUint32(const char* s, uint32_t& out);
