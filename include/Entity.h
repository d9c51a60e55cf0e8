/**
 * @file Entity.h
 * @brief Declares SimulationHandle (a tagged union over the three simulation flavours) and the
 *        Entity that optionally carries one.
 *
 * Helpers branch on the handle's kind instead of probing an entity for an engine.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <optional>
#include <string>
#include <utility>
#include <variant>

#include "CircularMaskOverlay.h"
#include "GridSimulationEngine.h"
#include "Logger.h"
#include "PatternRenderer.h"

/**
 * @class SimulationHandle
 * @brief Exclusively owns one simulation: a plain engine, a circular-mask overlay, or a
 *        rendered pattern entity (static or loop).
 */
class SimulationHandle {
public:
    enum class Kind { Engine, Masked, Rendered };

    explicit SimulationHandle(GridSimulationEngine engine) : sim(std::move(engine)) {}
    explicit SimulationHandle(CircularMaskOverlay overlay) : sim(std::move(overlay)) {}
    explicit SimulationHandle(RenderedEntity rendered) : sim(std::move(rendered)) {}

    Kind kind() const;

    /** @brief The grid being simulated, whatever the flavour. */
    GridSimulationEngine& engine();
    const GridSimulationEngine& engine() const;

    /** @brief The overlay, or nullptr if this is not a Masked handle. */
    CircularMaskOverlay* overlay() { return std::get_if<CircularMaskOverlay>(&sim); }
    /** @brief The rendered entity, or nullptr if this is not a Rendered handle. */
    RenderedEntity* rendered() { return std::get_if<RenderedEntity>(&sim); }
    const RenderedEntity* rendered() const { return std::get_if<RenderedEntity>(&sim); }

    /**
     * @brief Advance one host frame: throttled update (masked for overlays), then the loop reset
     *        check for loop-mode entities.
     * @return true when a generation was produced.
     */
    bool step(Verbosity verbosity = Verbosity::Quiet);

private:
    std::variant<GridSimulationEngine, CircularMaskOverlay, RenderedEntity> sim;
};

/** @brief "engine", "masked" or "rendered". */
const char* kindName(SimulationHandle::Kind k);

/**
 * @struct Entity
 * @brief A game object: screen position plus an optional simulation giving it a visual identity.
 */
struct Entity {
    std::string name;
    double x{0.0};                                 /**< pixel position (top-left of the grid) */
    double y{0.0};
    int cellSize{arcade_config::DefaultCellSize};  /**< pixels per cell when drawn */
    std::optional<SimulationHandle> sim;           /**< empty for entities without cells */

    bool hasSimulation() const { return sim.has_value(); }
};
