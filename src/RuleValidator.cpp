/**
 * @file RuleValidator.cpp
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "RuleValidator.h"

ValidationResult validateRuntime(GridSimulationEngine& engine) {
    if (engine.cols() < 7 || engine.rows() < 7) {
        return {false, "grid too small for rule validation (need 7x7)"};
    }

    // Blinker: vertical -> horizontal
    engine.clearGrid();
    engine.setCell(5, 4, true);
    engine.setCell(5, 5, true);
    engine.setCell(5, 6, true);
    engine.update();
    const bool horizontal = engine.getCell(4, 5) && engine.getCell(5, 5) && engine.getCell(6, 5) &&
                            !engine.getCell(5, 4) && !engine.getCell(5, 6);
    if (!horizontal) {
        engine.clearGrid();
        return {false, "engine does not follow B3/S23 (blinker test failed)"};
    }

    // Block: still life
    engine.clearGrid();
    engine.setCell(5, 5, true);
    engine.setCell(5, 6, true);
    engine.setCell(6, 5, true);
    engine.setCell(6, 6, true);
    engine.update();
    const bool stable = engine.getCell(5, 5) && engine.getCell(5, 6) &&
                        engine.getCell(6, 5) && engine.getCell(6, 6) && engine.countAliveCells() == 4;
    engine.clearGrid();
    if (!stable) return {false, "engine does not follow B3/S23 (block stability test failed)"};
    return {};
}
