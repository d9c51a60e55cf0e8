/**
 * @file RuleValidator.h
 * @brief Runtime self-check that an engine evolves under B3/S23.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <string>

#include "GridSimulationEngine.h"

struct ValidationResult {
    bool valid{true};
    std::string error; /**< empty when valid */
};

/**
 * @brief Clears @p engine, checks that a vertical blinker turns horizontal after one update and
 *        that a block survives one update. Destroys the engine's contents; needs at least 7x7.
 */
ValidationResult validateRuntime(GridSimulationEngine& engine);
