/**
 * @file LoopPattern.h
 * @brief Per-frame reset and speed control for loop-mode entities.
 *
 * The engine itself knows nothing about loops; the host calls updateLoopPattern() after each
 * throttled update.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include "Logger.h"
#include "PatternRenderer.h"

/**
 * @brief Count the generations elapsed since the last check; after a full period, clear the grid
 *        and re-stamp the original pattern at its original offsets.
 * @return true when a reset happened. A non-loop entity is left untouched and returns false.
 */
bool updateLoopPattern(RenderedEntity& entity, Verbosity verbosity = Verbosity::Quiet);

/**
 * @brief As above, first retuning the engine to @p loopUpdateRate (clamped to
 *        [MinLoopUpdateRate, MaxLoopUpdateRate]) when it differs from the current rate.
 */
bool updateLoopPattern(RenderedEntity& entity, double loopUpdateRate, Verbosity verbosity = Verbosity::Quiet);

/** @brief Clear and re-stamp the original pattern now; resets the loop counters. No-op without loop state. */
void resetLoopPattern(RenderedEntity& entity);
