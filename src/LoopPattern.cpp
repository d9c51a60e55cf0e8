/**
 * @file LoopPattern.cpp
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "LoopPattern.h"

#include <algorithm>
#include <sstream>

void resetLoopPattern(RenderedEntity& entity) {
    if (!entity.loop) return;
    LoopState& loop = *entity.loop;
    entity.engine.clearGrid();
    entity.engine.setPattern(loop.pattern, loop.offsetX, loop.offsetY);
    loop.resetCounter = 0;
    loop.lastGeneration = entity.engine.generation();
    ++loop.resets;
}

bool updateLoopPattern(RenderedEntity& entity, Verbosity verbosity) {
    if (!entity.loop) return false;
    LoopState& loop = *entity.loop;
    const uint64_t now = entity.engine.generation();

    // Someone cleared or reseeded the grid behind our back; restart counting from there.
    if (now < loop.lastGeneration) {
        loop.lastGeneration = now;
        loop.resetCounter = 0;
        return false;
    }
    const uint64_t elapsed = now - loop.lastGeneration;
    if (elapsed == 0) return false;

    loop.lastGeneration = now;
    loop.resetCounter += static_cast<int>(std::min<uint64_t>(elapsed, static_cast<uint64_t>(loop.period)));
    if (loop.resetCounter < loop.period) return false;

    resetLoopPattern(entity);
    std::ostringstream oss;
    oss << "loop " << loop.pattern.name() << " reset after " << loop.period << " generations";
    logVerbose(verbosity, oss.str());
    return true;
}

bool updateLoopPattern(RenderedEntity& entity, double loopUpdateRate, Verbosity verbosity) {
    if (!entity.loop) return false;
    const double target = std::clamp(loopUpdateRate, arcade_config::MinLoopUpdateRate,
                                     arcade_config::MaxLoopUpdateRate);
    if (entity.engine.updateRateFPS() != target) {
        entity.engine.setUpdateRateFPS(target);
        std::ostringstream oss;
        oss << "loop " << entity.loop->pattern.name() << " speed " << target << "fps";
        logVerbose(verbosity, oss.str());
    }
    return updateLoopPattern(entity, verbosity);
}
