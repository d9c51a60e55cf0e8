/**
 * @file Entity.cpp
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "Entity.h"
#include "LoopPattern.h"

SimulationHandle::Kind SimulationHandle::kind() const {
    if (std::holds_alternative<CircularMaskOverlay>(sim)) return Kind::Masked;
    if (std::holds_alternative<RenderedEntity>(sim)) return Kind::Rendered;
    return Kind::Engine;
}

GridSimulationEngine& SimulationHandle::engine() {
    if (auto* o = std::get_if<CircularMaskOverlay>(&sim)) return o->engine();
    if (auto* r = std::get_if<RenderedEntity>(&sim)) return r->engine;
    return std::get<GridSimulationEngine>(sim);
}

const GridSimulationEngine& SimulationHandle::engine() const {
    if (auto* o = std::get_if<CircularMaskOverlay>(&sim)) return o->engine();
    if (auto* r = std::get_if<RenderedEntity>(&sim)) return r->engine;
    return std::get<GridSimulationEngine>(sim);
}

bool SimulationHandle::step(Verbosity verbosity) {
    if (auto* o = std::get_if<CircularMaskOverlay>(&sim)) return o->updateThrottled();
    if (auto* r = std::get_if<RenderedEntity>(&sim)) {
        bool advanced = r->engine.updateThrottled();
        updateLoopPattern(*r, verbosity);
        return advanced;
    }
    return std::get<GridSimulationEngine>(sim).updateThrottled();
}

const char* kindName(SimulationHandle::Kind k) {
    switch (k) {
        case SimulationHandle::Kind::Engine: return "engine";
        case SimulationHandle::Kind::Masked: return "masked";
        case SimulationHandle::Kind::Rendered: return "rendered";
    }
    return "unknown";
}
