#pragma once

/// @file engine.hpp
/// @brief Main include header for drape_engine
///
/// drape_engine schedules systems:
/// - ISystem: prioritized fixed-step and frame hooks
/// - EngineWorld: registration, pause gating and dispatch
/// - FixedStepLoop / SimulationRunner: real-time to fixed-step conversion
/// - EventBusSystem / PerfEmitterSystem: bus frame bookkeeping

#include "fwd.hpp"
#include "system.hpp"
#include "world.hpp"
#include "fixed_step.hpp"
#include "runner.hpp"
#include "systems.hpp"
