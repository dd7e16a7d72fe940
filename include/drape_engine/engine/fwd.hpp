#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for drape_engine

namespace drape_engine {

struct SystemDescriptor;
struct SystemOptions;
class ISystem;
class EngineWorld;

struct FixedStepConfig;
class FixedStepLoop;

struct RunnerConfig;
class SimulationRunner;

class EventBusSystem;
class PerfEmitterSystem;

} // namespace drape_engine
