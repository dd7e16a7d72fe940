#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for drape_physics

#include <cstdint>

namespace drape_physics {

using BodyId = std::uint32_t;

struct RigidBody;
struct RigidSystemConfig;
struct CcdConfigUpdate;
struct BodySnapshot;
struct SatResult;
struct PickHit;

class RigidSystem;

enum class ScenarioId : std::uint8_t;
struct Scenario;

} // namespace drape_physics
