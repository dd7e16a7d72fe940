#pragma once

/// @file scenarios.hpp
/// @brief Canned rigid-body setups used by the sandbox and acceptance tests

#include "rigid_system.hpp"

#include <array>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace drape_physics {

enum class ScenarioId : std::uint8_t {
    StackRest,       ///< Two boxes stacked on a ground slab
    DropOntoStatic,  ///< One box falling onto a ground slab
    ThinWallCcd,     ///< Fast box against a thin wall with CCD on
};

inline constexpr std::array<ScenarioId, 3> ALL_SCENARIOS = {
    ScenarioId::StackRest,
    ScenarioId::DropOntoStatic,
    ScenarioId::ThinWallCcd,
};

/// Stable scenario name, e.g. "rigid-stack-rest"
[[nodiscard]] const char* scenario_name(ScenarioId id);

/// Look up a scenario by name
[[nodiscard]] std::optional<ScenarioId> parse_scenario(std::string_view name);

/// A ready-to-step scenario
struct Scenario {
    ScenarioId id = ScenarioId::StackRest;
    std::shared_ptr<drape_event::EventBus> bus;
    std::shared_ptr<RigidSystem> system;
    std::vector<Aabb> statics;
    BodyId primary_body = 0;  ///< Top box, falling box or fast box
};

/// Build a scenario on its own bus, or on `bus` when given
[[nodiscard]] Scenario create_rigid_scenario(ScenarioId id, std::shared_ptr<drape_event::EventBus> bus = nullptr);

} // namespace drape_physics
