#pragma once

/// @file sat.hpp
/// @brief Separating axis overlap test between an oriented box and an AABB

#include "types.hpp"

namespace drape_physics {

/// Discrete overlap result
struct SatResult {
    bool collided = false;
    Vec2 mtv{0.0f};     ///< Translation that moves the OBB out of the AABB
    Vec2 normal{0.0f};  ///< Unit axis of least overlap, pointing from the OBB toward the AABB
    float depth = 0.0f; ///< Overlap along `normal`
};

/// Test the two box axes and the two world axes for overlap
///
/// Touching boxes (zero overlap on some axis) do not collide.
[[nodiscard]] SatResult obb_vs_aabb(const Obb& obb, const Aabb& box);

} // namespace drape_physics
