/// @file sat.cpp
/// @brief OBB vs AABB separating axis test

#include <drape_engine/physics/sat.hpp>

#include <algorithm>
#include <array>
#include <cmath>

namespace drape_physics {

SatResult obb_vs_aabb(const Obb& obb, const Aabb& box) {
    const auto [ux, uy] = obb.axes();
    const std::array<Vec2, 4> axes = {ux, uy, drape_math::vec2::X, drape_math::vec2::Y};

    const Vec2 box_center = box.center();
    const Vec2 box_half = box.half_extents();

    float min_overlap = drape_math::consts::INFINITY_F;
    Vec2 best_axis(0.0f);
    float axis_sign = 1.0f;

    for (const Vec2& axis : axes) {
        const float obb_c = drape_math::dot(obb.center, axis);
        const float obb_r = obb.project_radius(axis);
        const float box_c = drape_math::dot(box_center, axis);
        const float box_r = box_half.x * std::abs(axis.x) + box_half.y * std::abs(axis.y);

        const float overlap = std::min(obb_c + obb_r, box_c + box_r) - std::max(obb_c - obb_r, box_c - box_r);
        // Also rejects NaN from degenerate input
        if (!(overlap > 0.0f)) {
            return SatResult{};
        }

        if (overlap < min_overlap) {
            min_overlap = overlap;
            best_axis = axis;
            axis_sign = (box_c - obb_c) >= 0.0f ? 1.0f : -1.0f;
        }
    }

    SatResult res;
    res.collided = true;
    res.normal = best_axis * axis_sign;
    res.mtv = -res.normal * min_overlap;
    res.depth = min_overlap;
    return res;
}

} // namespace drape_physics
