#pragma once

/// @file queries.hpp
/// @brief Ray and circle queries for drape_ccd

#include "sweep.hpp"

namespace drape_ccd {

// =============================================================================
// Ray Queries
// =============================================================================

/// Ray hit over the parametric range of the ray direction
struct RayHit {
    bool hit = false;
    float t_enter = 0.0f;
    float t_exit = 0.0f;
    Vec2 normal{0.0f};  ///< Outward normal of the entry face
    Vec2 point{0.0f};   ///< origin + dir * t_enter
};

/// Ray against an axis-aligned box (slab method)
/// A zero direction component is treated as a tiny non-zero value.
[[nodiscard]] RayHit ray_aabb_slabs(const Vec2& origin, const Vec2& dir, const Aabb& box) noexcept;

/// Ray against an oriented box, solved as slabs in the box's local frame
[[nodiscard]] RayHit ray_obb_local_slabs(const Vec2& origin, const Vec2& dir, const Obb& box) noexcept;

// =============================================================================
// Circle Queries
// =============================================================================

struct Circle {
    Vec2 center{0.0f};
    float radius = 0.0f;
};

struct CircleToi {
    bool hit = false;
    float t = 1.0f;
    Vec2 normal{1.0f, 0.0f};  ///< From B toward A at the time of impact
};

/// Earliest contact of two moving circles within [0, 1] of `dt`
[[nodiscard]] CircleToi circle_circle_toi(
    const Circle& a, const Vec2& va,
    const Circle& b, const Vec2& vb,
    float dt) noexcept;

} // namespace drape_ccd
