#pragma once

/// @file bounds.hpp
/// @brief 2D bounding volume types for drape_math
///
/// Aabb for static obstacles and picking, Obb for rotated rigid bodies.

#include "types.hpp"
#include "vec.hpp"
#include <array>
#include <cmath>
#include <algorithm>

namespace drape_math {

// =============================================================================
// Aabb (Axis-Aligned Bounding Box)
// =============================================================================

/// Axis-aligned 2D box
struct Aabb {
    Vec2 min = Vec2(0.0f);  ///< Minimum corner
    Vec2 max = Vec2(0.0f);  ///< Maximum corner

    constexpr Aabb() noexcept = default;

    constexpr Aabb(const Vec2& min_point, const Vec2& max_point) noexcept
        : min(min_point), max(max_point) {}

    /// Create from center and half extents
    static Aabb from_center_half(const Vec2& center, const Vec2& half) noexcept {
        return Aabb(center - half, center + half);
    }

    [[nodiscard]] Vec2 center() const noexcept {
        return (min + max) * 0.5f;
    }

    [[nodiscard]] Vec2 half_extents() const noexcept {
        return (max - min) * 0.5f;
    }

    /// Check if AABB is valid (min <= max for all components)
    [[nodiscard]] bool is_valid() const noexcept {
        return min.x <= max.x && min.y <= max.y;
    }

    /// Inclusive point containment
    [[nodiscard]] bool contains(const Vec2& p) const noexcept {
        return p.x >= min.x && p.x <= max.x && p.y >= min.y && p.y <= max.y;
    }

    [[nodiscard]] bool intersects(const Aabb& other) const noexcept {
        return min.x <= other.max.x && max.x >= other.min.x &&
               min.y <= other.max.y && max.y >= other.min.y;
    }

    /// Corner points, counter-clockwise from min
    [[nodiscard]] std::array<Vec2, 4> corners() const noexcept {
        return {Vec2(min.x, min.y), Vec2(max.x, min.y), Vec2(max.x, max.y), Vec2(min.x, max.y)};
    }

    bool operator==(const Aabb& other) const noexcept {
        return min == other.min && max == other.max;
    }
};

// =============================================================================
// Obb (Oriented Bounding Box)
// =============================================================================

/// Oriented 2D box: center, half extents and rotation angle in radians
struct Obb {
    Vec2 center = Vec2(0.0f);
    Vec2 half = Vec2(0.0f);
    float angle = 0.0f;

    constexpr Obb() noexcept = default;

    constexpr Obb(const Vec2& c, const Vec2& h, float a = 0.0f) noexcept
        : center(c), half(h), angle(a) {}

    static Obb from_aabb(const Aabb& box) noexcept {
        return Obb(box.center(), box.half_extents(), 0.0f);
    }

    /// Local axes (unit X and Y of the box frame)
    [[nodiscard]] std::array<Vec2, 2> axes() const noexcept {
        const float c = std::cos(angle);
        const float s = std::sin(angle);
        return {Vec2(c, s), Vec2(-s, c)};
    }

    /// World-space corners
    [[nodiscard]] std::array<Vec2, 4> corners() const noexcept {
        auto [ux, uy] = axes();
        const Vec2 ex = ux * half.x;
        const Vec2 ey = uy * half.y;
        return {center - ex - ey, center + ex - ey, center + ex + ey, center - ex + ey};
    }

    /// Projection radius onto a unit axis
    [[nodiscard]] float project_radius(const Vec2& axis) const noexcept {
        auto [ux, uy] = axes();
        return half.x * std::abs(dot(ux, axis)) + half.y * std::abs(dot(uy, axis));
    }

    /// Axis-aligned box enclosing this one
    [[nodiscard]] Aabb bounds() const noexcept {
        const Vec2 extent(project_radius(vec2::X), project_radius(vec2::Y));
        return Aabb(center - extent, center + extent);
    }

    /// Positive, finite half extents
    [[nodiscard]] bool is_valid() const noexcept {
        return std::isfinite(half.x) && std::isfinite(half.y) &&
               half.x > 0.0f && half.y > 0.0f &&
               is_finite(center) && std::isfinite(angle);
    }
};

} // namespace drape_math
