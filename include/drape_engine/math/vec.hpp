#pragma once

/// @file vec.hpp
/// @brief Vec2 utility functions for drape_math

#include "types.hpp"
#include <cmath>

namespace drape_math {

/// Dot product
[[nodiscard]] inline float dot(const Vec2& a, const Vec2& b) noexcept {
    return glm::dot(a, b);
}

/// Length of a vector
[[nodiscard]] inline float length(const Vec2& v) noexcept {
    return glm::length(v);
}

/// Squared length of a vector
[[nodiscard]] inline float length_squared(const Vec2& v) noexcept {
    return glm::length2(v);
}

/// Get perpendicular vector (rotated 90 degrees counter-clockwise)
[[nodiscard]] inline Vec2 perpendicular(const Vec2& v) noexcept {
    return Vec2(-v.y, v.x);
}

/// Normalize vector, returning zero if length is too small
[[nodiscard]] inline Vec2 normalize_or_zero(const Vec2& v) noexcept {
    const float len_sq = glm::length2(v);
    if (!(len_sq >= consts::EPSILON * consts::EPSILON)) {
        return vec2::ZERO;
    }
    return v * (1.0f / std::sqrt(len_sq));
}

/// Normalize vector, returning fallback if length is too small
[[nodiscard]] inline Vec2 normalize_or(const Vec2& v, const Vec2& fallback) noexcept {
    const float len_sq = glm::length2(v);
    if (!(len_sq >= consts::EPSILON * consts::EPSILON)) {
        return fallback;
    }
    return v * (1.0f / std::sqrt(len_sq));
}

/// Unit vector along an angle (the local X axis of a rotated frame)
[[nodiscard]] inline Vec2 from_angle(float radians) noexcept {
    return Vec2(std::cos(radians), std::sin(radians));
}

/// Rotate a vector counter-clockwise by an angle
[[nodiscard]] inline Vec2 rotate(const Vec2& v, float radians) noexcept {
    const float c = std::cos(radians);
    const float s = std::sin(radians);
    return Vec2(v.x * c - v.y * s, v.x * s + v.y * c);
}

/// Check both components are finite
[[nodiscard]] inline bool is_finite(const Vec2& v) noexcept {
    return std::isfinite(v.x) && std::isfinite(v.y);
}

} // namespace drape_math
