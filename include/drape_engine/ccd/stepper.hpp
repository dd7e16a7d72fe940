#pragma once

/// @file stepper.hpp
/// @brief CCD-aware integration of a single box

#include "sweep.hpp"

#include <span>

namespace drape_ccd {

/// Default back-off distance from the contact surface
inline constexpr float DEFAULT_EPSILON = 1e-4f;

/// Outcome of one CCD-guarded advance
struct AdvanceResult {
    Vec2 center{0.0f};          ///< New center
    bool collided = false;
    float t = 1.0f;             ///< Earliest normalized time of impact
    Vec2 normal{0.0f};          ///< Contact normal of the earliest hit
    std::optional<Vec2> point;  ///< Contact point of the earliest hit
};

/// Advance `body` by `velocity * dt`, stopping at the earliest obstacle contact
///
/// On a hit the body is placed at the time of impact and backed off by
/// `epsilon` along the contact normal; otherwise it moves the full step.
/// With `max_iterations` above 1 the rest of the step is swept again with
/// the velocity component into the contact removed, so a body pressed
/// against a surface keeps sliding along it. The reported t, normal and
/// point are those of the first hit.
[[nodiscard]] AdvanceResult advance_with_ccd(
    const Obb& body,
    const Vec2& velocity,
    float dt,
    std::span<const Aabb> obstacles,
    float epsilon = DEFAULT_EPSILON,
    int max_iterations = 1);

/// Same as above for oriented obstacles
[[nodiscard]] AdvanceResult advance_with_ccd(
    const Obb& body,
    const Vec2& velocity,
    float dt,
    std::span<const Obb> obstacles,
    float epsilon = DEFAULT_EPSILON,
    int max_iterations = 1);

} // namespace drape_ccd
