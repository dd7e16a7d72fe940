#pragma once

/// @file sweep.hpp
/// @brief Box-box time of impact for drape_ccd
///
/// sweep_toi moves box A by `velocity * dt` against a stationary box B and
/// reports the normalized time of first contact. The window assumes no
/// angular motion: rotations are sampled at the start of the step.

#include <drape_engine/math/math.hpp>

#include <optional>

namespace drape_ccd {

using drape_math::Vec2;
using drape_math::Aabb;
using drape_math::Obb;

/// Angles within this many radians of 0 or pi take the slab fast path
inline constexpr float AXIS_ALIGNED_TOLERANCE = 1e-4f;

/// Per-axis displacement treated as no motion
inline constexpr float MIN_AXIS_DISPLACEMENT = 1e-9f;

/// Time of impact result
struct SweepResult {
    bool hit = false;
    float t = 1.0f;                 ///< Normalized time of impact [0, 1]
    Vec2 normal{0.0f};              ///< Unit contact normal, opposing the motion of A
    std::optional<Vec2> point;      ///< Approximate contact point on B

    [[nodiscard]] static SweepResult miss() noexcept { return SweepResult{}; }
};

/// Angle is close enough to 0 or pi for the box to be treated as axis-aligned
[[nodiscard]] bool is_axis_aligned(float angle) noexcept;

/// Sweep A along `velocity` for `dt` against a stationary oriented box
[[nodiscard]] SweepResult sweep_toi(const Obb& moving, const Vec2& velocity, const Obb& other, float dt);

/// Sweep A along `velocity` for `dt` against a stationary axis-aligned box
[[nodiscard]] SweepResult sweep_toi(const Obb& moving, const Vec2& velocity, const Aabb& other, float dt);

} // namespace drape_ccd
