#pragma once

/// @file types.hpp
/// @brief Rigid body and configuration types for drape_physics

#include "fwd.hpp"

#include <drape_engine/math/math.hpp>
#include <drape_engine/ccd/settings.hpp>

#include <cmath>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace drape_physics {

using drape_math::Vec2;
using drape_math::Aabb;
using drape_math::Obb;

/// Entity id reported for static obstacles in collision events
inline constexpr BodyId STATIC_BODY = 0;

// =============================================================================
// RigidBody
// =============================================================================

/// Dynamic box body. Rotation is carried but never integrated.
struct RigidBody {
    BodyId id = 0;
    Vec2 center{0.0f};
    Vec2 half{0.5f};
    float angle = 0.0f;
    Vec2 velocity{0.0f};
    float mass = 1.0f;              ///< Non-positive values act as unit mass
    float restitution = 0.2f;       ///< Clamped to [0, 1] when used
    float friction = 0.5f;          ///< Clamped to [0, 1] when used

    /// Force CCD on or off for this body; unset follows the speed threshold
    std::optional<bool> ccd;

    [[nodiscard]] float inverse_mass() const noexcept {
        return (mass > 0.0f && std::isfinite(mass)) ? 1.0f / mass : 1.0f;
    }

    [[nodiscard]] Obb obb() const noexcept { return Obb(center, half, angle); }

    /// Unrotated box around the center, used for pair tests and picking
    [[nodiscard]] Aabb aabb() const noexcept { return Aabb::from_center_half(center, half); }
};

/// Debug view of a body
struct BodySnapshot {
    BodyId id = 0;
    Vec2 center{0.0f};
    Vec2 half{0.0f};
};

// =============================================================================
// Configuration
// =============================================================================

/// Supplies the current static obstacle set; queried once per fixed step
using StaticQuery = std::function<std::vector<Aabb>()>;

/// Construction-time settings for RigidSystem
struct RigidSystemConfig {
    std::string id = "rigid-static";
    int priority = 96;
    float gravity = 9.81f;                  ///< Acceleration along -Y
    bool enable_dynamic_pairs = false;
    float sleep_velocity_threshold = 0.01f;
    int sleep_frames_threshold = 60;

    /// CCD starts disabled with an unreachable speed threshold
    drape_ccd::CcdSettings ccd{false, drape_math::consts::INFINITY_F, drape_ccd::DEFAULT_EPSILON, 3};

    /// Copy with negative thresholds and zero frame counts clamped
    [[nodiscard]] RigidSystemConfig sanitized() const;
};

/// Partial CCD reconfiguration; `enabled` defaults to on when unset
struct CcdConfigUpdate {
    std::optional<float> speed_threshold;
    std::optional<float> epsilon;
    std::optional<bool> enabled;
};

} // namespace drape_physics
