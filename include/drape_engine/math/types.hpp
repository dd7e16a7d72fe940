#pragma once

/// @file types.hpp
/// @brief Core type definitions and constants for drape_math

#define GLM_FORCE_RADIANS
#define GLM_ENABLE_EXPERIMENTAL

#include <glm/glm.hpp>
#include <glm/gtx/norm.hpp>

#include "fwd.hpp"

#include <limits>

namespace drape_math {

// =============================================================================
// Constants
// =============================================================================

namespace consts {

inline constexpr float PI = 3.14159265358979323846f;
inline constexpr float TAU = 6.28318530717958647692f;

/// Generic float comparison epsilon
inline constexpr float EPSILON = 1e-6f;

inline constexpr float INFINITY_F = std::numeric_limits<float>::infinity();
inline constexpr float MAX_FLOAT = std::numeric_limits<float>::max();

} // namespace consts

// =============================================================================
// Vector Constants
// =============================================================================

namespace vec2 {
    inline constexpr Vec2 ZERO  = Vec2(0.0f, 0.0f);
    inline constexpr Vec2 ONE   = Vec2(1.0f, 1.0f);
    inline constexpr Vec2 X     = Vec2(1.0f, 0.0f);
    inline constexpr Vec2 Y     = Vec2(0.0f, 1.0f);
    inline constexpr Vec2 NEG_X = Vec2(-1.0f, 0.0f);
    inline constexpr Vec2 NEG_Y = Vec2(0.0f, -1.0f);
}

} // namespace drape_math
