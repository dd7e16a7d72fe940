#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for drape_math types

#include <glm/fwd.hpp>

namespace drape_math {

// =============================================================================
// Vector Types (GLM aliases)
// =============================================================================
using Vec2 = glm::vec2;
using DVec2 = glm::dvec2;

// =============================================================================
// Forward Declarations (drape_math types)
// =============================================================================
struct Aabb;
struct Obb;

} // namespace drape_math
