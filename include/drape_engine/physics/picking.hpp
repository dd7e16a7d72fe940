#pragma once

/// @file picking.hpp
/// @brief Point picking against body bounds

#include "types.hpp"

#include <optional>
#include <span>

namespace drape_physics {

struct PickHit {
    BodyId id = 0;
    Vec2 point{0.0f};
};

/// First body (in order) whose unrotated box contains the point, edges inclusive
[[nodiscard]] std::optional<PickHit> pick_body_at_point(const Vec2& point, std::span<const BodySnapshot> bodies);

} // namespace drape_physics
