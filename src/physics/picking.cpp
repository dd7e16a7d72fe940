/// @file picking.cpp
/// @brief Point picking

#include <drape_engine/physics/picking.hpp>

namespace drape_physics {

std::optional<PickHit> pick_body_at_point(const Vec2& point, std::span<const BodySnapshot> bodies) {
    for (const BodySnapshot& b : bodies) {
        if (Aabb::from_center_half(b.center, b.half).contains(point)) {
            return PickHit{b.id, point};
        }
    }
    return std::nullopt;
}

} // namespace drape_physics
