/// @file types.cpp
/// @brief drape_physics configuration helpers

#include <drape_engine/physics/types.hpp>

#include <algorithm>

namespace drape_physics {

RigidSystemConfig RigidSystemConfig::sanitized() const {
    RigidSystemConfig c = *this;
    if (!std::isfinite(c.gravity)) {
        c.gravity = RigidSystemConfig{}.gravity;
    }
    if (!(c.sleep_velocity_threshold >= 0.0f)) {
        c.sleep_velocity_threshold = 0.0f;
    }
    c.sleep_frames_threshold = std::max(1, c.sleep_frames_threshold);
    c.ccd = c.ccd.sanitized();
    return c;
}

} // namespace drape_physics
