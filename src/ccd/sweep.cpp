/// @file sweep.cpp
/// @brief Swept slab and swept SAT time of impact

#include <drape_engine/ccd/sweep.hpp>

#include <algorithm>
#include <array>
#include <cmath>

namespace drape_ccd {

namespace {

/// Strict overlap; boxes that only touch are apart
bool intervals_overlap(float a_min, float a_max, float b_min, float b_max) noexcept {
    return a_max > b_min && b_max > a_min;
}

/// Overlap at t=0: report an immediate hit opposing the motion
SweepResult initial_overlap(const Vec2& velocity) noexcept {
    SweepResult r;
    r.hit = true;
    r.t = 0.0f;
    r.normal = -drape_math::normalize_or(velocity, drape_math::vec2::X);
    return r;
}

/// Entry/exit interval for one axis
struct AxisInterval {
    bool separated = false;
    float entry = -drape_math::consts::INFINITY_F;
    float exit = drape_math::consts::INFINITY_F;
};

/// Closest point of B to `p`, in B's own frame then back to world
Vec2 closest_point_on(const Obb& box, const Vec2& p) noexcept {
    auto [ux, uy] = box.axes();
    const Vec2 rel = p - box.center;
    const float lx = std::clamp(drape_math::dot(rel, ux), -box.half.x, box.half.x);
    const float ly = std::clamp(drape_math::dot(rel, uy), -box.half.y, box.half.y);
    return box.center + ux * lx + uy * ly;
}

// =============================================================================
// Axis-Aligned Swept Slabs
// =============================================================================

AxisInterval slab_interval(float d, float a_min, float a_max, float b_min, float b_max) noexcept {
    AxisInterval iv;
    if (std::abs(d) < MIN_AXIS_DISPLACEMENT) {
        iv.separated = !intervals_overlap(a_min, a_max, b_min, b_max);
        return iv;
    }
    if (d > 0.0f) {
        iv.entry = (b_min - a_max) / d;
        iv.exit = (b_max - a_min) / d;
    } else {
        iv.entry = (b_max - a_min) / d;
        iv.exit = (b_min - a_max) / d;
    }
    return iv;
}

SweepResult sweep_axis_aligned(const Obb& a, const Vec2& velocity, const Obb& b, float dt) {
    const Vec2 d = velocity * dt;
    const Vec2 a_min = a.center - a.half;
    const Vec2 a_max = a.center + a.half;
    const Vec2 b_min = b.center - b.half;
    const Vec2 b_max = b.center + b.half;

    if (intervals_overlap(a_min.x, a_max.x, b_min.x, b_max.x) &&
        intervals_overlap(a_min.y, a_max.y, b_min.y, b_max.y)) {
        SweepResult r = initial_overlap(velocity);
        r.point = closest_point_on(b, a.center);
        return r;
    }

    const AxisInterval x = slab_interval(d.x, a_min.x, a_max.x, b_min.x, b_max.x);
    const AxisInterval y = slab_interval(d.y, a_min.y, a_max.y, b_min.y, b_max.y);
    if (x.separated || y.separated) {
        return SweepResult::miss();
    }

    const float t_enter = std::max(x.entry, y.entry);
    const float t_exit = std::min(x.exit, y.exit);
    if (!(t_enter <= t_exit) || t_exit <= 0.0f || t_enter > 1.0f) {
        return SweepResult::miss();
    }

    SweepResult r;
    r.hit = true;
    r.t = std::clamp(t_enter, 0.0f, 1.0f);

    const Vec2 c = a.center + d * r.t;
    if (x.entry > y.entry) {
        r.normal = Vec2(d.x > 0.0f ? -1.0f : 1.0f, 0.0f);
        r.point = Vec2(r.normal.x < 0.0f ? b_min.x : b_max.x, std::clamp(c.y, b_min.y, b_max.y));
    } else {
        r.normal = Vec2(0.0f, d.y > 0.0f ? -1.0f : 1.0f);
        r.point = Vec2(std::clamp(c.x, b_min.x, b_max.x), r.normal.y < 0.0f ? b_min.y : b_max.y);
    }
    return r;
}

// =============================================================================
// Rotated Swept SAT
// =============================================================================

SweepResult sweep_rotated(const Obb& a, const Vec2& velocity, const Obb& b, float dt) {
    const Vec2 d = velocity * dt;
    const Vec2 s = b.center - a.center;

    const auto a_axes = a.axes();
    const auto b_axes = b.axes();
    const std::array<Vec2, 4> axes = {a_axes[0], a_axes[1], b_axes[0], b_axes[1]};

    float t_enter = -drape_math::consts::INFINITY_F;
    float t_exit = drape_math::consts::INFINITY_F;
    Vec2 entry_axis = axes[0];
    bool overlapping = true;

    for (const Vec2& axis : axes) {
        const float sp = drape_math::dot(s, axis);
        const float r = a.project_radius(axis) + b.project_radius(axis);
        const float dp = drape_math::dot(d, axis);

        if (std::abs(sp) >= r) {
            overlapping = false;
        }

        // |sp - dp * t| <= r
        if (std::abs(dp) < MIN_AXIS_DISPLACEMENT) {
            if (std::abs(sp) >= r) {
                return SweepResult::miss();
            }
            continue;
        }

        const float t0 = (sp - r) / dp;
        const float t1 = (sp + r) / dp;
        const float entry = std::min(t0, t1);
        const float exit = std::max(t0, t1);

        if (entry > t_enter) {
            t_enter = entry;
            entry_axis = axis;
        }
        t_exit = std::min(t_exit, exit);
    }

    if (overlapping) {
        SweepResult r = initial_overlap(velocity);
        r.point = closest_point_on(b, a.center);
        return r;
    }

    if (!(t_enter <= t_exit) || t_exit <= 0.0f || t_enter > 1.0f) {
        return SweepResult::miss();
    }

    SweepResult r;
    r.hit = true;
    r.t = std::clamp(t_enter, 0.0f, 1.0f);

    Vec2 n = drape_math::normalize_or(entry_axis, drape_math::vec2::X);
    if (drape_math::dot(n, d) > 0.0f) {
        n = -n;
    }
    r.normal = n;
    r.point = closest_point_on(b, a.center + d * r.t);
    return r;
}

bool valid_inputs(const Obb& a, const Vec2& velocity, const Obb& b, float dt) noexcept {
    return a.is_valid() && b.is_valid() && drape_math::is_finite(velocity) &&
           std::isfinite(dt) && dt >= 0.0f;
}

} // anonymous namespace

// =============================================================================
// Public API
// =============================================================================

bool is_axis_aligned(float angle) noexcept {
    const float a = std::abs(angle);
    return a < AXIS_ALIGNED_TOLERANCE ||
           std::abs(a - drape_math::consts::PI) < AXIS_ALIGNED_TOLERANCE;
}

SweepResult sweep_toi(const Obb& moving, const Vec2& velocity, const Obb& other, float dt) {
    if (!valid_inputs(moving, velocity, other, dt)) {
        return SweepResult::miss();
    }
    if (is_axis_aligned(moving.angle) && is_axis_aligned(other.angle)) {
        return sweep_axis_aligned(moving, velocity, other, dt);
    }
    return sweep_rotated(moving, velocity, other, dt);
}

SweepResult sweep_toi(const Obb& moving, const Vec2& velocity, const Aabb& other, float dt) {
    return sweep_toi(moving, velocity, Obb::from_aabb(other), dt);
}

} // namespace drape_ccd
