/// @file queries.cpp
/// @brief Ray slab and circle time-of-impact queries

#include <drape_engine/ccd/queries.hpp>

#include <algorithm>
#include <cmath>

namespace drape_ccd {

namespace {

constexpr float TINY_DIRECTION = 1e-12f;
constexpr float STATIONARY_EPSILON = 1e-12f;

float safe_inverse(float v) noexcept {
    return 1.0f / (v == 0.0f ? TINY_DIRECTION : v);
}

} // anonymous namespace

// =============================================================================
// Ray Queries
// =============================================================================

RayHit ray_aabb_slabs(const Vec2& origin, const Vec2& dir, const Aabb& box) noexcept {
    const float inv_x = safe_inverse(dir.x);
    const float inv_y = safe_inverse(dir.y);

    const float t1 = (box.min.x - origin.x) * inv_x;
    const float t2 = (box.max.x - origin.x) * inv_x;
    const float t3 = (box.min.y - origin.y) * inv_y;
    const float t4 = (box.max.y - origin.y) * inv_y;

    const float tx_min = std::min(t1, t2);
    const float ty_min = std::min(t3, t4);
    const float tmin = std::max(tx_min, ty_min);
    const float tmax = std::min(std::max(t1, t2), std::max(t3, t4));

    RayHit hit;
    if (tmax < 0.0f || tmin > tmax) {
        return hit;
    }

    hit.hit = true;
    hit.t_enter = tmin;
    hit.t_exit = tmax;
    if (tx_min >= ty_min) {
        hit.normal = Vec2(t1 < t2 ? -1.0f : 1.0f, 0.0f);
    } else {
        hit.normal = Vec2(0.0f, t3 < t4 ? -1.0f : 1.0f);
    }
    hit.point = origin + dir * tmin;
    return hit;
}

RayHit ray_obb_local_slabs(const Vec2& origin, const Vec2& dir, const Obb& box) noexcept {
    auto [ux, uy] = box.axes();
    const Vec2 rel = origin - box.center;
    const Vec2 local_origin(drape_math::dot(rel, ux), drape_math::dot(rel, uy));
    const Vec2 local_dir(drape_math::dot(dir, ux), drape_math::dot(dir, uy));

    RayHit hit = ray_aabb_slabs(local_origin, local_dir, Aabb(-box.half, box.half));
    if (!hit.hit) {
        return hit;
    }

    const Vec2 local_point = local_origin + local_dir * hit.t_enter;
    hit.point = box.center + ux * local_point.x + uy * local_point.y;
    hit.normal = drape_math::normalize_or(ux * hit.normal.x + uy * hit.normal.y, drape_math::vec2::X);
    return hit;
}

// =============================================================================
// Circle Queries
// =============================================================================

CircleToi circle_circle_toi(const Circle& a, const Vec2& va,
                            const Circle& b, const Vec2& vb, float dt) noexcept {
    const Vec2 p = a.center - b.center;
    const Vec2 v = (va - vb) * dt;
    const float r = a.radius + b.radius;

    const float qa = drape_math::dot(v, v);
    const float qb = 2.0f * drape_math::dot(p, v);
    const float qc = drape_math::dot(p, p) - r * r;

    CircleToi res;
    if (qa < STATIONARY_EPSILON) {
        if (qc <= 0.0f) {
            res.hit = true;
            res.t = 0.0f;
            res.normal = drape_math::normalize_or(p, drape_math::vec2::X);
        }
        return res;
    }

    const float disc = qb * qb - 4.0f * qa * qc;
    if (disc < 0.0f) {
        return res;
    }

    const float sqrt_d = std::sqrt(disc);
    const float t1 = (-qb - sqrt_d) / (2.0f * qa);
    const float t2 = (-qb + sqrt_d) / (2.0f * qa);

    float t = drape_math::consts::INFINITY_F;
    if (t1 >= 0.0f && t1 <= 1.0f) t = std::min(t, t1);
    if (t2 >= 0.0f && t2 <= 1.0f) t = std::min(t, t2);
    if (!std::isfinite(t)) {
        return res;
    }

    res.hit = true;
    res.t = t;
    res.normal = drape_math::normalize_or(p + v * t, drape_math::vec2::X);
    return res;
}

} // namespace drape_ccd
