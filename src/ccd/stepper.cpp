/// @file stepper.cpp
/// @brief CCD-aware integration

#include <drape_engine/ccd/stepper.hpp>

#include <algorithm>

namespace drape_ccd {

namespace {

template<typename Shape>
std::optional<SweepResult> earliest_hit(const Obb& body, const Vec2& velocity, float dt,
                                        std::span<const Shape> obstacles) {
    std::optional<SweepResult> best;
    for (const Shape& obstacle : obstacles) {
        SweepResult res = sweep_toi(body, velocity, obstacle, dt);
        if (!res.hit) {
            continue;
        }
        if (!best || res.t < best->t) {
            best = res;
        }
    }
    return best;
}

template<typename Shape>
AdvanceResult advance_impl(const Obb& body, const Vec2& velocity, float dt,
                           std::span<const Shape> obstacles, float epsilon, int max_iterations) {
    AdvanceResult out;
    Obb moving = body;
    Vec2 v = velocity;
    float remaining = dt;

    for (int i = 0; i < std::max(max_iterations, 1) && remaining > 0.0f; ++i) {
        const std::optional<SweepResult> hit = earliest_hit(moving, v, remaining, obstacles);
        if (!hit) {
            moving.center += v * remaining;
            break;
        }

        const float t = std::clamp(hit->t, 0.0f, 1.0f);
        moving.center += v * (remaining * t) + hit->normal * epsilon;
        remaining *= 1.0f - t;

        if (!out.collided) {
            out.collided = true;
            out.t = t;
            out.normal = hit->normal;
            out.point = hit->point;
        }

        // Later sweeps slide along the contact surface
        const float vn = drape_math::dot(v, hit->normal);
        if (vn < 0.0f) {
            v -= hit->normal * vn;
        }
    }

    out.center = moving.center;
    return out;
}

} // anonymous namespace

AdvanceResult advance_with_ccd(const Obb& body, const Vec2& velocity, float dt,
                               std::span<const Aabb> obstacles, float epsilon, int max_iterations) {
    return advance_impl(body, velocity, dt, obstacles, epsilon, max_iterations);
}

AdvanceResult advance_with_ccd(const Obb& body, const Vec2& velocity, float dt,
                               std::span<const Obb> obstacles, float epsilon, int max_iterations) {
    return advance_impl(body, velocity, dt, obstacles, epsilon, max_iterations);
}

} // namespace drape_ccd
