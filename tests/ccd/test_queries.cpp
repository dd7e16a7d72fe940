/// @file test_queries.cpp
/// @brief Tests for ray slab and circle TOI queries

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <drape_engine/ccd/ccd.hpp>

#include <cmath>

using namespace drape_ccd;
using Catch::Matchers::WithinAbs;

// =============================================================================
// Ray Slabs
// =============================================================================

TEST_CASE("Ray slabs: AABB hit through the middle", "[ccd][ray]") {
    RayHit res = ray_aabb_slabs(Vec2(0.0f), Vec2(1.0f, 0.0f), Aabb(Vec2(2.0f, -1.0f), Vec2(4.0f, 1.0f)));
    REQUIRE(res.hit);
    REQUIRE_THAT(res.t_enter, WithinAbs(2.0, 1e-6));
    REQUIRE_THAT(res.t_exit, WithinAbs(4.0, 1e-6));
    REQUIRE(res.normal == Vec2(-1.0f, 0.0f));
    REQUIRE(res.point == Vec2(2.0f, 0.0f));
}

TEST_CASE("Ray slabs: AABB misses", "[ccd][ray]") {
    Aabb box(Vec2(2.0f, -1.0f), Vec2(4.0f, 1.0f));

    SECTION("aiming away") {
        REQUIRE_FALSE(ray_aabb_slabs(Vec2(0.0f), Vec2(-1.0f, 0.0f), box).hit);
    }

    SECTION("parallel outside the slab") {
        REQUIRE_FALSE(ray_aabb_slabs(Vec2(0.0f, 2.0f), Vec2(1.0f, 0.0f), box).hit);
    }
}

TEST_CASE("Ray slabs: vertical ray hits the top face", "[ccd][ray]") {
    RayHit res = ray_aabb_slabs(Vec2(3.0f, 5.0f), Vec2(0.0f, -1.0f), Aabb(Vec2(2.0f, -1.0f), Vec2(4.0f, 1.0f)));
    REQUIRE(res.hit);
    REQUIRE_THAT(res.t_enter, WithinAbs(4.0, 1e-5));
    REQUIRE(res.normal == Vec2(0.0f, 1.0f));
}

TEST_CASE("Ray slabs: rotated box hit point lies on a face", "[ccd][ray]") {
    const float theta = drape_math::consts::PI / 6.0f;
    Obb box(Vec2(3.0f, 0.0f), Vec2(1.0f, 0.5f), theta);

    RayHit res = ray_obb_local_slabs(Vec2(0.0f), Vec2(1.0f, 0.0f), box);
    REQUIRE(res.hit);

    const float c = std::cos(theta);
    const float s = std::sin(theta);
    const Vec2 p = res.point - box.center;
    const float lx = p.x * c + p.y * s;
    const float ly = -p.x * s + p.y * c;

    const float dx = std::abs(std::abs(lx) - box.half.x);
    const float dy = std::abs(std::abs(ly) - box.half.y);
    REQUIRE(std::min(dx, dy) < 1e-3f);
    REQUIRE(std::abs(lx) <= box.half.x + 1e-3f);
    REQUIRE(std::abs(ly) <= box.half.y + 1e-3f);
    REQUIRE_THAT(drape_math::length(res.normal), WithinAbs(1.0, 1e-5));
    REQUIRE(res.normal.x < 0.0f);
}

// =============================================================================
// Circle TOI
// =============================================================================

TEST_CASE("Circle TOI: head-on approach", "[ccd][circle]") {
    Circle a{Vec2(0.0f), 0.5f};
    Circle b{Vec2(3.0f, 0.0f), 0.5f};

    CircleToi res = circle_circle_toi(a, Vec2(1.0f, 0.0f), b, Vec2(-1.0f, 0.0f), 1.0f);
    REQUIRE(res.hit);
    REQUIRE_THAT(res.t, WithinAbs(1.0, 1e-6));
    REQUIRE_THAT(res.normal.x, WithinAbs(-1.0, 1e-6));
}

TEST_CASE("Circle TOI: diverging misses", "[ccd][circle]") {
    Circle a{Vec2(0.0f), 0.5f};
    Circle b{Vec2(3.0f, 0.0f), 0.5f};
    REQUIRE_FALSE(circle_circle_toi(a, Vec2(-1.0f, 0.0f), b, Vec2(1.0f, 0.0f), 1.0f).hit);
}

TEST_CASE("Circle TOI: stationary pair", "[ccd][circle]") {
    Circle a{Vec2(0.0f), 0.5f};

    SECTION("overlapping hits at t=0") {
        CircleToi res = circle_circle_toi(a, Vec2(0.0f), Circle{Vec2(0.0f, 0.8f), 0.5f}, Vec2(0.0f), 1.0f);
        REQUIRE(res.hit);
        REQUIRE(res.t == 0.0f);
        REQUIRE_THAT(res.normal.y, WithinAbs(-1.0, 1e-6));
    }

    SECTION("coincident centers use the fallback normal") {
        CircleToi res = circle_circle_toi(a, Vec2(0.0f), Circle{Vec2(0.0f), 0.5f}, Vec2(0.0f), 1.0f);
        REQUIRE(res.hit);
        REQUIRE(res.normal == Vec2(1.0f, 0.0f));
    }

    SECTION("apart misses") {
        REQUIRE_FALSE(circle_circle_toi(a, Vec2(0.0f), Circle{Vec2(5.0f, 0.0f), 0.5f}, Vec2(0.0f), 1.0f).hit);
    }
}
