/// @file test_stepper.cpp
/// @brief Tests for advance_with_ccd and CCD settings

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <drape_engine/ccd/ccd.hpp>

#include <cmath>
#include <vector>

using namespace drape_ccd;
using Catch::Matchers::WithinAbs;

TEST_CASE("Thin wall: no tunneling in a single step", "[ccd][stepper]") {
    Obb body(Vec2(0.0f, 0.0f), Vec2(0.1f, 0.1f));
    std::vector<Aabb> walls = {Aabb(Vec2(0.25f, -1.0f), Vec2(0.26f, 1.0f))};
    const Vec2 v(20.0f, 0.0f);
    const float dt = 1.0f / 60.0f;

    // Naive integration would pass straight through
    REQUIRE(body.center.x + v.x * dt + body.half.x > walls[0].max.x);

    AdvanceResult out = advance_with_ccd(body, v, dt, walls);
    REQUIRE(out.collided);
    REQUIRE(out.center.x + body.half.x <= walls[0].min.x + DEFAULT_EPSILON);
    REQUIRE(out.normal == Vec2(-1.0f, 0.0f));
    REQUIRE_THAT(out.t, WithinAbs(0.45, 1e-4));
}

TEST_CASE("advance_with_ccd keeps the earliest hit", "[ccd][stepper]") {
    Obb body(Vec2(0.0f, 0.0f), Vec2(0.1f, 0.1f));
    std::vector<Aabb> walls = {
        Aabb(Vec2(0.8f, -1.0f), Vec2(0.9f, 1.0f)),
        Aabb(Vec2(0.4f, -1.0f), Vec2(0.5f, 1.0f)),
    };

    AdvanceResult out = advance_with_ccd(body, Vec2(1.0f, 0.0f), 1.0f, walls, 1e-3f);
    REQUIRE(out.collided);
    REQUIRE_THAT(out.t, WithinAbs(0.3, 1e-5));
    REQUIRE_THAT(out.center.x, WithinAbs(0.3 - 1e-3, 1e-5));
    REQUIRE(out.point.has_value());
}

TEST_CASE("advance_with_ccd without hits advances the full step", "[ccd][stepper]") {
    Obb body(Vec2(0.0f, 0.0f), Vec2(0.1f, 0.1f));

    SECTION("no obstacles") {
        AdvanceResult out = advance_with_ccd(body, Vec2(2.0f, -1.0f), 0.5f, std::span<const Aabb>{});
        REQUIRE_FALSE(out.collided);
        REQUIRE(out.center == Vec2(1.0f, -0.5f));
    }

    SECTION("obstacle out of reach") {
        std::vector<Aabb> walls = {Aabb(Vec2(5.0f, -1.0f), Vec2(6.0f, 1.0f))};
        AdvanceResult out = advance_with_ccd(body, Vec2(1.0f, 0.0f), 1.0f, walls);
        REQUIRE_FALSE(out.collided);
        REQUIRE(out.center == Vec2(1.0f, 0.0f));
    }
}

TEST_CASE("advance_with_ccd against oriented obstacles", "[ccd][stepper]") {
    Obb body(Vec2(0.0f, 0.0f), Vec2(0.1f, 0.1f));
    std::vector<Obb> blocks = {Obb(Vec2(1.0f, 0.0f), Vec2(0.2f, 0.5f), 0.3f)};

    AdvanceResult out = advance_with_ccd(body, Vec2(3.0f, 0.0f), 1.0f, blocks);
    REQUIRE(out.collided);
    REQUIRE(out.center.x < 1.0f);
    REQUIRE(drape_math::dot(out.normal, Vec2(3.0f, 0.0f)) <= 0.0f);
}

TEST_CASE("advance_with_ccd slides along the contact surface", "[ccd][stepper]") {
    Obb body(Vec2(0.0f, 0.5f), Vec2(0.5f, 0.5f));
    std::vector<Aabb> floor = {Aabb(Vec2(-10.0f, -1.0f), Vec2(10.0f, 0.0f))};
    const Vec2 v(3.0f, -1.0f);

    SECTION("single sweep stops at the contact") {
        AdvanceResult out = advance_with_ccd(body, v, 1.0f, floor, 1e-3f);
        REQUIRE(out.collided);
        REQUIRE(out.t == 0.0f);
        REQUIRE(out.normal == Vec2(0.0f, 1.0f));
        REQUIRE_THAT(out.center.x, WithinAbs(0.0, 1e-6));
    }

    SECTION("further sweeps keep the tangential motion") {
        AdvanceResult out = advance_with_ccd(body, v, 1.0f, floor, 1e-3f, 3);
        REQUIRE(out.collided);
        REQUIRE(out.t == 0.0f);
        REQUIRE(out.normal == Vec2(0.0f, 1.0f));
        REQUIRE_THAT(out.center.x, WithinAbs(3.0, 1e-5));
        REQUIRE_THAT(out.center.y, WithinAbs(0.5 + 1e-3, 1e-5));
    }

    SECTION("a wall ahead still stops the slide") {
        floor.push_back(Aabb(Vec2(1.0f, 0.0f), Vec2(1.2f, 2.0f)));
        AdvanceResult out = advance_with_ccd(body, v, 1.0f, floor, 1e-3f, 3);
        REQUIRE(out.center.x + body.half.x <= 1.0f);
        REQUIRE(out.center.y >= 0.5f);
    }
}

TEST_CASE("CcdSettings sanitizing", "[ccd][settings]") {
    CcdSettings defaults;
    REQUIRE_FALSE(defaults.enabled);
    REQUIRE(defaults.speed_threshold == 5.0f);
    REQUIRE(defaults.max_iterations == 3);

    CcdSettings bad;
    bad.speed_threshold = -2.0f;
    bad.epsilon = std::nanf("");
    bad.max_iterations = 0;
    CcdSettings s = bad.sanitized();
    REQUIRE(s.speed_threshold == 0.0f);
    REQUIRE(s.epsilon == DEFAULT_EPSILON);
    REQUIRE(s.max_iterations == 1);

    CcdSettings tiny;
    tiny.epsilon = 1e-9f;
    REQUIRE(tiny.sanitized().epsilon == MIN_EPSILON);
}
