/// @file test_scenarios.cpp
/// @brief Acceptance runs of the canned rigid scenarios

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <drape_engine/physics/physics.hpp>
#include <drape_engine/event/event.hpp>

#include <algorithm>
#include <string>
#include <vector>

using namespace drape_physics;
using Catch::Matchers::WithinAbs;

namespace {

constexpr float DT = 1.0f / 60.0f;

float tail_range(const std::vector<float>& history, std::size_t window) {
    auto first = history.end() - static_cast<std::ptrdiff_t>(std::min(window, history.size()));
    auto [lo, hi] = std::minmax_element(first, history.end());
    return *hi - *lo;
}

} // anonymous namespace

TEST_CASE("Scenarios: names round trip", "[physics][scenarios]") {
    for (ScenarioId id : ALL_SCENARIOS) {
        auto parsed = parse_scenario(scenario_name(id));
        REQUIRE(parsed.has_value());
        REQUIRE(*parsed == id);
    }
    REQUIRE(std::string(scenario_name(ScenarioId::ThinWallCcd)) == "rigid-thin-wall-ccd");
    REQUIRE_FALSE(parse_scenario("cloth-c1-settling").has_value());
}

TEST_CASE("Scenarios: stacked boxes settle", "[physics][scenarios]") {
    Scenario s = create_rigid_scenario(ScenarioId::StackRest);
    REQUIRE(s.system->body_count() == 2);
    REQUIRE(s.primary_body == 2);
    REQUIRE(s.system->config().enable_dynamic_pairs);

    std::vector<float> top_y;
    for (int i = 0; i < 360; ++i) {
        s.system->fixed_update(DT);
        top_y.push_back(s.system->body(2)->center.y);
    }

    REQUIRE(tail_range(top_y, 60) < 0.08f);
    REQUIRE(s.system->body(2)->center.y > s.system->body(1)->center.y);
    REQUIRE(s.system->body(1)->center.y > 0.0f);
}

TEST_CASE("Scenarios: dropped box comes to rest on the floor", "[physics][scenarios]") {
    Scenario s = create_rigid_scenario(ScenarioId::DropOntoStatic);
    REQUIRE(s.statics.size() == 1);

    std::vector<float> ys;
    for (int i = 0; i < 240; ++i) {
        s.system->fixed_update(DT);
        ys.push_back(s.system->body(1)->center.y);
    }

    REQUIRE(ys.back() < ys.front());
    REQUIRE(tail_range(ys, 60) < 0.25f);

    const RigidBody& body = *s.system->body(1);
    REQUIRE(body.center.y - body.half.y > -0.02f);
}

TEST_CASE("Scenarios: thin wall is never crossed", "[physics][scenarios][ccd]") {
    Scenario s = create_rigid_scenario(ScenarioId::ThinWallCcd);
    REQUIRE(s.primary_body == 99);
    REQUIRE(s.system->ccd_settings().enabled);
    REQUIRE(s.system->ccd_settings().speed_threshold == 0.5f);

    s.bus->subscribe("wall", {{drape_event::Channel::FixedEnd, drape_event::event_ids::Collision}});
    const Aabb wall = s.statics.front();

    for (int i = 0; i < 60; ++i) {
        s.system->fixed_update(DT);
        const RigidBody& body = *s.system->body(99);
        REQUIRE(body.center.x + body.half.x <= wall.min.x + 1e-3f);
    }

    std::size_t collisions = 0;
    s.bus->cursor("wall")->read(drape_event::Channel::FixedEnd,
        [&collisions](const drape_event::EventHeader&, const drape_event::EventReader&) { ++collisions; });
    REQUIRE(collisions > 0);
}

TEST_CASE("Scenarios: share a caller-provided bus", "[physics][scenarios]") {
    auto bus = std::make_shared<drape_event::EventBus>();
    Scenario s = create_rigid_scenario(ScenarioId::DropOntoStatic, bus);
    REQUIRE(s.bus == bus);
    REQUIRE(s.system->bus() == bus);
}
