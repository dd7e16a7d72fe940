/// @file test_rigid_system.cpp
/// @brief Tests for RigidSystem integration, contacts, sleep and CCD policy

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <drape_engine/physics/physics.hpp>
#include <drape_engine/event/event.hpp>

#include <cmath>
#include <memory>
#include <string>
#include <vector>

using namespace drape_physics;
using drape_event::Channel;
using drape_event::EventBus;
using drape_event::EventHeader;
using drape_event::EventReader;
using Catch::Matchers::WithinAbs;

namespace {

constexpr float DT = 1.0f / 60.0f;

std::shared_ptr<EventBus> make_bus() {
    return std::make_shared<EventBus>(drape_event::BusOptions{256, 256});
}

StaticQuery no_statics() {
    return [] { return std::vector<Aabb>{}; };
}

StaticQuery statics(std::vector<Aabb> boxes) {
    return [boxes] { return boxes; };
}

RigidBody box(BodyId id, Vec2 center, Vec2 velocity = Vec2(0.0f)) {
    RigidBody b;
    b.id = id;
    b.center = center;
    b.half = Vec2(0.1f);
    b.velocity = velocity;
    b.restitution = 0.2f;
    b.friction = 0.5f;
    return b;
}

template<typename E>
std::vector<E> drain(EventBus& bus, const std::string& id, Channel channel = Channel::FixedEnd) {
    auto cursor = bus.cursor(id);
    std::vector<E> out;
    if (!cursor) {
        return out;
    }
    cursor->read(channel, [&out](const EventHeader& h, const EventReader& r) {
        if (h.id == E::KIND) {
            out.push_back(E::read(r));
        }
    });
    return out;
}

} // anonymous namespace

// =============================================================================
// Registration
// =============================================================================

TEST_CASE("RigidSystem: descriptor and defaults", "[physics][rigid]") {
    RigidSystem sys({}, no_statics(), make_bus());

    REQUIRE(sys.descriptor().name == "rigid-static");
    REQUIRE(sys.descriptor().priority == 96);
    REQUIRE_FALSE(sys.descriptor().allow_while_paused);
    REQUIRE_FALSE(sys.ccd_settings().enabled);
    REQUIRE(std::isinf(sys.ccd_settings().speed_threshold));
    REQUIRE(sys.ccd_settings().epsilon == 1e-4f);
    REQUIRE(sys.config().sleep_frames_threshold == 60);
}

TEST_CASE("RigidSystem: add_body rejects bad bodies", "[physics][rigid]") {
    RigidSystem sys({}, no_statics(), make_bus());
    REQUIRE(sys.add_body(box(1, Vec2(0.0f))).is_ok());

    SECTION("duplicate id") {
        auto res = sys.add_body(box(1, Vec2(1.0f)));
        REQUIRE(res.is_err());
        REQUIRE(res.error().code() == drape_core::ErrorCode::AlreadyExists);
        REQUIRE(res.error().is<drape_core::BodyError>());
        REQUIRE(res.error().as<drape_core::BodyError>()->body_id == 1);
    }

    SECTION("reserved id") {
        auto res = sys.add_body(box(0, Vec2(1.0f)));
        REQUIRE(res.is_err());
        REQUIRE(res.error().code() == drape_core::ErrorCode::InvalidArgument);
    }

    SECTION("degenerate shape") {
        RigidBody flat = box(5, Vec2(1.0f));
        flat.half = Vec2(0.1f, 0.0f);
        REQUIRE(sys.add_body(flat).is_err());
    }

    REQUIRE(sys.body_count() == 1);
    REQUIRE(sys.body_center(1) == Vec2(0.0f));
}

TEST_CASE("RigidSystem: remove_body keeps order", "[physics][rigid]") {
    RigidSystem sys({}, no_statics(), make_bus());
    REQUIRE(sys.add_body(box(1, Vec2(0.0f))).is_ok());
    REQUIRE(sys.add_body(box(2, Vec2(1.0f))).is_ok());
    REQUIRE(sys.add_body(box(3, Vec2(2.0f))).is_ok());

    REQUIRE(sys.remove_body(2));
    REQUIRE_FALSE(sys.remove_body(2));

    auto snapshot = sys.debug_get_bodies();
    REQUIRE(snapshot.size() == 2);
    REQUIRE(snapshot[0].id == 1);
    REQUIRE(snapshot[1].id == 3);
    REQUIRE(sys.body(3) != nullptr);
    REQUIRE(sys.body(3)->center == Vec2(2.0f));
    REQUIRE_FALSE(sys.body_center(2).has_value());
}

// =============================================================================
// Integration and Static Contacts
// =============================================================================

TEST_CASE("RigidSystem: semi-implicit gravity integration", "[physics][rigid]") {
    RigidSystemConfig config;
    config.gravity = 10.0f;
    RigidSystem sys(config, no_statics(), make_bus());
    REQUIRE(sys.add_body(box(1, Vec2(0.0f))).is_ok());

    sys.fixed_update(0.1f);
    REQUIRE_THAT(sys.body(1)->velocity.y, WithinAbs(-1.0, 1e-6));
    REQUIRE_THAT(sys.body(1)->center.y, WithinAbs(-0.1, 1e-6));

    SECTION("non-positive dt is ignored") {
        sys.fixed_update(0.0f);
        sys.fixed_update(-1.0f);
        REQUIRE_THAT(sys.body(1)->velocity.y, WithinAbs(-1.0, 1e-6));
    }
}

TEST_CASE("RigidSystem: static contact applies restitution and friction", "[physics][rigid]") {
    auto bus = make_bus();
    RigidSystemConfig config;
    config.gravity = 0.0f;
    RigidSystem sys(config, statics({Aabb(Vec2(-1.0f, -0.1f), Vec2(1.0f, 0.0f))}), bus);
    bus->subscribe("test", {{Channel::FixedEnd, drape_event::event_ids::Collision}});

    RigidBody b = box(7, Vec2(0.0f, 0.01f), Vec2(1.0f, -1.0f));
    b.restitution = 0.5f;
    b.friction = 0.5f;
    REQUIRE(sys.add_body(b).is_ok());

    sys.fixed_update(DT);

    const RigidBody& after = *sys.body(7);
    REQUIRE_THAT(after.velocity.y, WithinAbs(0.5, 1e-5));
    REQUIRE(std::abs(after.velocity.x) < 1.0f);
    REQUIRE_THAT(after.velocity.x, WithinAbs(0.25, 1e-5));
    // Pushed out of the ground, not into it
    REQUIRE(after.center.y - after.half.y >= -1e-5f);

    auto hits = drain<drape_event::CollisionEvent>(*bus, "test");
    REQUIRE(hits.size() == 1);
    REQUIRE(hits[0].a == 7);
    REQUIRE(hits[0].b == STATIC_BODY);
    REQUIRE_THAT(hits[0].normal.y, WithinAbs(1.0, 1e-6));
    REQUIRE_THAT(hits[0].depth, WithinAbs(0.1, 1e-4));
    REQUIRE_THAT(hits[0].contact.y, WithinAbs(after.center.y - after.half.y, 1e-6));
}

TEST_CASE("RigidSystem: body leaving a contact gets no impulse", "[physics][rigid]") {
    RigidSystemConfig config;
    config.gravity = 0.0f;
    RigidSystem sys(config, statics({Aabb(Vec2(-1.0f, -0.1f), Vec2(1.0f, 0.0f))}), make_bus());
    REQUIRE(sys.add_body(box(1, Vec2(0.0f, 0.05f), Vec2(0.0f, 0.3f))).is_ok());

    sys.fixed_update(DT);
    REQUIRE_THAT(sys.body(1)->velocity.y, WithinAbs(0.3, 1e-6));
    REQUIRE(sys.body(1)->center.y >= 0.1f - 1e-5f);
}

// =============================================================================
// Sleep and Wake
// =============================================================================

TEST_CASE("RigidSystem: slow body falls asleep and stops", "[physics][rigid][sleep]") {
    auto bus = make_bus();
    RigidSystemConfig config;
    config.gravity = 0.0f;
    config.sleep_frames_threshold = 4;
    RigidSystem sys(config, no_statics(), bus);
    bus->subscribe("sleep", {{Channel::FixedEnd, drape_event::event_ids::Sleep}});

    REQUIRE(sys.add_body(box(7, Vec2(0.0f), Vec2(0.005f, 0.0f))).is_ok());

    for (int i = 0; i < 3; ++i) {
        sys.fixed_update(DT);
    }
    REQUIRE_FALSE(sys.is_sleeping(7));
    REQUIRE(drain<drape_event::SleepEvent>(*bus, "sleep").empty());

    sys.fixed_update(DT);
    REQUIRE(sys.is_sleeping(7));
    auto sleeps = drain<drape_event::SleepEvent>(*bus, "sleep");
    REQUIRE(sleeps.size() == 1);
    REQUIRE(sleeps[0].entity == 7);
    REQUIRE(sys.body(7)->velocity == Vec2(0.0f));

    const Vec2 before = sys.body(7)->center;
    for (int i = 0; i < 10; ++i) {
        sys.fixed_update(DT);
    }
    REQUIRE(sys.body(7)->center == before);
    REQUIRE(drain<drape_event::SleepEvent>(*bus, "sleep").empty());
}

TEST_CASE("RigidSystem: sleeping body ignores gravity", "[physics][rigid][sleep]") {
    RigidSystemConfig config;
    config.sleep_frames_threshold = 1;
    RigidSystem sys(config, no_statics(), make_bus());
    REQUIRE(sys.add_body(box(3, Vec2(0.0f, 1.0f))).is_ok());

    for (int i = 0; i < 30; ++i) {
        sys.fixed_update(DT);
    }
    REQUIRE(sys.is_sleeping(3));
    REQUIRE(sys.body(3)->center == Vec2(0.0f, 1.0f));
}

TEST_CASE("RigidSystem: dynamic hit wakes a sleeping body", "[physics][rigid][sleep]") {
    auto bus = make_bus();
    RigidSystemConfig config;
    config.gravity = 0.0f;
    config.enable_dynamic_pairs = true;
    config.sleep_frames_threshold = 1;
    RigidSystem sys(config, no_statics(), bus);
    bus->subscribe("wake", {
        {Channel::FixedEnd, drape_event::event_ids::Sleep},
        {Channel::FixedEnd, drape_event::event_ids::Wake},
    });

    REQUIRE(sys.add_body(box(1, Vec2(0.0f, 0.26f), Vec2(0.0f, -3.0f))).is_ok());
    REQUIRE(sys.add_body(box(2, Vec2(0.0f, 0.0f))).is_ok());

    sys.fixed_update(DT);
    REQUIRE(sys.is_sleeping(2));
    REQUIRE_FALSE(sys.is_sleeping(1));

    std::vector<drape_event::EventKind> kinds;
    std::vector<std::uint32_t> entities;
    auto read_all = [&] {
        bus->cursor("wake")->read(Channel::FixedEnd, [&](const EventHeader& h, const EventReader& r) {
            kinds.push_back(h.id);
            entities.push_back(r.u32()[0]);
        });
    };
    read_all();
    REQUIRE(kinds == std::vector<drape_event::EventKind>{drape_event::event_ids::Sleep});
    REQUIRE(entities == std::vector<std::uint32_t>{2});

    kinds.clear();
    entities.clear();
    sys.fixed_update(DT);
    read_all();
    REQUIRE(kinds == std::vector<drape_event::EventKind>{drape_event::event_ids::Wake, drape_event::event_ids::Wake});
    REQUIRE(entities == std::vector<std::uint32_t>{1, 2});
    REQUIRE_FALSE(sys.is_sleeping(2));
    REQUIRE(sys.body(2)->velocity.y < 0.0f);

    const Vec2 before = sys.body(2)->center;
    sys.fixed_update(DT);
    REQUIRE(sys.body(2)->center.y < before.y);
}

TEST_CASE("RigidSystem: explicit wake", "[physics][rigid][sleep]") {
    auto bus = make_bus();
    RigidSystemConfig config;
    config.sleep_frames_threshold = 1;
    RigidSystem sys(config, no_statics(), bus);
    bus->subscribe("wake", {{Channel::FixedEnd, drape_event::event_ids::Wake}});
    REQUIRE(sys.add_body(box(4, Vec2(0.0f))).is_ok());

    sys.fixed_update(DT);
    REQUIRE(sys.is_sleeping(4));

    REQUIRE(sys.wake(4));
    REQUIRE_FALSE(sys.is_sleeping(4));
    auto wakes = drain<drape_event::WakeEvent>(*bus, "wake");
    REQUIRE(wakes.size() == 1);
    REQUIRE(wakes[0].entity == 4);

    REQUIRE_FALSE(sys.wake(404));
}

// =============================================================================
// Dynamic Pairs
// =============================================================================

TEST_CASE("RigidSystem: equal-mass impulse symmetry", "[physics][rigid][pairs]") {
    auto bus = make_bus();
    RigidSystemConfig config;
    config.gravity = 0.0f;
    config.enable_dynamic_pairs = true;
    config.sleep_velocity_threshold = 0.0f;
    RigidSystem sys(config, no_statics(), bus);
    bus->subscribe("pairs", {
        {Channel::FixedEnd, drape_event::event_ids::Collision},
        {Channel::FixedEnd, drape_event::event_ids::Impulse},
    });

    const float e = 0.5f;
    RigidBody a = box(1, Vec2(0.0f, 0.18f), Vec2(0.0f, -1.0f));
    RigidBody b = box(2, Vec2(0.0f, 0.0f), Vec2(0.0f, 0.5f));
    a.restitution = e;
    b.restitution = e;
    a.friction = 0.0f;
    b.friction = 0.0f;
    REQUIRE(sys.add_body(a).is_ok());
    REQUIRE(sys.add_body(b).is_ok());

    const float pre_rel = a.velocity.y - b.velocity.y;
    const float pre_momentum = a.velocity.y + b.velocity.y;

    sys.fixed_update(DT);

    const RigidBody& a1 = *sys.body(1);
    const RigidBody& b1 = *sys.body(2);
    const float post_rel = a1.velocity.y - b1.velocity.y;
    REQUIRE_THAT(post_rel, WithinAbs(-e * pre_rel, 1e-5));
    REQUIRE_THAT(a1.velocity.y + b1.velocity.y, WithinAbs(pre_momentum, 1e-5));
    REQUIRE_THAT(a1.velocity.x, WithinAbs(0.0, 1e-6));

    // Positional correction split evenly
    REQUIRE_THAT(a1.center.y - b1.center.y, WithinAbs(0.2, 1e-5));

    auto collisions = drain<drape_event::CollisionEvent>(*bus, "pairs");
    REQUIRE(collisions.size() == 1);
    REQUIRE(collisions[0].a == 1);
    REQUIRE(collisions[0].b == 2);
    REQUIRE_THAT(collisions[0].normal.y, WithinAbs(1.0, 1e-6));
}

TEST_CASE("RigidSystem: pair impulses are equal and opposite", "[physics][rigid][pairs]") {
    auto bus = make_bus();
    RigidSystemConfig config;
    config.gravity = 0.0f;
    config.enable_dynamic_pairs = true;
    config.sleep_velocity_threshold = 0.0f;
    RigidSystem sys(config, no_statics(), bus);
    bus->subscribe("impulses", {{Channel::FixedEnd, drape_event::event_ids::Impulse}});

    RigidBody a = box(1, Vec2(0.0f, 0.18f), Vec2(0.3f, -2.0f));
    RigidBody b = box(2, Vec2(0.0f, 0.0f));
    a.mass = 2.0f;
    REQUIRE(sys.add_body(a).is_ok());
    REQUIRE(sys.add_body(b).is_ok());

    const Vec2 pre_momentum = a.velocity * 2.0f + b.velocity;
    sys.fixed_update(DT);

    const Vec2 post_momentum = sys.body(1)->velocity * 2.0f + sys.body(2)->velocity;
    REQUIRE_THAT(post_momentum.x, WithinAbs(pre_momentum.x, 1e-5));
    REQUIRE_THAT(post_momentum.y, WithinAbs(pre_momentum.y, 1e-5));

    auto impulses = drain<drape_event::ImpulseEvent>(*bus, "impulses");
    REQUIRE(impulses.size() == 2);
    REQUIRE(impulses[0].entity == 1);
    REQUIRE(impulses[1].entity == 2);
    REQUIRE(impulses[0].impulse.y > 0.0f);
    REQUIRE_THAT(impulses[0].impulse.x + impulses[1].impulse.x, WithinAbs(0.0, 1e-6));
    REQUIRE_THAT(impulses[0].impulse.y + impulses[1].impulse.y, WithinAbs(0.0, 1e-6));

    // Positional correction is split by inverse mass: the lighter body moves twice as far
    const float moved_a = sys.body(1)->center.y - (0.18f - 2.0f * DT);
    const float moved_b = -sys.body(2)->center.y;
    REQUIRE(moved_a > 0.0f);
    REQUIRE_THAT(moved_b, WithinAbs(2.0f * moved_a, 1e-5));
}

TEST_CASE("RigidSystem: separating pair is corrected without events", "[physics][rigid][pairs]") {
    auto bus = make_bus();
    RigidSystemConfig config;
    config.gravity = 0.0f;
    config.enable_dynamic_pairs = true;
    RigidSystem sys(config, no_statics(), bus);
    bus->subscribe("pairs", {{Channel::FixedEnd, drape_event::event_ids::Collision}});

    REQUIRE(sys.add_body(box(1, Vec2(0.0f, 0.15f), Vec2(0.0f, 1.0f))).is_ok());
    REQUIRE(sys.add_body(box(2, Vec2(0.0f, 0.0f))).is_ok());

    sys.fixed_update(DT);
    REQUIRE_THAT(sys.body(1)->center.y - sys.body(2)->center.y, WithinAbs(0.2, 1e-5));
    REQUIRE_THAT(sys.body(1)->velocity.y, WithinAbs(1.0, 1e-6));
    REQUIRE(drain<drape_event::CollisionEvent>(*bus, "pairs").empty());
}

// =============================================================================
// CCD Policy
// =============================================================================

TEST_CASE("RigidSystem: CCD policy", "[physics][rigid][ccd]") {
    const Aabb wall(Vec2(0.0f, -1.0f), Vec2(0.02f, 1.0f));
    RigidSystemConfig config;
    config.gravity = 0.0f;
    RigidSystem sys(config, statics({wall}), make_bus());

    RigidBody fast = box(1, Vec2(-0.5f, 0.0f), Vec2(60.0f, 0.0f));

    SECTION("disabled by default, fast bodies tunnel") {
        REQUIRE(sys.add_body(fast).is_ok());
        sys.fixed_update(DT);
        REQUIRE_THAT(sys.body(1)->center.x, WithinAbs(0.5, 1e-5));
    }

    SECTION("enabling keeps an unreachable threshold") {
        sys.configure_ccd({});
        REQUIRE(sys.ccd_settings().enabled);
        REQUIRE(std::isinf(sys.ccd_settings().speed_threshold));
        REQUIRE(sys.add_body(fast).is_ok());
        sys.fixed_update(DT);
        REQUIRE(sys.body(1)->center.x > 0.4f);
    }

    SECTION("per-body override forces CCD on") {
        sys.configure_ccd({});
        fast.ccd = true;
        REQUIRE(sys.add_body(fast).is_ok());
        sys.fixed_update(DT);
        REQUIRE(sys.body(1)->center.x + fast.half.x <= wall.min.x + 1e-4f);
    }

    SECTION("per-body override forces CCD off") {
        sys.configure_ccd({0.0f, std::nullopt, true});
        fast.ccd = false;
        REQUIRE(sys.add_body(fast).is_ok());
        sys.fixed_update(DT);
        REQUIRE(sys.body(1)->center.x > 0.4f);
    }

    SECTION("threshold above the body speed") {
        sys.configure_ccd({100.0f, std::nullopt, std::nullopt});
        REQUIRE(sys.add_body(fast).is_ok());
        sys.fixed_update(DT);
        REQUIRE(sys.body(1)->center.x > 0.4f);
    }

    SECTION("explicit disable") {
        sys.configure_ccd({0.0f, std::nullopt, false});
        REQUIRE_FALSE(sys.ccd_settings().enabled);
    }

    SECTION("values are clamped") {
        sys.configure_ccd({-1.0f, 1e-9f, std::nullopt});
        REQUIRE(sys.ccd_settings().speed_threshold == 0.0f);
        REQUIRE(sys.ccd_settings().epsilon == drape_ccd::MIN_EPSILON);
    }
}

TEST_CASE("RigidSystem: body sliding on the floor with CCD keeps its speed", "[physics][rigid][ccd]") {
    auto bus = make_bus();
    RigidSystem sys(RigidSystemConfig{}, statics({Aabb(Vec2(-10.0f, -1.0f), Vec2(10.0f, 0.0f))}), bus);
    sys.configure_ccd({0.0f, 1e-4f, true});

    RigidBody slider = box(1, Vec2(0.0f, 0.1f), Vec2(10.0f, 0.0f));
    slider.friction = 0.0f;
    slider.restitution = 0.0f;
    REQUIRE(sys.add_body(slider).is_ok());

    for (int i = 0; i < 10; ++i) {
        sys.fixed_update(DT);
    }

    const RigidBody& after = *sys.body(1);
    REQUIRE_THAT(after.velocity.x, WithinAbs(10.0, 1e-4));
    REQUIRE_THAT(after.velocity.y, WithinAbs(0.0, 1e-4));
    REQUIRE_THAT(after.center.x, WithinAbs(10.0 * 10.0 * DT, 1e-3));
    REQUIRE(after.center.y >= 0.1f - 1e-5f);
    REQUIRE(after.center.y < 0.1f + 1e-3f);
}

TEST_CASE("RigidSystem: thin wall stops a fast body in one coarse step", "[physics][rigid][ccd]") {
    auto bus = make_bus();
    RigidSystemConfig config;
    config.gravity = 0.0f;
    RigidSystem sys(config, statics({Aabb(Vec2(0.0f, -1.0f), Vec2(0.02f, 1.0f))}), bus);
    sys.configure_ccd({1.0f, 1e-4f, std::nullopt});

    RigidBody fast = box(1, Vec2(-0.5f, 0.0f), Vec2(10.0f, 0.0f));
    REQUIRE(sys.add_body(fast).is_ok());

    sys.fixed_update(0.1f);

    const RigidBody& after = *sys.body(1);
    REQUIRE(after.center.x + after.half.x <= 1e-4f);
    REQUIRE_THAT(after.velocity.x, WithinAbs(-2.0, 1e-4));

    // Late subscriber still sees the retained events
    auto cursor = bus->subscribe("late", {
        {Channel::FixedEnd, drape_event::event_ids::Collision},
        {Channel::FixedEnd, drape_event::event_ids::CcdHit},
    });
    std::vector<drape_event::CcdHitEvent> hits;
    std::vector<drape_event::CollisionEvent> collisions;
    cursor.read(Channel::FixedEnd, [&](const EventHeader& h, const EventReader& r) {
        if (h.id == drape_event::event_ids::CcdHit) {
            hits.push_back(drape_event::CcdHitEvent::read(r));
        } else {
            collisions.push_back(drape_event::CollisionEvent::read(r));
        }
    });

    REQUIRE(hits.size() == 1);
    REQUIRE(hits[0].entity == 1);
    REQUIRE_THAT(hits[0].t, WithinAbs(0.4, 1e-4));
    REQUIRE(hits[0].normal == Vec2(-1.0f, 0.0f));

    REQUIRE(collisions.size() == 1);
    REQUIRE(collisions[0].b == STATIC_BODY);
    REQUIRE_THAT(collisions[0].depth, WithinAbs(1e-4, 1e-7));
}

// =============================================================================
// Picking
// =============================================================================

TEST_CASE("RigidSystem: pick_at publishes on FrameEnd", "[physics][rigid][picking]") {
    auto bus = make_bus();
    RigidSystem sys({}, no_statics(), bus);
    bus->subscribe("pick", {{Channel::FrameEnd, drape_event::event_ids::Pick}});
    REQUIRE(sys.add_body(box(5, Vec2(1.0f, 1.0f))).is_ok());

    REQUIRE_FALSE(sys.pick_at(Vec2(0.0f)).has_value());
    REQUIRE(drain<drape_event::PickEvent>(*bus, "pick", Channel::FrameEnd).empty());

    auto hit = sys.pick_at(Vec2(1.05f, 0.95f));
    REQUIRE(hit.has_value());
    REQUIRE(hit->id == 5);

    auto picks = drain<drape_event::PickEvent>(*bus, "pick", Channel::FrameEnd);
    REQUIRE(picks.size() == 1);
    REQUIRE(picks[0].entity == 5);
    REQUIRE(picks[0].point == Vec2(1.05f, 0.95f));
}
