/// @file scenarios.cpp
/// @brief Rigid scenario construction

#include <drape_engine/physics/scenarios.hpp>
#include <drape_engine/core/log.hpp>

namespace drape_physics {

namespace {

std::shared_ptr<drape_event::EventBus> bus_or_new(std::shared_ptr<drape_event::EventBus> bus, std::size_t capacity) {
    if (bus) {
        return bus;
    }
    drape_event::BusOptions options;
    options.capacity = capacity;
    options.mailbox_capacity = capacity;
    return std::make_shared<drape_event::EventBus>(options);
}

RigidBody make_box(BodyId id, Vec2 center, Vec2 half, float restitution, float friction) {
    RigidBody b;
    b.id = id;
    b.center = center;
    b.half = half;
    b.mass = 1.0f;
    b.restitution = restitution;
    b.friction = friction;
    return b;
}

StaticQuery fixed_statics(const std::vector<Aabb>& statics) {
    return [statics]() { return statics; };
}

void add_or_log(RigidSystem& system, const RigidBody& body) {
    auto result = system.add_body(body);
    if (!result) {
        drape_core::physics_logger()->error("Scenario body rejected: {}", result.error().message());
    }
}

} // anonymous namespace

const char* scenario_name(ScenarioId id) {
    switch (id) {
        case ScenarioId::StackRest: return "rigid-stack-rest";
        case ScenarioId::DropOntoStatic: return "rigid-drop-onto-static";
        case ScenarioId::ThinWallCcd: return "rigid-thin-wall-ccd";
        default: return "unknown";
    }
}

std::optional<ScenarioId> parse_scenario(std::string_view name) {
    for (ScenarioId id : ALL_SCENARIOS) {
        if (name == scenario_name(id)) {
            return id;
        }
    }
    return std::nullopt;
}

Scenario create_rigid_scenario(ScenarioId id, std::shared_ptr<drape_event::EventBus> bus) {
    Scenario s;
    s.id = id;

    const Aabb ground(Vec2(-1.0f, -0.1f), Vec2(1.0f, 0.0f));

    switch (id) {
        case ScenarioId::StackRest: {
            s.bus = bus_or_new(std::move(bus), 256);
            s.statics = {ground};

            RigidSystemConfig config;
            config.enable_dynamic_pairs = true;
            config.sleep_frames_threshold = 30;
            s.system = std::make_shared<RigidSystem>(config, fixed_statics(s.statics), s.bus);

            add_or_log(*s.system, make_box(1, Vec2(0.0f, 0.25f), Vec2(0.1f), 0.1f, 0.8f));
            add_or_log(*s.system, make_box(2, Vec2(0.0f, 0.55f), Vec2(0.1f), 0.1f, 0.8f));
            s.primary_body = 2;
            break;
        }

        case ScenarioId::DropOntoStatic: {
            s.bus = bus_or_new(std::move(bus), 128);
            s.statics = {ground};

            RigidSystemConfig config;
            config.sleep_frames_threshold = 45;
            s.system = std::make_shared<RigidSystem>(config, fixed_statics(s.statics), s.bus);

            add_or_log(*s.system, make_box(1, Vec2(0.0f, 0.6f), Vec2(0.12f, 0.08f), 0.2f, 0.6f));
            s.primary_body = 1;
            break;
        }

        case ScenarioId::ThinWallCcd: {
            s.bus = bus_or_new(std::move(bus), 128);
            s.statics = {Aabb(Vec2(0.0f, -1.0f), Vec2(0.02f, 1.0f))};

            RigidSystemConfig config;
            config.gravity = 0.0f;
            s.system = std::make_shared<RigidSystem>(config, fixed_statics(s.statics), s.bus);

            CcdConfigUpdate ccd;
            ccd.enabled = true;
            ccd.speed_threshold = 0.5f;
            ccd.epsilon = 1e-4f;
            s.system->configure_ccd(ccd);

            RigidBody fast = make_box(99, Vec2(-1.0f, 0.0f), Vec2(0.1f), 0.0f, 0.0f);
            fast.velocity = Vec2(6.0f, 0.0f);
            add_or_log(*s.system, fast);
            s.primary_body = 99;
            break;
        }
    }

    drape_core::physics_logger()->info("Scenario '{}' created with {} body(ies)",
        scenario_name(id), s.system ? s.system->body_count() : 0);
    return s;
}

} // namespace drape_physics
