/// @file sandbox.cpp
/// @brief Sandbox assembly and headless driving

#include <drape_engine/sandbox/sandbox.hpp>
#include <drape_engine/core/log.hpp>
#include <drape_engine/physics/scenarios.hpp>

namespace drape_sandbox {

namespace {

drape_core::Result<void> register_system(drape_engine::EngineWorld& world, std::shared_ptr<drape_engine::ISystem> system) {
    auto result = world.add_system(std::move(system));
    if (!result) {
        return drape_core::Err(result.error());
    }
    return drape_core::Ok();
}

drape_core::Result<void> build_custom(Sandbox& sandbox, const SandboxConfig& config) {
    sandbox.statics = config.statics;
    auto statics = config.statics;
    sandbox.physics = std::make_shared<drape_physics::RigidSystem>(
        config.physics, [statics]() { return statics; }, sandbox.bus);

    for (const auto& body : config.bodies) {
        auto added = sandbox.physics->add_body(body);
        if (!added) {
            return added;
        }
    }
    if (!config.bodies.empty()) {
        sandbox.primary_body = config.bodies.front().id;
    }
    return drape_core::Ok();
}

void count_event(EventTotals& totals, drape_event::EventKind kind) {
    switch (kind) {
        case drape_event::event_ids::Collision: ++totals.collisions; break;
        case drape_event::event_ids::Impulse: ++totals.impulses; break;
        case drape_event::event_ids::Wake: ++totals.wakes; break;
        case drape_event::event_ids::Sleep: ++totals.sleeps; break;
        case drape_event::event_ids::CcdHit: ++totals.ccd_hits; break;
        default: break;
    }
}

} // anonymous namespace

drape_core::Result<Sandbox> build_sandbox(const SandboxConfig& config) {
    Sandbox sandbox;
    sandbox.scenario = config.scenario;
    sandbox.bus = std::make_shared<drape_event::EventBus>(config.bus);
    sandbox.overlay = std::make_shared<drape_debug::DebugOverlayState>();

    sandbox.stats_cursor = sandbox.bus->subscribe(STATS_SUBSCRIBER, {
        {drape_event::Channel::FixedEnd, drape_event::event_ids::Collision},
        {drape_event::Channel::FixedEnd, drape_event::event_ids::Impulse},
        {drape_event::Channel::FixedEnd, drape_event::event_ids::Wake},
        {drape_event::Channel::FixedEnd, drape_event::event_ids::Sleep},
        {drape_event::Channel::FixedEnd, drape_event::event_ids::CcdHit},
    });

    if (config.is_custom()) {
        auto built = build_custom(sandbox, config);
        if (!built) {
            drape_core::engine_logger()->error("Custom scene rejected: {}", built.error().message());
            return drape_core::Err<Sandbox>(built.error());
        }
    } else {
        auto id = drape_physics::parse_scenario(config.scenario);
        if (!id) {
            auto err = drape_core::Error(drape_core::ErrorCode::InvalidArgument,
                "Unknown scenario: " + config.scenario);
            drape_core::engine_logger()->error("{}", err.message());
            return drape_core::Err<Sandbox>(err);
        }
        auto scenario = drape_physics::create_rigid_scenario(*id, sandbox.bus);
        sandbox.physics = scenario.system;
        sandbox.statics = scenario.statics;
        sandbox.primary_body = scenario.primary_body;
    }
    sandbox.overlay->aabbs = sandbox.statics;

    sandbox.runner = std::make_unique<drape_engine::SimulationRunner>(config.runner);
    auto& world = *sandbox.runner->world();

    sandbox.perf = std::make_shared<drape_engine::PerfEmitterSystem>(sandbox.bus);

    drape_debug::WakeMarkerOptions markers;
    markers.bus = sandbox.bus;
    markers.overlay = sandbox.overlay;
    std::weak_ptr<drape_physics::RigidSystem> physics = sandbox.physics;
    markers.position = [physics](std::uint32_t id) -> std::optional<drape_math::Vec2> {
        if (auto system = physics.lock()) {
            return system->body_center(id);
        }
        return std::nullopt;
    };

    const std::shared_ptr<drape_engine::ISystem> systems[] = {
        std::make_shared<drape_engine::EventBusSystem>(sandbox.bus),
        sandbox.perf,
        sandbox.physics,
        std::make_shared<drape_debug::EventOverlayAdapter>(sandbox.bus, sandbox.overlay),
        std::make_shared<drape_debug::WakeMarkerSystem>(markers),
        std::make_shared<drape_debug::BusMetricsOverlaySystem>(sandbox.bus, sandbox.overlay),
    };
    for (const auto& system : systems) {
        auto added = register_system(world, system);
        if (!added) {
            return drape_core::Err<Sandbox>(added.error());
        }
    }

    drape_core::engine_logger()->info("Sandbox '{}' ready: {} bodies, {} statics, {} systems",
        sandbox.scenario, sandbox.physics->body_count(), sandbox.statics.size(), world.system_count());
    return drape_core::Ok(std::move(sandbox));
}

RunSummary run_sandbox(Sandbox& sandbox, int frames, float frame_delta) {
    DRAPE_LOG_SCOPE("run_sandbox");
    RunSummary summary;
    for (int frame = 0; frame < frames; ++frame) {
        if (sandbox.runner->is_real_time()) {
            sandbox.runner->update(frame_delta);
        } else {
            sandbox.runner->step_once();
        }
        sandbox.runner->frame(frame_delta);

        sandbox.stats_cursor.read(drape_event::Channel::FixedEnd,
            [&summary](const drape_event::EventHeader& h, const drape_event::EventReader&) {
                count_event(summary.events, h.id);
            });
        ++summary.frames;
    }

    summary.fixed_steps = sandbox.runner->fixed_steps();
    summary.bodies = sandbox.physics->body_count();
    for (const auto& body : sandbox.physics->debug_get_bodies()) {
        if (sandbox.physics->is_sleeping(body.id)) {
            ++summary.sleeping;
        }
    }
    summary.metrics = sandbox.bus->metrics();
    return summary;
}

void log_summary(const Sandbox& sandbox, const RunSummary& summary) {
    auto logger = drape_core::engine_logger();
    logger->info("Ran '{}' for {} frames ({} fixed steps)", sandbox.scenario, summary.frames, summary.fixed_steps);
    logger->info("Bodies: {} ({} sleeping)", summary.bodies, summary.sleeping);
    logger->info("Events: {} collisions, {} impulses, {} wakes, {} sleeps, {} ccd hits",
        summary.events.collisions, summary.events.impulses, summary.events.wakes,
        summary.events.sleeps, summary.events.ccd_hits);
    logger->info("Bus drops: channel {}, tombstone {}, mailbox {}, writer errors {}",
        summary.metrics.channel_drops, summary.metrics.tombstone_drops,
        summary.metrics.total_mailbox_drops(), summary.metrics.writer_errors);

    if (sandbox.primary_body != 0) {
        if (auto center = sandbox.physics->body_center(sandbox.primary_body)) {
            logger->info("Body {} at ({:.4f}, {:.4f})", sandbox.primary_body, center->x, center->y);
        }
    }
}

} // namespace drape_sandbox
