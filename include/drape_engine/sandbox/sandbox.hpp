#pragma once

/// @file sandbox.hpp
/// @brief Headless sandbox assembly: bus, runner, physics and overlays

#include "config.hpp"

#include <drape_engine/debug/overlay.hpp>
#include <drape_engine/engine/runner.hpp>
#include <drape_engine/engine/systems.hpp>
#include <drape_engine/physics/rigid_system.hpp>

#include <cstdint>
#include <memory>
#include <string>

namespace drape_sandbox {

/// A wired-up simulation ready to be driven frame by frame
struct Sandbox {
    std::string scenario;
    std::shared_ptr<drape_event::EventBus> bus;
    std::unique_ptr<drape_engine::SimulationRunner> runner;
    std::shared_ptr<drape_physics::RigidSystem> physics;
    std::shared_ptr<drape_engine::PerfEmitterSystem> perf;
    std::shared_ptr<drape_debug::DebugOverlayState> overlay;
    std::vector<drape_math::Aabb> statics;
    drape_physics::BodyId primary_body = 0;

    /// Counts physics events between frames
    drape_event::EventCursor stats_cursor;
};

/// Physics event totals observed while running
struct EventTotals {
    std::uint64_t collisions = 0;
    std::uint64_t impulses = 0;
    std::uint64_t wakes = 0;
    std::uint64_t sleeps = 0;
    std::uint64_t ccd_hits = 0;
};

struct RunSummary {
    int frames = 0;
    std::uint64_t fixed_steps = 0;
    std::size_t bodies = 0;
    std::size_t sleeping = 0;
    EventTotals events;
    drape_event::BusMetrics metrics;
};

/// Subscriber id used for the sandbox statistics cursor
inline constexpr const char* STATS_SUBSCRIBER = "sandbox-stats";

/// Build the bus, runner and systems described by `config`
[[nodiscard]] drape_core::Result<Sandbox> build_sandbox(const SandboxConfig& config);

/// Run `frames` frames of `frame_delta` seconds each
///
/// With real time on the runner consumes the delta; with it off each frame
/// takes exactly one manual step.
RunSummary run_sandbox(Sandbox& sandbox, int frames, float frame_delta);

/// Log a summary at info level
void log_summary(const Sandbox& sandbox, const RunSummary& summary);

} // namespace drape_sandbox
