#pragma once

/// @file runner.hpp
/// @brief Real-time driver for an EngineWorld

#include "fwd.hpp"
#include "fixed_step.hpp"
#include "world.hpp"

#include <cstdint>
#include <memory>

namespace drape_engine {

/// Largest accepted substep count
inline constexpr int MAX_RUNNER_SUBSTEPS = 16;

struct RunnerConfig {
    float fixed_delta = DEFAULT_FIXED_DELTA;
    int max_substeps = DEFAULT_MAX_SUBSTEPS;  ///< Catch-up cap per update
    int substeps = 1;                         ///< World steps per fixed step
    bool real_time = true;
};

/// Drives a world from elapsed real time in fixed steps
///
/// Every fixed step, whether from update() or step_once(), is split into
/// `substeps` equal world steps.
class SimulationRunner {
public:
    /// @param world World to drive; a new one is created when null
    explicit SimulationRunner(RunnerConfig config = {}, std::shared_ptr<EngineWorld> world = nullptr);

    // Non-copyable (the loop callback captures this)
    SimulationRunner(const SimulationRunner&) = delete;
    SimulationRunner& operator=(const SimulationRunner&) = delete;

    /// Consume elapsed time; ignored while real time is off
    /// @return Number of fixed steps executed
    int update(float delta);

    /// Dispatch frame hooks
    void frame(float delta);

    /// Run exactly one fixed step, even when paused or not in real time
    void step_once();

    /// Turning real time off pauses both the world and the loop
    void set_real_time(bool enabled);
    [[nodiscard]] bool is_real_time() const noexcept { return m_real_time; }

    /// Non-finite counts reset to 1; others are rounded and clamped to [1, 16]
    void set_substeps(double substeps);
    [[nodiscard]] int substeps() const noexcept { return m_substeps; }

    [[nodiscard]] const std::shared_ptr<EngineWorld>& world() const noexcept { return m_world; }
    [[nodiscard]] FixedStepLoop& loop() noexcept { return m_loop; }
    [[nodiscard]] float fixed_delta() const noexcept { return m_loop.config().fixed_delta; }

    /// Fixed steps executed so far
    [[nodiscard]] std::uint64_t fixed_steps() const noexcept { return m_fixed_steps; }

private:
    void execute_step(float dt);

    std::shared_ptr<EngineWorld> m_world;
    FixedStepLoop m_loop;
    int m_substeps = 1;
    bool m_real_time = true;
    std::uint64_t m_fixed_steps = 0;
};

} // namespace drape_engine
