/// @file runner.cpp
/// @brief SimulationRunner implementation

#include <drape_engine/engine/runner.hpp>
#include <drape_engine/core/log.hpp>

#include <algorithm>
#include <cmath>
#include <utility>

namespace drape_engine {

SimulationRunner::SimulationRunner(RunnerConfig config, std::shared_ptr<EngineWorld> world)
    : m_world(world ? std::move(world) : std::make_shared<EngineWorld>())
    , m_loop(FixedStepConfig{config.fixed_delta, config.max_substeps},
             [this](float dt) { execute_step(dt); }) {
    set_substeps(static_cast<double>(config.substeps));
    if (!config.real_time) {
        set_real_time(false);
    }
    drape_core::engine_logger()->debug("Runner created (fixed delta {:.5f}s, catch-up {}, substeps {})",
        m_loop.config().fixed_delta, m_loop.config().max_substeps, m_substeps);
}

int SimulationRunner::update(float delta) {
    if (!m_real_time) {
        return 0;
    }
    return m_loop.update(delta);
}

void SimulationRunner::frame(float delta) {
    m_world->frame(delta);
}

void SimulationRunner::step_once() {
    execute_step(m_loop.config().fixed_delta);
}

void SimulationRunner::set_real_time(bool enabled) {
    m_real_time = enabled;
    m_world->set_paused(!enabled);
    m_loop.set_paused(!enabled);
}

void SimulationRunner::set_substeps(double substeps) {
    if (!std::isfinite(substeps)) {
        m_substeps = 1;
        return;
    }
    const double clamped = std::clamp(std::round(substeps), 1.0, static_cast<double>(MAX_RUNNER_SUBSTEPS));
    m_substeps = static_cast<int>(clamped);
}

void SimulationRunner::execute_step(float dt) {
    const int iterations = std::max(1, m_substeps);
    const float step_size = dt / static_cast<float>(iterations);

    const bool was_paused = m_world->is_paused();
    if (was_paused) {
        m_world->set_paused(false);
    }
    for (int i = 0; i < iterations; ++i) {
        m_world->step(step_size);
    }
    if (was_paused) {
        m_world->set_paused(true);
    }
    ++m_fixed_steps;
}

} // namespace drape_engine
