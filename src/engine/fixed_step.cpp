/// @file fixed_step.cpp
/// @brief FixedStepLoop implementation

#include <drape_engine/engine/fixed_step.hpp>
#include <drape_engine/core/log.hpp>

#include <algorithm>
#include <cmath>
#include <utility>

namespace drape_engine {

FixedStepLoop::FixedStepLoop(FixedStepConfig config, StepFn step)
    : m_config(config)
    , m_step(std::move(step)) {
    if (!std::isfinite(m_config.fixed_delta) || m_config.fixed_delta <= 0.0f) {
        m_config.fixed_delta = DEFAULT_FIXED_DELTA;
    }
    m_config.max_substeps = std::max(1, m_config.max_substeps);
}

int FixedStepLoop::update(float elapsed) {
    if (m_paused) {
        return 0;
    }
    if (std::isfinite(elapsed) && elapsed > 0.0f) {
        m_accumulator += elapsed;
    }

    int steps = 0;
    while (m_accumulator >= m_config.fixed_delta && steps < m_config.max_substeps) {
        if (m_step) {
            m_step(m_config.fixed_delta);
        }
        m_accumulator -= m_config.fixed_delta;
        ++steps;
    }

    const float cap = m_config.fixed_delta * static_cast<float>(m_config.max_substeps);
    if (m_accumulator > cap) {
        drape_core::engine_logger()->debug("Fixed-step catch-up saturated, dropping {:.4f}s", m_accumulator - cap);
        m_accumulator = cap;
    }
    return steps;
}

} // namespace drape_engine
