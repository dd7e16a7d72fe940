#pragma once

/// @file fixed_step.hpp
/// @brief Fixed-delta accumulator loop

#include "fwd.hpp"

#include <functional>

namespace drape_engine {

/// Default simulation rate
inline constexpr float DEFAULT_FIXED_DELTA = 1.0f / 60.0f;

/// Default cap on catch-up steps per update
inline constexpr int DEFAULT_MAX_SUBSTEPS = 5;

struct FixedStepConfig {
    float fixed_delta = DEFAULT_FIXED_DELTA;
    int max_substeps = DEFAULT_MAX_SUBSTEPS;
};

/// Converts variable elapsed time into whole fixed steps
///
/// At most `max_substeps` steps run per update; the leftover accumulator is
/// capped at `fixed_delta * max_substeps` so a long stall cannot queue an
/// unbounded backlog. Pausing freezes the accumulator without clearing it.
class FixedStepLoop {
public:
    using StepFn = std::function<void(float)>;

    FixedStepLoop(FixedStepConfig config, StepFn step);

    /// Accumulate `elapsed` seconds and run due steps
    /// @return Number of fixed steps executed
    int update(float elapsed);

    void set_paused(bool paused) noexcept { m_paused = paused; }
    [[nodiscard]] bool is_paused() const noexcept { return m_paused; }

    /// Drop any accumulated time
    void reset() noexcept { m_accumulator = 0.0f; }

    [[nodiscard]] float accumulator() const noexcept { return m_accumulator; }
    [[nodiscard]] const FixedStepConfig& config() const noexcept { return m_config; }

private:
    FixedStepConfig m_config;
    StepFn m_step;
    float m_accumulator = 0.0f;
    bool m_paused = false;
};

} // namespace drape_engine
