#pragma once

/// @file settings.hpp
/// @brief Tunable CCD policy shared by sandbox tooling

#include "stepper.hpp"

#include <algorithm>
#include <cmath>

namespace drape_ccd {

/// Smallest back-off distance accepted from configuration
inline constexpr float MIN_EPSILON = 1e-6f;

struct CcdSettings {
    bool enabled = false;
    float speed_threshold = 5.0f;   ///< Speeds at or above this use CCD
    float epsilon = DEFAULT_EPSILON;
    int max_iterations = 3;         ///< Sweeps per advance, see advance_with_ccd

    /// Copy with out-of-range values replaced by safe ones
    [[nodiscard]] CcdSettings sanitized() const noexcept {
        CcdSettings s = *this;
        if (std::isnan(s.speed_threshold) || s.speed_threshold < 0.0f) {
            s.speed_threshold = 0.0f;
        }
        if (!std::isfinite(s.epsilon) || s.epsilon < 0.0f) {
            s.epsilon = DEFAULT_EPSILON;
        }
        s.epsilon = std::max(s.epsilon, MIN_EPSILON);
        s.max_iterations = std::max(s.max_iterations, 1);
        return s;
    }
};

} // namespace drape_ccd
