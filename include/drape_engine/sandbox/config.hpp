#pragma once

/// @file config.hpp
/// @brief Sandbox configuration loaded from JSON
///
/// Every section is optional. Missing keys keep their defaults, fields of
/// the wrong JSON type are rejected, and out-of-range numbers are clamped.
///
/// @code{.json}
/// {
///   "log":     { "level": "debug", "console": true, "file": false, "directory": "logs" },
///   "bus":     { "capacity": 1024, "mailbox_capacity": 1024 },
///   "runner":  { "fixed_delta": 0.0166667, "max_substeps": 5, "substeps": 1, "real_time": true },
///   "physics": { "gravity": 9.81, "dynamic_pairs": true,
///                "ccd": { "enabled": true, "speed_threshold": 2.0, "epsilon": 0.0001 } },
///   "scenario": "custom",
///   "frames": 600,
///   "frame_delta": 0.0166667,
///   "statics": [ { "min": [-1, -0.1], "max": [1, 0] } ],
///   "bodies":  [ { "id": 1, "center": [0, 0.5], "half": [0.1, 0.1] } ]
/// }
/// @endcode

#include <drape_engine/core/error.hpp>
#include <drape_engine/core/log.hpp>
#include <drape_engine/engine/runner.hpp>
#include <drape_engine/event/types.hpp>
#include <drape_engine/physics/types.hpp>

#include <nlohmann/json_fwd.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace drape_sandbox {

/// Scenario name selecting the statics and bodies listed in the config
inline constexpr const char* CUSTOM_SCENARIO = "custom";

inline constexpr int DEFAULT_FRAMES = 600;

struct SandboxConfig {
    drape_core::LogConfig log;
    drape_event::BusOptions bus;
    drape_engine::RunnerConfig runner;

    /// Applies to the custom scenario; named scenarios carry their own tuning
    drape_physics::RigidSystemConfig physics;

    std::string scenario = "rigid-stack-rest";
    int frames = DEFAULT_FRAMES;                         ///< Frames to run, at least 0
    float frame_delta = drape_engine::DEFAULT_FIXED_DELTA;  ///< Simulated wall time per frame

    std::vector<drape_math::Aabb> statics;
    std::vector<drape_physics::RigidBody> bodies;

    [[nodiscard]] bool is_custom() const { return scenario == CUSTOM_SCENARIO; }

    /// Build from a parsed document
    [[nodiscard]] static drape_core::Result<SandboxConfig> from_json(const nlohmann::json& j);

    /// Parse a JSON string
    [[nodiscard]] static drape_core::Result<SandboxConfig> from_json_string(const std::string& text);
};

/// Read and parse a config file
[[nodiscard]] drape_core::Result<SandboxConfig> load_sandbox_config(const std::filesystem::path& path);

} // namespace drape_sandbox
