/// @file config.cpp
/// @brief SandboxConfig JSON loading

#include <drape_engine/sandbox/config.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <limits>
#include <optional>
#include <sstream>

namespace drape_sandbox {

using nlohmann::json;
using drape_core::ConfigError;
using drape_math::Vec2;

namespace {

// =============================================================================
// Field Readers
// =============================================================================

/// Each reader leaves `out` untouched when the key is absent or null

const json* find_field(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return nullptr;
    }
    return &*it;
}

std::optional<ConfigError> read_float(const json& obj, const char* key, const std::string& path, float& out) {
    const json* v = find_field(obj, key);
    if (!v) {
        return std::nullopt;
    }
    if (!v->is_number()) {
        return ConfigError::wrong_type(path + key, "a number");
    }
    out = v->get<float>();
    return std::nullopt;
}

std::optional<ConfigError> read_int(const json& obj, const char* key, const std::string& path, int& out) {
    const json* v = find_field(obj, key);
    if (!v) {
        return std::nullopt;
    }
    if (!v->is_number_integer()) {
        return ConfigError::wrong_type(path + key, "an integer");
    }
    const auto raw = v->get<std::int64_t>();
    out = static_cast<int>(std::clamp<std::int64_t>(raw,
        std::numeric_limits<int>::min(), std::numeric_limits<int>::max()));
    return std::nullopt;
}

std::optional<ConfigError> read_size(const json& obj, const char* key, const std::string& path, std::size_t& out) {
    const json* v = find_field(obj, key);
    if (!v) {
        return std::nullopt;
    }
    if (!v->is_number_integer()) {
        return ConfigError::wrong_type(path + key, "an integer");
    }
    const auto raw = v->get<std::int64_t>();
    out = raw > 0 ? static_cast<std::size_t>(raw) : 0;
    return std::nullopt;
}

std::optional<ConfigError> read_bool(const json& obj, const char* key, const std::string& path, bool& out) {
    const json* v = find_field(obj, key);
    if (!v) {
        return std::nullopt;
    }
    if (!v->is_boolean()) {
        return ConfigError::wrong_type(path + key, "a boolean");
    }
    out = v->get<bool>();
    return std::nullopt;
}

std::optional<ConfigError> read_string(const json& obj, const char* key, const std::string& path, std::string& out) {
    const json* v = find_field(obj, key);
    if (!v) {
        return std::nullopt;
    }
    if (!v->is_string()) {
        return ConfigError::wrong_type(path + key, "a string");
    }
    out = v->get<std::string>();
    return std::nullopt;
}

std::optional<ConfigError> read_vec2(const json& obj, const char* key, const std::string& path, Vec2& out) {
    const json* v = find_field(obj, key);
    if (!v) {
        return std::nullopt;
    }
    if (!v->is_array() || v->size() != 2 || !(*v)[0].is_number() || !(*v)[1].is_number()) {
        return ConfigError::wrong_type(path + key, "an array of two numbers");
    }
    out = Vec2((*v)[0].get<float>(), (*v)[1].get<float>());
    return std::nullopt;
}

std::optional<ConfigError> require_object(const json& obj, const char* key, const json*& out) {
    out = find_field(obj, key);
    if (out && !out->is_object()) {
        return ConfigError::wrong_type(key, "an object");
    }
    return std::nullopt;
}

// =============================================================================
// Sections
// =============================================================================

std::optional<ConfigError> parse_log(const json& j, drape_core::LogConfig& log) {
    const std::string path = "log.";
    std::string level;
    if (auto err = read_string(j, "level", path, level)) return err;
    if (!level.empty()) {
        auto parsed = drape_core::parse_log_level(level);
        if (!parsed) {
            return ConfigError::wrong_type(path + "level", "a log level name");
        }
        log.level = *parsed;
    }
    if (auto err = read_bool(j, "console", path, log.console_enabled)) return err;
    if (auto err = read_bool(j, "file", path, log.file_enabled)) return err;
    if (auto err = read_string(j, "directory", path, log.log_directory)) return err;
    if (auto err = read_size(j, "max_file_size", path, log.max_file_size)) return err;
    if (auto err = read_size(j, "max_files", path, log.max_files)) return err;
    log.max_files = std::max<std::size_t>(log.max_files, 1);
    return std::nullopt;
}

std::optional<ConfigError> parse_bus(const json& j, drape_event::BusOptions& bus) {
    const std::string path = "bus.";
    if (auto err = read_size(j, "capacity", path, bus.capacity)) return err;
    if (auto err = read_size(j, "mailbox_capacity", path, bus.mailbox_capacity)) return err;
    bus.capacity = drape_event::round_capacity(bus.capacity);
    bus.mailbox_capacity = drape_event::round_capacity(bus.mailbox_capacity);
    return std::nullopt;
}

std::optional<ConfigError> parse_runner(const json& j, drape_engine::RunnerConfig& runner) {
    const std::string path = "runner.";
    if (auto err = read_float(j, "fixed_delta", path, runner.fixed_delta)) return err;
    if (auto err = read_int(j, "max_substeps", path, runner.max_substeps)) return err;
    if (auto err = read_int(j, "substeps", path, runner.substeps)) return err;
    if (auto err = read_bool(j, "real_time", path, runner.real_time)) return err;

    if (!std::isfinite(runner.fixed_delta) || runner.fixed_delta <= 0.0f) {
        runner.fixed_delta = drape_engine::DEFAULT_FIXED_DELTA;
    }
    runner.max_substeps = std::max(1, runner.max_substeps);
    runner.substeps = std::clamp(runner.substeps, 1, drape_engine::MAX_RUNNER_SUBSTEPS);
    return std::nullopt;
}

std::optional<ConfigError> parse_physics(const json& j, drape_physics::RigidSystemConfig& physics) {
    const std::string path = "physics.";
    if (auto err = read_string(j, "id", path, physics.id)) return err;
    if (auto err = read_int(j, "priority", path, physics.priority)) return err;
    if (auto err = read_float(j, "gravity", path, physics.gravity)) return err;
    if (auto err = read_bool(j, "dynamic_pairs", path, physics.enable_dynamic_pairs)) return err;
    if (auto err = read_float(j, "sleep_velocity_threshold", path, physics.sleep_velocity_threshold)) return err;
    if (auto err = read_int(j, "sleep_frames_threshold", path, physics.sleep_frames_threshold)) return err;

    const json* ccd = find_field(j, "ccd");
    if (ccd) {
        if (!ccd->is_object()) {
            return ConfigError::wrong_type(path + "ccd", "an object");
        }
        const std::string ccd_path = path + "ccd.";
        if (auto err = read_bool(*ccd, "enabled", ccd_path, physics.ccd.enabled)) return err;
        if (auto err = read_float(*ccd, "speed_threshold", ccd_path, physics.ccd.speed_threshold)) return err;
        if (auto err = read_float(*ccd, "epsilon", ccd_path, physics.ccd.epsilon)) return err;
        if (auto err = read_int(*ccd, "max_iterations", ccd_path, physics.ccd.max_iterations)) return err;
    }

    physics = physics.sanitized();
    return std::nullopt;
}

std::optional<ConfigError> parse_statics(const json& j, std::vector<drape_math::Aabb>& statics) {
    if (!j.is_array()) {
        return ConfigError::wrong_type("statics", "an array");
    }
    for (std::size_t i = 0; i < j.size(); ++i) {
        const json& item = j[i];
        const std::string path = "statics[" + std::to_string(i) + "].";
        if (!item.is_object()) {
            return ConfigError::wrong_type("statics[" + std::to_string(i) + "]", "an object");
        }
        Vec2 min(0.0f);
        Vec2 max(0.0f);
        if (auto err = read_vec2(item, "min", path, min)) return err;
        if (auto err = read_vec2(item, "max", path, max)) return err;
        // Swapped corners are normalized rather than rejected
        statics.emplace_back(glm::min(min, max), glm::max(min, max));
    }
    return std::nullopt;
}

std::optional<ConfigError> parse_bodies(const json& j, std::vector<drape_physics::RigidBody>& bodies) {
    if (!j.is_array()) {
        return ConfigError::wrong_type("bodies", "an array");
    }
    for (std::size_t i = 0; i < j.size(); ++i) {
        const json& item = j[i];
        const std::string path = "bodies[" + std::to_string(i) + "].";
        if (!item.is_object()) {
            return ConfigError::wrong_type("bodies[" + std::to_string(i) + "]", "an object");
        }

        drape_physics::RigidBody body;
        const json* id = find_field(item, "id");
        if (!id || !id->is_number_integer() || id->get<std::int64_t>() <= 0
            || id->get<std::int64_t>() > std::numeric_limits<drape_physics::BodyId>::max()) {
            return ConfigError::wrong_type(path + "id", "a positive 32-bit integer");
        }
        body.id = static_cast<drape_physics::BodyId>(id->get<std::int64_t>());

        if (auto err = read_vec2(item, "center", path, body.center)) return err;
        if (auto err = read_vec2(item, "half", path, body.half)) return err;
        if (auto err = read_float(item, "angle", path, body.angle)) return err;
        if (auto err = read_vec2(item, "velocity", path, body.velocity)) return err;
        if (auto err = read_float(item, "mass", path, body.mass)) return err;
        if (auto err = read_float(item, "restitution", path, body.restitution)) return err;
        if (auto err = read_float(item, "friction", path, body.friction)) return err;

        const json* ccd = find_field(item, "ccd");
        if (ccd) {
            if (!ccd->is_boolean()) {
                return ConfigError::wrong_type(path + "ccd", "a boolean");
            }
            body.ccd = ccd->get<bool>();
        }

        body.restitution = std::clamp(body.restitution, 0.0f, 1.0f);
        body.friction = std::clamp(body.friction, 0.0f, 1.0f);
        bodies.push_back(body);
    }
    return std::nullopt;
}

drape_core::Result<SandboxConfig> fail(const ConfigError& err) {
    drape_core::core_logger()->error("{}", err.message);
    return drape_core::Err<SandboxConfig>(err);
}

} // anonymous namespace

// =============================================================================
// SandboxConfig
// =============================================================================

drape_core::Result<SandboxConfig> SandboxConfig::from_json(const json& j) {
    if (!j.is_object()) {
        return fail(ConfigError::wrong_type("<root>", "an object"));
    }

    SandboxConfig config;
    const json* section = nullptr;

    if (auto err = require_object(j, "log", section)) return fail(*err);
    if (section) {
        if (auto err = parse_log(*section, config.log)) return fail(*err);
    }

    if (auto err = require_object(j, "bus", section)) return fail(*err);
    if (section) {
        if (auto err = parse_bus(*section, config.bus)) return fail(*err);
    }

    if (auto err = require_object(j, "runner", section)) return fail(*err);
    if (section) {
        if (auto err = parse_runner(*section, config.runner)) return fail(*err);
    }

    if (auto err = require_object(j, "physics", section)) return fail(*err);
    if (section) {
        if (auto err = parse_physics(*section, config.physics)) return fail(*err);
    }

    if (auto err = read_string(j, "scenario", "", config.scenario)) return fail(*err);
    if (auto err = read_int(j, "frames", "", config.frames)) return fail(*err);
    if (auto err = read_float(j, "frame_delta", "", config.frame_delta)) return fail(*err);
    config.frames = std::max(0, config.frames);
    if (!std::isfinite(config.frame_delta) || config.frame_delta <= 0.0f) {
        config.frame_delta = drape_engine::DEFAULT_FIXED_DELTA;
    }

    if (const json* statics = find_field(j, "statics")) {
        if (auto err = parse_statics(*statics, config.statics)) return fail(*err);
    }
    if (const json* bodies = find_field(j, "bodies")) {
        if (auto err = parse_bodies(*bodies, config.bodies)) return fail(*err);
    }

    return drape_core::Ok(std::move(config));
}

drape_core::Result<SandboxConfig> SandboxConfig::from_json_string(const std::string& text) {
    try {
        return from_json(json::parse(text));
    } catch (const json::exception& e) {
        return fail(ConfigError::parse(e.what()));
    }
}

drape_core::Result<SandboxConfig> load_sandbox_config(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return fail(ConfigError::file_not_found(path.string()));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto result = SandboxConfig::from_json_string(buffer.str());
    if (result) {
        drape_core::core_logger()->info("Loaded sandbox config '{}' (scenario {}, {} frames)",
            path.string(), result->scenario, result->frames);
    }
    return result;
}

} // namespace drape_sandbox
