/// @file test_config.cpp
/// @brief Tests for SandboxConfig JSON loading

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <drape_engine/sandbox/config.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>

using namespace drape_sandbox;
using Catch::Matchers::WithinAbs;
using nlohmann::json;

TEST_CASE("SandboxConfig: empty document keeps defaults", "[sandbox][config]") {
    auto result = SandboxConfig::from_json(json::object());
    REQUIRE(result.is_ok());

    const SandboxConfig& c = result.value();
    REQUIRE(c.scenario == "rigid-stack-rest");
    REQUIRE(c.frames == DEFAULT_FRAMES);
    REQUIRE(c.bus.capacity == drape_event::DEFAULT_CAPACITY);
    REQUIRE(c.runner.substeps == 1);
    REQUIRE(c.runner.real_time);
    REQUIRE(c.physics.id == "rigid-static");
    REQUIRE_FALSE(c.physics.ccd.enabled);
    REQUIRE(c.statics.empty());
    REQUIRE(c.bodies.empty());
    REQUIRE_FALSE(c.is_custom());
}

TEST_CASE("SandboxConfig: full document", "[sandbox][config]") {
    const char* text = R"({
        "log": { "level": "debug", "console": false },
        "bus": { "capacity": 100, "mailbox_capacity": 64 },
        "runner": { "fixed_delta": 0.01, "max_substeps": 3, "substeps": 2, "real_time": false },
        "physics": {
            "gravity": 4.0,
            "dynamic_pairs": true,
            "sleep_frames_threshold": 20,
            "ccd": { "enabled": true, "speed_threshold": 2.5, "epsilon": 0.001 }
        },
        "scenario": "custom",
        "frames": 42,
        "frame_delta": 0.02,
        "statics": [ { "min": [1, 0], "max": [-1, -0.1] } ],
        "bodies": [
            { "id": 3, "center": [0, 0.5], "half": [0.1, 0.2], "velocity": [1, 0],
              "mass": 2, "restitution": 1.5, "friction": 0.3, "ccd": true }
        ]
    })";

    auto result = SandboxConfig::from_json_string(text);
    REQUIRE(result.is_ok());
    const SandboxConfig& c = result.value();

    REQUIRE(c.log.level == spdlog::level::debug);
    REQUIRE_FALSE(c.log.console_enabled);
    REQUIRE(c.bus.capacity == 128);
    REQUIRE(c.bus.mailbox_capacity == 64);
    REQUIRE(c.runner.fixed_delta == 0.01f);
    REQUIRE(c.runner.max_substeps == 3);
    REQUIRE(c.runner.substeps == 2);
    REQUIRE_FALSE(c.runner.real_time);
    REQUIRE(c.physics.gravity == 4.0f);
    REQUIRE(c.physics.enable_dynamic_pairs);
    REQUIRE(c.physics.sleep_frames_threshold == 20);
    REQUIRE(c.physics.ccd.enabled);
    REQUIRE(c.physics.ccd.speed_threshold == 2.5f);
    REQUIRE_THAT(c.physics.ccd.epsilon, WithinAbs(0.001, 1e-9));
    REQUIRE(c.is_custom());
    REQUIRE(c.frames == 42);
    REQUIRE(c.frame_delta == 0.02f);

    REQUIRE(c.statics.size() == 1);
    REQUIRE(c.statics[0].min == drape_math::Vec2(-1.0f, -0.1f));
    REQUIRE(c.statics[0].max == drape_math::Vec2(1.0f, 0.0f));

    REQUIRE(c.bodies.size() == 1);
    const auto& body = c.bodies[0];
    REQUIRE(body.id == 3);
    REQUIRE(body.half == drape_math::Vec2(0.1f, 0.2f));
    REQUIRE(body.velocity == drape_math::Vec2(1.0f, 0.0f));
    REQUIRE(body.mass == 2.0f);
    REQUIRE(body.restitution == 1.0f);
    REQUIRE(body.friction == 0.3f);
    REQUIRE(body.ccd == true);
}

TEST_CASE("SandboxConfig: out-of-range values are clamped", "[sandbox][config]") {
    json j = {
        {"bus", {{"capacity", 0}, {"mailbox_capacity", -5}}},
        {"runner", {{"fixed_delta", -1.0}, {"max_substeps", 0}, {"substeps", 99}}},
        {"physics", {{"sleep_velocity_threshold", -1.0}, {"sleep_frames_threshold", 0},
                     {"ccd", {{"epsilon", -0.5}, {"speed_threshold", -2.0}}}}},
        {"frames", -10},
        {"frame_delta", 0.0},
    };

    auto result = SandboxConfig::from_json(j);
    REQUIRE(result.is_ok());
    const SandboxConfig& c = result.value();

    REQUIRE(c.bus.capacity == 2);
    REQUIRE(c.bus.mailbox_capacity == 2);
    REQUIRE(c.runner.fixed_delta == drape_engine::DEFAULT_FIXED_DELTA);
    REQUIRE(c.runner.max_substeps == 1);
    REQUIRE(c.runner.substeps == drape_engine::MAX_RUNNER_SUBSTEPS);
    REQUIRE(c.physics.sleep_velocity_threshold == 0.0f);
    REQUIRE(c.physics.sleep_frames_threshold == 1);
    REQUIRE(c.physics.ccd.epsilon == drape_ccd::DEFAULT_EPSILON);
    REQUIRE(c.physics.ccd.speed_threshold == 0.0f);
    REQUIRE(c.frames == 0);
    REQUIRE(c.frame_delta == drape_engine::DEFAULT_FIXED_DELTA);
}

TEST_CASE("SandboxConfig: wrong types are errors", "[sandbox][config]") {
    auto expect_wrong_type = [](const json& j, const std::string& key) {
        auto result = SandboxConfig::from_json(j);
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == drape_core::ErrorCode::ValidationError);
        const auto* err = result.error().as<drape_core::ConfigError>();
        REQUIRE(err != nullptr);
        REQUIRE(err->key == key);
    };

    expect_wrong_type(json{{"frames", "many"}}, "frames");
    expect_wrong_type(json{{"frames", 1.5}}, "frames");
    expect_wrong_type(json{{"runner", 5}}, "runner");
    expect_wrong_type(json{{"runner", {{"real_time", 1}}}}, "runner.real_time");
    expect_wrong_type(json{{"physics", {{"ccd", {{"enabled", "yes"}}}}}}, "physics.ccd.enabled");
    expect_wrong_type(json{{"log", {{"level", "loud"}}}}, "log.level");
    expect_wrong_type(json{{"statics", {{{"min", {0}}, {"max", {1, 1}}}}}}, "statics[0].min");
    expect_wrong_type(json{{"bodies", {{{"center", {0, 0}}}}}}, "bodies[0].id");
    expect_wrong_type(json{{"bodies", {{{"id", 0}}}}}, "bodies[0].id");
    expect_wrong_type(json{{"bodies", json::object()}}, "bodies");
    expect_wrong_type(json::array(), "<root>");
}

TEST_CASE("SandboxConfig: malformed text is a parse error", "[sandbox][config]") {
    auto result = SandboxConfig::from_json_string("{ \"frames\": ");
    REQUIRE(result.is_err());
    REQUIRE(result.error().code() == drape_core::ErrorCode::ParseError);
}

TEST_CASE("SandboxConfig: loading from disk", "[sandbox][config]") {
    SECTION("missing file") {
        auto result = load_sandbox_config("/nonexistent/drape/sandbox.json");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == drape_core::ErrorCode::IOError);
    }

    SECTION("existing file") {
        const auto path = std::filesystem::temp_directory_path() / "drape_sandbox_config_test.json";
        {
            std::ofstream out(path);
            out << R"({ "scenario": "rigid-thin-wall-ccd", "frames": 12 })";
        }

        auto result = load_sandbox_config(path);
        std::filesystem::remove(path);

        REQUIRE(result.is_ok());
        REQUIRE(result->scenario == "rigid-thin-wall-ccd");
        REQUIRE(result->frames == 12);
    }
}
