/// @file main.cpp
/// @brief drape_sandbox entry point - runs a rigid scenario headless
///
/// Loads an optional JSON config, builds the bus, runner, physics and
/// overlay systems, runs the configured number of frames and logs bus and
/// physics statistics.

#include <drape_engine/core/log.hpp>
#include <drape_engine/physics/scenarios.hpp>
#include <drape_engine/sandbox/config.hpp>
#include <drape_engine/sandbox/sandbox.hpp>

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

namespace fs = std::filesystem;

namespace {

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " [OPTIONS] [CONFIG_PATH]\n"
              << "\n"
              << "Arguments:\n"
              << "  CONFIG_PATH         Sandbox JSON config (defaults apply when omitted)\n"
              << "\n"
              << "Options:\n"
              << "  --help, -h          Show this help message\n"
              << "  --version, -v       Show version information\n"
              << "  --list              List built-in scenarios\n"
              << "  --scenario NAME     Override the configured scenario\n"
              << "  --frames N          Override the configured frame count\n"
              << "  --log-level LEVEL   trace, debug, info, warn, error, critical, off\n"
              << "\n"
              << "Examples:\n"
              << "  " << program_name << " --scenario rigid-thin-wall-ccd --frames 120\n"
              << "  " << program_name << " configs/stack.json\n";
}

void print_version() {
    std::cout << "drape_sandbox 0.1.0\n"
              << "drape_engine rigid sandbox\n";
}

void list_scenarios() {
    for (auto id : drape_physics::ALL_SCENARIOS) {
        std::cout << drape_physics::scenario_name(id) << "\n";
    }
    std::cout << drape_sandbox::CUSTOM_SCENARIO << " (statics and bodies from the config)\n";
}

std::optional<int> parse_frames(const std::string& text) {
    char* end = nullptr;
    const long value = std::strtol(text.c_str(), &end, 10);
    if (end == text.c_str() || *end != '\0' || value < 0) {
        return std::nullopt;
    }
    return static_cast<int>(value);
}

} // anonymous namespace

// =============================================================================
// Main
// =============================================================================

int main(int argc, char** argv) {
    fs::path config_path;
    std::optional<std::string> scenario_override;
    std::optional<int> frames_override;
    std::optional<spdlog::level::level_enum> level_override;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        const bool has_value = i + 1 < argc;

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--version" || arg == "-v") {
            print_version();
            return 0;
        } else if (arg == "--list") {
            list_scenarios();
            return 0;
        } else if (arg == "--scenario" && has_value) {
            scenario_override = argv[++i];
        } else if (arg == "--frames" && has_value) {
            frames_override = parse_frames(argv[++i]);
            if (!frames_override) {
                std::cerr << "Invalid frame count: " << argv[i] << "\n";
                return 1;
            }
        } else if (arg == "--log-level" && has_value) {
            level_override = drape_core::parse_log_level(argv[++i]);
            if (!level_override) {
                std::cerr << "Invalid log level: " << argv[i] << "\n";
                return 1;
            }
        } else if (!arg.empty() && arg[0] != '-') {
            config_path = arg;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    drape_sandbox::SandboxConfig config;
    if (!config_path.empty()) {
        auto loaded = drape_sandbox::load_sandbox_config(config_path);
        if (!loaded) {
            std::cerr << "Failed to load config: " << loaded.error().message() << "\n";
            return 1;
        }
        config = std::move(*loaded);
    }

    if (scenario_override) {
        config.scenario = *scenario_override;
    }
    if (frames_override) {
        config.frames = *frames_override;
    }
    if (level_override) {
        config.log.level = *level_override;
    }

    drape_core::configure_logging(config.log);
    DRAPE_LOG_INFO("drape_sandbox: scenario '{}', {} frames", config.scenario, config.frames);

    auto sandbox = drape_sandbox::build_sandbox(config);
    if (!sandbox) {
        DRAPE_LOG_ERROR("Failed to build sandbox: {}", drape_core::build_error_chain(sandbox.error()));
        drape_core::shutdown_logging();
        return 1;
    }

    auto summary = drape_sandbox::run_sandbox(*sandbox, config.frames, config.frame_delta);
    drape_sandbox::log_summary(*sandbox, summary);

    drape_core::shutdown_logging();
    return 0;
}
