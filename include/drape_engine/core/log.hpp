#pragma once

/// @file log.hpp
/// @brief Logging utilities for drape_engine

#include <spdlog/spdlog.h>
#include <string>
#include <memory>
#include <optional>
#include <chrono>

// =============================================================================
// Logging Macros
// =============================================================================

#define DRAPE_LOG_TRACE(...) spdlog::trace(__VA_ARGS__)
#define DRAPE_LOG_DEBUG(...) spdlog::debug(__VA_ARGS__)
#define DRAPE_LOG_INFO(...) spdlog::info(__VA_ARGS__)
#define DRAPE_LOG_WARN(...) spdlog::warn(__VA_ARGS__)
#define DRAPE_LOG_ERROR(...) spdlog::error(__VA_ARGS__)

namespace drape_core {

inline constexpr const char* CORE_LOGGER = "drape_core";

// =============================================================================
// Log Configuration
// =============================================================================

/// Configuration for the logging system
struct LogConfig {
    bool console_enabled = true;
    bool file_enabled = false;
    std::string log_directory;
    std::size_t max_file_size = 10 * 1024 * 1024;  // 10 MB
    std::size_t max_files = 5;
    spdlog::level::level_enum level = spdlog::level::info;
};

/// Configure logging system with full options
void configure_logging(const LogConfig& config);

// =============================================================================
// Named Loggers
// =============================================================================

/// Get or create a named logger
///
/// Subsystem accessors below resolve through the registry on every call, so
/// loggers recreated after shutdown_logging() pick up the current config.
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

/// Core logger (configuration, errors)
std::shared_ptr<spdlog::logger> core_logger();

/// Event bus logger
std::shared_ptr<spdlog::logger> event_logger();

/// Rigid physics logger
std::shared_ptr<spdlog::logger> physics_logger();

/// Scheduler / runner logger
std::shared_ptr<spdlog::logger> engine_logger();

// =============================================================================
// Log Level Management
// =============================================================================

/// Set global log level
void set_global_log_level(spdlog::level::level_enum level);

/// Get current global log level
spdlog::level::level_enum get_global_log_level();

/// Parse log level from string
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str);

/// Get log level name
const char* log_level_name(spdlog::level::level_enum level);

// =============================================================================
// Log Scoping (RAII)
// =============================================================================

/// RAII log scope for block tracing
class LogScope {
public:
    LogScope(const std::string& name, const std::string& logger_name = CORE_LOGGER);
    ~LogScope();

    LogScope(const LogScope&) = delete;
    LogScope& operator=(const LogScope&) = delete;
    LogScope(LogScope&&) = delete;
    LogScope& operator=(LogScope&&) = delete;

private:
    std::string m_name;
    std::shared_ptr<spdlog::logger> m_logger;
    std::chrono::steady_clock::time_point m_start;
};

#define DRAPE_LOG_SCOPE(name) ::drape_core::LogScope _log_scope_##__LINE__(name)

// =============================================================================
// Lifecycle
// =============================================================================

/// Flush all loggers
void flush_all_loggers();

/// Shutdown logging system
void shutdown_logging();

} // namespace drape_core
