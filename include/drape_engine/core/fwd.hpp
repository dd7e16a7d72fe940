#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for drape_core module

#include <cstdint>

namespace drape_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct SystemError;
struct BodyError;
struct ConfigError;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Logging
// =============================================================================

struct LogConfig;
class LogScope;

} // namespace drape_core
