#pragma once

/// @file core.hpp
/// @brief Main include header for drape_core
///
/// drape_core provides the foundation shared by every drape_engine module:
/// - Error / Result for fallible operations
/// - Named spdlog loggers and log configuration

#include "fwd.hpp"
#include "error.hpp"
#include "log.hpp"

namespace drape_core {

/// Project version string
inline constexpr const char* VERSION = "0.1.0";

} // namespace drape_core
