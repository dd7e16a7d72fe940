#pragma once

/// @file physics.hpp
/// @brief Main include header for drape_physics
///
/// drape_physics provides box rigid bodies resolved against static AABB
/// obstacles, with optional CCD sweeps, dynamic pairs and sleep tracking.

#include "fwd.hpp"
#include "types.hpp"
#include "sat.hpp"
#include "picking.hpp"
#include "rigid_system.hpp"
#include "scenarios.hpp"
