#pragma once

/// @file ccd.hpp
/// @brief Main include header for drape_ccd
///
/// drape_ccd provides continuous collision detection:
/// - sweep_toi: box-box time of impact (slab fast path, swept SAT otherwise)
/// - advance_with_ccd: integrate a box without tunneling through obstacles
/// - Ray slab and circle time-of-impact queries

#include "sweep.hpp"
#include "stepper.hpp"
#include "queries.hpp"
#include "settings.hpp"
