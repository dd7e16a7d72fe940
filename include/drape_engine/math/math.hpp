#pragma once

/// @file math.hpp
/// @brief Main include header for drape_math

#include "fwd.hpp"
#include "types.hpp"
#include "vec.hpp"
#include "bounds.hpp"
