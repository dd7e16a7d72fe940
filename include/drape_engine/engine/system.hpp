#pragma once

/// @file system.hpp
/// @brief System interface for the drape_engine scheduler
///
/// A system is a unit of per-tick work. The world orders systems by
/// priority (higher runs first) and calls `fixed_update` once per fixed
/// step and `frame_update` once per rendered frame.

#include "fwd.hpp"

#include <optional>
#include <string>
#include <utility>

namespace drape_engine {

// =============================================================================
// SystemDescriptor
// =============================================================================

/// Scheduling metadata a system declares about itself
struct SystemDescriptor {
    std::string name;                ///< Preferred id, empty to auto-assign
    int priority = 0;                ///< Higher runs earlier
    bool allow_while_paused = false; ///< Keep running fixed steps while paused

    SystemDescriptor() = default;

    explicit SystemDescriptor(std::string n, int p = 0, bool paused = false)
        : name(std::move(n)), priority(p), allow_while_paused(paused) {}
};

/// Per-registration overrides of a system's descriptor
struct SystemOptions {
    std::optional<std::string> id;
    std::optional<int> priority;
    std::optional<bool> allow_while_paused;
};

// =============================================================================
// ISystem
// =============================================================================

/// Base interface for scheduled systems. Every hook is optional.
class ISystem {
public:
    virtual ~ISystem() = default;

    /// Get system descriptor
    [[nodiscard]] virtual const SystemDescriptor& descriptor() const = 0;

    /// Advance simulation state by one fixed step
    virtual void fixed_update(float dt) { (void)dt; }

    /// Per-frame work (runs even while the world is paused)
    virtual void frame_update(float dt) { (void)dt; }

    /// Called when the system is added to a world
    virtual void on_attach(EngineWorld& world) { (void)world; }

    /// Called when the system is removed from its world
    virtual void on_detach() {}
};

} // namespace drape_engine
