#pragma once

/// @file world.hpp
/// @brief Priority-ordered system registry for drape_engine
///
/// EngineWorld dispatches fixed steps and frames to registered systems in
/// priority order (higher first, registration order among equals). Each
/// dispatch iterates a snapshot of the list, so systems may add or remove
/// systems from inside their hooks; removed systems are skipped for the
/// rest of the dispatch.

#include "fwd.hpp"
#include "system.hpp"

#include <drape_engine/core/error.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace drape_engine {

class EngineWorld {
public:
    EngineWorld() = default;
    ~EngineWorld();

    // Non-copyable
    EngineWorld(const EngineWorld&) = delete;
    EngineWorld& operator=(const EngineWorld&) = delete;

    // =========================================================================
    // Registration
    // =========================================================================

    /// Register a system and call its on_attach hook
    /// @return The resolved system id: options.id, then descriptor name, then "system-N"
    [[nodiscard]] drape_core::Result<std::string> add_system(
        std::shared_ptr<ISystem> system, const SystemOptions& options = {});

    /// Unregister a system and call its on_detach hook
    /// @return true if the system was registered
    bool remove_system(const std::string& id);

    [[nodiscard]] std::shared_ptr<ISystem> get_system(const std::string& id) const;

    /// Get a registered system downcast to its concrete type
    template<typename T>
    [[nodiscard]] std::shared_ptr<T> get_system_as(const std::string& id) const {
        return std::dynamic_pointer_cast<T>(get_system(id));
    }

    /// Registered ids in dispatch order
    [[nodiscard]] std::vector<std::string> system_ids() const;

    [[nodiscard]] std::size_t system_count() const noexcept { return m_systems.size(); }

    // =========================================================================
    // Dispatch
    // =========================================================================

    void set_paused(bool paused) noexcept { m_paused = paused; }
    [[nodiscard]] bool is_paused() const noexcept { return m_paused; }

    /// Run fixed_update on every system, skipping those that disallow pausing while paused
    void step(float dt);

    /// Run frame_update on every system regardless of pause state
    void frame(float dt);

private:
    struct Entry {
        std::string id;
        std::shared_ptr<ISystem> system;
        int priority = 0;
        bool allow_while_paused = false;
        bool removed = false;
    };

    std::string resolve_id(const ISystem& system, const SystemOptions& options);

    std::vector<std::shared_ptr<Entry>> m_systems;
    bool m_paused = false;
    std::uint32_t m_id_counter = 0;
};

} // namespace drape_engine
