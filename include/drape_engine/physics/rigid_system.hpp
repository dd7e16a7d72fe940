#pragma once

/// @file rigid_system.hpp
/// @brief Box rigid bodies against static AABB obstacles
///
/// Per fixed step each awake body is integrated under gravity (optionally
/// swept with CCD), pushed out of overlapping obstacles and given a normal
/// and friction impulse. Optional dynamic pair resolution runs afterwards.
/// Contacts, impulses, sleep and wake transitions are published on the
/// bus' FixedEnd channel.

#include "types.hpp"
#include "sat.hpp"
#include "picking.hpp"

#include <drape_engine/core/error.hpp>
#include <drape_engine/engine/system.hpp>
#include <drape_engine/event/event_bus.hpp>

#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>

namespace drape_physics {

class RigidSystem : public drape_engine::ISystem {
public:
    RigidSystem(RigidSystemConfig config, StaticQuery obstacles, std::shared_ptr<drape_event::EventBus> bus);

    // =========================================================================
    // ISystem
    // =========================================================================

    [[nodiscard]] const drape_engine::SystemDescriptor& descriptor() const override { return m_descriptor; }

    void fixed_update(float dt) override;

    // =========================================================================
    // Bodies
    // =========================================================================

    /// Register a body; ids must be unique and non-zero
    [[nodiscard]] drape_core::Result<void> add_body(const RigidBody& body);

    /// Remove a body, keeping the order of the others
    /// @return true if the body existed
    bool remove_body(BodyId id);

    [[nodiscard]] const RigidBody* body(BodyId id) const;
    [[nodiscard]] RigidBody* body(BodyId id);

    [[nodiscard]] std::optional<Vec2> body_center(BodyId id) const;

    [[nodiscard]] std::size_t body_count() const noexcept { return m_bodies.size(); }

    [[nodiscard]] bool is_sleeping(BodyId id) const;

    /// Clear the sleep state of a body
    /// @return true if the body existed
    bool wake(BodyId id);

    // =========================================================================
    // CCD
    // =========================================================================

    void configure_ccd(const CcdConfigUpdate& update);

    [[nodiscard]] const drape_ccd::CcdSettings& ccd_settings() const noexcept { return m_config.ccd; }

    // =========================================================================
    // Debug
    // =========================================================================

    [[nodiscard]] std::vector<BodySnapshot> debug_get_bodies() const;

    /// Pick the first body containing `point` and publish Pick on FrameEnd
    std::optional<PickHit> pick_at(const Vec2& point);

    [[nodiscard]] const RigidSystemConfig& config() const noexcept { return m_config; }
    [[nodiscard]] const std::shared_ptr<drape_event::EventBus>& bus() const noexcept { return m_bus; }

private:
    struct SleepState {
        int frames_below = 0;
        bool sleeping = false;
    };

    struct CcdContact {
        Vec2 normal{0.0f};
        std::optional<Vec2> point;
    };

    [[nodiscard]] std::optional<std::size_t> index_of(BodyId id) const;
    void rebuild_index();

    /// Returns true if the body just fell asleep
    bool update_sleep(RigidBody& body, SleepState& state);
    [[nodiscard]] bool should_use_ccd(const RigidBody& body) const;
    std::optional<CcdContact> advance_with_ccd(RigidBody& body, float dt, const std::vector<Aabb>& obstacles);

    bool resolve_static(RigidBody& body, const std::vector<Aabb>& obstacles);
    void apply_ccd_response(RigidBody& body, const CcdContact& contact);
    void resolve_dynamic_pairs();
    void resolve_pair(std::size_t ia, std::size_t ib);
    void mark_awake(std::size_t index);

    RigidSystemConfig m_config;
    drape_engine::SystemDescriptor m_descriptor;
    StaticQuery m_obstacles;
    std::shared_ptr<drape_event::EventBus> m_bus;
    float m_sleep_velocity_sq = 0.0f;

    std::vector<RigidBody> m_bodies;
    std::vector<SleepState> m_sleep;  ///< Parallel to m_bodies
    std::unordered_map<BodyId, std::size_t> m_index;
};

} // namespace drape_physics
