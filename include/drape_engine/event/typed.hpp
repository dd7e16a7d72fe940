#pragma once

/// @file typed.hpp
/// @brief Typed payload layouts for the well-known event kinds
///
/// Each event struct names its KIND and knows how to write itself into,
/// and read itself back from, the fixed payload lanes. Layouts are a
/// stable contract with downstream consumers.

#include "event_bus.hpp"
#include <drape_engine/math/types.hpp>

#include <cstdint>

namespace drape_event {

// =============================================================================
// Physics Events
// =============================================================================

/// Contact between body `a` and body `b` (0 for static obstacles)
/// u32[0]=a, u32[1]=b, f32[0..1]=normal, f32[2..3]=contact, f32[4]=depth
struct CollisionEvent {
    static constexpr EventKind KIND = event_ids::Collision;

    std::uint32_t a = 0;
    std::uint32_t b = 0;
    drape_math::Vec2 normal{0.0f};
    drape_math::Vec2 contact{0.0f};
    float depth = 0.0f;

    void write(EventWriter& w) const;
    [[nodiscard]] static CollisionEvent read(const EventReader& r);
};

/// Impulse applied to a body: u32[0]=entity, f32[0..1]=impulse
struct ImpulseEvent {
    static constexpr EventKind KIND = event_ids::Impulse;

    std::uint32_t entity = 0;
    drape_math::Vec2 impulse{0.0f};

    void write(EventWriter& w) const;
    [[nodiscard]] static ImpulseEvent read(const EventReader& r);
};

/// Body woke up: u32[0]=entity
struct WakeEvent {
    static constexpr EventKind KIND = event_ids::Wake;

    std::uint32_t entity = 0;

    void write(EventWriter& w) const;
    [[nodiscard]] static WakeEvent read(const EventReader& r);
};

/// Body fell asleep: u32[0]=entity
struct SleepEvent {
    static constexpr EventKind KIND = event_ids::Sleep;

    std::uint32_t entity = 0;

    void write(EventWriter& w) const;
    [[nodiscard]] static SleepEvent read(const EventReader& r);
};

/// Sweep hit: u32[0]=entity, f32[0]=t, f32[1..2]=normal
struct CcdHitEvent {
    static constexpr EventKind KIND = event_ids::CcdHit;

    std::uint32_t entity = 0;
    float t = 0.0f;
    drape_math::Vec2 normal{0.0f};

    void write(EventWriter& w) const;
    [[nodiscard]] static CcdHitEvent read(const EventReader& r);
};

/// Picked body: u32[0]=entity, f32[0..1]=point
struct PickEvent {
    static constexpr EventKind KIND = event_ids::Pick;

    std::uint32_t entity = 0;
    drape_math::Vec2 point{0.0f};

    void write(EventWriter& w) const;
    [[nodiscard]] static PickEvent read(const EventReader& r);
};

// =============================================================================
// Tooling Events
// =============================================================================

/// Pointer position: f32[0..1]=point
struct PointerMoveEvent {
    static constexpr EventKind KIND = event_ids::PointerMove;

    drape_math::Vec2 point{0.0f};

    void write(EventWriter& w) const;
    [[nodiscard]] static PointerMoveEvent read(const EventReader& r);
};

/// Frame timing row: f32[0]=ms, u32[0]=label symbol
struct PerfRowEvent {
    static constexpr EventKind KIND = event_ids::PerfRow;

    float ms = 0.0f;
    std::uint32_t label = 0;

    void write(EventWriter& w) const;
    [[nodiscard]] static PerfRowEvent read(const EventReader& r);
};

/// Element registry change kinds
enum class RegistryChange : std::uint8_t {
    Add,
    Update,
    Remove,
};

/// Element registry change: u32[0]=entity
struct RegistryEvent {
    RegistryChange change = RegistryChange::Add;
    std::uint32_t entity = 0;

    [[nodiscard]] EventKind kind() const noexcept;
    void write(EventWriter& w) const;
    [[nodiscard]] static RegistryEvent read(const EventHeader& header, const EventReader& r);
};

// =============================================================================
// Publishing Helpers
// =============================================================================

/// Publish a typed event with a static KIND
template<typename E>
Seq publish_event(EventBus& bus, Channel channel, const E& event) {
    return bus.publish(channel, E::KIND, [&event](EventWriter& w) { event.write(w); });
}

/// Publish a registry change on the frame-end channel
Seq publish_registry(EventBus& bus, const RegistryEvent& event);

} // namespace drape_event
