#pragma once

/// @file overlay.hpp
/// @brief Debug overlay state and the bus-driven systems that fill it

#include <drape_engine/engine/system.hpp>
#include <drape_engine/event/event_bus.hpp>
#include <drape_engine/math/bounds.hpp>

#include <array>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace drape_debug {

using drape_math::Vec2;

// =============================================================================
// DebugOverlayState
// =============================================================================

/// Bar slots in DebugOverlayState::bus_bars
enum class BusBar : std::uint8_t {
    ChannelDrops = 0,
    TombstoneDrops = 1,
    MailboxDrops = 2,
};

/// Shared state read by a renderer and written by overlay systems and UI
struct DebugOverlayState {
    Vec2 pointer{0.0f};  ///< World-space pointer position
    bool visible = false;
    bool draw_aabbs = false;
    bool draw_sleep = false;

    std::vector<drape_math::Aabb> aabbs;  ///< Static obstacles to outline
    std::vector<Vec2> wake_markers;       ///< Live wake markers, oldest first

    /// Normalized [0, 1] bar levels indexed by BusBar
    std::array<float, 3> bus_bars{0.0f, 0.0f, 0.0f};

    [[nodiscard]] float bar(BusBar which) const noexcept {
        return bus_bars[static_cast<std::size_t>(which)];
    }
};

// =============================================================================
// WakeMarkerSystem
// =============================================================================

/// Resolves an entity id to its world-space center, nullopt if unknown
using PositionLookup = std::function<std::optional<Vec2>(std::uint32_t)>;

inline constexpr int DEFAULT_MARKER_LIFETIME = 12;

struct WakeMarkerOptions {
    std::shared_ptr<drape_event::EventBus> bus;
    std::shared_ptr<DebugOverlayState> overlay;
    PositionLookup position;
    int lifetime_frames = DEFAULT_MARKER_LIFETIME;  ///< Frames a marker stays visible, at least 1
};

/// Turns Wake events into short-lived markers at the woken body's position
class WakeMarkerSystem : public drape_engine::ISystem {
public:
    static constexpr const char* SUBSCRIBER_ID = "wakeMarkers";

    explicit WakeMarkerSystem(WakeMarkerOptions options);
    ~WakeMarkerSystem() override;

    WakeMarkerSystem(const WakeMarkerSystem&) = delete;
    WakeMarkerSystem& operator=(const WakeMarkerSystem&) = delete;

    [[nodiscard]] const drape_engine::SystemDescriptor& descriptor() const override { return m_descriptor; }

    void frame_update(float dt) override;

    [[nodiscard]] int lifetime_frames() const noexcept { return m_lifetime; }
    [[nodiscard]] std::size_t marker_count() const noexcept { return m_markers.size(); }

private:
    struct Marker {
        Vec2 position{0.0f};
        int ttl = 0;
    };

    drape_engine::SystemDescriptor m_descriptor{"wake-markers", 8, true};
    std::shared_ptr<drape_event::EventBus> m_bus;
    std::shared_ptr<DebugOverlayState> m_overlay;
    PositionLookup m_position;
    int m_lifetime;
    drape_event::EventCursor m_cursor;
    std::vector<Marker> m_markers;
};

// =============================================================================
// BusMetricsOverlaySystem
// =============================================================================

/// Map a drop counter onto a [0, 1] bar: min(1, log10(1 + v) / 2)
[[nodiscard]] float metric_bar_level(std::uint64_t value) noexcept;

/// Mirrors the bus drop counters into DebugOverlayState::bus_bars each frame
class BusMetricsOverlaySystem : public drape_engine::ISystem {
public:
    BusMetricsOverlaySystem(std::shared_ptr<drape_event::EventBus> bus, std::shared_ptr<DebugOverlayState> overlay);

    [[nodiscard]] const drape_engine::SystemDescriptor& descriptor() const override { return m_descriptor; }

    void frame_update(float dt) override;

private:
    drape_engine::SystemDescriptor m_descriptor{"bus-metrics-overlay", 6, true};
    std::shared_ptr<drape_event::EventBus> m_bus;
    std::shared_ptr<DebugOverlayState> m_overlay;
};

// =============================================================================
// EventOverlayAdapter
// =============================================================================

/// Copies PointerMove events from FrameBegin into DebugOverlayState::pointer
class EventOverlayAdapter : public drape_engine::ISystem {
public:
    static constexpr const char* SUBSCRIBER_ID = "overlay";

    EventOverlayAdapter(std::shared_ptr<drape_event::EventBus> bus, std::shared_ptr<DebugOverlayState> overlay);
    ~EventOverlayAdapter() override;

    EventOverlayAdapter(const EventOverlayAdapter&) = delete;
    EventOverlayAdapter& operator=(const EventOverlayAdapter&) = delete;

    [[nodiscard]] const drape_engine::SystemDescriptor& descriptor() const override { return m_descriptor; }

    void frame_update(float dt) override;

private:
    drape_engine::SystemDescriptor m_descriptor{"event-overlay-adapter", 9, true};
    std::shared_ptr<drape_event::EventBus> m_bus;
    std::shared_ptr<DebugOverlayState> m_overlay;
    drape_event::EventCursor m_cursor;
};

} // namespace drape_debug
