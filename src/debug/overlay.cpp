/// @file overlay.cpp
/// @brief Debug overlay systems

#include <drape_engine/debug/overlay.hpp>
#include <drape_engine/core/log.hpp>
#include <drape_engine/event/typed.hpp>

#include <algorithm>
#include <cmath>
#include <utility>

namespace drape_debug {

namespace {

std::shared_ptr<drape_event::EventBus> bus_or_private(std::shared_ptr<drape_event::EventBus> bus, const char* owner) {
    if (bus) {
        return bus;
    }
    drape_core::engine_logger()->warn("{} created without a bus, using a private one", owner);
    return std::make_shared<drape_event::EventBus>();
}

std::shared_ptr<DebugOverlayState> overlay_or_new(std::shared_ptr<DebugOverlayState> overlay) {
    return overlay ? std::move(overlay) : std::make_shared<DebugOverlayState>();
}

} // anonymous namespace

// =============================================================================
// WakeMarkerSystem
// =============================================================================

WakeMarkerSystem::WakeMarkerSystem(WakeMarkerOptions options)
    : m_bus(bus_or_private(std::move(options.bus), "WakeMarkerSystem"))
    , m_overlay(overlay_or_new(std::move(options.overlay)))
    , m_position(std::move(options.position))
    , m_lifetime(std::max(1, options.lifetime_frames)) {
    m_cursor = m_bus->subscribe(SUBSCRIBER_ID, {
        {drape_event::Channel::FixedEnd, drape_event::event_ids::Wake},
    });
}

WakeMarkerSystem::~WakeMarkerSystem() {
    m_bus->unsubscribe(SUBSCRIBER_ID);
}

void WakeMarkerSystem::frame_update(float /*dt*/) {
    m_cursor.read(drape_event::Channel::FixedEnd,
        [this](const drape_event::EventHeader&, const drape_event::EventReader& r) {
            const auto wake = drape_event::WakeEvent::read(r);
            if (!m_position) {
                return;
            }
            if (auto pos = m_position(wake.entity)) {
                m_markers.push_back(Marker{*pos, m_lifetime});
            }
        });

    if (m_markers.empty()) {
        m_overlay->wake_markers.clear();
        return;
    }

    for (auto& marker : m_markers) {
        --marker.ttl;
    }
    m_markers.erase(std::remove_if(m_markers.begin(), m_markers.end(),
        [](const Marker& m) { return m.ttl <= 0; }), m_markers.end());

    m_overlay->wake_markers.clear();
    m_overlay->wake_markers.reserve(m_markers.size());
    for (const auto& marker : m_markers) {
        m_overlay->wake_markers.push_back(marker.position);
    }
}

// =============================================================================
// BusMetricsOverlaySystem
// =============================================================================

float metric_bar_level(std::uint64_t value) noexcept {
    const double level = std::log10(1.0 + static_cast<double>(value)) / 2.0;
    return static_cast<float>(std::min(1.0, level));
}

BusMetricsOverlaySystem::BusMetricsOverlaySystem(
    std::shared_ptr<drape_event::EventBus> bus, std::shared_ptr<DebugOverlayState> overlay)
    : m_bus(bus_or_private(std::move(bus), "BusMetricsOverlaySystem"))
    , m_overlay(overlay_or_new(std::move(overlay))) {}

void BusMetricsOverlaySystem::frame_update(float /*dt*/) {
    const auto& metrics = m_bus->metrics();
    m_overlay->bus_bars[static_cast<std::size_t>(BusBar::ChannelDrops)] = metric_bar_level(metrics.channel_drops);
    m_overlay->bus_bars[static_cast<std::size_t>(BusBar::TombstoneDrops)] = metric_bar_level(metrics.tombstone_drops);
    m_overlay->bus_bars[static_cast<std::size_t>(BusBar::MailboxDrops)] = metric_bar_level(metrics.total_mailbox_drops());
}

// =============================================================================
// EventOverlayAdapter
// =============================================================================

EventOverlayAdapter::EventOverlayAdapter(
    std::shared_ptr<drape_event::EventBus> bus, std::shared_ptr<DebugOverlayState> overlay)
    : m_bus(bus_or_private(std::move(bus), "EventOverlayAdapter"))
    , m_overlay(overlay_or_new(std::move(overlay))) {
    m_cursor = m_bus->subscribe(SUBSCRIBER_ID, {
        {drape_event::Channel::FrameBegin, drape_event::event_ids::PointerMove},
    });
}

EventOverlayAdapter::~EventOverlayAdapter() {
    m_bus->unsubscribe(SUBSCRIBER_ID);
}

void EventOverlayAdapter::frame_update(float /*dt*/) {
    m_cursor.read(drape_event::Channel::FrameBegin,
        [this](const drape_event::EventHeader&, const drape_event::EventReader& r) {
            m_overlay->pointer = drape_event::PointerMoveEvent::read(r).point;
        });
}

} // namespace drape_debug
