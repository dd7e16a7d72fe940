#pragma once

/// @file event_bus.hpp
/// @brief Multi-channel ring-buffered event bus for drape_event
///
/// Events are written once into a per-channel slot ring and fanned out as
/// sequence numbers into bounded per-subscriber mailboxes. Readers pull
/// payloads lazily from the ring and re-validate each seq, so overwritten
/// (stale) and invalidated (tombstoned) events are dropped and counted
/// instead of delivered.
///
/// Single-threaded. A read in progress blocks nested reads, and publishes
/// made from inside a read callback reach mailboxes once the read ends,
/// and only those of subscribers whose interest predates the publish.

#include "fwd.hpp"
#include "types.hpp"
#include "ring.hpp"
#include "mailbox.hpp"

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace drape_event {

/// Payload writer callback used by publish
using WriteFn = std::function<void(EventWriter&)>;

/// Reader callback invoked once per delivered event
using ReadFn = std::function<void(const EventHeader&, const EventReader&)>;

// =============================================================================
// EventCursor
// =============================================================================

/// Subscriber-bound read handle. Cheap to copy; must not outlive its bus.
class EventCursor {
public:
    EventCursor() = default;

    /// Drain pending events on a channel in publish order
    /// @param limit Maximum entries to consume, 0 for all currently pending
    /// @return Number of events delivered to `fn`
    std::size_t read(Channel channel, const ReadFn& fn, std::size_t limit = 0) const;

    /// Discard pending events on a channel
    void fast_forward(Channel channel) const;

    /// Pending (not yet read) entries on a channel
    [[nodiscard]] std::size_t pending(Channel channel) const;

    [[nodiscard]] const std::string& id() const noexcept { return m_id; }
    [[nodiscard]] bool is_valid() const noexcept { return m_bus != nullptr; }

private:
    friend class EventBus;
    EventCursor(EventBus* bus, std::string id) : m_bus(bus), m_id(std::move(id)) {}

    EventBus* m_bus = nullptr;
    std::string m_id;
};

// =============================================================================
// EventBus
// =============================================================================

class EventBus {
public:
    explicit EventBus(BusOptions options = {});

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;
    EventBus(EventBus&&) = delete;
    EventBus& operator=(EventBus&&) = delete;

    // =========================================================================
    // Publishing
    // =========================================================================

    /// Write an event into the channel ring and fan it out to interested mailboxes
    /// @param writer Fills payload lanes; if it throws the event is dropped
    /// @return The seq assigned to the event
    Seq publish(Channel channel, EventKind kind, const WriteFn& writer = {});

    /// Tombstone a previously published event if its slot still holds it
    /// @return true if this call invalidated the event
    bool invalidate(Channel channel, Seq seq);

    // =========================================================================
    // Subscriptions
    // =========================================================================

    /// Register interest in (channel, kind) pairs
    /// @param backfill Replay retained matching events (first subscribe only)
    EventCursor subscribe(const std::string& id, const std::vector<Want>& wants, bool backfill = true);

    /// Replace a subscriber's interests; pending entries are discarded
    void update_subscription(const std::string& id, const std::vector<Want>& wants);

    /// Remove a subscriber, its mailboxes and interests
    /// @return true if the subscriber existed
    bool unsubscribe(const std::string& id);

    /// Cursor for an existing subscriber
    [[nodiscard]] std::optional<EventCursor> cursor(const std::string& id);

    [[nodiscard]] bool is_subscribed(const std::string& id) const;

    /// Channel heads recorded when `id` last unsubscribed
    [[nodiscard]] std::optional<std::array<Seq, CHANNEL_COUNT>> epoch(const std::string& id) const;

    // =========================================================================
    // Frames and Introspection
    // =========================================================================

    /// Advance the frame index stamped into event headers
    void advance_frame() noexcept { ++m_frame; }
    [[nodiscard]] std::uint32_t frame() const noexcept { return m_frame; }

    [[nodiscard]] const BusMetrics& metrics() const noexcept { return m_metrics; }
    [[nodiscard]] BusStats stats() const;

    [[nodiscard]] Seq head(Channel channel) const noexcept { return ring(channel).head(); }
    [[nodiscard]] std::size_t capacity() const noexcept { return m_options.capacity; }
    [[nodiscard]] std::size_t mailbox_capacity() const noexcept { return m_options.mailbox_capacity; }

private:
    friend class EventCursor;

    struct Subscriber {
        std::vector<Mailbox> mailboxes;                         ///< Indexed by channel
        std::array<std::vector<EventKind>, CHANNEL_COUNT> wants;  ///< Deduplicated kinds
        /// Channel head when each kind was registered; deferred fan-out skips seqs at or below it
        std::array<std::map<EventKind, Seq>, CHANNEL_COUNT> since;
    };

    struct PendingFanout {
        Channel channel;
        EventKind kind;
        Seq seq;
    };

    [[nodiscard]] EventRing& ring(Channel channel) noexcept { return m_rings[channel_index(channel)]; }
    [[nodiscard]] const EventRing& ring(Channel channel) const noexcept { return m_rings[channel_index(channel)]; }

    Subscriber& ensure_subscriber(const std::string& id, bool& created);
    void register_wants(const std::string& id, Subscriber& sub, const std::vector<Want>& wants);
    void remove_interests(const std::string& id, Subscriber& sub);
    void backfill(const std::string& id, Subscriber& sub);
    void fan_out(Channel channel, EventKind kind, Seq seq);
    void deliver(const std::string& id, Subscriber& sub, Channel channel, Seq seq);
    void flush_pending();

    std::size_t read(const std::string& id, Channel channel, const ReadFn& fn, std::size_t limit);
    std::size_t drain(const std::string& id, Channel channel, const ReadFn& fn, std::size_t max);
    void fast_forward(const std::string& id, Channel channel);
    std::size_t pending(const std::string& id, Channel channel) const;

    BusOptions m_options;
    std::vector<EventRing> m_rings;
    std::unordered_map<std::string, Subscriber> m_subscribers;
    std::array<std::map<EventKind, std::vector<std::string>>, CHANNEL_COUNT> m_interest;
    std::unordered_map<std::string, std::array<Seq, CHANNEL_COUNT>> m_epochs;
    BusMetrics m_metrics;
    std::uint32_t m_frame = 0;
    bool m_reading = false;
    std::vector<PendingFanout> m_pending;
};

} // namespace drape_event
