/// @file event_bus.cpp
/// @brief EventBus and EventCursor implementation

#include <drape_engine/event/event_bus.hpp>
#include <drape_engine/core/log.hpp>

#include <algorithm>
#include <exception>

namespace drape_event {

// =============================================================================
// EventCursor
// =============================================================================

std::size_t EventCursor::read(Channel channel, const ReadFn& fn, std::size_t limit) const {
    if (!m_bus) {
        return 0;
    }
    return m_bus->read(m_id, channel, fn, limit);
}

void EventCursor::fast_forward(Channel channel) const {
    if (m_bus) {
        m_bus->fast_forward(m_id, channel);
    }
}

std::size_t EventCursor::pending(Channel channel) const {
    return m_bus ? m_bus->pending(m_id, channel) : 0;
}

// =============================================================================
// EventBus: Construction
// =============================================================================

EventBus::EventBus(BusOptions options)
    : m_options(options)
{
    m_options.capacity = round_capacity(options.capacity);
    m_options.mailbox_capacity = round_capacity(options.mailbox_capacity);

    m_rings.reserve(CHANNEL_COUNT);
    for (std::size_t i = 0; i < CHANNEL_COUNT; ++i) {
        m_rings.emplace_back(m_options.capacity);
    }

    drape_core::event_logger()->debug("Event bus created (capacity {}, mailbox {})",
        m_options.capacity, m_options.mailbox_capacity);
}

// =============================================================================
// EventBus: Publishing
// =============================================================================

Seq EventBus::publish(Channel channel, EventKind kind, const WriteFn& writer) {
    EventRing& r = ring(channel);
    EventRing::Reservation res = r.reserve();
    if (res.overwritten) {
        ++m_metrics.channel_drops;
    }

    if (writer) {
        try {
            EventWriter w = r.writer(res.slot);
            writer(w);
        } catch (const std::exception& e) {
            ++m_metrics.writer_errors;
            drape_core::event_logger()->warn("Dropping event kind {} on {} (seq {}): writer failed: {}",
                kind, channel_name(channel), res.seq, e.what());
            return res.seq;
        }
    }

    r.commit(res.slot, kind, m_frame);

    if (m_reading) {
        m_pending.push_back(PendingFanout{channel, kind, res.seq});
    } else {
        flush_pending();
        fan_out(channel, kind, res.seq);
    }
    return res.seq;
}

bool EventBus::invalidate(Channel channel, Seq seq) {
    if (!ring(channel).invalidate(seq)) {
        return false;
    }
    ++m_metrics.tombstone_drops;
    return true;
}

void EventBus::fan_out(Channel channel, EventKind kind, Seq seq) {
    const std::size_t idx = channel_index(channel);
    auto& interest = m_interest[idx];
    auto it = interest.find(kind);
    if (it == interest.end()) {
        return;
    }
    for (const auto& id : it->second) {
        auto sub = m_subscribers.find(id);
        if (sub == m_subscribers.end()) {
            continue;
        }
        // Interest registered after this event was published
        auto since = sub->second.since[idx].find(kind);
        if (since != sub->second.since[idx].end() && seq <= since->second) {
            continue;
        }
        deliver(id, sub->second, channel, seq);
    }
}

void EventBus::deliver(const std::string& id, Subscriber& sub, Channel channel, Seq seq) {
    if (sub.mailboxes[channel_index(channel)].push(seq)) {
        ++m_metrics.mailbox_drops[id];
    }
}

void EventBus::flush_pending() {
    if (m_pending.empty()) {
        return;
    }
    std::vector<PendingFanout> pending;
    pending.swap(m_pending);
    for (const auto& p : pending) {
        fan_out(p.channel, p.kind, p.seq);
    }
}

// =============================================================================
// EventBus: Subscriptions
// =============================================================================

EventBus::Subscriber& EventBus::ensure_subscriber(const std::string& id, bool& created) {
    auto it = m_subscribers.find(id);
    if (it != m_subscribers.end()) {
        created = false;
        return it->second;
    }

    Subscriber sub;
    sub.mailboxes.reserve(CHANNEL_COUNT);
    for (std::size_t i = 0; i < CHANNEL_COUNT; ++i) {
        sub.mailboxes.emplace_back(m_options.mailbox_capacity);
    }
    created = true;
    return m_subscribers.emplace(id, std::move(sub)).first->second;
}

void EventBus::register_wants(const std::string& id, Subscriber& sub, const std::vector<Want>& wants) {
    for (const auto& want : wants) {
        auto& kinds = sub.wants[channel_index(want.channel)];
        if (std::find(kinds.begin(), kinds.end(), want.kind) != kinds.end()) {
            continue;
        }
        kinds.push_back(want.kind);
        sub.since[channel_index(want.channel)][want.kind] = ring(want.channel).head();
        m_interest[channel_index(want.channel)][want.kind].push_back(id);
    }
}

void EventBus::remove_interests(const std::string& id, Subscriber& sub) {
    for (std::size_t c = 0; c < CHANNEL_COUNT; ++c) {
        auto& interest = m_interest[c];
        for (EventKind kind : sub.wants[c]) {
            auto it = interest.find(kind);
            if (it == interest.end()) {
                continue;
            }
            auto& ids = it->second;
            ids.erase(std::remove(ids.begin(), ids.end(), id), ids.end());
            if (ids.empty()) {
                interest.erase(it);
            }
        }
        sub.wants[c].clear();
        sub.since[c].clear();
    }
}

void EventBus::backfill(const std::string& id, Subscriber& sub) {
    for (Channel channel : ALL_CHANNELS) {
        const auto& kinds = sub.wants[channel_index(channel)];
        if (kinds.empty()) {
            continue;
        }

        const EventRing& r = ring(channel);
        const Seq head = r.head();
        const Seq window = static_cast<Seq>(r.capacity());
        const Seq start = head >= window ? head - window + 1 : 1;

        for (Seq seq = start; seq <= head; ++seq) {
            if (!r.holds(seq)) {
                continue;
            }
            const std::size_t slot = r.slot_of(seq);
            if (!r.is_valid(slot)) {
                continue;
            }
            if (std::find(kinds.begin(), kinds.end(), r.kind_at(slot)) != kinds.end()) {
                deliver(id, sub, channel, seq);
            }
        }
    }
}

EventCursor EventBus::subscribe(const std::string& id, const std::vector<Want>& wants, bool backfill_enabled) {
    bool created = false;
    Subscriber& sub = ensure_subscriber(id, created);
    register_wants(id, sub, wants);

    // Returning subscribers never see events published while they were away
    const bool returning = m_epochs.find(id) != m_epochs.end();
    if (created && backfill_enabled && !returning) {
        backfill(id, sub);
    }

    drape_core::event_logger()->debug("Subscriber '{}' registered {} interest(s){}",
        id, wants.size(), created ? "" : " (existing)");
    return EventCursor(this, id);
}

void EventBus::update_subscription(const std::string& id, const std::vector<Want>& wants) {
    bool created = false;
    Subscriber& sub = ensure_subscriber(id, created);
    if (!created) {
        remove_interests(id, sub);
        for (auto& mailbox : sub.mailboxes) {
            mailbox.clear();
        }
    }
    register_wants(id, sub, wants);
}

bool EventBus::unsubscribe(const std::string& id) {
    auto it = m_subscribers.find(id);
    if (it == m_subscribers.end()) {
        return false;
    }

    remove_interests(id, it->second);

    std::array<Seq, CHANNEL_COUNT> heads{};
    for (Channel channel : ALL_CHANNELS) {
        heads[channel_index(channel)] = ring(channel).head();
    }
    m_epochs[id] = heads;

    m_subscribers.erase(it);
    drape_core::event_logger()->debug("Subscriber '{}' removed", id);
    return true;
}

std::optional<EventCursor> EventBus::cursor(const std::string& id) {
    if (m_subscribers.find(id) == m_subscribers.end()) {
        return std::nullopt;
    }
    return EventCursor(this, id);
}

bool EventBus::is_subscribed(const std::string& id) const {
    return m_subscribers.find(id) != m_subscribers.end();
}

std::optional<std::array<Seq, CHANNEL_COUNT>> EventBus::epoch(const std::string& id) const {
    auto it = m_epochs.find(id);
    if (it == m_epochs.end()) {
        return std::nullopt;
    }
    return it->second;
}

// =============================================================================
// EventBus: Reading
// =============================================================================

std::size_t EventBus::read(const std::string& id, Channel channel, const ReadFn& fn, std::size_t limit) {
    if (m_reading) {
        return 0;
    }

    // Publishes parked by a callback that threw
    flush_pending();

    auto it = m_subscribers.find(id);
    if (it == m_subscribers.end()) {
        return 0;
    }

    const std::size_t available = it->second.mailboxes[channel_index(channel)].size();
    const std::size_t max = limit == 0 ? available : std::min(available, limit);
    if (max == 0) {
        return 0;
    }

    const std::size_t delivered = drain(id, channel, fn, max);

    // Publishes made by callbacks reach mailboxes once the read is over
    flush_pending();
    return delivered;
}

std::size_t EventBus::drain(const std::string& id, Channel channel, const ReadFn& fn, std::size_t max) {
    struct ReadGuard {
        EventBus& bus;
        explicit ReadGuard(EventBus& b) : bus(b) { bus.m_reading = true; }
        ~ReadGuard() { bus.m_reading = false; }
    } guard(*this);

    const std::size_t idx = channel_index(channel);
    const EventRing& r = ring(channel);
    std::size_t delivered = 0;

    for (std::size_t i = 0; i < max; ++i) {
        // The callback may unsubscribe this reader
        auto sub = m_subscribers.find(id);
        if (sub == m_subscribers.end()) {
            break;
        }
        std::optional<Seq> seq = sub->second.mailboxes[idx].pop();
        if (!seq) {
            break;
        }

        if (!r.holds(*seq)) {
            ++m_metrics.channel_drops;
            continue;
        }
        const std::size_t slot = r.slot_of(*seq);
        if (!r.is_valid(slot)) {
            ++m_metrics.tombstone_drops;
            continue;
        }

        if (fn) {
            fn(r.header(slot), r.reader(slot));
        }
        ++delivered;
    }
    return delivered;
}

void EventBus::fast_forward(const std::string& id, Channel channel) {
    auto it = m_subscribers.find(id);
    if (it != m_subscribers.end()) {
        it->second.mailboxes[channel_index(channel)].clear();
    }
}

std::size_t EventBus::pending(const std::string& id, Channel channel) const {
    auto it = m_subscribers.find(id);
    if (it == m_subscribers.end()) {
        return 0;
    }
    return it->second.mailboxes[channel_index(channel)].size();
}

// =============================================================================
// EventBus: Introspection
// =============================================================================

BusStats EventBus::stats() const {
    BusStats stats;
    stats.subscribers = m_subscribers.size();
    stats.frame = m_frame;

    for (Channel channel : ALL_CHANNELS) {
        const std::size_t idx = channel_index(channel);
        ChannelStats& cs = stats.channels[idx];
        const EventRing& r = ring(channel);
        cs.head = r.head();
        cs.tick = r.tick();
        cs.capacity = r.capacity();

        for (const auto& [id, sub] : m_subscribers) {
            cs.pending += sub.mailboxes[idx].size();
            if (!sub.wants[idx].empty()) {
                ++cs.subscribers;
            }
        }
    }
    return stats;
}

} // namespace drape_event
