#pragma once

/// @file ring.hpp
/// @brief Per-channel slot ring for drape_event
///
/// Structure-of-arrays storage: one header lane set (id, seq, frame, tick,
/// valid) plus four fixed-width payload lanes per slot. Capacity is a power
/// of two so `seq & mask` selects the slot.

#include "types.hpp"

#include <cstdint>
#include <vector>

namespace drape_event {

class EventRing {
public:
    /// Result of claiming the next slot
    struct Reservation {
        Seq seq = 0;
        std::size_t slot = 0;
        bool overwritten = false;  ///< Slot still held a valid event
    };

    /// @param capacity Slot count (rounded up to a power of two, minimum 2)
    explicit EventRing(std::size_t capacity);

    /// Claim the next slot: stamp the new seq, mark it invalid, zero its lanes
    Reservation reserve();

    /// Publish the header of a reserved slot and mark it valid
    /// @return The channel tick assigned to the event
    std::uint32_t commit(std::size_t slot, EventKind id, std::uint32_t frame);

    /// Tombstone the slot holding `seq` if it is still valid
    /// @return true if this call invalidated the event
    bool invalidate(Seq seq);

    [[nodiscard]] EventWriter writer(std::size_t slot);
    [[nodiscard]] EventReader reader(std::size_t slot) const;
    [[nodiscard]] EventHeader header(std::size_t slot) const;

    [[nodiscard]] std::size_t slot_of(Seq seq) const noexcept {
        return static_cast<std::size_t>(seq & m_mask);
    }

    /// The slot for `seq` has not been overwritten by a later event
    [[nodiscard]] bool holds(Seq seq) const noexcept {
        return seq != 0 && m_seq[slot_of(seq)] == seq;
    }

    [[nodiscard]] bool is_valid(std::size_t slot) const noexcept { return m_valid[slot] != 0; }
    [[nodiscard]] EventKind kind_at(std::size_t slot) const noexcept { return m_id[slot]; }

    [[nodiscard]] Seq head() const noexcept { return m_head; }
    [[nodiscard]] std::uint32_t tick() const noexcept { return m_tick; }
    [[nodiscard]] std::size_t capacity() const noexcept { return m_capacity; }

private:
    std::size_t m_capacity;
    Seq m_mask;
    Seq m_head = 0;
    std::uint32_t m_tick = 0;

    // Header lanes
    std::vector<EventKind> m_id;
    std::vector<Seq> m_seq;
    std::vector<std::uint32_t> m_frame;
    std::vector<std::uint32_t> m_tick_lane;
    std::vector<std::uint8_t> m_valid;

    // Payload lanes
    std::vector<float> m_f32;
    std::vector<std::int32_t> m_i32;
    std::vector<std::uint32_t> m_u32;
    std::vector<std::uint32_t> m_sym;
};

} // namespace drape_event
