/// @file ring.cpp
/// @brief EventRing implementation

#include <drape_engine/event/ring.hpp>

#include <algorithm>

namespace drape_event {

EventRing::EventRing(std::size_t capacity)
    : m_capacity(round_capacity(capacity))
    , m_mask(static_cast<Seq>(m_capacity - 1))
    , m_id(m_capacity, 0)
    , m_seq(m_capacity, 0)
    , m_frame(m_capacity, 0)
    , m_tick_lane(m_capacity, 0)
    , m_valid(m_capacity, 0)
    , m_f32(m_capacity * lanes::F32, 0.0f)
    , m_i32(m_capacity * lanes::I32, 0)
    , m_u32(m_capacity * lanes::U32, 0)
    , m_sym(m_capacity * lanes::SYM, 0)
{
}

EventRing::Reservation EventRing::reserve() {
    Reservation r;
    r.seq = ++m_head;
    r.slot = slot_of(r.seq);
    r.overwritten = m_valid[r.slot] != 0;

    m_valid[r.slot] = 0;
    m_seq[r.slot] = r.seq;
    m_id[r.slot] = 0;

    std::fill_n(m_f32.begin() + static_cast<std::ptrdiff_t>(r.slot * lanes::F32), lanes::F32, 0.0f);
    std::fill_n(m_i32.begin() + static_cast<std::ptrdiff_t>(r.slot * lanes::I32), lanes::I32, 0);
    std::fill_n(m_u32.begin() + static_cast<std::ptrdiff_t>(r.slot * lanes::U32), lanes::U32, 0u);
    std::fill_n(m_sym.begin() + static_cast<std::ptrdiff_t>(r.slot * lanes::SYM), lanes::SYM, 0u);

    return r;
}

std::uint32_t EventRing::commit(std::size_t slot, EventKind id, std::uint32_t frame) {
    m_id[slot] = id;
    m_frame[slot] = frame;
    m_tick_lane[slot] = ++m_tick;
    m_valid[slot] = 1;
    return m_tick;
}

bool EventRing::invalidate(Seq seq) {
    if (!holds(seq)) {
        return false;
    }
    std::size_t slot = slot_of(seq);
    if (m_valid[slot] == 0) {
        return false;
    }
    m_valid[slot] = 0;
    return true;
}

EventWriter EventRing::writer(std::size_t slot) {
    return EventWriter(
        std::span<float>(m_f32.data() + slot * lanes::F32, lanes::F32),
        std::span<std::int32_t>(m_i32.data() + slot * lanes::I32, lanes::I32),
        std::span<std::uint32_t>(m_u32.data() + slot * lanes::U32, lanes::U32),
        std::span<std::uint32_t>(m_sym.data() + slot * lanes::SYM, lanes::SYM));
}

EventReader EventRing::reader(std::size_t slot) const {
    return EventReader(
        std::span<const float>(m_f32.data() + slot * lanes::F32, lanes::F32),
        std::span<const std::int32_t>(m_i32.data() + slot * lanes::I32, lanes::I32),
        std::span<const std::uint32_t>(m_u32.data() + slot * lanes::U32, lanes::U32),
        std::span<const std::uint32_t>(m_sym.data() + slot * lanes::SYM, lanes::SYM));
}

EventHeader EventRing::header(std::size_t slot) const {
    EventHeader h;
    h.id = m_id[slot];
    h.seq = m_seq[slot];
    h.frame = m_frame[slot];
    h.tick = m_tick_lane[slot];
    return h;
}

} // namespace drape_event
