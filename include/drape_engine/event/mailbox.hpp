#pragma once

/// @file mailbox.hpp
/// @brief Bounded per-subscriber FIFO of event sequence numbers
///
/// Circular buffer with power-of-2 capacity. Pushing into a full mailbox
/// evicts the oldest entry so the newest is always admitted.

#include "types.hpp"

#include <optional>
#include <vector>

namespace drape_event {

class Mailbox {
public:
    using size_type = std::size_t;

    /// @param capacity Maximum pending entries (rounded up to a power of two, minimum 2)
    explicit Mailbox(size_type capacity)
        : m_buffer(round_capacity(capacity), 0)
        , m_mask(round_capacity(capacity) - 1) {}

    /// Append a seq, evicting the oldest entry when full
    /// @return true if an entry was evicted
    bool push(Seq seq) {
        bool evicted = false;
        if (m_len == m_buffer.size()) {
            m_read = (m_read + 1) & m_mask;
            --m_len;
            evicted = true;
        }
        m_buffer[(m_read + m_len) & m_mask] = seq;
        ++m_len;
        return evicted;
    }

    /// Remove and return the oldest entry
    [[nodiscard]] std::optional<Seq> pop() {
        if (m_len == 0) {
            return std::nullopt;
        }
        Seq seq = m_buffer[m_read];
        m_read = (m_read + 1) & m_mask;
        --m_len;
        return seq;
    }

    /// Discard everything pending
    void clear() noexcept {
        m_read = 0;
        m_len = 0;
    }

    [[nodiscard]] size_type size() const noexcept { return m_len; }
    [[nodiscard]] bool empty() const noexcept { return m_len == 0; }
    [[nodiscard]] size_type capacity() const noexcept { return m_buffer.size(); }

private:
    std::vector<Seq> m_buffer;
    size_type m_mask;
    size_type m_read = 0;
    size_type m_len = 0;
};

} // namespace drape_event
