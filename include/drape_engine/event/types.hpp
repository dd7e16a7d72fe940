#pragma once

/// @file types.hpp
/// @brief Channels, event kinds, slot headers and payload lanes for drape_event

#include "fwd.hpp"

#include <array>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <map>
#include <span>
#include <string>
#include <vector>

namespace drape_event {

// =============================================================================
// Channel
// =============================================================================

/// Independent delivery channels, each with its own ring and sequence space
enum class Channel : std::uint8_t {
    FrameBegin = 0,  ///< Before a rendered frame
    FixedEnd = 1,    ///< After a fixed simulation step
    FrameEnd = 2,    ///< After a rendered frame
    Immediate = 3,   ///< Out-of-band
};

inline constexpr std::size_t CHANNEL_COUNT = 4;

inline constexpr std::array<Channel, CHANNEL_COUNT> ALL_CHANNELS = {
    Channel::FrameBegin, Channel::FixedEnd, Channel::FrameEnd, Channel::Immediate,
};

[[nodiscard]] constexpr std::size_t channel_index(Channel channel) noexcept {
    return static_cast<std::size_t>(channel);
}

[[nodiscard]] constexpr const char* channel_name(Channel channel) noexcept {
    switch (channel) {
        case Channel::FrameBegin: return "frame_begin";
        case Channel::FixedEnd: return "fixed_end";
        case Channel::FrameEnd: return "frame_end";
        case Channel::Immediate: return "immediate";
    }
    return "unknown";
}

// =============================================================================
// Event Kinds
// =============================================================================

/// Stable numeric event kind ids shared with every consumer
namespace event_ids {
    inline constexpr EventKind PointerMove = 1;
    inline constexpr EventKind PerfRow = 2;
    inline constexpr EventKind CcdHit = 3;
    inline constexpr EventKind Collision = 4;
    inline constexpr EventKind Impulse = 5;
    inline constexpr EventKind Wake = 6;
    inline constexpr EventKind Sleep = 7;
    inline constexpr EventKind Pick = 8;
    inline constexpr EventKind RegistryAdd = 9;
    inline constexpr EventKind RegistryUpdate = 10;
    inline constexpr EventKind RegistryRemove = 11;
}

// =============================================================================
// Payload Lanes
// =============================================================================

/// Fixed lane widths per slot
namespace lanes {
    inline constexpr std::size_t F32 = 16;
    inline constexpr std::size_t I32 = 8;
    inline constexpr std::size_t U32 = 8;
    inline constexpr std::size_t SYM = 4;
}

/// Slot metadata handed to readers
struct EventHeader {
    EventKind id = 0;
    Seq seq = 0;
    std::uint32_t frame = 0;
    std::uint32_t tick = 0;
};

/// Mutable view over one slot's payload lanes
class EventWriter {
public:
    EventWriter(std::span<float> f32, std::span<std::int32_t> i32,
                std::span<std::uint32_t> u32, std::span<std::uint32_t> sym) noexcept
        : m_f32(f32), m_i32(i32), m_u32(u32), m_sym(sym) {}

    [[nodiscard]] std::span<float> f32() const noexcept { return m_f32; }
    [[nodiscard]] std::span<std::int32_t> i32() const noexcept { return m_i32; }
    [[nodiscard]] std::span<std::uint32_t> u32() const noexcept { return m_u32; }
    [[nodiscard]] std::span<std::uint32_t> sym() const noexcept { return m_sym; }

private:
    std::span<float> m_f32;
    std::span<std::int32_t> m_i32;
    std::span<std::uint32_t> m_u32;
    std::span<std::uint32_t> m_sym;
};

/// Read-only view over one slot's payload lanes
class EventReader {
public:
    EventReader(std::span<const float> f32, std::span<const std::int32_t> i32,
                std::span<const std::uint32_t> u32, std::span<const std::uint32_t> sym) noexcept
        : m_f32(f32), m_i32(i32), m_u32(u32), m_sym(sym) {}

    [[nodiscard]] std::span<const float> f32() const noexcept { return m_f32; }
    [[nodiscard]] std::span<const std::int32_t> i32() const noexcept { return m_i32; }
    [[nodiscard]] std::span<const std::uint32_t> u32() const noexcept { return m_u32; }
    [[nodiscard]] std::span<const std::uint32_t> sym() const noexcept { return m_sym; }

private:
    std::span<const float> m_f32;
    std::span<const std::int32_t> m_i32;
    std::span<const std::uint32_t> m_u32;
    std::span<const std::uint32_t> m_sym;
};

// =============================================================================
// Subscriptions
// =============================================================================

/// One (channel, kind) interest
struct Want {
    Channel channel = Channel::FrameEnd;
    EventKind kind = 0;
};

// =============================================================================
// Options and Metrics
// =============================================================================

inline constexpr std::size_t DEFAULT_CAPACITY = 1024;

/// Round up to the next power of two, minimum 2
[[nodiscard]] constexpr std::size_t round_capacity(std::size_t n) noexcept {
    if (n < 2) return 2;
    return std::bit_ceil(n);
}

/// Bus construction options
struct BusOptions {
    std::size_t capacity = DEFAULT_CAPACITY;          ///< Ring slots per channel
    std::size_t mailbox_capacity = DEFAULT_CAPACITY;  ///< Pending seqs per subscriber per channel
};

/// Cumulative drop counters, reset only at construction
struct BusMetrics {
    std::uint64_t channel_drops = 0;    ///< Valid slots overwritten or stale on read
    std::uint64_t tombstone_drops = 0;  ///< Invalidations and tombstoned slots skipped on read
    std::map<std::string, std::uint64_t> mailbox_drops;  ///< Evictions per subscriber
    std::uint64_t writer_errors = 0;    ///< Publishes whose writer threw

    [[nodiscard]] std::uint64_t total_mailbox_drops() const noexcept {
        std::uint64_t total = 0;
        for (const auto& [id, count] : mailbox_drops) {
            total += count;
        }
        return total;
    }
};

/// Per-channel snapshot
struct ChannelStats {
    Seq head = 0;
    std::uint32_t tick = 0;
    std::size_t capacity = 0;
    std::size_t pending = 0;      ///< Entries queued across all mailboxes
    std::size_t subscribers = 0;  ///< Subscribers with at least one interest
};

/// Whole-bus snapshot
struct BusStats {
    std::array<ChannelStats, CHANNEL_COUNT> channels{};
    std::size_t subscribers = 0;
    std::uint32_t frame = 0;
};

} // namespace drape_event
