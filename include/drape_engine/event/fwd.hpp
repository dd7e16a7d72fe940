#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for drape_event

#include <cstdint>

namespace drape_event {

enum class Channel : std::uint8_t;
using EventKind = std::uint32_t;
using Seq = std::uint64_t;

struct EventHeader;
class EventWriter;
class EventReader;
struct Want;
struct BusOptions;
struct BusMetrics;
struct ChannelStats;
struct BusStats;

class EventRing;
class Mailbox;
class EventBus;
class EventCursor;

} // namespace drape_event
