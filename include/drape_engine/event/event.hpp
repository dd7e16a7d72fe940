#pragma once

/// @file event.hpp
/// @brief Main include header for drape_event
///
/// drape_event provides:
/// - EventBus: ring-buffered multi-channel publish/subscribe
/// - EventCursor: per-subscriber mailbox reader
/// - Typed payload layouts for physics and tooling events

#include "fwd.hpp"
#include "types.hpp"
#include "ring.hpp"
#include "mailbox.hpp"
#include "event_bus.hpp"
#include "typed.hpp"
