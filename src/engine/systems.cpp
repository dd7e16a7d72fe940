/// @file systems.cpp
/// @brief Built-in engine systems

#include <drape_engine/engine/systems.hpp>
#include <drape_engine/event/typed.hpp>

#include <utility>

namespace drape_engine {

// =============================================================================
// EventBusSystem
// =============================================================================

EventBusSystem::EventBusSystem(drape_event::BusOptions options)
    : m_bus(std::make_shared<drape_event::EventBus>(options)) {}

EventBusSystem::EventBusSystem(std::shared_ptr<drape_event::EventBus> bus)
    : m_bus(bus ? std::move(bus) : std::make_shared<drape_event::EventBus>()) {}

void EventBusSystem::frame_update(float /*dt*/) {
    m_bus->advance_frame();
}

// =============================================================================
// PerfEmitterSystem
// =============================================================================

PerfEmitterSystem::PerfEmitterSystem(std::shared_ptr<drape_event::EventBus> bus, std::uint32_t label)
    : m_bus(std::move(bus))
    , m_label(label) {}

void PerfEmitterSystem::frame_update(float dt) {
    if (!m_bus) {
        return;
    }
    drape_event::publish_event(*m_bus, drape_event::Channel::FrameEnd,
        drape_event::PerfRowEvent{dt * 1000.0f, m_label});
    ++m_rows;
}

} // namespace drape_engine
