#pragma once

/// @file systems.hpp
/// @brief Built-in engine systems tied to the event bus

#include "system.hpp"

#include <drape_engine/event/event_bus.hpp>

#include <cstdint>
#include <memory>

namespace drape_engine {

// =============================================================================
// EventBusSystem
// =============================================================================

/// Owns the shared bus and advances its frame index once per frame
class EventBusSystem : public ISystem {
public:
    explicit EventBusSystem(drape_event::BusOptions options = {});

    /// Wrap an existing bus
    explicit EventBusSystem(std::shared_ptr<drape_event::EventBus> bus);

    [[nodiscard]] const SystemDescriptor& descriptor() const override { return m_descriptor; }

    void frame_update(float dt) override;

    [[nodiscard]] const std::shared_ptr<drape_event::EventBus>& bus() const noexcept { return m_bus; }

private:
    SystemDescriptor m_descriptor{"event-bus", 1000, true};
    std::shared_ptr<drape_event::EventBus> m_bus;
};

// =============================================================================
// PerfEmitterSystem
// =============================================================================

/// Publishes one PerfRow per frame on FrameEnd with the frame time in ms
class PerfEmitterSystem : public ISystem {
public:
    explicit PerfEmitterSystem(std::shared_ptr<drape_event::EventBus> bus, std::uint32_t label = 0);

    [[nodiscard]] const SystemDescriptor& descriptor() const override { return m_descriptor; }

    void frame_update(float dt) override;

    [[nodiscard]] std::uint64_t rows_published() const noexcept { return m_rows; }

private:
    SystemDescriptor m_descriptor{"perf-emitter", 999, true};
    std::shared_ptr<drape_event::EventBus> m_bus;
    std::uint32_t m_label;
    std::uint64_t m_rows = 0;
};

} // namespace drape_engine
