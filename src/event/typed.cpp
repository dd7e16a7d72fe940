/// @file typed.cpp
/// @brief Payload lane encoding for the well-known event kinds

#include <drape_engine/event/typed.hpp>

namespace drape_event {

namespace {

void write_vec2(std::span<float> f32, std::size_t at, const drape_math::Vec2& v) {
    f32[at] = v.x;
    f32[at + 1] = v.y;
}

drape_math::Vec2 read_vec2(std::span<const float> f32, std::size_t at) {
    return drape_math::Vec2(f32[at], f32[at + 1]);
}

} // anonymous namespace

// =============================================================================
// Physics Events
// =============================================================================

void CollisionEvent::write(EventWriter& w) const {
    w.u32()[0] = a;
    w.u32()[1] = b;
    write_vec2(w.f32(), 0, normal);
    write_vec2(w.f32(), 2, contact);
    w.f32()[4] = depth;
}

CollisionEvent CollisionEvent::read(const EventReader& r) {
    CollisionEvent e;
    e.a = r.u32()[0];
    e.b = r.u32()[1];
    e.normal = read_vec2(r.f32(), 0);
    e.contact = read_vec2(r.f32(), 2);
    e.depth = r.f32()[4];
    return e;
}

void ImpulseEvent::write(EventWriter& w) const {
    w.u32()[0] = entity;
    write_vec2(w.f32(), 0, impulse);
}

ImpulseEvent ImpulseEvent::read(const EventReader& r) {
    return ImpulseEvent{r.u32()[0], read_vec2(r.f32(), 0)};
}

void WakeEvent::write(EventWriter& w) const {
    w.u32()[0] = entity;
}

WakeEvent WakeEvent::read(const EventReader& r) {
    return WakeEvent{r.u32()[0]};
}

void SleepEvent::write(EventWriter& w) const {
    w.u32()[0] = entity;
}

SleepEvent SleepEvent::read(const EventReader& r) {
    return SleepEvent{r.u32()[0]};
}

void CcdHitEvent::write(EventWriter& w) const {
    w.u32()[0] = entity;
    w.f32()[0] = t;
    write_vec2(w.f32(), 1, normal);
}

CcdHitEvent CcdHitEvent::read(const EventReader& r) {
    return CcdHitEvent{r.u32()[0], r.f32()[0], read_vec2(r.f32(), 1)};
}

void PickEvent::write(EventWriter& w) const {
    w.u32()[0] = entity;
    write_vec2(w.f32(), 0, point);
}

PickEvent PickEvent::read(const EventReader& r) {
    return PickEvent{r.u32()[0], read_vec2(r.f32(), 0)};
}

// =============================================================================
// Tooling Events
// =============================================================================

void PointerMoveEvent::write(EventWriter& w) const {
    write_vec2(w.f32(), 0, point);
}

PointerMoveEvent PointerMoveEvent::read(const EventReader& r) {
    return PointerMoveEvent{read_vec2(r.f32(), 0)};
}

void PerfRowEvent::write(EventWriter& w) const {
    w.f32()[0] = ms;
    w.u32()[0] = label;
}

PerfRowEvent PerfRowEvent::read(const EventReader& r) {
    return PerfRowEvent{r.f32()[0], r.u32()[0]};
}

EventKind RegistryEvent::kind() const noexcept {
    switch (change) {
        case RegistryChange::Add: return event_ids::RegistryAdd;
        case RegistryChange::Update: return event_ids::RegistryUpdate;
        case RegistryChange::Remove: return event_ids::RegistryRemove;
    }
    return event_ids::RegistryUpdate;
}

void RegistryEvent::write(EventWriter& w) const {
    w.u32()[0] = entity;
}

RegistryEvent RegistryEvent::read(const EventHeader& header, const EventReader& r) {
    RegistryEvent e;
    e.entity = r.u32()[0];
    if (header.id == event_ids::RegistryAdd) {
        e.change = RegistryChange::Add;
    } else if (header.id == event_ids::RegistryRemove) {
        e.change = RegistryChange::Remove;
    } else {
        e.change = RegistryChange::Update;
    }
    return e;
}

Seq publish_registry(EventBus& bus, const RegistryEvent& event) {
    return bus.publish(Channel::FrameEnd, event.kind(), [&event](EventWriter& w) { event.write(w); });
}

} // namespace drape_event
