/// @file rigid_system.cpp
/// @brief RigidSystem implementation

#include <drape_engine/physics/rigid_system.hpp>
#include <drape_engine/ccd/stepper.hpp>
#include <drape_engine/core/log.hpp>
#include <drape_engine/event/typed.hpp>

#include <algorithm>
#include <cmath>
#include <span>

namespace drape_physics {

using drape_event::Channel;
using drape_event::publish_event;

namespace {

float clamp01(float v) {
    return std::clamp(v, 0.0f, 1.0f);
}

} // anonymous namespace

// =============================================================================
// Construction
// =============================================================================

RigidSystem::RigidSystem(RigidSystemConfig config, StaticQuery obstacles,
                         std::shared_ptr<drape_event::EventBus> bus)
    : m_config(config.sanitized())
    , m_obstacles(std::move(obstacles))
    , m_bus(std::move(bus)) {
    m_descriptor = drape_engine::SystemDescriptor(m_config.id, m_config.priority, false);
    m_sleep_velocity_sq = m_config.sleep_velocity_threshold * m_config.sleep_velocity_threshold;

    if (!m_bus) {
        drape_core::physics_logger()->warn("RigidSystem '{}' created without a bus, using a private one", m_config.id);
        m_bus = std::make_shared<drape_event::EventBus>();
    }

    drape_core::physics_logger()->debug(
        "RigidSystem '{}' created (gravity {}, dynamic pairs {}, sleep {} frames below {})",
        m_config.id, m_config.gravity, m_config.enable_dynamic_pairs,
        m_config.sleep_frames_threshold, m_config.sleep_velocity_threshold);
}

// =============================================================================
// Bodies
// =============================================================================

drape_core::Result<void> RigidSystem::add_body(const RigidBody& body) {
    if (body.id == STATIC_BODY) {
        auto err = drape_core::BodyError::invalid_id();
        drape_core::physics_logger()->error("{}", err.message);
        return drape_core::Err(err);
    }
    if (m_index.contains(body.id)) {
        auto err = drape_core::BodyError::duplicate_id(body.id);
        drape_core::physics_logger()->error("{}", err.message);
        return drape_core::Err(err);
    }
    if (!std::isfinite(body.half.x) || !std::isfinite(body.half.y) ||
        body.half.x <= 0.0f || body.half.y <= 0.0f) {
        auto err = drape_core::BodyError::invalid_shape(body.id);
        drape_core::physics_logger()->error("{}", err.message);
        return drape_core::Err(err);
    }

    m_index.emplace(body.id, m_bodies.size());
    m_bodies.push_back(body);
    m_sleep.push_back(SleepState{});
    drape_core::physics_logger()->trace("Body {} added at ({}, {})", body.id, body.center.x, body.center.y);
    return drape_core::Ok();
}

bool RigidSystem::remove_body(BodyId id) {
    auto index = index_of(id);
    if (!index) {
        return false;
    }
    m_bodies.erase(m_bodies.begin() + static_cast<std::ptrdiff_t>(*index));
    m_sleep.erase(m_sleep.begin() + static_cast<std::ptrdiff_t>(*index));
    rebuild_index();
    drape_core::physics_logger()->trace("Body {} removed", id);
    return true;
}

const RigidBody* RigidSystem::body(BodyId id) const {
    auto index = index_of(id);
    return index ? &m_bodies[*index] : nullptr;
}

RigidBody* RigidSystem::body(BodyId id) {
    auto index = index_of(id);
    return index ? &m_bodies[*index] : nullptr;
}

std::optional<Vec2> RigidSystem::body_center(BodyId id) const {
    const RigidBody* b = body(id);
    if (!b) {
        return std::nullopt;
    }
    return b->center;
}

bool RigidSystem::is_sleeping(BodyId id) const {
    auto index = index_of(id);
    return index && m_sleep[*index].sleeping;
}

bool RigidSystem::wake(BodyId id) {
    auto index = index_of(id);
    if (!index) {
        return false;
    }
    const bool was_sleeping = m_sleep[*index].sleeping;
    mark_awake(*index);
    if (was_sleeping) {
        publish_event(*m_bus, Channel::FixedEnd, drape_event::WakeEvent{id});
    }
    return true;
}

std::optional<std::size_t> RigidSystem::index_of(BodyId id) const {
    auto it = m_index.find(id);
    if (it == m_index.end()) {
        return std::nullopt;
    }
    return it->second;
}

void RigidSystem::rebuild_index() {
    m_index.clear();
    for (std::size_t i = 0; i < m_bodies.size(); ++i) {
        m_index.emplace(m_bodies[i].id, i);
    }
}

// =============================================================================
// CCD Configuration
// =============================================================================

void RigidSystem::configure_ccd(const CcdConfigUpdate& update) {
    drape_ccd::CcdSettings& ccd = m_config.ccd;
    if (update.speed_threshold && !std::isnan(*update.speed_threshold)) {
        ccd.speed_threshold = std::max(0.0f, *update.speed_threshold);
    }
    if (update.epsilon && std::isfinite(*update.epsilon)) {
        ccd.epsilon = std::max(drape_ccd::MIN_EPSILON, *update.epsilon);
    }
    ccd.enabled = update.enabled.value_or(true);

    drape_core::physics_logger()->debug("CCD {} (speed threshold {}, epsilon {})",
        ccd.enabled ? "enabled" : "disabled", ccd.speed_threshold, ccd.epsilon);
}

// =============================================================================
// Fixed Step
// =============================================================================

void RigidSystem::fixed_update(float dt) {
    if (!std::isfinite(dt) || dt <= 0.0f) {
        return;
    }

    const std::vector<Aabb> obstacles = m_obstacles ? m_obstacles() : std::vector<Aabb>{};

    for (std::size_t i = 0; i < m_bodies.size(); ++i) {
        RigidBody& body = m_bodies[i];
        SleepState& state = m_sleep[i];

        if (state.sleeping || update_sleep(body, state)) {
            continue;
        }

        body.velocity.y -= m_config.gravity * dt;

        std::optional<CcdContact> ccd_hit;
        if (should_use_ccd(body) && !obstacles.empty()) {
            ccd_hit = advance_with_ccd(body, dt, obstacles);
        } else {
            body.center += body.velocity * dt;
        }

        const bool touched = resolve_static(body, obstacles);
        if (ccd_hit && !touched) {
            apply_ccd_response(body, *ccd_hit);
        }
    }

    if (m_config.enable_dynamic_pairs && m_bodies.size() > 1) {
        resolve_dynamic_pairs();
    }
}

bool RigidSystem::update_sleep(RigidBody& body, SleepState& state) {
    if (drape_math::length_squared(body.velocity) >= m_sleep_velocity_sq) {
        state.frames_below = 0;
        return false;
    }

    state.frames_below += 1;
    if (state.frames_below < m_config.sleep_frames_threshold) {
        return false;
    }

    state.sleeping = true;
    body.velocity = Vec2(0.0f);
    publish_event(*m_bus, Channel::FixedEnd, drape_event::SleepEvent{body.id});
    drape_core::physics_logger()->trace("Body {} asleep after {} frames", body.id, state.frames_below);
    return true;
}

bool RigidSystem::should_use_ccd(const RigidBody& body) const {
    if (!m_config.ccd.enabled) {
        return false;
    }
    if (body.ccd.has_value()) {
        return *body.ccd;
    }
    return drape_math::length(body.velocity) >= m_config.ccd.speed_threshold;
}

std::optional<RigidSystem::CcdContact> RigidSystem::advance_with_ccd(
    RigidBody& body, float dt, const std::vector<Aabb>& obstacles) {
    const drape_ccd::AdvanceResult sweep = drape_ccd::advance_with_ccd(
        body.obb(), body.velocity, dt, std::span<const Aabb>(obstacles),
        m_config.ccd.epsilon, m_config.ccd.max_iterations);
    body.center = sweep.center;

    if (!sweep.collided) {
        return std::nullopt;
    }

    publish_event(*m_bus, Channel::FixedEnd, drape_event::CcdHitEvent{body.id, sweep.t, sweep.normal});
    drape_core::physics_logger()->trace("Body {} swept into obstacle at t={} normal ({}, {})",
        body.id, sweep.t, sweep.normal.x, sweep.normal.y);
    return CcdContact{sweep.normal, sweep.point};
}

// =============================================================================
// Static Contacts
// =============================================================================

bool RigidSystem::resolve_static(RigidBody& body, const std::vector<Aabb>& obstacles) {
    bool touched = false;
    for (const Aabb& box : obstacles) {
        const SatResult res = obb_vs_aabb(body.obb(), box);
        if (!res.collided) {
            continue;
        }
        touched = true;

        body.center += res.mtv;

        // Contact normal points out of the obstacle
        const Vec2 n = -res.normal;
        const float inv_mass = body.inverse_mass();
        const float vn = drape_math::dot(body.velocity, n);
        if (vn < 0.0f) {
            const float e = clamp01(body.restitution);
            const float jn = -(1.0f + e) * vn / inv_mass;
            body.velocity += n * (jn * inv_mass);

            const Vec2 t = drape_math::perpendicular(n);
            const float vt = drape_math::dot(body.velocity, t);
            const float mu = clamp01(body.friction);
            const float jt = std::clamp(-vt / inv_mass, -mu * jn, mu * jn);
            body.velocity += t * (jt * inv_mass);
        }

        drape_event::CollisionEvent ev;
        ev.a = body.id;
        ev.b = STATIC_BODY;
        ev.normal = n;
        ev.contact = body.center - n * body.half;
        ev.depth = drape_math::length(res.mtv);
        publish_event(*m_bus, Channel::FixedEnd, ev);
    }
    return touched;
}

void RigidSystem::apply_ccd_response(RigidBody& body, const CcdContact& contact) {
    const float inv_mass = body.inverse_mass();
    const Vec2 n = contact.normal;
    const float vn = drape_math::dot(body.velocity, n);
    if (vn < 0.0f) {
        const float e = clamp01(body.restitution);
        const float jn = -(1.0f + e) * vn / inv_mass;
        body.velocity += n * (jn * inv_mass);
    }

    drape_event::CollisionEvent ev;
    ev.a = body.id;
    ev.b = STATIC_BODY;
    ev.normal = contact.normal;
    ev.contact = contact.point.value_or(body.center - contact.normal * body.half);
    ev.depth = m_config.ccd.epsilon;
    publish_event(*m_bus, Channel::FixedEnd, ev);
}

// =============================================================================
// Dynamic Pairs
// =============================================================================

void RigidSystem::resolve_dynamic_pairs() {
    const std::size_t n = m_bodies.size();
    for (std::size_t i = 0; i < n; ++i) {
        for (std::size_t j = i + 1; j < n; ++j) {
            resolve_pair(i, j);
        }
    }
}

void RigidSystem::resolve_pair(std::size_t ia, std::size_t ib) {
    RigidBody& a = m_bodies[ia];
    RigidBody& b = m_bodies[ib];

    const SatResult ab = obb_vs_aabb(a.obb(), b.aabb());
    const SatResult ba = obb_vs_aabb(b.obb(), a.aabb());
    if (!ab.collided && !ba.collided) {
        return;
    }

    // Keep the shallower of the two penetrations
    const bool use_ab = ab.collided && (!ba.collided || ab.depth <= ba.depth);
    const float depth = use_ab ? ab.depth : ba.depth;
    // Unit normal from b toward a
    const Vec2 n = use_ab ? -ab.normal : ba.normal;

    const float inv_a = a.inverse_mass();
    const float inv_b = b.inverse_mass();
    const float inv_sum = inv_a + inv_b;

    a.center += n * (depth * inv_a / inv_sum);
    b.center -= n * (depth * inv_b / inv_sum);

    const Vec2 rel = a.velocity - b.velocity;
    const float vn = drape_math::dot(rel, n);
    if (vn >= 0.0f) {
        return;
    }

    const float e = clamp01((a.restitution + b.restitution) * 0.5f);
    const float jn = -(1.0f + e) * vn / inv_sum;
    const Vec2 normal_impulse = n * jn;
    a.velocity += normal_impulse * inv_a;
    b.velocity -= normal_impulse * inv_b;

    const Vec2 t = drape_math::perpendicular(n);
    const float vt = drape_math::dot(rel, t);
    const float mu = clamp01((a.friction + b.friction) * 0.5f);
    const float jt = std::clamp(-vt / inv_sum, -mu * jn, mu * jn);
    const Vec2 friction_impulse = t * jt;
    a.velocity += friction_impulse * inv_a;
    b.velocity -= friction_impulse * inv_b;

    const Vec2 impulse = normal_impulse + friction_impulse;

    drape_event::CollisionEvent ev;
    ev.a = a.id;
    ev.b = b.id;
    ev.normal = n;
    ev.contact = (a.center + b.center) * 0.5f;
    ev.depth = depth;
    publish_event(*m_bus, Channel::FixedEnd, ev);

    publish_event(*m_bus, Channel::FixedEnd, drape_event::ImpulseEvent{a.id, impulse});
    publish_event(*m_bus, Channel::FixedEnd, drape_event::ImpulseEvent{b.id, -impulse});

    mark_awake(ia);
    mark_awake(ib);
    publish_event(*m_bus, Channel::FixedEnd, drape_event::WakeEvent{a.id});
    publish_event(*m_bus, Channel::FixedEnd, drape_event::WakeEvent{b.id});
}

void RigidSystem::mark_awake(std::size_t index) {
    SleepState& state = m_sleep[index];
    if (state.sleeping) {
        drape_core::physics_logger()->trace("Body {} woke", m_bodies[index].id);
    }
    state.sleeping = false;
    state.frames_below = 0;
}

// =============================================================================
// Debug
// =============================================================================

std::vector<BodySnapshot> RigidSystem::debug_get_bodies() const {
    std::vector<BodySnapshot> out;
    out.reserve(m_bodies.size());
    for (const RigidBody& b : m_bodies) {
        out.push_back(BodySnapshot{b.id, b.center, b.half});
    }
    return out;
}

std::optional<PickHit> RigidSystem::pick_at(const Vec2& point) {
    const std::vector<BodySnapshot> bodies = debug_get_bodies();
    auto hit = pick_body_at_point(point, bodies);
    if (hit) {
        publish_event(*m_bus, Channel::FrameEnd, drape_event::PickEvent{hit->id, hit->point});
    }
    return hit;
}

} // namespace drape_physics
