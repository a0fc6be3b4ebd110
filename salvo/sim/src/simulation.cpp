#include <salvo/sim/simulation.hpp>
#include <salvo/core/log.hpp>

#include <cmath>
#include <exception>

namespace salvo::sim {

Simulation::Simulation(const physics::ICollisionQuery& world, core::EventDispatcher& events,
                       const SimSettings& settings)
    : m_settings(settings)
    , m_events(events)
    , m_registry(settings)
    , m_movement(world, settings.gravity)
    , m_resolver(world, settings.swept_step_factor)
    , m_effects(world, m_registry, events, settings.random_seed)
    , m_lifecycle(m_registry, events)
    , m_clock(settings.fixed_timestep, settings.max_substeps) {}

Simulation::~Simulation() {
    if (m_in_tick) {
        log(LogLevel::Error, "[Simulation] Destroyed from inside a tick; {} entities left uncompleted",
            m_registry.size() + m_registry.pending_count());
        return;
    }
    shutdown();
}

// ============================================================================
// Spawn / removal
// ============================================================================

SpawnResult Simulation::spawn(const Vec3& start, const Vec3& direction, float speed,
                              const SpawnOptions& options) {
    return spawn(EntitySpec::projectile(start, direction, speed, options));
}

SpawnResult Simulation::spawn(const EntitySpec& spec) {
    SpawnResult result = m_registry.spawn(spec, m_now);
    if (!result) {
        ++m_stats.rejected;
        log(LogLevel::Warn, "[Simulation] Rejected {} spawn: {}", spec.options.archetype,
            to_string(result.error));
        return result;
    }
    ++m_stats.spawned;
    return result;
}

bool Simulation::remove(EntityId id) {
    return m_lifecycle.cancel(id, m_now, m_in_tick);
}

void Simulation::shutdown() {
    for (EntityId id : m_registry.pending_ids()) {
        m_lifecycle.cancel(id, m_now, false);
    }
    for (EntityId id : m_registry.active_ids()) {
        m_lifecycle.cancel(id, m_now, m_in_tick);
    }
    if (!m_in_tick) {
        m_lifecycle.retire_finished(m_now);
    }
    m_stats.completed = m_lifecycle.completed_count();
}

// ============================================================================
// Stepping
// ============================================================================

void Simulation::tick(float dt) {
    if (m_in_tick) {
        log(LogLevel::Error, "[Simulation] tick() called from inside a tick");
        return;
    }
    if (!std::isfinite(dt) || dt <= 0.0f) {
        log(LogLevel::Warn, "[Simulation] Ignoring tick with dt={}", dt);
        return;
    }

    m_in_tick = true;
    ++m_tick;
    ++m_stats.ticks;

    announce(m_registry.flush_pending());
    m_now += seconds_to_sim(dt);

    // Ids are collected up front; entities spawned below wait for the next tick
    std::vector<EntityId> projectiles;
    std::vector<EntityId> zones;
    m_registry.for_each_active([&](EntityId id) {
        const auto& info = m_registry.raw().get<EntityInfo>(id);
        (info.kind == EntityKind::AreaEffect ? zones : projectiles).push_back(id);
    });

    for (EntityId id : projectiles) {
        try {
            process_projectile(id, dt);
        } catch (const std::exception& e) {
            handle_fault(id, e.what());
        }
    }

    for (EntityId id : zones) {
        try {
            process_zone(id);
        } catch (const std::exception& e) {
            handle_fault(id, e.what());
        }
    }

    m_lifecycle.update(m_now);
    capture_render_stream();
    m_lifecycle.retire_finished(m_now);
    m_stats.completed = m_lifecycle.completed_count();

    m_in_tick = false;
}

uint32_t Simulation::advance(double frame_dt) {
    m_clock.update(frame_dt);

    uint32_t ticks = 0;
    while (m_clock.consume_tick()) {
        tick(static_cast<float>(m_clock.fixed_dt));
        ++ticks;
    }
    return ticks;
}

void Simulation::process_projectile(EntityId id, float dt) {
    auto& reg = m_registry.raw();
    auto* info = reg.try_get<EntityInfo>(id);
    if (!info || !info->is_active()) return;

    auto& motion = reg.get<Motion>(id);
    if (const auto* homing = reg.try_get<Homing>(id)) {
        // m_now is already the end of this step
        m_movement.steer(homing->config, motion, m_now - seconds_to_sim(dt), dt);
    }
    m_movement.integrate(motion, reg.try_get<Lifetime>(id), m_now, dt);

    auto* collider = reg.try_get<Collider>(id);
    if (!collider) return;

    auto hit = m_resolver.resolve(id, motion, *collider, m_tick);
    if (!hit) return;

    ++m_stats.hits;
    m_effects.on_hit(id, *hit, m_now);
}

void Simulation::process_zone(EntityId id) {
    auto& reg = m_registry.raw();
    auto* info = reg.try_get<EntityInfo>(id);
    if (!info || !info->is_active()) return;

    m_movement.follow(reg.get<Motion>(id), reg.get<AreaEffectZone>(id));
    m_effects.update_zone(id, m_now);
}

void Simulation::handle_fault(EntityId id, const char* what) {
    ++m_stats.faults;
    log(LogLevel::Error, "[Simulation] Entity {} faulted: {}", to_integral(id), what);
    m_lifecycle.fault(id);
}

void Simulation::announce(const std::vector<EntityId>& spawned) {
    for (EntityId id : spawned) {
        const auto& info = m_registry.raw().get<EntityInfo>(id);
        const auto& motion = m_registry.raw().get<Motion>(id);

        EntitySpawnedEvent event;
        event.id = id;
        event.kind = info.kind;
        event.archetype = info.archetype;
        event.position = motion.position;
        event.parent = info.parent;

        try {
            m_events.dispatch(event);
        } catch (const std::exception& e) {
            handle_fault(id, e.what());
        }
    }
}

void Simulation::capture_render_stream() {
    m_render_stream.clear();

    auto view = m_registry.raw().view<const EntityInfo, const Motion>();
    for (auto entity : view) {
        const auto& info = view.get<const EntityInfo>(entity);
        const auto& motion = view.get<const Motion>(entity);
        m_render_stream.push_back(RenderSample{entity, info.kind, motion.position, info.state});
    }
}

// ============================================================================
// Queries
// ============================================================================

std::optional<EntitySnapshot> Simulation::get(EntityId id) const {
    return m_registry.get(id);
}

std::vector<EntitySnapshot> Simulation::active_entities() const {
    std::vector<EntitySnapshot> result;
    for_each_active([&result](const EntitySnapshot& snapshot) {
        result.push_back(snapshot);
    });
    return result;
}

} // namespace salvo::sim
