#include <salvo/sim/entity_registry.hpp>
#include <salvo/core/log.hpp>

#include <algorithm>
#include <cmath>

namespace salvo::sim {

EntityRegistry::EntityRegistry(const SimSettings& settings)
    : m_default_collider_radius(settings.default_collider_radius)
    , m_default_lifetime_ms(settings.default_lifetime_ms) {}

// ============================================================================
// Validation
// ============================================================================

namespace {

SpawnError validate_projectile(const EntitySpec& spec) {
    const SpawnOptions& o = spec.options;

    if (!is_finite(spec.position) || !is_finite(spec.direction)) return SpawnError::InvalidVector;
    if (is_near_zero(spec.direction)) return SpawnError::ZeroDirection;
    if (!std::isfinite(spec.speed) || spec.speed <= 0.0f) return SpawnError::NonPositiveSpeed;

    if (o.max_lifetime_ms && *o.max_lifetime_ms == 0) return SpawnError::InvalidLifetime;
    if (o.max_distance && !(std::isfinite(*o.max_distance) && *o.max_distance > 0.0f)) {
        return SpawnError::InvalidDistance;
    }
    if (o.collider_radius && !(std::isfinite(*o.collider_radius) && *o.collider_radius > 0.0f)) {
        return SpawnError::InvalidCollider;
    }
    if (o.motion.type == MotionType::Dynamic && !std::isfinite(o.motion.gravity_scale)) {
        return SpawnError::InvalidVector;
    }
    if (o.homing) {
        const HomingConfig& h = *o.homing;
        if (!h.has_target() || !std::isfinite(h.strength) || h.strength < 0.0f) {
            return SpawnError::InvalidHoming;
        }
        if (h.target_point && !is_finite(*h.target_point)) return SpawnError::InvalidHoming;
    }
    for (const auto& payload : o.payload) {
        if (!payload.is_valid()) return SpawnError::InvalidPayload;
    }
    return SpawnError::None;
}

SpawnError validate_area_effect(const EntitySpec& spec) {
    const AreaEffectSpec& z = spec.zone;

    if (!is_finite(spec.position)) return SpawnError::InvalidVector;
    if (z.duration_ms == 0 || z.tick_interval_ms == 0) return SpawnError::InvalidZone;
    if (!std::isfinite(z.magnitude)) return SpawnError::InvalidZone;
    if (z.radius) {
        if (!(std::isfinite(*z.radius) && *z.radius > 0.0f)) return SpawnError::InvalidZone;
    } else if (!z.attached_target.valid()) {
        return SpawnError::InvalidZone;
    }
    return SpawnError::None;
}

} // namespace

SpawnError EntityRegistry::validate(const EntitySpec& spec) {
    switch (spec.kind) {
        case EntityKind::Projectile: return validate_projectile(spec);
        case EntityKind::AreaEffect: return validate_area_effect(spec);
    }
    return SpawnError::InvalidZone;
}

// ============================================================================
// Spawn
// ============================================================================

SpawnResult EntityRegistry::spawn(const EntitySpec& spec, SimTime now) {
    SpawnResult result;
    result.error = validate(spec);
    if (!result.ok()) {
        return result;
    }

    PendingSpawn pending;
    pending.id = m_registry.create();
    pending.spec = spec;
    pending.spawn_time = now;

    if (spec.kind == EntityKind::Projectile) {
        SpawnOptions& o = pending.spec.options;
        pending.spec.direction = glm::normalize(spec.direction);
        if (!o.max_lifetime_ms && !o.max_distance) {
            o.max_lifetime_ms = m_default_lifetime_ms;
        }
    }

    result.id = pending.id;
    m_pending.push_back(std::move(pending));
    return result;
}

std::vector<EntityId> EntityRegistry::flush_pending() {
    std::vector<EntityId> flushed;
    if (m_pending.empty()) return flushed;

    std::vector<PendingSpawn> batch;
    batch.swap(m_pending);

    flushed.reserve(batch.size());
    for (const auto& pending : batch) {
        materialize(pending);
        flushed.push_back(pending.id);
    }
    return flushed;
}

void EntityRegistry::materialize(const PendingSpawn& pending) {
    const EntitySpec& spec = pending.spec;
    const SpawnOptions& o = spec.options;
    EntityId id = pending.id;

    auto& info = m_registry.emplace<EntityInfo>(id);
    info.kind = spec.kind;
    info.spawn_time = pending.spawn_time;
    info.archetype = o.archetype;
    info.parent = spec.parent;

    auto& motion = m_registry.emplace<Motion>(id);
    motion.position = spec.position;
    motion.previous_position = spec.position;
    motion.anchor_position = spec.position;
    motion.anchor_time = pending.spawn_time;

    auto& lifetime = m_registry.emplace<Lifetime>(id);

    if (spec.kind == EntityKind::AreaEffect) {
        const AreaEffectSpec& z = spec.zone;
        lifetime.max_lifetime_ms = z.duration_ms;

        auto& zone = m_registry.emplace<AreaEffectZone>(id);
        zone.magnitude = z.magnitude;
        zone.radius = z.radius;
        zone.tick_interval_ms = z.tick_interval_ms;
        zone.next_tick = pending.spawn_time + ms_to_sim(z.tick_interval_ms);
        zone.ends_at = pending.spawn_time + ms_to_sim(z.duration_ms);
        zone.attached_target = z.attached_target;
        zone.owner = z.owner;
        zone.mask = z.mask;
        zone.damage_type = z.damage_type;
        return;
    }

    motion.model = o.motion;
    motion.direction = spec.direction;
    motion.speed = spec.speed;
    motion.velocity = spec.direction * spec.speed;

    lifetime.max_lifetime_ms = o.max_lifetime_ms;
    lifetime.max_distance = o.max_distance;
    lifetime.on_expire = o.on_expire;

    auto& collider = m_registry.emplace<Collider>(id);
    collider.radius = o.collider_radius.value_or(m_default_collider_radius);
    collider.mask = o.collision_mask;
    collider.mode = o.collision;
    collider.owner = o.owner;
    collider.behavior = o.behavior;
    collider.bounces_remaining = o.behavior == HitBehavior::Bouncing ? o.bounce_count : 0;

    if (!o.payload.empty()) {
        m_registry.emplace<EffectSource>(id, EffectSource{o.payload});
    }
    if (o.homing) {
        m_registry.emplace<Homing>(id, Homing{*o.homing});
    }
}

// ============================================================================
// Lookup
// ============================================================================

bool EntityRegistry::contains(EntityId id) const {
    return id != NullEntity && m_registry.valid(id);
}

bool EntityRegistry::is_pending(EntityId id) const {
    return find_pending(id) != nullptr;
}

const EntityRegistry::PendingSpawn* EntityRegistry::find_pending(EntityId id) const {
    for (const auto& pending : m_pending) {
        if (pending.id == id) return &pending;
    }
    return nullptr;
}

EntitySnapshot EntityRegistry::snapshot_pending(const PendingSpawn& pending) const {
    EntitySnapshot s;
    s.id = pending.id;
    s.kind = pending.spec.kind;
    s.position = pending.spec.position;
    s.direction = pending.spec.direction;
    s.speed = pending.spec.speed;
    s.spawn_time = pending.spawn_time;
    s.archetype = pending.spec.options.archetype;
    s.pending = true;
    if (pending.spec.kind == EntityKind::AreaEffect) {
        s.max_lifetime_ms = pending.spec.zone.duration_ms;
    } else {
        s.max_lifetime_ms = pending.spec.options.max_lifetime_ms;
        s.max_distance = pending.spec.options.max_distance;
    }
    return s;
}

std::optional<EntitySnapshot> EntityRegistry::get(EntityId id) const {
    if (!contains(id)) return std::nullopt;

    if (const PendingSpawn* pending = find_pending(id)) {
        return snapshot_pending(*pending);
    }

    const auto* info = m_registry.try_get<EntityInfo>(id);
    const auto* motion = m_registry.try_get<Motion>(id);
    if (!info || !motion) return std::nullopt;

    EntitySnapshot s;
    s.id = id;
    s.kind = info->kind;
    s.state = info->state;
    s.reason = info->reason;
    s.position = motion->position;
    s.direction = motion->direction;
    s.speed = motion->speed;
    s.distance_traveled = motion->distance_traveled;
    s.spawn_time = info->spawn_time;
    s.archetype = info->archetype;
    if (const auto* lifetime = m_registry.try_get<Lifetime>(id)) {
        s.max_lifetime_ms = lifetime->max_lifetime_ms;
        s.max_distance = lifetime->max_distance;
    }
    return s;
}

// ============================================================================
// Removal
// ============================================================================

bool EntityRegistry::remove(EntityId id) {
    if (!contains(id)) return false;

    auto it = std::find_if(m_pending.begin(), m_pending.end(),
        [id](const PendingSpawn& p) { return p.id == id; });
    if (it != m_pending.end()) {
        m_pending.erase(it);
    }

    m_registry.destroy(id);
    return true;
}

void EntityRegistry::clear() {
    m_pending.clear();
    m_registry.clear();
}

// ============================================================================
// Queries
// ============================================================================

std::vector<EntityId> EntityRegistry::active_ids() const {
    std::vector<EntityId> ids;
    for_each_active([&ids](EntityId id) { ids.push_back(id); });
    return ids;
}

std::vector<EntityId> EntityRegistry::pending_ids() const {
    std::vector<EntityId> ids;
    ids.reserve(m_pending.size());
    for (const auto& pending : m_pending) {
        ids.push_back(pending.id);
    }
    return ids;
}

size_t EntityRegistry::active_count() const {
    size_t count = 0;
    for_each_active([&count](EntityId) { ++count; });
    return count;
}

size_t EntityRegistry::size() const {
    return m_registry.view<const EntityInfo>().size();
}

} // namespace salvo::sim
