#include <salvo/sim/effect_dispatcher.hpp>
#include <salvo/core/log.hpp>

#include <algorithm>

namespace salvo::sim {

namespace {

// When a kinematic entity reached its current position. A swept hit snaps the
// position back along the line from the anchor, so this is earlier than now.
SimTime contact_time(const Motion& motion, SimTime now) {
    if (motion.model.type != MotionType::Kinematic || motion.speed <= 0.0f) return now;

    float along = glm::length(motion.position - motion.anchor_position);
    return std::min(now, motion.anchor_time + seconds_to_sim(along / motion.speed));
}

} // namespace

EffectDispatcher::EffectDispatcher(const physics::ICollisionQuery& query, EntityRegistry& registry,
                                   core::EventDispatcher& events, uint32_t seed)
    : m_query(query)
    , m_registry(registry)
    , m_events(events)
    , m_rng(seed) {}

bool EffectDispatcher::roll(std::optional<float> chance) {
    if (!chance) return true;
    if (*chance >= 1.0f) return true;
    if (*chance <= 0.0f) return false;
    return m_chance(m_rng) < *chance;
}

bool EffectDispatcher::is_live(EntityId id) const {
    // Payloads applied on behalf of no entity (tools, tests) are never cancelled
    if (id == NullEntity) return true;
    if (!m_registry.contains(id)) return false;
    const auto* info = m_registry.raw().try_get<EntityInfo>(id);
    return info && info->is_active();
}

void EffectDispatcher::emit_damage(EntityId source, ActorId target, ActorId owner, float amount,
                                   const std::string& damage_type, const Vec3& point, PayloadKind kind) {
    DamageAppliedEvent event;
    event.info.source = source;
    event.info.target = target;
    event.info.instigator = owner;
    event.info.amount = amount;
    event.info.damage_type = damage_type;
    event.info.point = point;
    event.info.kind = kind;

    ++m_applications;
    m_events.dispatch(event);
}

// ============================================================================
// Hit resolution
// ============================================================================

HitOutcome EffectDispatcher::on_hit(EntityId id, const CollisionEvent& hit, SimTime now) {
    auto& reg = m_registry.raw();
    if (!is_live(id)) {
        return HitOutcome::Suppressed;
    }

    // Copy what the payload run needs; damage handlers may cancel this entity
    HitBehavior behavior = HitBehavior::Standard;
    ActorId owner;
    LayerMask mask = physics::DEFAULT_PROJECTILE_MASK;
    if (const auto* collider = reg.try_get<Collider>(id)) {
        behavior = collider->behavior;
        owner = collider->owner;
        mask = collider->mask;
    }
    std::vector<EffectPayload> payload;
    if (const auto* source = reg.try_get<EffectSource>(id)) {
        payload = source->payload;
    }

    apply_payload(id, payload, hit, owner, mask, now);

    auto& info = reg.get<EntityInfo>(id);
    if (!info.is_active()) {
        log(LogLevel::Debug, "[EffectDispatcher] Hit of entity {} suppressed by cancellation", to_integral(id));
        return HitOutcome::Suppressed;
    }
    ++info.hit_count;

    HitOutcome outcome = HitOutcome::Consumed;
    switch (behavior) {
        case HitBehavior::Standard:
            break;

        case HitBehavior::Piercing:
            outcome = HitOutcome::Pierced;
            break;

        case HitBehavior::Bouncing: {
            auto& collider = reg.get<Collider>(id);
            if (collider.bounces_remaining == 0) break;

            auto& motion = reg.get<Motion>(id);
            --collider.bounces_remaining;
            collider.skip_next = hit.other;

            if (hit.normal && !is_near_zero(*hit.normal)) {
                Vec3 n = glm::normalize(*hit.normal);
                motion.direction = safe_normalize(glm::reflect(motion.direction, n), -motion.direction);
                motion.velocity = glm::reflect(motion.velocity, n);
            } else {
                motion.direction = -motion.direction;
                motion.velocity = -motion.velocity;
            }
            motion.reanchor(contact_time(motion, now));
            outcome = HitOutcome::Bounced;
            break;
        }
    }

    if (outcome == HitOutcome::Consumed) {
        info.state = EntityState::Consumed;
        info.reason = CompletionReason::Hit;
    }

    m_events.dispatch(CollisionResolvedEvent{hit, outcome});
    return outcome;
}

uint32_t EffectDispatcher::apply_payload(EntityId source, const std::vector<EffectPayload>& payload,
                                         const CollisionEvent& hit, ActorId owner, LayerMask mask, SimTime now) {
    uint32_t applied = 0;

    for (const auto& entry : payload) {
        if (!is_live(source)) break;
        if (!roll(entry.trigger_chance)) continue;

        switch (entry.kind) {
            case PayloadKind::InstantDamage:
                if (hit.other.valid()) {
                    emit_damage(source, hit.other, owner, entry.magnitude, entry.damage_type,
                                hit.point, entry.kind);
                    ++applied;
                }
                break;

            case PayloadKind::AreaDamage: {
                physics::QueryFilter filter;
                filter.layer_mask = mask;
                if (owner.valid()) filter.ignore.push_back(owner);

                // Uniform damage, no falloff
                for (ActorId target : m_query.query_radius(hit.point, entry.radius.value_or(0.0f), filter)) {
                    if (!is_live(source)) break;
                    emit_damage(source, target, owner, entry.magnitude, entry.damage_type,
                                hit.point, entry.kind);
                    ++applied;
                }
                break;
            }

            case PayloadKind::DamageOverTime:
                spawn_zone(source, entry, hit, owner, mask, now);
                break;
        }
    }

    return applied;
}

void EffectDispatcher::spawn_zone(EntityId source, const EffectPayload& payload, const CollisionEvent& hit,
                                  ActorId owner, LayerMask mask, SimTime now) {
    AreaEffectSpec zone;
    zone.magnitude = payload.magnitude;
    zone.radius = payload.radius;
    zone.duration_ms = payload.duration_ms.value_or(0);
    zone.tick_interval_ms = payload.tick_interval_ms.value_or(0);
    zone.owner = owner;
    zone.mask = mask;
    zone.damage_type = payload.damage_type;

    Vec3 position = hit.point;
    if (!payload.radius) {
        zone.attached_target = hit.other;
        if (auto target_position = m_query.get_position(hit.other)) {
            position = *target_position;
        }
    }

    auto result = m_registry.spawn(EntitySpec::area_effect(position, zone, source), now);
    if (!result) {
        log(LogLevel::Warn, "[EffectDispatcher] Damage-over-time from entity {} not spawned: {}",
            to_integral(source), to_string(result.error));
        return;
    }
    log(LogLevel::Debug, "[EffectDispatcher] Entity {} spawned zone {}", to_integral(source),
        to_integral(result.id));
}

// ============================================================================
// Damage-over-time zones
// ============================================================================

uint32_t EffectDispatcher::update_zone(EntityId id, SimTime now) {
    auto& reg = m_registry.raw();
    uint32_t ticks = 0;

    while (is_live(id)) {
        auto* zone = reg.try_get<AreaEffectZone>(id);
        const auto* motion = reg.try_get<Motion>(id);
        if (!zone || !motion) break;
        if (zone->next_tick > now || zone->next_tick > zone->ends_at) break;

        // Copy before dispatching; handlers run arbitrary code
        AreaEffectZone state = *zone;
        Vec3 center = motion->position;
        zone->next_tick += ms_to_sim(zone->tick_interval_ms);
        ++zone->ticks_applied;
        ++ticks;

        if (state.radius) {
            physics::QueryFilter filter;
            filter.layer_mask = state.mask;
            if (state.owner.valid()) filter.ignore.push_back(state.owner);

            for (ActorId target : m_query.query_radius(center, *state.radius, filter)) {
                if (!is_live(id)) break;
                emit_damage(id, target, state.owner, state.magnitude, state.damage_type,
                            center, PayloadKind::DamageOverTime);
            }
        } else if (m_query.get_position(state.attached_target)) {
            emit_damage(id, state.attached_target, state.owner, state.magnitude, state.damage_type,
                        center, PayloadKind::DamageOverTime);
        }
    }

    return ticks;
}

} // namespace salvo::sim
