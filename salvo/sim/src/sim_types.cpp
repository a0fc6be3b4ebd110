#include <salvo/sim/sim_types.hpp>

#include <cmath>
#include <utility>

namespace salvo::sim {

SimTime seconds_to_sim(double seconds) {
    if (!(seconds > 0.0)) return 0;
    return static_cast<SimTime>(std::llround(seconds * 1000000.0));
}

// ============================================================================
// EffectPayload
// ============================================================================

EffectPayload EffectPayload::instant(float magnitude, std::string type) {
    EffectPayload p;
    p.kind = PayloadKind::InstantDamage;
    p.magnitude = magnitude;
    p.damage_type = std::move(type);
    return p;
}

EffectPayload EffectPayload::area(float magnitude, float radius, std::string type) {
    EffectPayload p;
    p.kind = PayloadKind::AreaDamage;
    p.magnitude = magnitude;
    p.radius = radius;
    p.damage_type = std::move(type);
    return p;
}

EffectPayload EffectPayload::over_time(float magnitude, uint32_t duration_ms, uint32_t interval_ms,
                                       std::optional<float> radius, std::string type) {
    EffectPayload p;
    p.kind = PayloadKind::DamageOverTime;
    p.magnitude = magnitude;
    p.duration_ms = duration_ms;
    p.tick_interval_ms = interval_ms;
    p.radius = radius;
    p.damage_type = std::move(type);
    return p;
}

bool EffectPayload::is_valid() const {
    if (!std::isfinite(magnitude)) return false;
    if (trigger_chance && !(*trigger_chance >= 0.0f && *trigger_chance <= 1.0f)) return false;
    if (radius && !(std::isfinite(*radius) && *radius > 0.0f)) return false;

    switch (kind) {
        case PayloadKind::InstantDamage:
            return true;
        case PayloadKind::AreaDamage:
            return radius.has_value();
        case PayloadKind::DamageOverTime:
            return duration_ms.value_or(0) > 0 && tick_interval_ms.value_or(0) > 0;
    }
    return false;
}

// ============================================================================
// EntitySpec
// ============================================================================

EntitySpec EntitySpec::projectile(const Vec3& start, const Vec3& direction, float speed,
                                  SpawnOptions options) {
    EntitySpec spec;
    spec.kind = EntityKind::Projectile;
    spec.position = start;
    spec.direction = direction;
    spec.speed = speed;
    spec.options = std::move(options);
    return spec;
}

EntitySpec EntitySpec::area_effect(const Vec3& position, AreaEffectSpec zone, EntityId parent) {
    EntitySpec spec;
    spec.kind = EntityKind::AreaEffect;
    spec.position = position;
    spec.speed = 0.0f;
    spec.zone = std::move(zone);
    spec.parent = parent;
    spec.options.archetype = "area_effect";
    return spec;
}

// ============================================================================
// String conversion
// ============================================================================

const char* to_string(EntityKind kind) {
    switch (kind) {
        case EntityKind::Projectile: return "projectile";
        case EntityKind::AreaEffect: return "area_effect";
    }
    return "unknown";
}

const char* to_string(EntityState state) {
    switch (state) {
        case EntityState::Active:   return "active";
        case EntityState::Consumed: return "consumed";
        case EntityState::Expired:  return "expired";
    }
    return "unknown";
}

const char* to_string(CompletionReason reason) {
    switch (reason) {
        case CompletionReason::None:             return "none";
        case CompletionReason::Hit:              return "hit";
        case CompletionReason::LifetimeExpired:  return "lifetime_expired";
        case CompletionReason::DistanceExceeded: return "distance_exceeded";
        case CompletionReason::Cancelled:        return "cancelled";
        case CompletionReason::Faulted:          return "faulted";
    }
    return "unknown";
}

const char* to_string(PayloadKind kind) {
    switch (kind) {
        case PayloadKind::InstantDamage:  return "damage";
        case PayloadKind::AreaDamage:     return "area";
        case PayloadKind::DamageOverTime: return "dot";
    }
    return "unknown";
}

const char* to_string(HitBehavior behavior) {
    switch (behavior) {
        case HitBehavior::Standard: return "standard";
        case HitBehavior::Piercing: return "piercing";
        case HitBehavior::Bouncing: return "bouncing";
    }
    return "unknown";
}

const char* to_string(SpawnError error) {
    switch (error) {
        case SpawnError::None:             return "none";
        case SpawnError::ZeroDirection:    return "direction is the zero vector";
        case SpawnError::NonPositiveSpeed: return "speed must be positive";
        case SpawnError::InvalidVector:    return "vector has a non-finite component";
        case SpawnError::InvalidLifetime:  return "lifetime must be positive";
        case SpawnError::InvalidDistance:  return "max distance must be positive";
        case SpawnError::InvalidCollider:  return "collider radius must be positive";
        case SpawnError::InvalidPayload:   return "payload entry is missing a required field";
        case SpawnError::InvalidHoming:    return "homing needs a target and a non-negative strength";
        case SpawnError::InvalidZone:      return "area effect needs a duration, an interval and a radius or target";
    }
    return "unknown";
}

} // namespace salvo::sim
