#pragma once

#include <salvo/sim/sim_types.hpp>

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace salvo::sim {

// Every simulated entity carries EntityInfo. The remaining components are
// capabilities: a system only sees the entities that carry what it needs.

struct EntityInfo {
    EntityKind kind = EntityKind::Projectile;
    EntityState state = EntityState::Active;
    CompletionReason reason = CompletionReason::None;
    SimTime spawn_time = 0;
    std::string archetype;
    EntityId parent = NullEntity;
    uint32_t hit_count = 0;
    bool completion_sent = false;

    bool is_active() const { return state == EntityState::Active; }
};

// Movable
struct Motion {
    MotionModel model;
    Vec3 position{0.0f};
    Vec3 direction{0.0f, 0.0f, 1.0f};   // Unit length
    float speed = 0.0f;
    Vec3 velocity{0.0f};                // Dynamic only

    // Kinematic reference point, moved whenever the direction changes
    Vec3 anchor_position{0.0f};
    SimTime anchor_time = 0;

    Vec3 previous_position{0.0f};       // Position before the last step
    float step_length = 0.0f;           // Length of the last step
    float distance_traveled = 0.0f;
    bool distance_capped = false;       // Last step was clamped to max_distance

    void reanchor(SimTime now) {
        anchor_position = position;
        anchor_time = now;
    }
};

struct Lifetime {
    std::optional<uint32_t> max_lifetime_ms;
    std::optional<float> max_distance;
    ExpirePolicy on_expire = ExpirePolicy::Vanish;
};

// Collidable
struct Collider {
    float radius = 0.25f;
    LayerMask mask = physics::DEFAULT_PROJECTILE_MASK;
    CollisionMode mode = CollisionMode::Auto;
    ActorId owner;
    HitBehavior behavior = HitBehavior::Standard;
    uint32_t bounces_remaining = 0;

    std::vector<ActorId> already_hit;   // Piercing
    ActorId skip_next;                  // Surface just bounced off, ignored for one query
    uint64_t last_hit_tick = UINT64_MAX;

    bool was_hit(ActorId actor) const {
        return std::find(already_hit.begin(), already_hit.end(), actor) != already_hit.end();
    }
};

// EffectSource
struct EffectSource {
    std::vector<EffectPayload> payload;
};

struct Homing {
    HomingConfig config;
};

// Damage-over-time zone state (AreaEffect kind)
struct AreaEffectZone {
    float magnitude = 0.0f;
    std::optional<float> radius;
    uint32_t tick_interval_ms = 0;
    SimTime next_tick = 0;
    SimTime ends_at = 0;
    ActorId attached_target;
    ActorId owner;
    LayerMask mask = physics::DEFAULT_PROJECTILE_MASK;
    std::string damage_type;
    uint32_t ticks_applied = 0;
};

} // namespace salvo::sim
