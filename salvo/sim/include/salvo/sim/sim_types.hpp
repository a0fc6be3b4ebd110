#pragma once

#include <salvo/core/math.hpp>
#include <salvo/physics/collision_query.hpp>
#include <salvo/physics/layers.hpp>

#include <entt/entity/entity.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace salvo::sim {

using namespace salvo::core;
using physics::ActorId;
using physics::LayerMask;
using physics::NoActor;

// ============================================================================
// Time
// ============================================================================

// Simulated time in microseconds since the simulation started.
// Integer time keeps lifetimes and kinematic positions reproducible.
using SimTime = uint64_t;

constexpr SimTime ms_to_sim(uint64_t ms) { return ms * 1000; }
constexpr double sim_to_ms(SimTime t) { return static_cast<double>(t) / 1000.0; }
constexpr double sim_to_seconds(SimTime t) { return static_cast<double>(t) / 1000000.0; }
SimTime seconds_to_sim(double seconds);

// ============================================================================
// Entity handle
// ============================================================================

// 32-bit slot index + 32-bit generation. A destroyed slot is reused only with
// a bumped generation, so stale handles never alias a live entity.
enum class EntityId : uint64_t {};

inline constexpr EntityId NullEntity = entt::null;

inline uint64_t to_integral(EntityId id) {
    return static_cast<uint64_t>(id);
}

// ============================================================================
// Tagged variants
// ============================================================================

enum class EntityKind : uint8_t {
    Projectile,
    AreaEffect      // Stationary or attached damage-over-time zone
};

// Active -> Consumed | Expired, never back
enum class EntityState : uint8_t {
    Active,
    Consumed,
    Expired
};

enum class CompletionReason : uint8_t {
    None,
    Hit,
    LifetimeExpired,
    DistanceExceeded,
    Cancelled,
    Faulted
};

enum class MotionType : uint8_t {
    Kinematic,      // position = anchor + direction * speed * elapsed
    Dynamic         // velocity integrated under gravity
};

struct MotionModel {
    MotionType type = MotionType::Kinematic;
    float gravity_scale = 1.0f;     // Dynamic only

    static MotionModel kinematic() { return {}; }
    static MotionModel dynamic(float gravity_scale = 1.0f) {
        return MotionModel{MotionType::Dynamic, gravity_scale};
    }
};

enum class CollisionMode : uint8_t {
    Auto,           // Swept when the step outruns the collider, else discrete
    Discrete,
    Swept
};

enum class HitBehavior : uint8_t {
    Standard,       // Consumed by the first hit
    Piercing,       // Continues, never hits the same target twice
    Bouncing        // Reflects until the bounce budget runs out
};

enum class HitOutcome : uint8_t {
    Consumed,
    Pierced,
    Bounced,
    Suppressed      // Entity was cancelled before the hit finished resolving
};

// What an entity does when it expires without ever hitting anything
enum class ExpirePolicy : uint8_t {
    Vanish,
    TerminalEffect  // Emits TerminalEffectEvent at the final position
};

// ============================================================================
// Payload
// ============================================================================

enum class PayloadKind : uint8_t {
    InstantDamage,
    AreaDamage,
    DamageOverTime
};

struct EffectPayload {
    PayloadKind kind = PayloadKind::InstantDamage;
    float magnitude = 0.0f;
    std::optional<float> radius;                // Required for AreaDamage
    std::optional<uint32_t> duration_ms;        // Required for DamageOverTime
    std::optional<uint32_t> tick_interval_ms;   // Required for DamageOverTime
    std::optional<float> trigger_chance;        // [0,1], always triggers when unset
    std::string damage_type = "physical";

    static EffectPayload instant(float magnitude, std::string type = "physical");
    static EffectPayload area(float magnitude, float radius, std::string type = "physical");
    static EffectPayload over_time(float magnitude, uint32_t duration_ms, uint32_t interval_ms,
                                   std::optional<float> radius = std::nullopt,
                                   std::string type = "physical");

    bool is_valid() const;
};

// Steering toward a fixed point or a tracked actor
struct HomingConfig {
    float strength = 0.1f;
    std::optional<Vec3> target_point;
    ActorId target_actor;

    bool has_target() const { return target_point.has_value() || target_actor.valid(); }
};

// ============================================================================
// Spawn description
// ============================================================================

struct SpawnOptions {
    std::optional<uint32_t> max_lifetime_ms;
    std::optional<float> max_distance;
    MotionModel motion;
    std::vector<EffectPayload> payload;

    HitBehavior behavior = HitBehavior::Standard;
    uint32_t bounce_count = 0;                  // Bouncing only
    std::optional<HomingConfig> homing;
    CollisionMode collision = CollisionMode::Auto;
    std::optional<float> collider_radius;       // SimSettings default when unset
    LayerMask collision_mask = physics::DEFAULT_PROJECTILE_MASK;
    ActorId owner;                              // Never hit by its own projectile
    ExpirePolicy on_expire = ExpirePolicy::Vanish;
    std::string archetype = "projectile";
};

// Damage-over-time zone parameters (AreaEffect kind)
struct AreaEffectSpec {
    float magnitude = 0.0f;
    std::optional<float> radius;                // Unset: single target, follows attached_target
    uint32_t duration_ms = 0;
    uint32_t tick_interval_ms = 0;
    ActorId attached_target;
    ActorId owner;
    LayerMask mask = physics::DEFAULT_PROJECTILE_MASK;
    std::string damage_type = "physical";
};

struct EntitySpec {
    EntityKind kind = EntityKind::Projectile;
    Vec3 position{0.0f};
    Vec3 direction{0.0f, 0.0f, 1.0f};
    float speed = 0.0f;
    SpawnOptions options;
    AreaEffectSpec zone;                        // AreaEffect only
    EntityId parent = NullEntity;

    static EntitySpec projectile(const Vec3& start, const Vec3& direction, float speed,
                                 SpawnOptions options = {});
    static EntitySpec area_effect(const Vec3& position, AreaEffectSpec zone,
                                  EntityId parent = NullEntity);
};

enum class SpawnError : uint8_t {
    None,
    ZeroDirection,
    NonPositiveSpeed,
    InvalidVector,      // NaN or infinite component
    InvalidLifetime,
    InvalidDistance,
    InvalidCollider,
    InvalidPayload,
    InvalidHoming,
    InvalidZone
};

struct SpawnResult {
    SpawnError error = SpawnError::None;
    EntityId id = NullEntity;

    bool ok() const { return error == SpawnError::None; }
    explicit operator bool() const { return ok(); }
};

// ============================================================================
// Collision and read-only views
// ============================================================================

struct CollisionEvent {
    EntityId entity = NullEntity;
    ActorId other;
    Vec3 point{0.0f};
    std::optional<Vec3> normal;
    float distance = 0.0f;          // distance_traveled when the hit happened
};

struct EntitySnapshot {
    EntityId id = NullEntity;
    EntityKind kind = EntityKind::Projectile;
    EntityState state = EntityState::Active;
    CompletionReason reason = CompletionReason::None;
    Vec3 position{0.0f};
    Vec3 direction{0.0f, 0.0f, 1.0f};
    float speed = 0.0f;
    float distance_traveled = 0.0f;
    SimTime spawn_time = 0;
    std::optional<uint32_t> max_lifetime_ms;
    std::optional<float> max_distance;
    std::string archetype;
    bool pending = false;           // Spawned this tick, not yet simulated
};

// One entry of the per-tick stream handed to renderers
struct RenderSample {
    EntityId id = NullEntity;
    EntityKind kind = EntityKind::Projectile;
    Vec3 position{0.0f};
    EntityState state = EntityState::Active;
};

// ============================================================================
// String conversion
// ============================================================================

const char* to_string(EntityKind kind);
const char* to_string(EntityState state);
const char* to_string(CompletionReason reason);
const char* to_string(PayloadKind kind);
const char* to_string(HitBehavior behavior);
const char* to_string(SpawnError error);

} // namespace salvo::sim
