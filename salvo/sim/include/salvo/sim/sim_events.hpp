#pragma once

#include <salvo/sim/sim_types.hpp>

#include <string>

namespace salvo::sim {

// ============================================================================
// Simulation events
// ============================================================================
//
// Dispatched synchronously through the core::EventDispatcher handed to the
// Simulation. Handlers may spawn or cancel entities; spawns become visible on
// the next tick.

// An entity became visible to the simulation
struct EntitySpawnedEvent {
    EntityId id = NullEntity;
    EntityKind kind = EntityKind::Projectile;
    std::string archetype;
    Vec3 position{0.0f};
    EntityId parent = NullEntity;
};

// The single authoritative hit of an entity for this tick
struct CollisionResolvedEvent {
    CollisionEvent collision;
    HitOutcome outcome = HitOutcome::Consumed;
};

struct DamageInfo {
    EntityId source = NullEntity;   // Projectile or zone that applied the damage
    ActorId target;
    ActorId instigator;             // Owner of the source, if any
    float amount = 0.0f;
    std::string damage_type;
    Vec3 point{0.0f};
    PayloadKind kind = PayloadKind::InstantDamage;
};

struct DamageAppliedEvent {
    DamageInfo info;
};

// Exactly one per entity, right before it leaves the registry
struct EntityCompletedEvent {
    EntityId id = NullEntity;
    EntityKind kind = EntityKind::Projectile;
    EntityState state = EntityState::Expired;
    CompletionReason reason = CompletionReason::None;
    Vec3 position{0.0f};
    float distance_traveled = 0.0f;
    SimTime age = 0;
    std::string archetype;
};

// Expired without a hit under ExpirePolicy::TerminalEffect
struct TerminalEffectEvent {
    EntityId id = NullEntity;
    Vec3 position{0.0f};
    std::string archetype;
};

} // namespace salvo::sim
