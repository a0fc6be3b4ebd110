#pragma once

#include <salvo/core/event_dispatcher.hpp>
#include <salvo/physics/collision_query.hpp>
#include <salvo/sim/entity_registry.hpp>
#include <salvo/sim/sim_events.hpp>
#include <salvo/sim/sim_types.hpp>

#include <cstdint>
#include <optional>
#include <random>
#include <vector>

namespace salvo::sim {

// ============================================================================
// EffectDispatcher - turns hits into damage and child entities
// ============================================================================
//
// Hit behavior state machine, per projectile:
//   Standard  - apply payload, Active -> Consumed
//   Piercing  - apply payload, stay Active
//   Bouncing  - apply payload, reflect and stay Active while the bounce
//               budget lasts, then Consumed
//
// Payload entries run in order. The entity is re-checked before each entry so
// that a cancellation raised by a damage handler stops the rest of the list.
// DamageOverTime entries spawn AreaEffect children through the registry; they
// start ticking on the next simulation tick like any other spawn.

class EffectDispatcher {
public:
    EffectDispatcher(const physics::ICollisionQuery& query, EntityRegistry& registry,
                     core::EventDispatcher& events, uint32_t seed = 1337);

    // Resolve an authoritative hit for a projectile
    HitOutcome on_hit(EntityId id, const CollisionEvent& hit, SimTime now);

    // Apply one payload list at a hit. Returns the number of damage applications.
    uint32_t apply_payload(EntityId source, const std::vector<EffectPayload>& payload,
                           const CollisionEvent& hit, ActorId owner, LayerMask mask, SimTime now);

    // Run the due ticks of one damage-over-time zone
    uint32_t update_zone(EntityId id, SimTime now);

    // Trigger-chance roll; unset chance always passes
    bool roll(std::optional<float> chance);

    void reseed(uint32_t seed) { m_rng.seed(seed); }

    uint64_t applications() const { return m_applications; }

private:
    bool is_live(EntityId id) const;
    void emit_damage(EntityId source, ActorId target, ActorId owner, float amount,
                     const std::string& damage_type, const Vec3& point, PayloadKind kind);
    void spawn_zone(EntityId source, const EffectPayload& payload, const CollisionEvent& hit,
                    ActorId owner, LayerMask mask, SimTime now);

    const physics::ICollisionQuery& m_query;
    EntityRegistry& m_registry;
    core::EventDispatcher& m_events;
    std::mt19937 m_rng;
    std::uniform_real_distribution<float> m_chance{0.0f, 1.0f};
    uint64_t m_applications = 0;
};

} // namespace salvo::sim
