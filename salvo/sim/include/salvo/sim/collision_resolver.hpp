#pragma once

#include <salvo/physics/collision_query.hpp>
#include <salvo/sim/components.hpp>
#include <salvo/sim/sim_types.hpp>

#include <cstdint>
#include <optional>

namespace salvo::sim {

// ============================================================================
// CollisionResolver - one authoritative hit per entity per tick
// ============================================================================
//
// Discrete: overlap test of the collider sphere at the current position, the
// first reported contact wins.
// Swept: the collider sphere is cast from the previous position along the
// step and the nearest hit strictly inside the step wins. Non-piercing
// entities are snapped back to where the sphere first touched; the event
// point is the contact on the actor's surface.
// A swept miss still checks the end position so grazing contacts are kept.

class CollisionResolver {
public:
    CollisionResolver(const physics::ICollisionQuery& query, float swept_step_factor = 1.0f);

    // Strategy actually used for this entity this tick
    CollisionMode select_mode(const Motion& motion, const Collider& collider) const;

    std::optional<CollisionEvent> resolve(EntityId id, Motion& motion, Collider& collider, uint64_t tick) const;

    // Filter applied to this entity's queries: mask, owner, already-hit targets
    static physics::QueryFilter make_filter(const Collider& collider);

private:
    std::optional<CollisionEvent> resolve_discrete(EntityId id, const Motion& motion, const Collider& collider,
                                                   const physics::QueryFilter& filter) const;
    std::optional<CollisionEvent> resolve_swept(EntityId id, Motion& motion, const Collider& collider,
                                                const physics::QueryFilter& filter) const;

    const physics::ICollisionQuery& m_query;
    float m_swept_step_factor;
};

} // namespace salvo::sim
