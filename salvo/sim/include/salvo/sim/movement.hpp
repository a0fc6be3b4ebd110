#pragma once

#include <salvo/physics/collision_query.hpp>
#include <salvo/sim/components.hpp>
#include <salvo/sim/sim_types.hpp>

#include <optional>

namespace salvo::sim {

// Float accumulation slack when comparing traveled distance to the budget
constexpr float DISTANCE_EPSILON = 1e-3f;

// ============================================================================
// MovementIntegrator - advances Motion components one tick at a time
// ============================================================================

class MovementIntegrator {
public:
    MovementIntegrator(const physics::ICollisionQuery& query, const Vec3& gravity);

    // Bend the direction toward the homing target, keeping speed.
    // step_start is the time of motion.position; kinematic motion restarts
    // its closed form there so the following integrate() covers the full dt.
    // Returns false when there is no usable target this tick.
    bool steer(const HomingConfig& homing, Motion& motion, SimTime step_start, float dt) const;

    // Advance one projectile to time `now`. The step is clamped so that
    // distance_traveled never exceeds max_distance.
    void integrate(Motion& motion, const Lifetime* lifetime, SimTime now, float dt) const;

    // Attached zones follow their target; free zones stay put
    void follow(Motion& motion, const AreaEffectZone& zone) const;

    // Kinematic closed form, exposed for tests and tools
    static Vec3 kinematic_position(const Motion& motion, SimTime now);

    const Vec3& gravity() const { return m_gravity; }

private:
    std::optional<Vec3> resolve_target(const HomingConfig& homing) const;
    static void advance_to(Motion& motion, const Vec3& next, const Lifetime* lifetime);

    const physics::ICollisionQuery& m_query;
    Vec3 m_gravity;
};

} // namespace salvo::sim
