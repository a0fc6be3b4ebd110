#include <salvo/sim/movement.hpp>

#include <algorithm>

namespace salvo::sim {

MovementIntegrator::MovementIntegrator(const physics::ICollisionQuery& query, const Vec3& gravity)
    : m_query(query)
    , m_gravity(gravity) {}

Vec3 MovementIntegrator::kinematic_position(const Motion& motion, SimTime now) {
    SimTime since = now > motion.anchor_time ? now - motion.anchor_time : 0;
    float elapsed = static_cast<float>(sim_to_seconds(since));
    return motion.anchor_position + motion.direction * motion.speed * elapsed;
}

// ============================================================================
// Homing
// ============================================================================

std::optional<Vec3> MovementIntegrator::resolve_target(const HomingConfig& homing) const {
    if (homing.target_point) {
        return homing.target_point;
    }
    if (homing.target_actor.valid()) {
        return m_query.get_position(homing.target_actor);
    }
    return std::nullopt;
}

bool MovementIntegrator::steer(const HomingConfig& homing, Motion& motion, SimTime step_start, float dt) const {
    auto target = resolve_target(homing);
    if (!target) return false;

    Vec3 to_target = *target - motion.position;
    if (is_near_zero(to_target)) return false;

    Vec3 desired = glm::normalize(to_target);
    float t = std::clamp(homing.strength * dt * 10.0f, 0.0f, 1.0f);
    Vec3 blended = glm::mix(motion.direction, desired, t);

    // Exactly opposite directions blend to zero; keep flying straight
    if (is_near_zero(blended)) return false;
    motion.direction = glm::normalize(blended);

    if (motion.model.type == MotionType::Dynamic) {
        float magnitude = glm::length(motion.velocity);
        motion.velocity = motion.direction * magnitude;
    } else {
        motion.reanchor(step_start);
    }
    return true;
}

// ============================================================================
// Integration
// ============================================================================

void MovementIntegrator::advance_to(Motion& motion, const Vec3& next, const Lifetime* lifetime) {
    Vec3 delta = next - motion.position;
    float step = glm::length(delta);

    motion.previous_position = motion.position;
    motion.distance_capped = false;

    if (lifetime && lifetime->max_distance) {
        float budget = *lifetime->max_distance;
        float remaining = std::max(0.0f, budget - motion.distance_traveled);
        if (step + DISTANCE_EPSILON >= remaining) {
            Vec3 heading = safe_normalize(delta, motion.direction);
            motion.position = motion.position + heading * remaining;
            motion.step_length = remaining;
            motion.distance_traveled = budget;
            motion.distance_capped = true;
            return;
        }
    }

    motion.position = next;
    motion.step_length = step;
    motion.distance_traveled += step;
}

void MovementIntegrator::integrate(Motion& motion, const Lifetime* lifetime, SimTime now, float dt) const {
    Vec3 next;

    switch (motion.model.type) {
        case MotionType::Kinematic:
            next = kinematic_position(motion, now);
            break;

        case MotionType::Dynamic:
            motion.velocity += m_gravity * motion.model.gravity_scale * dt;
            next = motion.position + motion.velocity * dt;
            motion.speed = glm::length(motion.velocity);
            motion.direction = safe_normalize(motion.velocity, motion.direction);
            break;
    }

    advance_to(motion, next, lifetime);
}

void MovementIntegrator::follow(Motion& motion, const AreaEffectZone& zone) const {
    motion.previous_position = motion.position;
    motion.step_length = 0.0f;

    if (!zone.attached_target.valid()) return;

    auto target = m_query.get_position(zone.attached_target);
    if (!target) return;

    float step = glm::length(*target - motion.position);
    motion.position = *target;
    motion.step_length = step;
    motion.distance_traveled += step;
}

} // namespace salvo::sim
