#include <salvo/sim/collision_resolver.hpp>

namespace salvo::sim {

CollisionResolver::CollisionResolver(const physics::ICollisionQuery& query, float swept_step_factor)
    : m_query(query)
    , m_swept_step_factor(swept_step_factor) {}

CollisionMode CollisionResolver::select_mode(const Motion& motion, const Collider& collider) const {
    if (collider.mode != CollisionMode::Auto) {
        return collider.mode;
    }
    float diameter = collider.radius * 2.0f;
    return motion.step_length > diameter * m_swept_step_factor ? CollisionMode::Swept
                                                                : CollisionMode::Discrete;
}

physics::QueryFilter CollisionResolver::make_filter(const Collider& collider) {
    physics::QueryFilter filter;
    filter.layer_mask = collider.mask;
    if (collider.owner.valid()) {
        filter.ignore.push_back(collider.owner);
    }
    if (collider.skip_next.valid()) {
        filter.ignore.push_back(collider.skip_next);
    }
    filter.ignore.insert(filter.ignore.end(), collider.already_hit.begin(), collider.already_hit.end());
    return filter;
}

std::optional<CollisionEvent> CollisionResolver::resolve(EntityId id, Motion& motion, Collider& collider,
                                                         uint64_t tick) const {
    if (collider.last_hit_tick == tick) {
        return std::nullopt;
    }

    physics::QueryFilter filter = make_filter(collider);
    collider.skip_next = NoActor;

    std::optional<CollisionEvent> hit;
    if (select_mode(motion, collider) == CollisionMode::Swept && motion.step_length > EPSILON) {
        hit = resolve_swept(id, motion, collider, filter);
    }
    if (!hit) {
        hit = resolve_discrete(id, motion, collider, filter);
    }
    if (!hit) {
        return std::nullopt;
    }

    collider.last_hit_tick = tick;
    if (collider.behavior == HitBehavior::Piercing) {
        collider.already_hit.push_back(hit->other);
    }
    return hit;
}

std::optional<CollisionEvent> CollisionResolver::resolve_discrete(EntityId id, const Motion& motion,
                                                                  const Collider& collider,
                                                                  const physics::QueryFilter& filter) const {
    auto contacts = m_query.query_intersect(physics::QueryShape::sphere(motion.position, collider.radius), filter);

    for (const auto& contact : contacts) {
        // The world may not honour the ignore list; enforce it here
        if (filter.is_ignored(contact.actor)) continue;

        CollisionEvent event;
        event.entity = id;
        event.other = contact.actor;
        event.point = contact.point;
        event.normal = contact.normal;
        event.distance = motion.distance_traveled;
        return event;
    }
    return std::nullopt;
}

std::optional<CollisionEvent> CollisionResolver::resolve_swept(EntityId id, Motion& motion,
                                                               const Collider& collider,
                                                               const physics::QueryFilter& filter) const {
    Vec3 step = motion.position - motion.previous_position;
    float step_length = glm::length(step);
    if (step_length <= EPSILON) return std::nullopt;

    Vec3 heading = step / step_length;
    auto hit = m_query.query_sweep(motion.previous_position, collider.radius, heading, step_length, filter);
    if (!hit.hit || hit.distance >= step_length || filter.is_ignored(hit.actor)) {
        return std::nullopt;
    }

    float distance_before = motion.distance_traveled - motion.step_length;

    CollisionEvent event;
    event.entity = id;
    event.other = hit.actor;
    event.point = hit.point;
    event.normal = hit.normal;
    event.distance = distance_before + hit.distance;

    if (collider.behavior != HitBehavior::Piercing) {
        motion.position = motion.previous_position + heading * hit.distance;
        motion.step_length = hit.distance;
        motion.distance_traveled = event.distance;
        motion.distance_capped = false;
    }
    return event;
}

} // namespace salvo::sim
