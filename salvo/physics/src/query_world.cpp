#include <salvo/physics/query_world.hpp>

#include <cmath>
#include <limits>
#include <utility>

namespace salvo::physics {

namespace {

// Sphere vs sphere. Normal points from a toward b, point lies on a's surface.
bool sphere_sphere_overlap(const Vec3& a_center, float a_radius,
                           const Vec3& b_center, float b_radius,
                           Vec3& out_hit_point, Vec3& out_hit_normal) {
    Vec3 diff = b_center - a_center;
    float dist_sq = glm::dot(diff, diff);
    float radius_sum = a_radius + b_radius;

    if (dist_sq > radius_sum * radius_sum) return false;

    float dist = std::sqrt(dist_sq);
    if (dist > 0.0001f) {
        out_hit_normal = diff / dist;
        out_hit_point = a_center + out_hit_normal * a_radius;
    } else {
        out_hit_normal = Vec3(0.0f, 1.0f, 0.0f);
        out_hit_point = a_center;
    }
    return true;
}

// Box a vs sphere b. Normal points out of the box toward the sphere.
bool box_sphere_overlap(const AABB& box, const Vec3& sphere_center, float sphere_radius,
                        Vec3& out_hit_point, Vec3& out_hit_normal) {
    Vec3 closest = box.closest_point(sphere_center);
    Vec3 diff = sphere_center - closest;
    float dist_sq = glm::dot(diff, diff);

    if (dist_sq > sphere_radius * sphere_radius) return false;

    float dist = std::sqrt(dist_sq);
    if (dist > 0.0001f) {
        out_hit_normal = diff / dist;
        out_hit_point = closest;
        return true;
    }

    // Sphere center inside the box: push out along the shallowest axis
    Vec3 local = sphere_center - box.center();
    Vec3 penetration = box.extents() - glm::abs(local);
    int axis = 0;
    if (penetration.y < penetration[axis]) axis = 1;
    if (penetration.z < penetration[axis]) axis = 2;

    out_hit_normal = Vec3(0.0f);
    out_hit_normal[axis] = local[axis] >= 0.0f ? 1.0f : -1.0f;
    out_hit_point = sphere_center;
    out_hit_point[axis] = local[axis] >= 0.0f ? box.max[axis] : box.min[axis];
    return true;
}

// Box vs box (axis aligned). Normal points from a toward b.
bool box_box_overlap(const Vec3& a_center, const Vec3& a_half,
                     const Vec3& b_center, const Vec3& b_half,
                     Vec3& out_hit_point, Vec3& out_hit_normal) {
    Vec3 diff = b_center - a_center;
    Vec3 overlap(
        (a_half.x + b_half.x) - std::abs(diff.x),
        (a_half.y + b_half.y) - std::abs(diff.y),
        (a_half.z + b_half.z) - std::abs(diff.z)
    );

    if (overlap.x < 0.0f || overlap.y < 0.0f || overlap.z < 0.0f) return false;

    if (overlap.x < overlap.y && overlap.x < overlap.z) {
        out_hit_normal = Vec3(diff.x >= 0.0f ? 1.0f : -1.0f, 0.0f, 0.0f);
    } else if (overlap.y < overlap.z) {
        out_hit_normal = Vec3(0.0f, diff.y >= 0.0f ? 1.0f : -1.0f, 0.0f);
    } else {
        out_hit_normal = Vec3(0.0f, 0.0f, diff.z >= 0.0f ? 1.0f : -1.0f);
    }
    out_hit_point = (a_center + b_center) * 0.5f;
    return true;
}

} // namespace

// ============================================================================
// Ray tests
// ============================================================================

bool ray_sphere(const Ray& ray, const Vec3& center, float radius, float& t, Vec3& normal) {
    Vec3 m = ray.origin - center;
    float b = glm::dot(m, ray.direction);
    float c = glm::dot(m, m) - radius * radius;

    // Origin inside: report an immediate hit facing back along the ray
    if (c <= 0.0f) {
        t = 0.0f;
        normal = -ray.direction;
        return true;
    }
    if (b > 0.0f) return false;

    float disc = b * b - c;
    if (disc < 0.0f) return false;

    t = -b - std::sqrt(disc);
    if (t < 0.0f) t = 0.0f;
    normal = safe_normalize(ray.at(t) - center, -ray.direction);
    return true;
}

bool ray_aabb(const Ray& ray, const AABB& box, float& t, Vec3& normal) {
    float t_min = 0.0f;
    float t_max = std::numeric_limits<float>::max();
    int hit_axis = -1;
    float hit_sign = 0.0f;

    for (int i = 0; i < 3; ++i) {
        if (std::abs(ray.direction[i]) < EPSILON) {
            if (ray.origin[i] < box.min[i] || ray.origin[i] > box.max[i]) return false;
            continue;
        }

        float inv = 1.0f / ray.direction[i];
        float t1 = (box.min[i] - ray.origin[i]) * inv;
        float t2 = (box.max[i] - ray.origin[i]) * inv;
        float sign = -1.0f;
        if (t1 > t2) {
            std::swap(t1, t2);
            sign = 1.0f;
        }
        if (t1 > t_min) {
            t_min = t1;
            hit_axis = i;
            hit_sign = sign;
        }
        t_max = std::min(t_max, t2);
        if (t_min > t_max) return false;
    }

    t = t_min;
    if (hit_axis < 0) {
        normal = -ray.direction;
    } else {
        normal = Vec3(0.0f);
        normal[hit_axis] = hit_sign;
    }
    return true;
}

// ============================================================================
// Actor management
// ============================================================================

ActorId QueryWorld::add_sphere(const Vec3& center, float radius, uint16_t layer) {
    Actor actor;
    actor.id = ActorId{m_next_id++};
    actor.position = center;
    actor.shape.type = ShapeType::Sphere;
    actor.shape.radius = radius;
    actor.layer = layer;
    m_actors.push_back(actor);
    return actor.id;
}

ActorId QueryWorld::add_box(const Vec3& center, const Vec3& half_extents, uint16_t layer) {
    Actor actor;
    actor.id = ActorId{m_next_id++};
    actor.position = center;
    actor.shape.type = ShapeType::Box;
    actor.shape.half_extents = half_extents;
    actor.layer = layer;
    m_actors.push_back(actor);
    return actor.id;
}

bool QueryWorld::remove(ActorId actor) {
    for (auto it = m_actors.begin(); it != m_actors.end(); ++it) {
        if (it->id == actor) {
            m_actors.erase(it);
            return true;
        }
    }
    return false;
}

bool QueryWorld::set_position(ActorId actor, const Vec3& position) {
    Actor* a = find(actor);
    if (!a) return false;
    a->position = position;
    return true;
}

void QueryWorld::clear() {
    m_actors.clear();
}

std::optional<uint16_t> QueryWorld::get_layer(ActorId actor) const {
    const Actor* a = find(actor);
    if (!a) return std::nullopt;
    return a->layer;
}

const QueryWorld::Actor* QueryWorld::find(ActorId actor) const {
    for (const auto& a : m_actors) {
        if (a.id == actor) return &a;
    }
    return nullptr;
}

QueryWorld::Actor* QueryWorld::find(ActorId actor) {
    for (auto& a : m_actors) {
        if (a.id == actor) return &a;
    }
    return nullptr;
}

bool QueryWorld::passes(const Actor& actor, const QueryFilter& filter) const {
    return mask_includes(filter.layer_mask, actor.layer) && !filter.is_ignored(actor.id);
}

// ============================================================================
// Queries
// ============================================================================

std::vector<Contact> QueryWorld::query_intersect(const QueryShape& shape,
                                                 const QueryFilter& filter) const {
    std::vector<Contact> contacts;

    for (const auto& actor : m_actors) {
        if (!passes(actor, filter)) continue;

        Vec3 point{0.0f};
        Vec3 normal{0.0f, 1.0f, 0.0f};
        bool overlapping = false;

        if (actor.shape.type == ShapeType::Sphere) {
            if (shape.type == ShapeType::Sphere) {
                overlapping = sphere_sphere_overlap(actor.position, actor.shape.radius,
                                                    shape.center, shape.radius, point, normal);
            } else {
                // Query box against actor sphere: flip the box-out normal
                AABB query_box = AABB::from_center(shape.center, shape.half_extents);
                Vec3 box_normal;
                overlapping = box_sphere_overlap(query_box, actor.position, actor.shape.radius,
                                                 point, box_normal);
                if (overlapping) {
                    normal = -box_normal;
                    point = actor.position + normal * actor.shape.radius;
                }
            }
        } else {
            AABB actor_box = AABB::from_center(actor.position, actor.shape.half_extents);
            if (shape.type == ShapeType::Sphere) {
                overlapping = box_sphere_overlap(actor_box, shape.center, shape.radius, point, normal);
            } else {
                overlapping = box_box_overlap(actor.position, actor.shape.half_extents,
                                              shape.center, shape.half_extents, point, normal);
            }
        }

        if (overlapping) {
            contacts.push_back(Contact{actor.id, point, normal});
        }
    }

    return contacts;
}

RaycastHit QueryWorld::query_ray(const Vec3& origin, const Vec3& direction,
                                 float max_distance, const QueryFilter& filter) const {
    return query_sweep(origin, 0.0f, direction, max_distance, filter);
}

RaycastHit QueryWorld::query_sweep(const Vec3& origin, float radius, const Vec3& direction,
                                   float max_distance, const QueryFilter& filter) const {
    RaycastHit result;
    if (max_distance <= 0.0f || radius < 0.0f || is_near_zero(direction)) return result;

    Ray ray(origin, direction);
    float best = max_distance;

    // Each actor is grown by the sweep radius and hit with the center ray.
    // Boxes grow as boxes, so their edges and corners are slightly generous.
    for (const auto& actor : m_actors) {
        if (!passes(actor, filter)) continue;

        float t = 0.0f;
        Vec3 normal{0.0f};
        bool hit = false;
        if (actor.shape.type == ShapeType::Sphere) {
            hit = ray_sphere(ray, actor.position, actor.shape.radius + radius, t, normal);
        } else {
            AABB grown = AABB::from_center(actor.position, actor.shape.half_extents + Vec3(radius));
            hit = ray_aabb(ray, grown, t, normal);
        }

        if (hit && t <= best) {
            // Ties keep the first reported actor
            if (result.hit && t == result.distance) continue;
            best = t;
            result.hit = true;
            result.actor = actor.id;
            result.distance = t;
            result.point = ray.at(t) - normal * radius;
            result.normal = normal;
        }
    }

    return result;
}

std::vector<ActorId> QueryWorld::query_radius(const Vec3& point, float radius,
                                              const QueryFilter& filter) const {
    std::vector<ActorId> actors;
    if (radius < 0.0f) return actors;

    for (const Contact& contact : query_intersect(QueryShape::sphere(point, radius), filter)) {
        actors.push_back(contact.actor);
    }
    return actors;
}

std::optional<Vec3> QueryWorld::get_position(ActorId actor) const {
    const Actor* a = find(actor);
    if (!a) return std::nullopt;
    return a->position;
}

} // namespace salvo::physics
