#pragma once

#include <salvo/physics/collision_query.hpp>

#include <cstdint>
#include <optional>
#include <vector>

namespace salvo::physics {

// Static collider registered with a QueryWorld
struct ActorShape {
    ShapeType type = ShapeType::Sphere;
    float radius = 0.5f;
    Vec3 half_extents{0.5f};
};

// ============================================================================
// QueryWorld - brute-force in-memory ICollisionQuery
// ============================================================================
//
// Holds sphere and box actors and answers queries by testing every actor.
// Used by the headless tools and the tests; a game hands the simulation its
// own physics engine behind ICollisionQuery instead.

class QueryWorld : public ICollisionQuery {
public:
    QueryWorld() = default;

    ActorId add_sphere(const Vec3& center, float radius, uint16_t layer = layers::STATIC);
    ActorId add_box(const Vec3& center, const Vec3& half_extents, uint16_t layer = layers::STATIC);
    bool remove(ActorId actor);
    bool set_position(ActorId actor, const Vec3& position);
    void clear();

    size_t actor_count() const { return m_actors.size(); }
    std::optional<uint16_t> get_layer(ActorId actor) const;

    // ICollisionQuery
    std::vector<Contact> query_intersect(const QueryShape& shape,
                                         const QueryFilter& filter) const override;
    RaycastHit query_ray(const Vec3& origin, const Vec3& direction,
                         float max_distance, const QueryFilter& filter) const override;
    RaycastHit query_sweep(const Vec3& origin, float radius, const Vec3& direction,
                           float max_distance, const QueryFilter& filter) const override;
    std::vector<ActorId> query_radius(const Vec3& point, float radius,
                                      const QueryFilter& filter) const override;
    std::optional<Vec3> get_position(ActorId actor) const override;

private:
    struct Actor {
        ActorId id;
        Vec3 position{0.0f};
        ActorShape shape;
        uint16_t layer = layers::STATIC;
    };

    bool passes(const Actor& actor, const QueryFilter& filter) const;
    const Actor* find(ActorId actor) const;
    Actor* find(ActorId actor);

    std::vector<Actor> m_actors;
    uint32_t m_next_id = 0;
};

// Shape tests shared with the simulation tests
bool ray_sphere(const Ray& ray, const Vec3& center, float radius, float& t, Vec3& normal);
bool ray_aabb(const Ray& ray, const AABB& box, float& t, Vec3& normal);

} // namespace salvo::physics
