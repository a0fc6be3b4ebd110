#pragma once

#include <salvo/core/math.hpp>
#include <salvo/physics/layers.hpp>

#include <algorithm>
#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

namespace salvo::physics {

using namespace salvo::core;

// Handle to an actor or collider owned by the physics collaborator
struct ActorId {
    uint32_t id = UINT32_MAX;

    bool valid() const { return id != UINT32_MAX; }
    bool operator==(const ActorId& other) const { return id == other.id; }
    bool operator!=(const ActorId& other) const { return id != other.id; }
};

constexpr ActorId NoActor{};

enum class ShapeType : uint8_t {
    Sphere,
    Box
};

// Shape used for overlap queries
struct QueryShape {
    ShapeType type = ShapeType::Sphere;
    Vec3 center{0.0f};
    float radius = 0.5f;            // Sphere
    Vec3 half_extents{0.5f};        // Box

    static QueryShape sphere(const Vec3& c, float r) {
        QueryShape s;
        s.type = ShapeType::Sphere;
        s.center = c;
        s.radius = r;
        return s;
    }

    static QueryShape box(const Vec3& c, const Vec3& half) {
        QueryShape s;
        s.type = ShapeType::Box;
        s.center = c;
        s.half_extents = half;
        return s;
    }
};

// Which actors a query may report
struct QueryFilter {
    LayerMask layer_mask = ALL_LAYERS;
    std::vector<ActorId> ignore;

    bool is_ignored(ActorId actor) const {
        return std::find(ignore.begin(), ignore.end(), actor) != ignore.end();
    }
};

struct Contact {
    ActorId actor;
    Vec3 point{0.0f};
    std::optional<Vec3> normal;     // Points out of the actor's surface
};

struct RaycastHit {
    ActorId actor;
    Vec3 point{0.0f};
    Vec3 normal{0.0f};
    float distance = 0.0f;
    bool hit = false;
};

// ============================================================================
// ICollisionQuery - read-only view of the physics world
// ============================================================================
//
// The simulation core never owns the physics world. All queries are const and
// must be safe to call any number of times per tick.

class ICollisionQuery {
public:
    virtual ~ICollisionQuery() = default;

    // All actors overlapping the shape, in the order the world reports them
    virtual std::vector<Contact> query_intersect(const QueryShape& shape,
                                                 const QueryFilter& filter) const = 0;

    // Nearest actor along the ray within max_distance
    virtual RaycastHit query_ray(const Vec3& origin, const Vec3& direction,
                                 float max_distance, const QueryFilter& filter) const = 0;

    // Sphere cast: nearest actor touched by a sphere of `radius` moving along
    // the ray. distance is how far the center travels before contact, point
    // is the contact on the actor's surface.
    virtual RaycastHit query_sweep(const Vec3& origin, float radius, const Vec3& direction,
                                   float max_distance, const QueryFilter& filter) const = 0;

    // All actors whose shape comes within radius of point
    virtual std::vector<ActorId> query_radius(const Vec3& point, float radius,
                                              const QueryFilter& filter) const = 0;

    // Current position of an actor, nullopt once the actor is gone
    virtual std::optional<Vec3> get_position(ActorId actor) const = 0;
};

} // namespace salvo::physics

template<>
struct std::hash<salvo::physics::ActorId> {
    size_t operator()(const salvo::physics::ActorId& a) const noexcept {
        return std::hash<uint32_t>{}(a.id);
    }
};
