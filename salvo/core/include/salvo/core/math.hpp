#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>

#include <cmath>

namespace salvo::core {

using Vec3 = glm::vec3;

// Axis-aligned bounding box
struct AABB {
    Vec3 min{0.0f};
    Vec3 max{0.0f};

    AABB() = default;
    AABB(const Vec3& min_, const Vec3& max_) : min(min_), max(max_) {}

    static AABB from_center(const Vec3& center, const Vec3& half_extents) {
        return AABB(center - half_extents, center + half_extents);
    }

    Vec3 center() const { return (min + max) * 0.5f; }
    Vec3 size() const { return max - min; }
    Vec3 extents() const { return size() * 0.5f; }

    bool contains(const Vec3& point) const {
        return point.x >= min.x && point.x <= max.x &&
               point.y >= min.y && point.y <= max.y &&
               point.z >= min.z && point.z <= max.z;
    }

    Vec3 closest_point(const Vec3& point) const {
        return glm::clamp(point, min, max);
    }
};

// Ray for swept queries
struct Ray {
    Vec3 origin{0.0f};
    Vec3 direction{0.0f, 0.0f, 1.0f};

    Ray() = default;
    Ray(const Vec3& o, const Vec3& d) : origin(o), direction(glm::normalize(d)) {}

    Vec3 at(float t) const { return origin + direction * t; }
};

// Math constants
constexpr float EPSILON = 1e-6f;

inline bool is_finite(const Vec3& v) {
    return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
}

inline bool is_near_zero(const Vec3& v, float epsilon = EPSILON) {
    return glm::dot(v, v) <= epsilon * epsilon;
}

// Normalize, falling back when the input has no usable length
inline Vec3 safe_normalize(const Vec3& v, const Vec3& fallback = Vec3{0.0f, 0.0f, 1.0f}) {
    float len = glm::length(v);
    if (len <= EPSILON || !std::isfinite(len)) return fallback;
    return v / len;
}

} // namespace salvo::core
