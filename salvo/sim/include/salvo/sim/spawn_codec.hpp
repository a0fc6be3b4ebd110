#pragma once

#include <salvo/sim/sim_types.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace salvo::sim {

// ============================================================================
// Spawn event wire format
// ============================================================================
//
//   { "type": "fireball",
//     "config": { "startPosition": [x,y,z], "direction": [x,y,z],
//                 "speed": 25, "duration": 1500, ...payload fields } }
//
// Vectors are always 3-element arrays. duration is the lifetime in ms.
// Optional payload fields: maxDistance, motion, gravityScale, behavior,
// bounceCount, homingStrength, homingTarget, radius, collision, expire,
// effects[{type, value, radius, duration, interval, chance, damageType}].
// A known archetype without "effects" gets its preset payload.

struct SpawnEvent {
    std::string type;
    EntitySpec spec;
};

// Returns nullopt and fills out_error when the event is malformed
std::optional<SpawnEvent> decode_spawn_event(const nlohmann::json& j, std::string& out_error);
std::optional<SpawnEvent> decode_spawn_event(const std::string& text, std::string& out_error);

nlohmann::json encode_spawn_event(const SpawnEvent& event);

// Vector helpers shared with the scenario loader
nlohmann::json vec3_to_json(const Vec3& v);
bool vec3_from_json(const nlohmann::json& j, Vec3& out);

} // namespace salvo::sim
