#include <salvo/sim/spawn_codec.hpp>
#include <salvo/sim/spells.hpp>

namespace salvo::sim {

using json = nlohmann::json;

nlohmann::json vec3_to_json(const Vec3& v) {
    return json::array({v.x, v.y, v.z});
}

bool vec3_from_json(const nlohmann::json& j, Vec3& out) {
    if (!j.is_array() || j.size() != 3) return false;
    for (const auto& component : j) {
        if (!component.is_number()) return false;
    }
    out = Vec3(j[0].get<float>(), j[1].get<float>(), j[2].get<float>());
    return true;
}

namespace {

bool read_number(const json& config, const char* key, float& out, std::string& out_error) {
    if (!config.contains(key)) return true;
    if (!config[key].is_number()) {
        out_error = std::string(key) + " must be a number";
        return false;
    }
    out = config[key].get<float>();
    return true;
}

bool read_count(const json& config, const char* key, uint32_t& out, std::string& out_error) {
    if (!config.contains(key)) return true;
    if (!config[key].is_number_unsigned()) {
        out_error = std::string(key) + " must be a non-negative integer";
        return false;
    }
    out = config[key].get<uint32_t>();
    return true;
}

std::optional<EffectPayload> decode_effect(const json& e, std::string& out_error) {
    if (!e.is_object()) {
        out_error = "effects entries must be objects";
        return std::nullopt;
    }
    if (!e.contains("type") || !e["type"].is_string()) {
        out_error = "effect is missing its type";
        return std::nullopt;
    }
    if (!e.contains("value") || !e["value"].is_number()) {
        out_error = "effect is missing its value";
        return std::nullopt;
    }

    EffectPayload payload;
    std::string type = e["type"].get<std::string>();
    if (type == "damage") {
        payload.kind = PayloadKind::InstantDamage;
    } else if (type == "area") {
        payload.kind = PayloadKind::AreaDamage;
    } else if (type == "dot") {
        payload.kind = PayloadKind::DamageOverTime;
    } else if (type == "burn") {
        payload.kind = PayloadKind::DamageOverTime;
        payload.damage_type = "fire";
    } else {
        out_error = "unknown effect type '" + type + "'";
        return std::nullopt;
    }
    payload.magnitude = e["value"].get<float>();

    float radius = 0.0f;
    uint32_t duration = 0;
    uint32_t interval = 0;
    float chance = 1.0f;
    if (!read_number(e, "radius", radius, out_error)) return std::nullopt;
    if (!read_count(e, "duration", duration, out_error)) return std::nullopt;
    if (!read_count(e, "interval", interval, out_error)) return std::nullopt;
    if (!read_number(e, "chance", chance, out_error)) return std::nullopt;

    if (e.contains("radius")) payload.radius = radius;
    if (e.contains("duration")) payload.duration_ms = duration;
    if (e.contains("interval")) payload.tick_interval_ms = interval;
    if (e.contains("chance")) payload.trigger_chance = chance;
    if (e.contains("damageType")) {
        if (!e["damageType"].is_string()) {
            out_error = "damageType must be a string";
            return std::nullopt;
        }
        payload.damage_type = e["damageType"].get<std::string>();
    }

    if (!payload.is_valid()) {
        out_error = "effect '" + type + "' is missing a required field";
        return std::nullopt;
    }
    return payload;
}

json encode_effect(const EffectPayload& payload) {
    json e;
    e["type"] = to_string(payload.kind);
    e["value"] = payload.magnitude;
    if (payload.radius) e["radius"] = *payload.radius;
    if (payload.duration_ms) e["duration"] = *payload.duration_ms;
    if (payload.tick_interval_ms) e["interval"] = *payload.tick_interval_ms;
    if (payload.trigger_chance) e["chance"] = *payload.trigger_chance;
    e["damageType"] = payload.damage_type;
    return e;
}

} // namespace

// ============================================================================
// Decode
// ============================================================================

std::optional<SpawnEvent> decode_spawn_event(const nlohmann::json& j, std::string& out_error) {
    try {
        if (!j.is_object()) {
            out_error = "spawn event must be an object";
            return std::nullopt;
        }
        if (!j.contains("type") || !j["type"].is_string()) {
            out_error = "missing type";
            return std::nullopt;
        }
        if (!j.contains("config") || !j["config"].is_object()) {
            out_error = "missing config";
            return std::nullopt;
        }

        const json& config = j["config"];
        SpawnEvent event;
        event.type = j["type"].get<std::string>();

        EntitySpec& spec = event.spec;
        SpawnOptions& options = spec.options;
        spec.kind = EntityKind::Projectile;
        options.archetype = event.type;

        if (!config.contains("startPosition") || !vec3_from_json(config["startPosition"], spec.position)) {
            out_error = "startPosition must be a 3-element array";
            return std::nullopt;
        }
        if (!config.contains("direction") || !vec3_from_json(config["direction"], spec.direction)) {
            out_error = "direction must be a 3-element array";
            return std::nullopt;
        }
        if (!config.contains("speed")) {
            out_error = "missing speed";
            return std::nullopt;
        }
        if (!read_number(config, "speed", spec.speed, out_error)) return std::nullopt;

        if (!config.contains("duration")) {
            out_error = "missing duration";
            return std::nullopt;
        }
        uint32_t duration = 0;
        if (!read_count(config, "duration", duration, out_error)) return std::nullopt;
        if (duration > 0) options.max_lifetime_ms = duration;

        if (config.contains("maxDistance")) {
            float max_distance = 0.0f;
            if (!read_number(config, "maxDistance", max_distance, out_error)) return std::nullopt;
            options.max_distance = max_distance;
        }

        if (config.contains("motion")) {
            std::string motion = config["motion"].is_string() ? config["motion"].get<std::string>() : "";
            if (motion == "kinematic") {
                options.motion = MotionModel::kinematic();
            } else if (motion == "dynamic") {
                float gravity_scale = 1.0f;
                if (!read_number(config, "gravityScale", gravity_scale, out_error)) return std::nullopt;
                options.motion = MotionModel::dynamic(gravity_scale);
            } else {
                out_error = "motion must be \"kinematic\" or \"dynamic\"";
                return std::nullopt;
            }
        }

        if (config.contains("behavior")) {
            std::string behavior = config["behavior"].is_string() ? config["behavior"].get<std::string>() : "";
            if (behavior == "standard") {
                options.behavior = HitBehavior::Standard;
            } else if (behavior == "piercing") {
                options.behavior = HitBehavior::Piercing;
            } else if (behavior == "bouncing") {
                options.behavior = HitBehavior::Bouncing;
            } else {
                out_error = "behavior must be \"standard\", \"piercing\" or \"bouncing\"";
                return std::nullopt;
            }
        }
        if (!read_count(config, "bounceCount", options.bounce_count, out_error)) return std::nullopt;

        if (config.contains("homingTarget")) {
            HomingConfig homing;
            Vec3 target;
            if (!vec3_from_json(config["homingTarget"], target)) {
                out_error = "homingTarget must be a 3-element array";
                return std::nullopt;
            }
            homing.target_point = target;
            if (!read_number(config, "homingStrength", homing.strength, out_error)) return std::nullopt;
            options.homing = homing;
        } else if (config.contains("homingStrength")) {
            out_error = "homingStrength requires homingTarget";
            return std::nullopt;
        }

        if (config.contains("radius")) {
            float radius = 0.0f;
            if (!read_number(config, "radius", radius, out_error)) return std::nullopt;
            options.collider_radius = radius;
        }

        if (config.contains("collision")) {
            std::string collision = config["collision"].is_string() ? config["collision"].get<std::string>() : "";
            if (collision == "auto") {
                options.collision = CollisionMode::Auto;
            } else if (collision == "discrete") {
                options.collision = CollisionMode::Discrete;
            } else if (collision == "swept") {
                options.collision = CollisionMode::Swept;
            } else {
                out_error = "collision must be \"auto\", \"discrete\" or \"swept\"";
                return std::nullopt;
            }
        }

        if (config.contains("expire")) {
            std::string expire = config["expire"].is_string() ? config["expire"].get<std::string>() : "";
            if (expire == "vanish") {
                options.on_expire = ExpirePolicy::Vanish;
            } else if (expire == "terminal") {
                options.on_expire = ExpirePolicy::TerminalEffect;
            } else {
                out_error = "expire must be \"vanish\" or \"terminal\"";
                return std::nullopt;
            }
        }

        if (config.contains("effects")) {
            if (!config["effects"].is_array()) {
                out_error = "effects must be an array";
                return std::nullopt;
            }
            for (const auto& e : config["effects"]) {
                auto payload = decode_effect(e, out_error);
                if (!payload) return std::nullopt;
                options.payload.push_back(*payload);
            }
        } else {
            options.payload = spells::default_payload(event.type);
        }

        return event;
    } catch (const json::exception& e) {
        out_error = e.what();
        return std::nullopt;
    }
}

std::optional<SpawnEvent> decode_spawn_event(const std::string& text, std::string& out_error) {
    json j = json::parse(text, nullptr, false);
    if (j.is_discarded()) {
        out_error = "invalid JSON";
        return std::nullopt;
    }
    return decode_spawn_event(j, out_error);
}

// ============================================================================
// Encode
// ============================================================================

nlohmann::json encode_spawn_event(const SpawnEvent& event) {
    const EntitySpec& spec = event.spec;
    const SpawnOptions& options = spec.options;

    json config;
    config["startPosition"] = vec3_to_json(spec.position);
    config["direction"] = vec3_to_json(spec.direction);
    config["speed"] = spec.speed;
    config["duration"] = options.max_lifetime_ms.value_or(0);

    if (options.max_distance) config["maxDistance"] = *options.max_distance;

    if (options.motion.type == MotionType::Dynamic) {
        config["motion"] = "dynamic";
        config["gravityScale"] = options.motion.gravity_scale;
    } else {
        config["motion"] = "kinematic";
    }

    if (options.behavior != HitBehavior::Standard) {
        config["behavior"] = to_string(options.behavior);
    }
    if (options.behavior == HitBehavior::Bouncing) {
        config["bounceCount"] = options.bounce_count;
    }
    if (options.homing && options.homing->target_point) {
        config["homingTarget"] = vec3_to_json(*options.homing->target_point);
        config["homingStrength"] = options.homing->strength;
    }
    if (options.collider_radius) config["radius"] = *options.collider_radius;

    switch (options.collision) {
        case CollisionMode::Auto: break;
        case CollisionMode::Discrete: config["collision"] = "discrete"; break;
        case CollisionMode::Swept: config["collision"] = "swept"; break;
    }
    if (options.on_expire == ExpirePolicy::TerminalEffect) config["expire"] = "terminal";

    json effects = json::array();
    for (const auto& payload : options.payload) {
        effects.push_back(encode_effect(payload));
    }
    config["effects"] = effects;

    json j;
    j["type"] = event.type;
    j["config"] = config;
    return j;
}

} // namespace salvo::sim
