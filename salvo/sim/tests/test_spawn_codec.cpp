#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <salvo/sim/entity_registry.hpp>
#include <salvo/sim/spawn_codec.hpp>

using namespace salvo::sim;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::ContainsSubstring;
using json = nlohmann::json;

namespace {

json bolt_event() {
    return json{
        {"type", "bolt"},
        {"config", {
            {"startPosition", {0.0, 1.0, 0.0}},
            {"direction", {0.0, 0.0, 2.0}},
            {"speed", 15.0},
            {"duration", 800},
            {"effects", json::array({json{{"type", "damage"}, {"value", 12.0}}})}
        }}
    };
}

} // namespace

TEST_CASE("Decode a minimal spawn event", "[sim][codec]") {
    std::string error;
    auto event = decode_spawn_event(bolt_event(), error);
    REQUIRE(event.has_value());
    REQUIRE(error.empty());

    REQUIRE(event->type == "bolt");
    const auto& spec = event->spec;
    REQUIRE(spec.kind == EntityKind::Projectile);
    REQUIRE_THAT(spec.position.y, WithinAbs(1.0f, 1e-6f));
    REQUIRE_THAT(spec.speed, WithinAbs(15.0f, 1e-6f));
    REQUIRE(spec.options.max_lifetime_ms == 800u);
    REQUIRE(spec.options.archetype == "bolt");
    REQUIRE_FALSE(spec.options.max_distance.has_value());

    REQUIRE(spec.options.payload.size() == 1);
    REQUIRE(spec.options.payload[0].kind == PayloadKind::InstantDamage);
    REQUIRE_THAT(spec.options.payload[0].magnitude, WithinAbs(12.0f, 1e-6f));

    REQUIRE(EntityRegistry::validate(spec) == SpawnError::None);
}

TEST_CASE("Decode the optional fields", "[sim][codec]") {
    json j = bolt_event();
    auto& config = j["config"];
    config["maxDistance"] = 40.0;
    config["motion"] = "dynamic";
    config["gravityScale"] = 0.5;
    config["behavior"] = "bouncing";
    config["bounceCount"] = 2;
    config["homingTarget"] = {5.0, 0.0, 5.0};
    config["homingStrength"] = 0.3;
    config["radius"] = 0.6;
    config["collision"] = "swept";
    config["expire"] = "terminal";
    config["effects"] = json::array({
        json{{"type", "area"}, {"value", 30.0}, {"radius", 4.0}},
        json{{"type", "burn"}, {"value", 3.0}, {"duration", 3000}, {"interval", 500}, {"chance", 0.25}},
    });

    std::string error;
    auto event = decode_spawn_event(j, error);
    REQUIRE(event.has_value());

    const auto& options = event->spec.options;
    REQUIRE(options.max_distance == 40.0f);
    REQUIRE(options.motion.type == MotionType::Dynamic);
    REQUIRE_THAT(options.motion.gravity_scale, WithinAbs(0.5f, 1e-6f));
    REQUIRE(options.behavior == HitBehavior::Bouncing);
    REQUIRE(options.bounce_count == 2);
    REQUIRE(options.homing.has_value());
    REQUIRE_THAT(options.homing->strength, WithinAbs(0.3f, 1e-6f));
    REQUIRE_THAT(options.homing->target_point->x, WithinAbs(5.0f, 1e-6f));
    REQUIRE(options.collider_radius == 0.6f);
    REQUIRE(options.collision == CollisionMode::Swept);
    REQUIRE(options.on_expire == ExpirePolicy::TerminalEffect);

    REQUIRE(options.payload.size() == 2);
    REQUIRE(options.payload[0].kind == PayloadKind::AreaDamage);
    REQUIRE(options.payload[0].radius == 4.0f);

    const auto& burn = options.payload[1];
    REQUIRE(burn.kind == PayloadKind::DamageOverTime);
    REQUIRE(burn.damage_type == "fire");
    REQUIRE(burn.duration_ms == 3000u);
    REQUIRE(burn.tick_interval_ms == 500u);
    REQUIRE(burn.trigger_chance == 0.25f);
}

TEST_CASE("Zero duration means no lifetime budget", "[sim][codec]") {
    json j = bolt_event();
    j["config"]["duration"] = 0;
    j["config"]["maxDistance"] = 10.0;

    std::string error;
    auto event = decode_spawn_event(j, error);
    REQUIRE(event.has_value());
    REQUIRE_FALSE(event->spec.options.max_lifetime_ms.has_value());
}

TEST_CASE("Known archetypes fall back to their preset payload", "[sim][codec]") {
    json j = bolt_event();
    j["type"] = "fireball";
    j["config"].erase("effects");

    std::string error;
    auto event = decode_spawn_event(j, error);
    REQUIRE(event.has_value());

    const auto& payload = event->spec.options.payload;
    REQUIRE(payload.size() == 2);
    REQUIRE(payload[0].kind == PayloadKind::InstantDamage);
    REQUIRE(payload[1].kind == PayloadKind::DamageOverTime);
    REQUIRE(payload[1].damage_type == "fire");

    SECTION("Unknown archetype carries nothing") {
        j["type"] = "pebble";
        auto pebble = decode_spawn_event(j, error);
        REQUIRE(pebble.has_value());
        REQUIRE(pebble->spec.options.payload.empty());
    }
}

TEST_CASE("Malformed spawn events are rejected", "[sim][codec]") {
    std::string error;

    SECTION("Not JSON") {
        REQUIRE_FALSE(decode_spawn_event(std::string("{ \"type\": "), error).has_value());
        REQUIRE(error == "invalid JSON");
    }

    SECTION("Missing speed") {
        json j = bolt_event();
        j["config"].erase("speed");
        REQUIRE_FALSE(decode_spawn_event(j, error).has_value());
        REQUIRE(error == "missing speed");
    }

    SECTION("Missing duration") {
        json j = bolt_event();
        j["config"].erase("duration");
        REQUIRE_FALSE(decode_spawn_event(j, error).has_value());
        REQUIRE(error == "missing duration");
    }

    SECTION("Vectors need exactly three numbers") {
        json j = bolt_event();
        j["config"]["direction"] = {1.0, 0.0};
        REQUIRE_FALSE(decode_spawn_event(j, error).has_value());
        REQUIRE_THAT(error, ContainsSubstring("direction"));

        j = bolt_event();
        j["config"]["startPosition"] = {1.0, "up", 0.0};
        REQUIRE_FALSE(decode_spawn_event(j, error).has_value());
        REQUIRE_THAT(error, ContainsSubstring("startPosition"));
    }

    SECTION("Homing strength without a target") {
        json j = bolt_event();
        j["config"]["homingStrength"] = 0.5;
        REQUIRE_FALSE(decode_spawn_event(j, error).has_value());
        REQUIRE(error == "homingStrength requires homingTarget");
    }

    SECTION("Unknown effect type") {
        json j = bolt_event();
        j["config"]["effects"] = json::array({json{{"type", "heal"}, {"value", 5.0}}});
        REQUIRE_FALSE(decode_spawn_event(j, error).has_value());
        REQUIRE(error == "unknown effect type 'heal'");
    }

    SECTION("Damage over time without an interval") {
        json j = bolt_event();
        j["config"]["effects"] = json::array({json{{"type", "dot"}, {"value", 5.0}, {"duration", 1000}}});
        REQUIRE_FALSE(decode_spawn_event(j, error).has_value());
        REQUIRE_THAT(error, ContainsSubstring("dot"));
    }

    SECTION("Negative duration") {
        json j = bolt_event();
        j["config"]["duration"] = -5;
        REQUIRE_FALSE(decode_spawn_event(j, error).has_value());
        REQUIRE_THAT(error, ContainsSubstring("duration"));
    }
}

TEST_CASE("Encoded events decode to the same spawn", "[sim][codec]") {
    std::string error;
    json j = bolt_event();
    j["config"]["behavior"] = "piercing";
    j["config"]["collision"] = "discrete";
    j["config"]["effects"].push_back(json{{"type", "dot"}, {"value", 2.0}, {"duration", 1000}, {"interval", 250}, {"radius", 1.5}});

    auto first = decode_spawn_event(j, error);
    REQUIRE(first.has_value());

    auto second = decode_spawn_event(encode_spawn_event(*first), error);
    REQUIRE(second.has_value());

    const auto& a = first->spec.options;
    const auto& b = second->spec.options;
    REQUIRE(second->type == first->type);
    REQUIRE(b.max_lifetime_ms == a.max_lifetime_ms);
    REQUIRE(b.behavior == HitBehavior::Piercing);
    REQUIRE(b.collision == CollisionMode::Discrete);
    REQUIRE(b.payload.size() == a.payload.size());
    REQUIRE(b.payload[1].kind == PayloadKind::DamageOverTime);
    REQUIRE(b.payload[1].radius == 1.5f);
    REQUIRE(b.payload[1].tick_interval_ms == 250u);
}
