#pragma once

#include <salvo/sim/sim_types.hpp>

#include <cstdint>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

namespace salvo::sim::spells {

// ============================================================================
// Preset archetypes
// ============================================================================

struct FireballParams {
    float speed = 25.0f;
    uint32_t lifetime_ms = 1500;
    float damage = 20.0f;
    float burn_ratio = 0.5f;                // Burn per tick = damage * ratio
    uint32_t burn_duration_ms = 2000;
    uint32_t burn_interval_ms = 1000;
    float collider_radius = 0.3f;
};

// Straight bolt that burns the actor it hits
EntitySpec fireball(const Vec3& origin, const Vec3& direction, ActorId caster = {},
                    const FireballParams& params = {});

struct MeteorParams {
    float height = 30.0f;                   // Spawn height above the target
    float spread_radius = 0.0f;             // Random horizontal offset
    float speed = 30.0f;
    float gravity_scale = 3.0f;
    uint32_t lifetime_ms = 10000;
    float damage = 50.0f;
    float explosion_radius = 5.0f;
    float burn_ratio = 0.3f;
    uint32_t burn_duration_ms = 5000;
    uint32_t burn_interval_ms = 1000;
    float burn_radius_ratio = 0.7f;
    float burn_chance = 0.8f;
    float collider_radius = 1.0f;
};

// Falls onto the target, explodes and leaves a burning zone
EntitySpec meteor(const Vec3& target, std::mt19937& rng, ActorId caster = {},
                  const MeteorParams& params = {});

struct BulletParams {
    float speed = 120.0f;
    float damage = 10.0f;
    float collider_radius = 0.05f;
};

// Swept shot from start toward end, never flying past end
EntitySpec bullet(const Vec3& start, const Vec3& end, ActorId shooter = {},
                  const BulletParams& params = {});

// Payload a known archetype carries when a spawn event omits its effects
std::vector<EffectPayload> default_payload(const std::string& archetype);

// ============================================================================
// CastCooldown - per-caster cast gate
// ============================================================================

class CastCooldown {
public:
    explicit CastCooldown(uint32_t cooldown_ms = 2000) : m_cooldown_ms(cooldown_ms) {}

    bool ready(ActorId caster, SimTime now) const;

    // Starts the cooldown and returns true when the caster is ready
    bool try_cast(ActorId caster, SimTime now);

    uint32_t remaining_ms(ActorId caster, SimTime now) const;

    void reset(ActorId caster) { m_last_cast.erase(caster); }
    void clear() { m_last_cast.clear(); }

    uint32_t cooldown_ms() const { return m_cooldown_ms; }

private:
    uint32_t m_cooldown_ms;
    std::unordered_map<ActorId, SimTime> m_last_cast;
};

} // namespace salvo::sim::spells
