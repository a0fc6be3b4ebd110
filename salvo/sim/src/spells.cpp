#include <salvo/sim/spells.hpp>

#include <cmath>

namespace salvo::sim::spells {

namespace {

std::vector<EffectPayload> fireball_payload(const FireballParams& params) {
    // No burn radius: the burn sticks to whoever was hit
    return {
        EffectPayload::instant(params.damage, "fire"),
        EffectPayload::over_time(params.damage * params.burn_ratio, params.burn_duration_ms,
                                 params.burn_interval_ms, std::nullopt, "fire"),
    };
}

std::vector<EffectPayload> meteor_payload(const MeteorParams& params) {
    EffectPayload burn = EffectPayload::over_time(params.damage * params.burn_ratio, params.burn_duration_ms,
                                                  params.burn_interval_ms,
                                                  params.explosion_radius * params.burn_radius_ratio, "fire");
    burn.trigger_chance = params.burn_chance;

    return {
        EffectPayload::area(params.damage, params.explosion_radius, "fire"),
        burn,
    };
}

} // namespace

EntitySpec fireball(const Vec3& origin, const Vec3& direction, ActorId caster, const FireballParams& params) {
    SpawnOptions options;
    options.archetype = "fireball";
    options.max_lifetime_ms = params.lifetime_ms;
    options.collider_radius = params.collider_radius;
    options.owner = caster;
    options.on_expire = ExpirePolicy::TerminalEffect;
    options.payload = fireball_payload(params);

    return EntitySpec::projectile(origin, direction, params.speed, options);
}

EntitySpec meteor(const Vec3& target, std::mt19937& rng, ActorId caster, const MeteorParams& params) {
    Vec3 impact = target;
    if (params.spread_radius > 0.0f) {
        // Uniform over the disc
        std::uniform_real_distribution<float> unit(0.0f, 1.0f);
        float angle = unit(rng) * 2.0f * glm::pi<float>();
        float distance = std::sqrt(unit(rng)) * params.spread_radius;
        impact.x += std::cos(angle) * distance;
        impact.z += std::sin(angle) * distance;
    }

    SpawnOptions options;
    options.archetype = "meteor";
    options.max_lifetime_ms = params.lifetime_ms;
    options.motion = MotionModel::dynamic(params.gravity_scale);
    options.collision = CollisionMode::Swept;
    options.collider_radius = params.collider_radius;
    options.owner = caster;
    options.payload = meteor_payload(params);

    Vec3 start = impact + Vec3(0.0f, params.height, 0.0f);
    return EntitySpec::projectile(start, Vec3(0.0f, -1.0f, 0.0f), params.speed, options);
}

EntitySpec bullet(const Vec3& start, const Vec3& end, ActorId shooter, const BulletParams& params) {
    SpawnOptions options;
    options.archetype = "bullet";
    options.max_distance = glm::length(end - start);
    options.collision = CollisionMode::Swept;
    options.collider_radius = params.collider_radius;
    options.owner = shooter;
    options.payload = {EffectPayload::instant(params.damage)};

    // start == end leaves a zero direction, which spawn rejects
    return EntitySpec::projectile(start, end - start, params.speed, options);
}

std::vector<EffectPayload> default_payload(const std::string& archetype) {
    if (archetype == "fireball") return fireball_payload({});
    if (archetype == "meteor") return meteor_payload({});
    if (archetype == "bullet") return {EffectPayload::instant(BulletParams{}.damage)};
    return {};
}

// ============================================================================
// CastCooldown
// ============================================================================

bool CastCooldown::ready(ActorId caster, SimTime now) const {
    auto it = m_last_cast.find(caster);
    if (it == m_last_cast.end()) return true;
    return now >= it->second + ms_to_sim(m_cooldown_ms);
}

bool CastCooldown::try_cast(ActorId caster, SimTime now) {
    if (!ready(caster, now)) return false;
    m_last_cast[caster] = now;
    return true;
}

uint32_t CastCooldown::remaining_ms(ActorId caster, SimTime now) const {
    auto it = m_last_cast.find(caster);
    if (it == m_last_cast.end()) return 0;
    SimTime ready_at = it->second + ms_to_sim(m_cooldown_ms);
    if (now >= ready_at) return 0;
    return static_cast<uint32_t>((ready_at - now + 999) / 1000);
}

} // namespace salvo::sim::spells
