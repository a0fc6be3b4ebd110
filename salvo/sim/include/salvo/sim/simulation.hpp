#pragma once

#include <salvo/core/event_dispatcher.hpp>
#include <salvo/core/game_clock.hpp>
#include <salvo/physics/collision_query.hpp>
#include <salvo/sim/collision_resolver.hpp>
#include <salvo/sim/effect_dispatcher.hpp>
#include <salvo/sim/entity_registry.hpp>
#include <salvo/sim/lifecycle_scheduler.hpp>
#include <salvo/sim/movement.hpp>
#include <salvo/sim/sim_events.hpp>
#include <salvo/sim/sim_settings.hpp>
#include <salvo/sim/sim_types.hpp>

#include <cstdint>
#include <optional>
#include <vector>

namespace salvo::sim {

struct SimStats {
    uint64_t ticks = 0;
    uint64_t spawned = 0;
    uint64_t rejected = 0;
    uint64_t hits = 0;
    uint64_t completed = 0;
    uint64_t faults = 0;
};

// ============================================================================
// Simulation - explicit tick over the projectile / effect pipeline
// ============================================================================
//
// Per tick:
//   1. pending spawns become active
//   2. homing steer, movement, collision and hit resolution per projectile
//   3. damage-over-time zones run their due ticks
//   4. lifetime and distance budgets are applied
//   5. the render stream is captured and finished entities are retired
//
// A std::exception thrown while processing one entity retires that entity as
// Faulted; the rest of the tick carries on.
//
// The physics world and the event dispatcher are borrowed and must outlive
// the simulation. Destroying the simulation cancels whatever is still alive
// or pending, so every spawned entity gets its completion event.

class Simulation {
public:
    Simulation(const physics::ICollisionQuery& world, core::EventDispatcher& events,
               const SimSettings& settings = {});
    ~Simulation();

    Simulation(const Simulation&) = delete;
    Simulation& operator=(const Simulation&) = delete;

    // ========================================================================
    // Spawn / removal
    // ========================================================================

    SpawnResult spawn(const Vec3& start, const Vec3& direction, float speed,
                      const SpawnOptions& options = {});
    SpawnResult spawn(const EntitySpec& spec);

    // Cancel an entity (owner despawn, room leave). Unknown ids are a no-op.
    bool remove(EntityId id);

    // Cancel everything still alive or pending
    void shutdown();

    // ========================================================================
    // Stepping
    // ========================================================================

    // One simulation step of dt seconds
    void tick(float dt);

    // Feed frame time; runs as many fixed ticks as are due. Returns the count.
    uint32_t advance(double frame_dt);

    // ========================================================================
    // Queries
    // ========================================================================

    std::optional<EntitySnapshot> get(EntityId id) const;
    std::vector<EntitySnapshot> active_entities() const;

    template<typename Fn>
    void for_each_active(Fn&& fn) const {
        m_registry.for_each_active([&](EntityId id) {
            if (auto snapshot = m_registry.get(id)) {
                fn(*snapshot);
            }
        });
    }

    // Positions and states of every entity simulated in the last tick,
    // including the ones retired at its end
    const std::vector<RenderSample>& render_stream() const { return m_render_stream; }

    SimTime now() const { return m_now; }
    uint64_t tick_count() const { return m_tick; }
    bool in_tick() const { return m_in_tick; }

    const SimStats& stats() const { return m_stats; }
    const SimSettings& settings() const { return m_settings; }
    core::EventDispatcher& events() { return m_events; }

    EntityRegistry& registry() { return m_registry; }
    const EntityRegistry& registry() const { return m_registry; }

private:
    void process_projectile(EntityId id, float dt);
    void process_zone(EntityId id);
    void announce(const std::vector<EntityId>& spawned);
    void capture_render_stream();
    void handle_fault(EntityId id, const char* what);

    SimSettings m_settings;
    core::EventDispatcher& m_events;

    EntityRegistry m_registry;
    MovementIntegrator m_movement;
    CollisionResolver m_resolver;
    EffectDispatcher m_effects;
    LifecycleScheduler m_lifecycle;
    core::GameClock m_clock;

    SimTime m_now = 0;
    uint64_t m_tick = 0;
    bool m_in_tick = false;

    SimStats m_stats;
    std::vector<RenderSample> m_render_stream;
};

} // namespace salvo::sim
