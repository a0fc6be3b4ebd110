#pragma once

#include <salvo/sim/components.hpp>
#include <salvo/sim/sim_settings.hpp>
#include <salvo/sim/sim_types.hpp>

#include <entt/entt.hpp>

#include <cstddef>
#include <optional>
#include <vector>

namespace salvo::sim {

// ============================================================================
// EntityRegistry - owns every simulated entity
// ============================================================================
//
// Storage is an EnTT registry keyed by the 64-bit EntityId, so ids are stable
// slot indices with a generation counter and a stale id resolves to nothing.
//
// spawn() only reserves the id. Components are created by flush_pending(),
// which the simulation calls at the start of each tick, so spawns made while
// a tick iterates the active set never show up in that same tick.

class EntityRegistry {
public:
    using Registry = entt::basic_registry<EntityId>;

    explicit EntityRegistry(const SimSettings& settings = {});
    ~EntityRegistry() = default;

    EntityRegistry(const EntityRegistry&) = delete;
    EntityRegistry& operator=(const EntityRegistry&) = delete;

    // Validate and reserve. Nothing is created when the result carries an error.
    SpawnResult spawn(const EntitySpec& spec, SimTime now);

    static SpawnError validate(const EntitySpec& spec);

    // Materialize everything spawned since the last flush. Returns the new ids.
    std::vector<EntityId> flush_pending();

    // Live or pending
    bool contains(EntityId id) const;
    bool is_pending(EntityId id) const;
    std::optional<EntitySnapshot> get(EntityId id) const;

    // Destroy immediately. Unknown or already removed ids are a no-op.
    bool remove(EntityId id);

    // Visit every materialized entity still in the Active state
    template<typename Fn>
    void for_each_active(Fn&& fn) const {
        auto view = m_registry.view<const EntityInfo>();
        for (auto entity : view) {
            if (view.get<const EntityInfo>(entity).is_active()) {
                fn(entity);
            }
        }
    }

    std::vector<EntityId> active_ids() const;
    std::vector<EntityId> pending_ids() const;

    size_t active_count() const;
    size_t pending_count() const { return m_pending.size(); }

    // Materialized entities in any state
    size_t size() const;

    void clear();

    Registry& raw() { return m_registry; }
    const Registry& raw() const { return m_registry; }

private:
    struct PendingSpawn {
        EntityId id = NullEntity;
        EntitySpec spec;
        SimTime spawn_time = 0;
    };

    void materialize(const PendingSpawn& pending);
    EntitySnapshot snapshot_pending(const PendingSpawn& pending) const;
    const PendingSpawn* find_pending(EntityId id) const;

    Registry m_registry;
    std::vector<PendingSpawn> m_pending;
    float m_default_collider_radius;
    uint32_t m_default_lifetime_ms;
};

} // namespace salvo::sim
