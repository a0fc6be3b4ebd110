#pragma once

#include <salvo/core/event_dispatcher.hpp>
#include <salvo/sim/entity_registry.hpp>
#include <salvo/sim/sim_events.hpp>
#include <salvo/sim/sim_types.hpp>

#include <cstdint>
#include <vector>

namespace salvo::sim {

// ============================================================================
// LifecycleScheduler - expiry, completion notification and removal
// ============================================================================
//
// Every entity that enters the registry leaves it through retire(), which
// sends exactly one EntityCompletedEvent before the registry forgets the id.

class LifecycleScheduler {
public:
    LifecycleScheduler(EntityRegistry& registry, core::EventDispatcher& events);

    // Apply lifetime and distance budgets to one active entity.
    // Returns true when the entity expired.
    bool check_expiry(EntityId id, SimTime now);

    // check_expiry() over every active entity
    uint32_t update(SimTime now);

    // Notify and remove every materialized entity that is no longer Active
    uint32_t retire_finished(SimTime now);

    // Notify and remove one finished entity. Unknown ids are a no-op.
    bool retire(EntityId id, SimTime now);

    // External cancellation. Active entities become Expired/Cancelled and are
    // retired now, or at the end of the tick when `defer` is set. Pending
    // entities are retired without ever being simulated.
    bool cancel(EntityId id, SimTime now, bool defer);

    // Mark an entity whose processing threw. Retired with the rest.
    void fault(EntityId id);

    uint64_t completed_count() const { return m_completed; }

private:
    void notify(const EntityCompletedEvent& completed, bool expired_without_hit, ExpirePolicy policy);

    EntityRegistry& m_registry;
    core::EventDispatcher& m_events;
    uint64_t m_completed = 0;
};

} // namespace salvo::sim
