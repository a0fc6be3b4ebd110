#include <salvo/sim/lifecycle_scheduler.hpp>
#include <salvo/sim/movement.hpp>
#include <salvo/core/log.hpp>

#include <exception>

namespace salvo::sim {

LifecycleScheduler::LifecycleScheduler(EntityRegistry& registry, core::EventDispatcher& events)
    : m_registry(registry)
    , m_events(events) {}

// ============================================================================
// Expiry
// ============================================================================

bool LifecycleScheduler::check_expiry(EntityId id, SimTime now) {
    auto& reg = m_registry.raw();
    auto* info = reg.try_get<EntityInfo>(id);
    if (!info || !info->is_active()) return false;

    const auto* lifetime = reg.try_get<Lifetime>(id);
    if (!lifetime) return false;

    SimTime age = now > info->spawn_time ? now - info->spawn_time : 0;
    if (lifetime->max_lifetime_ms && age >= ms_to_sim(*lifetime->max_lifetime_ms)) {
        info->state = EntityState::Expired;
        info->reason = CompletionReason::LifetimeExpired;
        return true;
    }

    const auto* motion = reg.try_get<Motion>(id);
    if (lifetime->max_distance && motion &&
        motion->distance_traveled + DISTANCE_EPSILON >= *lifetime->max_distance) {
        info->state = EntityState::Expired;
        info->reason = CompletionReason::DistanceExceeded;
        return true;
    }
    return false;
}

uint32_t LifecycleScheduler::update(SimTime now) {
    uint32_t expired = 0;
    for (EntityId id : m_registry.active_ids()) {
        if (check_expiry(id, now)) ++expired;
    }
    return expired;
}

void LifecycleScheduler::fault(EntityId id) {
    auto* info = m_registry.raw().try_get<EntityInfo>(id);
    if (!info || !info->is_active()) return;
    info->state = EntityState::Expired;
    info->reason = CompletionReason::Faulted;
}

// ============================================================================
// Retirement
// ============================================================================

void LifecycleScheduler::notify(const EntityCompletedEvent& completed, bool expired_without_hit,
                                ExpirePolicy policy) {
    log(LogLevel::Debug, "[Lifecycle] Entity {} ({}) {}: {}", to_integral(completed.id),
        completed.archetype, to_string(completed.state), to_string(completed.reason));

    // A throwing handler must not keep the entity alive
    try {
        m_events.dispatch(completed);
        if (expired_without_hit && policy == ExpirePolicy::TerminalEffect) {
            m_events.dispatch(TerminalEffectEvent{completed.id, completed.position, completed.archetype});
        }
    } catch (const std::exception& e) {
        log(LogLevel::Error, "[Lifecycle] Completion handler for entity {} threw: {}",
            to_integral(completed.id), e.what());
    }
}

bool LifecycleScheduler::retire(EntityId id, SimTime now) {
    auto& reg = m_registry.raw();
    if (!m_registry.contains(id) || m_registry.is_pending(id)) return false;

    auto* info = reg.try_get<EntityInfo>(id);
    if (!info || info->is_active() || info->completion_sent) return false;
    info->completion_sent = true;

    EntityCompletedEvent completed;
    completed.id = id;
    completed.kind = info->kind;
    completed.state = info->state;
    completed.reason = info->reason;
    completed.age = now > info->spawn_time ? now - info->spawn_time : 0;
    completed.archetype = info->archetype;
    if (const auto* motion = reg.try_get<Motion>(id)) {
        completed.position = motion->position;
        completed.distance_traveled = motion->distance_traveled;
    }

    bool expired_without_hit = info->state == EntityState::Expired && info->hit_count == 0 &&
                               (info->reason == CompletionReason::LifetimeExpired ||
                                info->reason == CompletionReason::DistanceExceeded);
    ExpirePolicy policy = ExpirePolicy::Vanish;
    if (const auto* lifetime = reg.try_get<Lifetime>(id)) {
        policy = lifetime->on_expire;
    }

    notify(completed, expired_without_hit, policy);

    m_registry.remove(id);
    ++m_completed;
    return true;
}

uint32_t LifecycleScheduler::retire_finished(SimTime now) {
    std::vector<EntityId> finished;
    auto view = m_registry.raw().view<const EntityInfo>();
    for (auto entity : view) {
        if (!view.get<const EntityInfo>(entity).is_active()) {
            finished.push_back(entity);
        }
    }

    uint32_t retired = 0;
    for (EntityId id : finished) {
        if (retire(id, now)) ++retired;
    }
    return retired;
}

bool LifecycleScheduler::cancel(EntityId id, SimTime now, bool defer) {
    if (!m_registry.contains(id)) return false;

    if (m_registry.is_pending(id)) {
        auto snapshot = m_registry.get(id);
        m_registry.remove(id);
        if (!snapshot) return false;

        EntityCompletedEvent completed;
        completed.id = id;
        completed.kind = snapshot->kind;
        completed.state = EntityState::Expired;
        completed.reason = CompletionReason::Cancelled;
        completed.position = snapshot->position;
        completed.age = now > snapshot->spawn_time ? now - snapshot->spawn_time : 0;
        completed.archetype = snapshot->archetype;

        notify(completed, false, ExpirePolicy::Vanish);
        ++m_completed;
        return true;
    }

    auto* info = m_registry.raw().try_get<EntityInfo>(id);
    if (!info || !info->is_active()) return false;

    info->state = EntityState::Expired;
    info->reason = CompletionReason::Cancelled;
    if (!defer) {
        retire(id, now);
    }
    return true;
}

} // namespace salvo::sim
