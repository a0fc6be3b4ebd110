#include <salvo/core/event_dispatcher.hpp>

namespace salvo::core {

void EventDispatcher::flush() {
    std::vector<std::function<void()>> pending;
    pending.swap(m_queued_events);

    for (const auto& dispatch_fn : pending) {
        dispatch_fn();
    }
}

} // namespace salvo::core
