#pragma once

#include <algorithm>
#include <cstdint>
#include <functional>
#include <memory>
#include <type_traits>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace salvo::core {

// ============================================================================
// ScopedConnection - RAII handle for event subscriptions
// ============================================================================

class ScopedConnection {
public:
    ScopedConnection() = default;

    explicit ScopedConnection(std::function<void()> disconnect_fn)
        : m_disconnect(std::move(disconnect_fn)) {}

    ~ScopedConnection() {
        disconnect();
    }

    ScopedConnection(const ScopedConnection&) = delete;
    ScopedConnection& operator=(const ScopedConnection&) = delete;

    ScopedConnection(ScopedConnection&& other) noexcept
        : m_disconnect(std::move(other.m_disconnect)) {
        other.m_disconnect = nullptr;
    }

    ScopedConnection& operator=(ScopedConnection&& other) noexcept {
        if (this != &other) {
            disconnect();
            m_disconnect = std::move(other.m_disconnect);
            other.m_disconnect = nullptr;
        }
        return *this;
    }

    void disconnect() {
        if (m_disconnect) {
            m_disconnect();
            m_disconnect = nullptr;
        }
    }

    bool connected() const {
        return m_disconnect != nullptr;
    }

private:
    std::function<void()> m_disconnect;
};

// ============================================================================
// EventDispatcher - Type-safe event pub/sub, owned and passed by the caller
// ============================================================================
//
// Single-threaded. Handlers may subscribe, unsubscribe or dispatch from inside
// a handler; a dispatch always runs against the handler list as it was when
// the dispatch started. Connections may outlive the dispatcher.

class EventDispatcher {
public:
    EventDispatcher() : m_table(std::make_shared<HandlerTable>()) {}
    ~EventDispatcher() = default;

    EventDispatcher(const EventDispatcher&) = delete;
    EventDispatcher& operator=(const EventDispatcher&) = delete;
    EventDispatcher(EventDispatcher&&) = delete;
    EventDispatcher& operator=(EventDispatcher&&) = delete;

    // ========================================================================
    // Subscription
    // ========================================================================

    template<typename T>
    ScopedConnection subscribe(std::function<void(const T&)> callback) {
        static_assert(std::is_class_v<T>, "Event type must be a class/struct");

        auto type_idx = std::type_index(typeid(T));
        uint64_t handler_id = m_table->next_id++;

        auto wrapper = [callback = std::move(callback)](const void* event) {
            callback(*static_cast<const T*>(event));
        };
        m_table->handlers[type_idx].push_back({handler_id, std::move(wrapper)});

        std::weak_ptr<HandlerTable> weak = m_table;
        return ScopedConnection([weak, type_idx, handler_id]() {
            if (auto table = weak.lock()) {
                table->remove(type_idx, handler_id);
            }
        });
    }

    // ========================================================================
    // Immediate Dispatch
    // ========================================================================

    template<typename T>
    void dispatch(const T& event) {
        static_assert(std::is_class_v<T>, "Event type must be a class/struct");

        auto it = m_table->handlers.find(std::type_index(typeid(T)));
        if (it == m_table->handlers.end()) return;

        std::vector<Handler> snapshot = it->second;
        for (const auto& handler : snapshot) {
            handler.callback(&event);
        }
    }

    // ========================================================================
    // Deferred Dispatch (Queue)
    // ========================================================================

    template<typename T>
    void queue(T event) {
        static_assert(std::is_class_v<T>, "Event type must be a class/struct");
        m_queued_events.push_back([this, event = std::move(event)]() {
            dispatch(event);
        });
    }

    // Dispatch everything queued so far. Events queued by handlers during the
    // flush are kept for the next flush.
    void flush();

    bool has_queued_events() const { return !m_queued_events.empty(); }
    size_t queued_event_count() const { return m_queued_events.size(); }
    void clear_queue() { m_queued_events.clear(); }

    // ========================================================================
    // Utility
    // ========================================================================

    template<typename T>
    size_t handler_count() const {
        auto it = m_table->handlers.find(std::type_index(typeid(T)));
        return it != m_table->handlers.end() ? it->second.size() : 0;
    }

    void clear_all_handlers() { m_table->handlers.clear(); }

private:
    struct Handler {
        uint64_t id;
        std::function<void(const void*)> callback;
    };

    struct HandlerTable {
        std::unordered_map<std::type_index, std::vector<Handler>> handlers;
        uint64_t next_id = 1;

        void remove(std::type_index type, uint64_t id) {
            auto it = handlers.find(type);
            if (it == handlers.end()) return;
            auto& list = it->second;
            list.erase(
                std::remove_if(list.begin(), list.end(),
                    [id](const Handler& h) { return h.id == id; }),
                list.end()
            );
        }
    };

    std::shared_ptr<HandlerTable> m_table;
    std::vector<std::function<void()>> m_queued_events;
};

} // namespace salvo::core
