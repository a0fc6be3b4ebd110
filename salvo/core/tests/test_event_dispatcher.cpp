#include <catch2/catch_test_macros.hpp>
#include <salvo/core/event_dispatcher.hpp>
#include <memory>
#include <string>
#include <vector>

using namespace salvo::core;

namespace {

struct HitEvent {
    int target = 0;
};

struct NoteEvent {
    std::string text;
};

} // namespace

TEST_CASE("EventDispatcher delivers to subscribers", "[core][events]") {
    EventDispatcher dispatcher;

    SECTION("Single subscriber") {
        int target = -1;
        auto conn = dispatcher.subscribe<HitEvent>([&](const HitEvent& e) {
            target = e.target;
        });

        dispatcher.dispatch(HitEvent{7});
        REQUIRE(target == 7);
    }

    SECTION("Subscribers run in subscription order") {
        std::vector<int> order;
        auto conn1 = dispatcher.subscribe<HitEvent>([&](const HitEvent&) { order.push_back(1); });
        auto conn2 = dispatcher.subscribe<HitEvent>([&](const HitEvent&) { order.push_back(2); });

        dispatcher.dispatch(HitEvent{});
        REQUIRE(order == std::vector<int>{1, 2});
    }

    SECTION("Event types do not cross") {
        int hits = 0;
        int notes = 0;
        auto conn1 = dispatcher.subscribe<HitEvent>([&](const HitEvent&) { hits++; });
        auto conn2 = dispatcher.subscribe<NoteEvent>([&](const NoteEvent&) { notes++; });

        dispatcher.dispatch(NoteEvent{"x"});
        REQUIRE(hits == 0);
        REQUIRE(notes == 1);
    }

    SECTION("Dispatch without subscribers is a no-op") {
        dispatcher.dispatch(HitEvent{1});
        REQUIRE(dispatcher.handler_count<HitEvent>() == 0);
    }
}

TEST_CASE("ScopedConnection lifetime", "[core][events]") {
    SECTION("Destroying the connection unsubscribes") {
        EventDispatcher dispatcher;
        int count = 0;
        {
            auto conn = dispatcher.subscribe<HitEvent>([&](const HitEvent&) { count++; });
            dispatcher.dispatch(HitEvent{});
        }
        dispatcher.dispatch(HitEvent{});
        REQUIRE(count == 1);
        REQUIRE(dispatcher.handler_count<HitEvent>() == 0);
    }

    SECTION("Moved connection stays subscribed") {
        EventDispatcher dispatcher;
        int count = 0;
        ScopedConnection kept;
        {
            auto conn = dispatcher.subscribe<HitEvent>([&](const HitEvent&) { count++; });
            kept = std::move(conn);
            REQUIRE_FALSE(conn.connected());
        }
        dispatcher.dispatch(HitEvent{});
        REQUIRE(count == 1);
        REQUIRE(kept.connected());
    }

    SECTION("Connection may outlive the dispatcher") {
        ScopedConnection conn;
        {
            auto dispatcher = std::make_unique<EventDispatcher>();
            conn = dispatcher->subscribe<HitEvent>([](const HitEvent&) {});
        }
        REQUIRE(conn.connected());
        conn.disconnect();
        REQUIRE_FALSE(conn.connected());
    }
}

TEST_CASE("EventDispatcher re-entrancy", "[core][events]") {
    EventDispatcher dispatcher;

    SECTION("Subscribing inside a handler does not see the current event") {
        int late_count = 0;
        ScopedConnection late;
        auto conn = dispatcher.subscribe<HitEvent>([&](const HitEvent&) {
            if (!late.connected()) {
                late = dispatcher.subscribe<HitEvent>([&](const HitEvent&) { late_count++; });
            }
        });

        dispatcher.dispatch(HitEvent{});
        REQUIRE(late_count == 0);

        dispatcher.dispatch(HitEvent{});
        REQUIRE(late_count == 1);
    }

    SECTION("Unsubscribing inside a handler takes effect on the next dispatch") {
        int second_count = 0;
        ScopedConnection second;
        auto first = dispatcher.subscribe<HitEvent>([&](const HitEvent&) {
            second.disconnect();
        });
        second = dispatcher.subscribe<HitEvent>([&](const HitEvent&) { second_count++; });

        dispatcher.dispatch(HitEvent{});
        REQUIRE(second_count == 1);

        dispatcher.dispatch(HitEvent{});
        REQUIRE(second_count == 1);
        REQUIRE(dispatcher.handler_count<HitEvent>() == 1);
    }

    SECTION("Nested dispatch of another type") {
        std::vector<std::string> notes;
        auto conn1 = dispatcher.subscribe<HitEvent>([&](const HitEvent& e) {
            dispatcher.dispatch(NoteEvent{"hit " + std::to_string(e.target)});
        });
        auto conn2 = dispatcher.subscribe<NoteEvent>([&](const NoteEvent& e) {
            notes.push_back(e.text);
        });

        dispatcher.dispatch(HitEvent{3});
        REQUIRE(notes == std::vector<std::string>{"hit 3"});
    }
}

TEST_CASE("EventDispatcher deferred queue", "[core][events]") {
    EventDispatcher dispatcher;
    std::vector<int> targets;
    auto conn = dispatcher.subscribe<HitEvent>([&](const HitEvent& e) {
        targets.push_back(e.target);
    });

    SECTION("Queued events wait for flush") {
        dispatcher.queue(HitEvent{1});
        dispatcher.queue(HitEvent{2});
        REQUIRE(targets.empty());
        REQUIRE(dispatcher.queued_event_count() == 2);

        dispatcher.flush();
        REQUIRE(targets == std::vector<int>{1, 2});
        REQUIRE_FALSE(dispatcher.has_queued_events());
    }

    SECTION("Events queued during a flush run on the next flush") {
        auto requeue = dispatcher.subscribe<NoteEvent>([&](const NoteEvent&) {
            dispatcher.queue(HitEvent{9});
        });

        dispatcher.queue(NoteEvent{});
        dispatcher.flush();
        REQUIRE(targets.empty());
        REQUIRE(dispatcher.queued_event_count() == 1);

        dispatcher.flush();
        REQUIRE(targets == std::vector<int>{9});
    }

    SECTION("clear_queue drops pending events") {
        dispatcher.queue(HitEvent{1});
        dispatcher.clear_queue();
        dispatcher.flush();
        REQUIRE(targets.empty());
    }
}

TEST_CASE("EventDispatcher handler bookkeeping", "[core][events]") {
    EventDispatcher dispatcher;

    auto conn1 = dispatcher.subscribe<HitEvent>([](const HitEvent&) {});
    auto conn2 = dispatcher.subscribe<HitEvent>([](const HitEvent&) {});
    auto conn3 = dispatcher.subscribe<NoteEvent>([](const NoteEvent&) {});

    REQUIRE(dispatcher.handler_count<HitEvent>() == 2);
    REQUIRE(dispatcher.handler_count<NoteEvent>() == 1);

    conn1.disconnect();
    REQUIRE(dispatcher.handler_count<HitEvent>() == 1);

    dispatcher.clear_all_handlers();
    REQUIRE(dispatcher.handler_count<HitEvent>() == 0);
    REQUIRE(dispatcher.handler_count<NoteEvent>() == 0);

    // Disconnecting after a clear is harmless
    conn2.disconnect();
    REQUIRE_FALSE(conn2.connected());
}
