/// @file test_emitter.cpp
/// @brief Tests for EventEmitter registration and delivery

#include <catch2/catch_test_macros.hpp>
#include <ember/event/event.hpp>

#include "support/recording_host.hpp"
#include "support/test_emitter.hpp"

#include <vector>

using namespace ember_event;
using ember_test::Delivery;
using ember_test::RecordingHost;
using ember_test::TestEmitter;

TEST_CASE("EventEmitter: lazy initialization", "[event][emitter]") {
    RecordingHost host;
    TestEmitter emitter(host);

    REQUIRE_FALSE(emitter.handlers_initialized());

    SECTION("emit before any registration is a no-op") {
        emitter.emit(TestEmitter::EVENT_ONE);
        REQUIRE_FALSE(emitter.handlers_initialized());
        REQUIRE(host.deliveries.empty());
    }

    SECTION("unregister before any registration is a no-op") {
        auto h = host.create();
        emitter.unregister_handler(TestEmitter::EVENT_ONE, h, "_OnEvent");
        emitter.unregister_handler(h);
        REQUIRE_FALSE(emitter.handlers_initialized());
    }

    SECTION("first registration allocates every slot") {
        auto h = host.create();
        emitter.register_handler(TestEmitter::EVENT_TWO, h, "_OnEvent");
        REQUIRE(emitter.handlers_initialized());
        REQUIRE(emitter.handler_count(TestEmitter::EVENT_ONE) == 0);
        REQUIRE(emitter.handler_count(TestEmitter::EVENT_TWO) == 1);
    }
}

TEST_CASE("EventEmitter: register, emit, unregister", "[event][emitter]") {
    RecordingHost host;
    TestEmitter emitter(host);
    auto h = host.create();

    emitter.register_handler(TestEmitter::EVENT_ONE, h, "_OnEvent");

    emitter.emit(TestEmitter::EVENT_ONE);
    REQUIRE(host.deliveries == std::vector<Delivery>{{h, "_OnEvent"}});

    emitter.emit(TestEmitter::EVENT_TWO);
    REQUIRE(host.deliveries.size() == 1);

    emitter.unregister_handler(TestEmitter::EVENT_ONE, h, "_OnEvent");
    emitter.emit(TestEmitter::EVENT_ONE);
    REQUIRE(host.deliveries.size() == 1);
    REQUIRE(emitter.handler_count(TestEmitter::EVENT_ONE) == 0);
}

TEST_CASE("EventEmitter: same handler under two names fires both in order", "[event][emitter]") {
    RecordingHost host;
    TestEmitter emitter(host);
    auto h = host.create();

    emitter.register_handler(TestEmitter::EVENT_ONE, h, "_A");
    emitter.register_handler(TestEmitter::EVENT_ONE, h, "_B");

    emitter.emit(TestEmitter::EVENT_ONE);

    REQUIRE(host.deliveries == std::vector<Delivery>{{h, "_A"}, {h, "_B"}});
}

TEST_CASE("EventEmitter: delivery follows registration order across handlers", "[event][emitter]") {
    RecordingHost host;
    TestEmitter emitter(host);
    auto a = host.create();
    auto b = host.create();
    auto c = host.create();

    emitter.register_handler(TestEmitter::EVENT_ONE, b, "_OnB");
    emitter.register_handler(TestEmitter::EVENT_ONE, a, "_OnA");
    emitter.register_handler(TestEmitter::EVENT_ONE, c, "_OnC");

    emitter.emit(TestEmitter::EVENT_ONE);

    REQUIRE(host.deliveries == std::vector<Delivery>{{b, "_OnB"}, {a, "_OnA"}, {c, "_OnC"}});
}

TEST_CASE("EventEmitter: duplicate registrations each fire", "[event][emitter]") {
    RecordingHost host;
    TestEmitter emitter(host);
    auto h = host.create();

    emitter.register_handler(TestEmitter::EVENT_ONE, h, "_OnEvent");
    emitter.register_handler(TestEmitter::EVENT_ONE, h, "_OnEvent");

    emitter.emit(TestEmitter::EVENT_ONE);
    REQUIRE(host.count(h, "_OnEvent") == 2);
}

TEST_CASE("EventEmitter: per-slot unregister removes exactly one entry", "[event][emitter]") {
    RecordingHost host;
    TestEmitter emitter(host);
    auto h = host.create();
    auto other = host.create();

    SECTION("matching name is found past earlier entries of the same handler") {
        emitter.register_handler(TestEmitter::EVENT_ONE, h, "_A");
        emitter.register_handler(TestEmitter::EVENT_ONE, other, "_B");
        emitter.register_handler(TestEmitter::EVENT_ONE, h, "_B");
        emitter.register_handler(TestEmitter::EVENT_ONE, h, "_C");

        emitter.unregister_handler(TestEmitter::EVENT_ONE, h, "_B");

        REQUIRE(emitter.subscriptions(TestEmitter::EVENT_ONE) == std::vector<Subscription>{
            {h, "_A"}, {other, "_B"}, {h, "_C"}});
    }

    SECTION("twice under the same name removes only the first") {
        emitter.register_handler(TestEmitter::EVENT_ONE, h, "_A");
        emitter.register_handler(TestEmitter::EVENT_ONE, other, "_X");
        emitter.register_handler(TestEmitter::EVENT_ONE, h, "_A");

        emitter.unregister_handler(TestEmitter::EVENT_ONE, h, "_A");

        REQUIRE(emitter.subscriptions(TestEmitter::EVENT_ONE) == std::vector<Subscription>{
            {other, "_X"}, {h, "_A"}});

        emitter.emit(TestEmitter::EVENT_ONE);
        REQUIRE(host.count(h, "_A") == 1);
    }

    SECTION("last entry of the slot can be removed") {
        emitter.register_handler(TestEmitter::EVENT_ONE, h, "_A");
        emitter.register_handler(TestEmitter::EVENT_ONE, h, "_B");

        emitter.unregister_handler(TestEmitter::EVENT_ONE, h, "_B");

        REQUIRE(emitter.subscriptions(TestEmitter::EVENT_ONE) == std::vector<Subscription>{{h, "_A"}});
    }

    SECTION("no matching name leaves the slot untouched") {
        emitter.register_handler(TestEmitter::EVENT_ONE, h, "_A");
        emitter.register_handler(TestEmitter::EVENT_ONE, h, "_B");

        emitter.unregister_handler(TestEmitter::EVENT_ONE, h, "_Missing");
        emitter.unregister_handler(TestEmitter::EVENT_ONE, other, "_A");

        REQUIRE(emitter.handler_count(TestEmitter::EVENT_ONE) == 2);
    }

    SECTION("other slots are untouched") {
        emitter.register_handler(TestEmitter::EVENT_ONE, h, "_A");
        emitter.register_handler(TestEmitter::EVENT_TWO, h, "_A");

        emitter.unregister_handler(TestEmitter::EVENT_ONE, h, "_A");

        REQUIRE(emitter.handler_count(TestEmitter::EVENT_ONE) == 0);
        REQUIRE(emitter.handler_count(TestEmitter::EVENT_TWO) == 1);
    }
}

TEST_CASE("EventEmitter: register then unregister restores the slot", "[event][emitter]") {
    RecordingHost host;
    TestEmitter emitter(host);
    auto a = host.create();
    auto b = host.create();

    emitter.register_handler(TestEmitter::EVENT_ONE, a, "_A");
    emitter.register_handler(TestEmitter::EVENT_ONE, b, "_B");
    const auto before = emitter.subscriptions(TestEmitter::EVENT_ONE);

    emitter.register_handler(TestEmitter::EVENT_ONE, b, "_Extra");
    emitter.unregister_handler(TestEmitter::EVENT_ONE, b, "_Extra");

    REQUIRE(emitter.subscriptions(TestEmitter::EVENT_ONE) == before);
}

TEST_CASE("EventEmitter: bulk unregister", "[event][emitter]") {
    RecordingHost host;
    TestEmitter emitter(host);
    auto h = host.create();
    auto other = host.create();

    emitter.register_handler(TestEmitter::EVENT_ONE, h, "_A");
    emitter.register_handler(TestEmitter::EVENT_ONE, other, "_X");
    emitter.register_handler(TestEmitter::EVENT_ONE, h, "_B");
    emitter.register_handler(TestEmitter::EVENT_TWO, other, "_Y");
    emitter.register_handler(TestEmitter::EVENT_TWO, h, "_C");

    SECTION("removes every entry of the handler and keeps the rest in order") {
        emitter.unregister_handler(h);

        REQUIRE(emitter.subscriptions(TestEmitter::EVENT_ONE) == std::vector<Subscription>{{other, "_X"}});
        REQUIRE(emitter.subscriptions(TestEmitter::EVENT_TWO) == std::vector<Subscription>{{other, "_Y"}});

        emitter.emit(TestEmitter::EVENT_ONE);
        emitter.emit(TestEmitter::EVENT_TWO);
        REQUIRE(host.deliveries == std::vector<Delivery>{{other, "_X"}, {other, "_Y"}});
    }

    SECTION("accepts a handler that is no longer alive") {
        host.destroy(h);
        emitter.unregister_handler(h);

        REQUIRE(emitter.handler_count(TestEmitter::EVENT_ONE) == 1);
        REQUIRE(emitter.handler_count(TestEmitter::EVENT_TWO) == 1);
    }

    SECTION("unknown handler leaves everything untouched") {
        auto stranger = host.create();
        emitter.unregister_handler(stranger);

        REQUIRE(emitter.handler_count(TestEmitter::EVENT_ONE) == 3);
        REQUIRE(emitter.handler_count(TestEmitter::EVENT_TWO) == 2);
    }
}

TEST_CASE("EventEmitter: stale handlers", "[event][emitter]") {
    RecordingHost host;
    TestEmitter emitter(host);
    auto first = host.create();
    auto stale = host.create();
    auto last = host.create();

    emitter.register_handler(TestEmitter::EVENT_ONE, first, "_First");
    emitter.register_handler(TestEmitter::EVENT_ONE, stale, "_Stale");
    emitter.register_handler(TestEmitter::EVENT_ONE, last, "_Last");
    emitter.register_handler(TestEmitter::EVENT_TWO, stale, "_Other");

    host.destroy(stale);

    SECTION("skipped during emit without stopping the broadcast") {
        emitter.emit(TestEmitter::EVENT_ONE);

        REQUIRE(host.deliveries == std::vector<Delivery>{{first, "_First"}, {last, "_Last"}});
        // not pruned by the broadcast itself
        REQUIRE(emitter.handler_count(TestEmitter::EVENT_ONE) == 3);
    }

    SECTION("pruned from every slot by the sweep") {
        emitter.sweep();

        REQUIRE(emitter.subscriptions(TestEmitter::EVENT_ONE) == std::vector<Subscription>{
            {first, "_First"}, {last, "_Last"}});
        REQUIRE(emitter.handler_count(TestEmitter::EVENT_TWO) == 0);
    }

    SECTION("pruned by the next registration") {
        auto fresh = host.create();
        emitter.register_handler(TestEmitter::EVENT_TWO, fresh, "_Fresh");

        REQUIRE(emitter.subscriptions(TestEmitter::EVENT_ONE) == std::vector<Subscription>{
            {first, "_First"}, {last, "_Last"}});
        REQUIRE(emitter.subscriptions(TestEmitter::EVENT_TWO) == std::vector<Subscription>{{fresh, "_Fresh"}});
    }

    SECTION("pruned by a per-slot unregister so names stay aligned") {
        emitter.unregister_handler(TestEmitter::EVENT_ONE, last, "_Last");

        REQUIRE(emitter.subscriptions(TestEmitter::EVENT_ONE) == std::vector<Subscription>{{first, "_First"}});
    }
}

TEST_CASE("EventEmitter: invalid input is ignored", "[event][emitter]") {
    RecordingHost host;
    TestEmitter emitter(host);
    auto h = host.create();

    SECTION("out of range slots") {
        emitter.register_handler(-1, h, "_A");
        emitter.register_handler(TestEmitter::EVENT_COUNT, h, "_A");
        REQUIRE(emitter.handler_count(TestEmitter::EVENT_ONE) == 0);
        REQUIRE(emitter.handler_count(TestEmitter::EVENT_TWO) == 0);

        emitter.emit(-1);
        emitter.emit(TestEmitter::EVENT_COUNT);
        REQUIRE(host.deliveries.empty());
    }

    SECTION("empty callback name") {
        emitter.register_handler(TestEmitter::EVENT_ONE, h, "");
        REQUIRE(emitter.handler_count(TestEmitter::EVENT_ONE) == 0);
    }

    SECTION("null and destroyed handlers") {
        emitter.register_handler(TestEmitter::EVENT_ONE, HandlerRef::null(), "_A");

        auto gone = host.create();
        host.destroy(gone);
        emitter.register_handler(TestEmitter::EVENT_ONE, gone, "_A");

        REQUIRE(emitter.handler_count(TestEmitter::EVENT_ONE) == 0);
    }

    SECTION("malformed per-slot unregister keeps the registration") {
        emitter.register_handler(TestEmitter::EVENT_ONE, h, "_A");

        emitter.unregister_handler(TestEmitter::EVENT_ONE, HandlerRef::null(), "_A");
        emitter.unregister_handler(TestEmitter::EVENT_COUNT, h, "_A");
        emitter.unregister_handler(TestEmitter::EVENT_ONE, h, "");
        emitter.unregister_handler(HandlerRef::null());

        REQUIRE(emitter.handler_count(TestEmitter::EVENT_ONE) == 1);
    }
}

TEST_CASE("EventEmitter: zero and negative event counts", "[event][emitter]") {
    RecordingHost host;
    auto h = host.create();

    SECTION("zero slots rejects every registration") {
        TestEmitter emitter(host, 0);
        emitter.register_handler(0, h, "_A");
        REQUIRE(emitter.handlers_initialized());
        REQUIRE(emitter.handler_count(0) == 0);
    }

    SECTION("negative count behaves like zero") {
        TestEmitter emitter(host, -3);
        emitter.register_handler(0, h, "_A");
        emitter.emit(0);
        REQUIRE(host.deliveries.empty());
    }
}

TEST_CASE("EventEmitter: inspection of unknown slots", "[event][emitter]") {
    RecordingHost host;
    TestEmitter emitter(host);
    emitter.register_handler(TestEmitter::EVENT_ONE, host.create(), "_A");

    REQUIRE(emitter.handler_count(-1) == 0);
    REQUIRE(emitter.handler_count(TestEmitter::EVENT_COUNT) == 0);
    REQUIRE(emitter.subscriptions(TestEmitter::EVENT_COUNT).empty());
    REQUIRE(emitter.emitter_name() == "test_emitter");
}
