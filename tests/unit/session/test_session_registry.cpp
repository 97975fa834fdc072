// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include "mock/fsd_fixture.hpp"

#include "session/session_registry.hpp"

#include <catch2/catch.hpp>

#include <thread>
#include <vector>

using registry::client_state;
using registry::session_registry;

TEST_CASE("session_registry: register and get") {
    session_registry reg;
    auto id = test::endpoint(5001);

    auto s = reg.register_session(id);
    REQUIRE(s.id == id);
    REQUIRE(s.state == client_state::CONNECTED);
    REQUIRE_FALSE(s.callsign.has_value());
    REQUIRE_FALSE(s.type.has_value());
    REQUIRE(reg.size() == 1);

    // registering again keeps the existing session
    reg.mutate(id, [](registry::session& s) { s.state = client_state::IDENTIFIED; });
    REQUIRE(reg.register_session(id).state == client_state::IDENTIFIED);
    REQUIRE(reg.size() == 1);

    REQUIRE_FALSE(reg.get(test::endpoint(5002)).has_value());
}

TEST_CASE("session_registry: mutate") {
    session_registry reg;
    auto id = test::endpoint(5001);
    reg.register_session(id);

    REQUIRE(reg.mutate(id, [](registry::session& s) {
        s.callsign = "AAL123";
        s.state = client_state::ACTIVE;
    }));
    REQUIRE(reg.get(id)->callsign == "AAL123");
    REQUIRE(reg.get(id)->is_active());

    SECTION("vanished session is a no-op") {
        reg.remove(id);
        bool called = false;
        REQUIRE_FALSE(reg.mutate(id, [&called](registry::session&) { called = true; }));
        REQUIRE_FALSE(called);
    }
}

TEST_CASE("session_registry: callsign index") {
    session_registry reg;
    auto a = test::endpoint(5001);
    auto b = test::endpoint(5002);
    reg.register_session(a);
    reg.register_session(b);

    REQUIRE(reg.index_callsign("AAL123", a));
    REQUIRE(reg.index_callsign("BAW456", b));
    REQUIRE(reg.resolve_callsign("AAL123") == a);
    REQUIRE(reg.find_by_callsign("BAW456")->id == b);
    REQUIRE(reg.indexed_callsigns() == 2);

    SECTION("index needs a session") {
        REQUIRE_FALSE(reg.index_callsign("DLH789", test::endpoint(5003)));
        REQUIRE_FALSE(reg.resolve_callsign("DLH789").has_value());
    }

    SECTION("unindex") {
        REQUIRE(reg.unindex_callsign("AAL123"));
        REQUIRE_FALSE(reg.unindex_callsign("AAL123"));
        REQUIRE_FALSE(reg.resolve_callsign("AAL123").has_value());
        REQUIRE(reg.get(a).has_value());
    }

    SECTION("remove drops every callsign of the connection") {
        REQUIRE(reg.index_callsign("AAL123_2", a));
        REQUIRE(reg.remove(a));

        REQUIRE_FALSE(reg.resolve_callsign("AAL123").has_value());
        REQUIRE_FALSE(reg.resolve_callsign("AAL123_2").has_value());
        REQUIRE(reg.resolve_callsign("BAW456") == b);
        REQUIRE(reg.indexed_callsigns() == 1);
    }

    SECTION("callsign moves to the newest connection") {
        REQUIRE(reg.index_callsign("AAL123", b));
        REQUIRE(reg.resolve_callsign("AAL123") == b);
        reg.remove(a);
        REQUIRE(reg.resolve_callsign("AAL123") == b);
    }
}

TEST_CASE("session_registry: find_by_callsign before login") {
    session_registry reg;
    auto a = test::endpoint(5001);
    auto b = test::endpoint(5002);
    reg.register_session(a);
    reg.register_session(b);

    // identified: callsign recorded, not indexed
    REQUIRE(reg.mutate(b, [](registry::session& s) { s.callsign = "BAW456"; }));
    REQUIRE_FALSE(reg.resolve_callsign("BAW456").has_value());

    auto found = reg.find_by_callsign("BAW456");
    REQUIRE(found.has_value());
    REQUIRE(found->id == b);
    REQUIRE_FALSE(reg.find_by_callsign("AAL123").has_value());

    reg.remove(b);
    REQUIRE_FALSE(reg.find_by_callsign("BAW456").has_value());
}

TEST_CASE("session_registry: removing a connection that never logged in") {
    session_registry reg;
    auto a = test::endpoint(5001);
    auto b = test::endpoint(5002);
    reg.register_session(a);
    reg.register_session(b);
    reg.index_callsign("BAW456", b);

    REQUIRE_NOTHROW(reg.remove(a));
    REQUIRE(reg.size() == 1);
    REQUIRE(reg.resolve_callsign("BAW456") == b);
    REQUIRE(reg.indexed_callsigns() == 1);

    SECTION("twice") { REQUIRE_FALSE(reg.remove(a)); }

    SECTION("never registered") { REQUIRE_FALSE(reg.remove(test::endpoint(5099))); }
}

TEST_CASE("session_registry: concurrent access") {
    session_registry reg;
    constexpr uint16_t clients = 8;
    constexpr int rounds = 200;

    std::vector<std::thread> threads;
    for (uint16_t i = 0; i < clients; ++i) {
        threads.emplace_back([&reg, i]() {
            auto id = test::endpoint(6000 + i);
            auto callsign = "CS" + std::to_string(i);
            for (int r = 0; r < rounds; ++r) {
                reg.register_session(id);
                reg.mutate(id, [&callsign](registry::session& s) {
                    s.callsign = callsign;
                    s.state = client_state::ACTIVE;
                });
                reg.index_callsign(callsign, id);
                reg.resolve_callsign(callsign);
                reg.remove(id);
            }
            reg.register_session(id);
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    REQUIRE(reg.size() == clients);
    REQUIRE(reg.indexed_callsigns() == 0);
}
