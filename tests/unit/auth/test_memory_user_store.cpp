// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include "auth/memory_user_store.hpp"

#include <catch2/catch.hpp>

using namespace auth;

TEST_CASE("auth::parse_user_entry") {
    SECTION("full entry") {
        auto user = parse_user_entry("1234567:secret:John Doe:5:3");
        REQUIRE(user.network_id == "1234567");
        REQUIRE(user.password == "secret");
        REQUIRE(user.record.real_name == "John Doe");
        REQUIRE(user.record.atc_rating == 5);
        REQUIRE(user.record.pilot_rating == 3);
    }

    SECTION("ratings default to one") {
        auto user = parse_user_entry("1234567:secret:John Doe");
        REQUIRE(user.record.atc_rating == 1);
        REQUIRE(user.record.pilot_rating == 1);
    }

    SECTION("malformed") {
        REQUIRE_THROWS_AS(parse_user_entry("1234567:secret"), std::invalid_argument);
        REQUIRE_THROWS_AS(parse_user_entry(":secret:John"), std::invalid_argument);
        REQUIRE_THROWS_AS(parse_user_entry("1234567:secret:John:x"), std::invalid_argument);
    }
}

TEST_CASE("auth::memory_user_store") {
    memory_user_store store;
    store.load({"69d7"}, {"1234567:secret:John Doe:5:3"});
    REQUIRE(store.user_count() == 1);

    SECTION("whitelist") {
        REQUIRE(store.is_allowed("69d7"));
        REQUIRE_FALSE(store.is_allowed("beef"));
        REQUIRE_FALSE(store.is_allowed(""));
    }

    SECTION("authenticate") {
        auto record = store.authenticate("1234567", "secret");
        REQUIRE(record.real_name == "John Doe");
        REQUIRE(record.atc_rating == 5);
        REQUIRE(record.pilot_rating == 3);
    }

    SECTION("failures") {
        auto failure_of = [&store](std::string_view id, std::string_view password) {
            try {
                store.authenticate(id, password);
            } catch (const auth_error& e) {
                return e.failure();
            }
            FAIL("expected auth_error");
            return auth_failure::OTHER;
        };

        REQUIRE(failure_of("9999999", "secret") == auth_failure::USER_NOT_FOUND);
        REQUIRE(failure_of("1234567", "guess") == auth_failure::INVALID_CREDENTIALS);
    }

    SECTION("added users can log in") {
        store.add_user(parse_user_entry("7654321:hunter2:Jane Roe"));
        REQUIRE(store.user_count() == 2);
        REQUIRE(store.authenticate("7654321", "hunter2").real_name == "Jane Roe");
    }
}
