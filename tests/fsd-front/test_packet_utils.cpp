// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include "frontend/fsd_server/connection/fsd_connection.hpp"
#include "frontend/fsd_server/packet/packet_utils.hpp"
#include "frontend/fsd_server/protocol_const.hpp"

#include <catch2/catch.hpp>

#include <algorithm>

using namespace frontend::fsd;

TEST_CASE("fsd::packet_utils::generate_token") {
    auto token = generate_token(TOKEN_LENGTH);

    REQUIRE(token.size() == 22);
    REQUIRE(std::all_of(token.begin(), token.end(), [](char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
    }));
    REQUIRE(generate_token(TOKEN_LENGTH) != generate_token(TOKEN_LENGTH));
}

TEST_CASE("fsd::packet_utils::builders") {
    SECTION("server identification") {
        auto line = format(build_server_ident("0123456789abcdef012345"));
        REQUIRE(line == "$DISERVER:CLIENT:VATSIM FSD V3.13:0123456789abcdef012345\r\n");
    }

    SECTION("errors use three digit codes") {
        REQUIRE(format(build_error("AAL123", fsd_error::INVALID_CREDENTIALS, "", error_text::INVALID_CREDENTIALS)) ==
                "$ERserver:AAL123:003::Invalid credentials\r\n");
        REQUIRE(format(build_error("AAL123", fsd_error::NO_FLIGHTPLAN, "AAL123", error_text::NO_FLIGHTPLAN)) ==
                "$ERserver:AAL123:008:AAL123:No flightplan\r\n");
        REQUIRE(error_code_string(fsd_error::UNAUTHORIZED_SOFTWARE) == "016");
    }

    SECTION("admission rejection") {
        REQUIRE(fsd_connection::build_too_many_connections_error() ==
                "$ERserver:unknown:012::Too many clients connected\r\n");
    }

    SECTION("heartbeat") { REQUIRE(format(build_heartbeat()) == "#DLSERVER:*:0:0\r\n"); }

    SECTION("flight plan acknowledgment") {
        REQUIRE(format(build_flight_plan_ack("AAL123", "BAW456")) == "#PCserver:AAL123:CCP:BC:BAW456:0\r\n");
    }
}

TEST_CASE("fsd::packet_utils::unescape_message_text") {
    REQUIRE(unescape_message_text({"Hello there"}) == "Hello there");
    REQUIRE(unescape_message_text({"Hello", "", "World"}) == "Hello:World");
    REQUIRE(unescape_message_text({"ratio 1", "2"}) == "ratio 1:2");
    REQUIRE(unescape_message_text({}).empty());
}
