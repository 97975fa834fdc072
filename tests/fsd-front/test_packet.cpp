// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include "frontend/fsd_server/packet/packet.hpp"

#include <catch2/catch.hpp>

using namespace frontend::fsd;

TEST_CASE("fsd::packet::parse server identification") {
    auto pkt = parse("$DISERVER:CLIENT:VATSIM FSD V3.13:TOKEN\r\n");

    REQUIRE(pkt.type == packet_type::REQUEST);
    REQUIRE(pkt.command == "DI");
    REQUIRE(pkt.destination == "SERVER");
    REQUIRE(pkt.source == "CLIENT");
    REQUIRE(pkt.data == std::vector<std::string>{"VATSIM FSD V3.13", "TOKEN"});
}

TEST_CASE("fsd::packet::parse text message") {
    auto pkt = parse("#TMUAX123:BAW456:Hello there\r\n");

    REQUIRE(pkt.type == packet_type::CLIENT);
    REQUIRE(pkt.command == "TM");
    REQUIRE(pkt.source == "UAX123");
    REQUIRE(pkt.destination == "BAW456");
    REQUIRE(pkt.data == std::vector<std::string>{"Hello there"});
}

TEST_CASE("fsd::packet::parse position update") {
    auto pkt = parse("@NUAX123:1200:1:45.5:-73.5:35000:450:123456789:50\r\n");

    REQUIRE(pkt.type == packet_type::PILOT_UPDATE);
    REQUIRE(pkt.command == "N");
    REQUIRE(pkt.destination == "UAX123");
    REQUIRE(pkt.source.empty());
    REQUIRE(pkt.data.size() == 7);
    REQUIRE(pkt.data.front() == "1");

    auto atc = parse("%EGLL_TWR:19400:4:100:1:51.47:-0.46:0\r\n");
    REQUIRE(atc.type == packet_type::ATC_UPDATE);
    REQUIRE(atc.destination == "LL_TWR");
    REQUIRE(atc.source.empty());
}

TEST_CASE("fsd::packet::parse client identification") {
    auto pkt = parse("$IDUAX123:SERVER:69d7:EuroScope 3.2:3:2:1234567:987654321\r\n");

    REQUIRE(pkt.command == "ID");
    REQUIRE(pkt.source == "UAX123");
    REQUIRE(pkt.destination == "SERVER");
    REQUIRE(pkt.data.size() == 6);
    REQUIRE(pkt.data[0] == "69d7");
    REQUIRE(pkt.data[4] == "1234567");
}

TEST_CASE("fsd::packet::parse command extraction") {
    SECTION("single letter mnemonic") {
        auto pkt = parse("$CAB:CD:x\r\n");
        REQUIRE(pkt.command == "C");
        REQUIRE(pkt.source == "AB");
    }

    SECTION("unknown mnemonic falls back to two characters") {
        auto pkt = parse("#XYUAX123:SERVER\r\n");
        REQUIRE(pkt.command == "XY");
        REQUIRE(pkt.source == "UAX123");
        REQUIRE(pkt.destination == "SERVER");
        REQUIRE(pkt.data.empty());
    }

    SECTION("two letter mnemonics win over single letters") {
        auto pkt = parse("$CRUAX123:BAW456:RN:John\r\n");
        REQUIRE(pkt.command == "CR");
    }
}

TEST_CASE("fsd::packet::parse line terminators") {
    REQUIRE(parse("#TMA:B:hi\n") == parse("#TMA:B:hi\r\n"));
    REQUIRE(parse("#TMA:B:hi") == parse("#TMA:B:hi\r\n"));
    REQUIRE(parse("  #TMA:B:hi  \r\n").data == std::vector<std::string>{"hi"});
}

TEST_CASE("fsd::packet::parse errors") {
    auto kind_of = [](std::string_view line) {
        try {
            parse(line);
        } catch (const packet_error& e) {
            return e.kind();
        }
        FAIL("expected packet_error for " << line);
        return packet_error_kind::INVALID_FORMAT;
    };

    REQUIRE(kind_of("") == packet_error_kind::INVALID_FORMAT);
    REQUIRE(kind_of("\r\n") == packet_error_kind::INVALID_FORMAT);
    REQUIRE(kind_of("*TMA:B:hi") == packet_error_kind::INVALID_FORMAT);
    REQUIRE(kind_of("$IDUAX123") == packet_error_kind::INVALID_FORMAT);
    REQUIRE(kind_of("$:SERVER:x") == packet_error_kind::MISSING_FIELD);
}

TEST_CASE("fsd::packet::format round trip") {
    auto line = GENERATE(as<std::string>{},
                         "#TMUAX123:BAW456:Hello there\r\n",
                         "$IDUAX123:SERVER:69d7:EuroScope 3.2:3:2:1234567:987654321\r\n",
                         "#AAEGLL_TWR:SERVER:John Doe:1234567:secret:5:100\r\n",
                         "#APUAX123:SERVER:1234567:secret:1:100:1:John Doe\r\n",
                         "$CQUAX123:BAW456:RN\r\n",
                         "$CRBAW456:UAX123:RN:John Doe::3\r\n",
                         "#DPUAX123:1234567\r\n",
                         "$FPUAX123:*A:I:B738:420:EGLL:1200:0:35000:KJFK:7:30:9:0:EGKK:remarks:DCT\r\n");

    REQUIRE(format(parse(line)) == line);
}

TEST_CASE("fsd::packet::format irregular field order") {
    SECTION("server identification puts the destination first") {
        packet pkt{
            .type = packet_type::REQUEST,
            .command = "DI",
            .source = "CLIENT",
            .destination = "SERVER",
            .data = {"VATSIM FSD V3.13", "abc"},
        };
        REQUIRE(format(pkt) == "$DISERVER:CLIENT:VATSIM FSD V3.13:abc\r\n");
        REQUIRE(parse(format(pkt)) == pkt);
    }

    SECTION("position updates carry no source") {
        auto pkt = parse("@NUAX123:1200:1:45.5:-73.5:35000\r\n");
        pkt.source = "ignored";
        REQUIRE(format(pkt) == "@NUAX123:1:45.5:-73.5:35000\r\n");
    }

    SECTION("no data fields") {
        packet pkt{.type = packet_type::CLIENT, .command = "DA", .source = "EGLL_TWR", .destination = "1234567"};
        REQUIRE(format(pkt) == "#DAEGLL_TWR:1234567\r\n");
        REQUIRE(pkt.to_string() == "#DAEGLL_TWR:1234567");
    }
}
