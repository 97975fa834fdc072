// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace frontend::fsd {
    constexpr char FIELD_DELIMITER = ':';
    constexpr std::string_view LINE_TERMINATOR = "\r\n";
    constexpr std::string_view ESCAPED_DELIMITER = "::";

    constexpr std::string_view PROTOCOL_VERSION = "VATSIM FSD V3.13";
    constexpr size_t TOKEN_LENGTH = 22;

    constexpr std::string_view SERVER_IDENT = "SERVER";
    constexpr std::string_view SERVER_SOURCE = "server";
    constexpr std::string_view CLIENT_PLACEHOLDER = "CLIENT";
    constexpr std::string_view BROADCAST_DESTINATION = "*";
    constexpr std::string_view SYSTEM_INFO_DESTINATION = "DATA";
    constexpr std::string_view UNKNOWN_CALLSIGN = "unknown";

    // Pilot update field positions, counted in the parsed data fields.
    constexpr size_t SQUAWK_FIELD = 1;
    constexpr size_t LATITUDE_FIELD = 3;
    constexpr size_t LONGITUDE_FIELD = 4;
    constexpr size_t ALTITUDE_FIELD = 5;
    constexpr std::string_view EMERGENCY_SQUAWK = "7500";

    // $ID(callsign):SERVER:(client id):(client string):3:2:(network id):(num)
    constexpr size_t IDENT_CLIENT_ID_FIELD = 0;
    constexpr size_t IDENT_CLIENT_STRING_FIELD = 1;
    constexpr size_t IDENT_NETWORK_ID_FIELD = 4;

    constexpr std::array<std::string_view, 7> WELCOME_LINES = {
        "By using your assigned identification number on this server you",
        "hereby agree to the terms of the network Code of Regulations and the",
        "network User Agreement and the network Code of Conduct.",
        "All logins are tracked and identification numbers are recorded.",
        "Users must enter their real full first names and surnames when logging",
        "onto any of the network servers.",
        "Have a safe flight.",
    };

    constexpr std::string_view ATC_CAPABILITIES = "CAPS:ATCINFO=1:SECPOS=1:MODELDESC=1:ONGOINGCOORD=1";

    constexpr std::string_view ATIS_VOICE_SERVER = "voice.fsd.local/atis";
    constexpr std::array<std::string_view, 9> ATIS_LINES = {
        "London Heathrow ATIS Information Alpha",
        "Runway 27L in use for landing",
        "Runway 27R in use for departure",
        "Wind 270 at 8 knots",
        "Visibility 10km",
        "Cloud scattered at 4000ft",
        "Temperature 15 Celsius",
        "QNH 1013",
        "Advise on first contact you have information Alpha",
    };

    constexpr std::string_view METAR_BODY = "AUTO 09008KT 9999 FEW040 BKN100 15/08 Q1013 NOSIG";
    constexpr size_t METAR_MIN_FIELDS = 2;
    constexpr size_t METAR_STATION_FIELD = 1;

    constexpr std::string_view INF_SYS_UID = "-123456789";
    constexpr std::string_view INF_PILOT_SIMULATOR = "Prepar3dV3";
    // reported until the client sends its first position
    constexpr double INF_DEFAULT_LATITUDE = 51.5;
    constexpr double INF_DEFAULT_LONGITUDE = -0.1;
    constexpr int32_t INF_DEFAULT_ALTITUDE = 35000;

    constexpr std::string_view ACC_CONFIGURATION = R"({"config":{"is_full_data":true,)"
                                                   R"("lights":{"strobe_on":false,"landing_on":false,"taxi_on":true,)"
                                                   R"("beacon_on":true,"nav_on":true,"logo_on":false},)"
                                                   R"("engines":{"1":{"on":true},"2":{"on":true}},)"
                                                   R"("gear_down":false,"flaps_pct":0,"spoilers_out":false,)"
                                                   R"("on_ground":true}})";
} // namespace frontend::fsd
