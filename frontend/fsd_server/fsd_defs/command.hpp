// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include <array>
#include <string_view>

namespace frontend::fsd {
    struct fsd_command {
        static constexpr std::string_view SERVER_IDENT = "DI";
        static constexpr std::string_view CLIENT_IDENT = "ID";
        static constexpr std::string_view ADD_ATC = "AA";
        static constexpr std::string_view ADD_PILOT = "AP";
        static constexpr std::string_view DELETE_ATC = "DA";
        static constexpr std::string_view DELETE_PILOT = "DP";
        static constexpr std::string_view TEXT_MESSAGE = "TM";
        static constexpr std::string_view CLIENT_QUERY = "CQ";
        static constexpr std::string_view CLIENT_RESPONSE = "CR";
        static constexpr std::string_view FLIGHT_PLAN = "FP";
        static constexpr std::string_view METAR_REQUEST = "AX";
        static constexpr std::string_view METAR_RESPONSE = "AR";
        static constexpr std::string_view ERROR = "ER";
        static constexpr std::string_view PRO_CONTROLLER = "PC";
        static constexpr std::string_view HEARTBEAT = "DL";
        static constexpr std::string_view POSITION_NORMAL = "N";
        static constexpr std::string_view POSITION_STANDBY = "S";
        static constexpr std::string_view POSITION_IDENT = "Y";
    };

    // Matched before the single letter mnemonics.
    inline constexpr std::array<std::string_view, 11> TWO_LETTER_COMMANDS =
        {"DI", "ID", "TM", "AA", "AP", "DA", "DP", "CQ", "CR", "FP", "NV"};

    inline constexpr std::array<std::string_view, 5> ONE_LETTER_COMMANDS = {"N", "S", "Y", "C", "R"};

    // Sub-types carried in data[0] of a $CQ request.
    struct query_type {
        static constexpr std::string_view CAPS = "CAPS";
        static constexpr std::string_view ATIS = "ATIS";
        static constexpr std::string_view REAL_NAME = "RN";
        static constexpr std::string_view SYSTEM_INFO = "INF";
        static constexpr std::string_view AIRCRAFT_CONFIG = "ACC";
        static constexpr std::string_view IP = "IP";
    };
} // namespace frontend::fsd
