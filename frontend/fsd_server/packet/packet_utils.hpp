// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include "../fsd_defs/error.hpp"
#include "packet.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace frontend::fsd {
    // Lowercase hexadecimal correlation token.
    std::string generate_token(size_t length);

    packet make_packet(packet_type type,
                       std::string_view command,
                       std::string_view source,
                       std::string_view destination,
                       std::vector<std::string> data = {});

    // $DISERVER:CLIENT:(protocol version):(token)
    packet build_server_ident(std::string token);

    // $ERserver:(callsign):(code):(param):(text)
    packet build_error(std::string_view destination, fsd_error code, std::string_view param, std::string_view text);

    packet build_text_message(std::string_view source, std::string_view destination, std::string_view text);

    // #DLSERVER:*:0:0
    packet build_heartbeat();

    // #PCserver:(callsign):CCP:BC:(flightplan callsign):0
    packet build_flight_plan_ack(std::string_view destination, std::string_view flight_plan_callsign);

    // Message text is everything after the destination; "::" inside it stands for one literal ':'.
    std::string unescape_message_text(const std::vector<std::string>& fields);
} // namespace frontend::fsd
