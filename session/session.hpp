// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 OtterStax

#pragma once

#include "utility/connection_uid.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace registry {
    // CONNECTED -> IDENTIFIED -> ACTIVE -> DISCONNECTED (terminal)
    enum class client_state : uint8_t
    {
        CONNECTED,
        IDENTIFIED,
        ACTIVE,
        DISCONNECTED,
    };

    enum class client_type : uint8_t
    {
        PILOT,
        ATC,
        OBSERVER,
    };

    struct position {
        double latitude = 0.0;
        double longitude = 0.0;
        int32_t altitude = 0;
    };

    // Protocol state of one live connection, keyed by the connection's remote endpoint.
    struct session {
        explicit session(connection_id id)
            : id(std::move(id)) {}

        connection_id id;
        std::optional<std::string> callsign;
        client_state state = client_state::CONNECTED;
        std::optional<client_type> type;
        std::optional<std::string> real_name;
        std::optional<std::string> network_id;
        std::optional<int32_t> rating;
        std::optional<std::string> client_string;
        std::optional<position> last_position;

        bool is_active() const noexcept { return state == client_state::ACTIVE; }
    };

    inline const char* to_string(client_state state) {
        switch (state) {
            case client_state::CONNECTED:
                return "CONNECTED";
            case client_state::IDENTIFIED:
                return "IDENTIFIED";
            case client_state::ACTIVE:
                return "ACTIVE";
            case client_state::DISCONNECTED:
                return "DISCONNECTED";
        }
        return "UNKNOWN";
    }
} // namespace registry
