// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include <cstdint>
#include <optional>

namespace frontend::fsd {
    // Categories are determined by the first character of a line.
    enum class packet_type : uint8_t
    {
        REQUEST,       // '$' requests and responses
        CLIENT,        // '#' client add/remove, text messages
        ATC_UPDATE,    // '%'
        PILOT_UPDATE,  // '@'
        IVAO_SPECIFIC, // '!'
        IVAO_DATA,     // '&'
        IVAO_OTHER,    // '-'
    };

    constexpr std::optional<packet_type> packet_type_from_prefix(char prefix) noexcept {
        switch (prefix) {
            case '$':
                return packet_type::REQUEST;
            case '#':
                return packet_type::CLIENT;
            case '%':
                return packet_type::ATC_UPDATE;
            case '@':
                return packet_type::PILOT_UPDATE;
            case '!':
                return packet_type::IVAO_SPECIFIC;
            case '&':
                return packet_type::IVAO_DATA;
            case '-':
                return packet_type::IVAO_OTHER;
            default:
                return std::nullopt;
        }
    }

    constexpr char packet_type_prefix(packet_type type) noexcept {
        switch (type) {
            case packet_type::REQUEST:
                return '$';
            case packet_type::CLIENT:
                return '#';
            case packet_type::ATC_UPDATE:
                return '%';
            case packet_type::PILOT_UPDATE:
                return '@';
            case packet_type::IVAO_SPECIFIC:
                return '!';
            case packet_type::IVAO_DATA:
                return '&';
            case packet_type::IVAO_OTHER:
                return '-';
        }
        return '$';
    }

    constexpr bool is_position_update(packet_type type) noexcept {
        return type == packet_type::ATC_UPDATE || type == packet_type::PILOT_UPDATE;
    }
} // namespace frontend::fsd
