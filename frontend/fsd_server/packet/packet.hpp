// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include "../fsd_defs/packet_type.hpp"

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace frontend::fsd {
    enum class packet_error_kind : uint8_t
    {
        INVALID_FORMAT,
        MISSING_FIELD,
    };

    class packet_error : public std::runtime_error {
    public:
        packet_error(packet_error_kind kind, const std::string& what)
            : std::runtime_error(what)
            , kind_(kind) {}

        packet_error_kind kind() const noexcept { return kind_; }

    private:
        packet_error_kind kind_;
    };

    // One protocol line. Which identifier comes first on the wire depends on the command:
    //   DI               command+destination:source
    //   position updates command+destination (source is the sending connection)
    //   everything else  command+source:destination
    struct packet {
        packet_type type = packet_type::REQUEST;
        std::string command;
        std::string source;
        std::string destination;
        std::vector<std::string> data;

        bool operator==(const packet&) const = default;

        // Wire form without the line terminator, for logging.
        std::string to_string() const;
    };

    // Throws packet_error on malformed input.
    packet parse(std::string_view line);

    // Always terminated with "\r\n".
    std::string format(const packet& pkt);
} // namespace frontend::fsd
