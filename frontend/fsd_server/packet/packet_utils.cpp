// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include "packet_utils.hpp"
#include "../fsd_defs/command.hpp"
#include "../protocol_const.hpp"

#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/replace.hpp>

#include <random>

namespace frontend::fsd {
    std::string generate_token(size_t length) {
        static constexpr std::string_view HEX_DIGITS = "0123456789abcdef";
        thread_local std::mt19937 gen{std::random_device{}()};
        std::uniform_int_distribution<size_t> dist(0, HEX_DIGITS.size() - 1);

        std::string token(length, '0');
        for (auto& c : token) {
            c = HEX_DIGITS[dist(gen)];
        }
        return token;
    }

    packet make_packet(packet_type type,
                       std::string_view command,
                       std::string_view source,
                       std::string_view destination,
                       std::vector<std::string> data) {
        return packet{
            .type = type,
            .command = std::string(command),
            .source = std::string(source),
            .destination = std::string(destination),
            .data = std::move(data),
        };
    }

    packet build_server_ident(std::string token) {
        return make_packet(packet_type::REQUEST,
                           fsd_command::SERVER_IDENT,
                           CLIENT_PLACEHOLDER,
                           SERVER_IDENT,
                           {std::string(PROTOCOL_VERSION), std::move(token)});
    }

    packet build_error(std::string_view destination, fsd_error code, std::string_view param, std::string_view text) {
        return make_packet(packet_type::REQUEST,
                           fsd_command::ERROR,
                           SERVER_SOURCE,
                           destination,
                           {error_code_string(code), std::string(param), std::string(text)});
    }

    packet build_text_message(std::string_view source, std::string_view destination, std::string_view text) {
        return make_packet(packet_type::CLIENT, fsd_command::TEXT_MESSAGE, source, destination, {std::string(text)});
    }

    packet build_heartbeat() {
        return make_packet(packet_type::CLIENT, fsd_command::HEARTBEAT, SERVER_IDENT, BROADCAST_DESTINATION, {"0", "0"});
    }

    packet build_flight_plan_ack(std::string_view destination, std::string_view flight_plan_callsign) {
        return make_packet(packet_type::CLIENT,
                           fsd_command::PRO_CONTROLLER,
                           SERVER_SOURCE,
                           destination,
                           {"CCP", "BC", std::string(flight_plan_callsign), "0"});
    }

    std::string unescape_message_text(const std::vector<std::string>& fields) {
        auto text = boost::algorithm::join(fields, std::string(1, FIELD_DELIMITER));
        boost::algorithm::replace_all(text, std::string(ESCAPED_DELIMITER), std::string(1, FIELD_DELIMITER));
        return text;
    }
} // namespace frontend::fsd
