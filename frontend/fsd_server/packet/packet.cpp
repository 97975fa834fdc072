// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include "packet.hpp"
#include "../fsd_defs/command.hpp"
#include "../protocol_const.hpp"

#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>

#include <algorithm>

namespace {
    using namespace frontend::fsd;

    std::string_view strip_line(std::string_view raw) {
        while (!raw.empty() && (raw.back() == '\n' || raw.back() == '\r')) {
            raw.remove_suffix(1);
        }
        return raw;
    }

    template<size_t N>
    bool is_one_of(std::string_view value, const std::array<std::string_view, N>& known) {
        return std::find(known.begin(), known.end(), value) != known.end();
    }

    // Commands are one or two letters glued to the first identifier, e.g. "TMUAX123" or "NUAX123".
    std::pair<std::string, std::string> split_command_ident(std::string_view s) {
        if (s.size() >= 2 && is_one_of(s.substr(0, 2), TWO_LETTER_COMMANDS)) {
            return {std::string(s.substr(0, 2)), std::string(s.substr(2))};
        }

        if (!s.empty() && is_one_of(s.substr(0, 1), ONE_LETTER_COMMANDS)) {
            return {std::string(s.substr(0, 1)), std::string(s.substr(1))};
        }

        if (s.size() >= 2) {
            return {std::string(s.substr(0, 2)), std::string(s.substr(2))};
        }
        return {std::string(s), std::string()};
    }
} // namespace

namespace frontend::fsd {
    packet parse(std::string_view line) {
        std::string raw(strip_line(line));
        boost::algorithm::trim(raw);

        if (raw.empty()) {
            throw packet_error(packet_error_kind::INVALID_FORMAT, "Empty packet");
        }

        auto type = packet_type_from_prefix(raw.front());
        if (!type.has_value()) {
            throw packet_error(packet_error_kind::INVALID_FORMAT, std::string("Unknown prefix: ") + raw.front());
        }

        std::string_view without_prefix(raw);
        without_prefix.remove_prefix(1);

        auto first_colon = without_prefix.find(FIELD_DELIMITER);
        if (first_colon == std::string_view::npos) {
            throw packet_error(packet_error_kind::INVALID_FORMAT, "No field delimiter found");
        }

        auto command_ident = without_prefix.substr(0, first_colon);
        if (command_ident.empty()) {
            throw packet_error(packet_error_kind::MISSING_FIELD, "Missing command");
        }
        auto rest = without_prefix.substr(first_colon + 1);

        auto [cmd, first_ident] = split_command_ident(command_ident);

        std::string second_ident;
        std::vector<std::string> data;
        if (auto next = rest.find(FIELD_DELIMITER); next == std::string_view::npos) {
            second_ident = std::string(rest);
        } else {
            second_ident = std::string(rest.substr(0, next));
            auto tail = std::string(rest.substr(next + 1));
            boost::algorithm::split(data, tail, [](char c) { return c == FIELD_DELIMITER; });
        }

        packet pkt;
        pkt.type = *type;
        pkt.command = std::move(cmd);
        pkt.data = std::move(data);

        if (pkt.command == fsd_command::SERVER_IDENT) {
            pkt.destination = std::move(first_ident);
            pkt.source = std::move(second_ident);
        } else if (is_position_update(pkt.type)) {
            // the subject of the update; the sender is known only from the connection
            pkt.destination = std::move(first_ident);
        } else {
            pkt.source = std::move(first_ident);
            pkt.destination = std::move(second_ident);
        }
        return pkt;
    }

    std::string packet::to_string() const {
        std::string result;
        result += packet_type_prefix(type);
        result += command;

        if (command == fsd_command::SERVER_IDENT) {
            result += destination;
            result += FIELD_DELIMITER;
            result += source;
        } else if (is_position_update(type)) {
            result += destination;
        } else {
            result += source;
            result += FIELD_DELIMITER;
            result += destination;
        }

        if (!data.empty()) {
            result += FIELD_DELIMITER;
            result += boost::algorithm::join(data, std::string(1, FIELD_DELIMITER));
        }
        return result;
    }

    std::string format(const packet& pkt) {
        auto line = pkt.to_string();
        line += LINE_TERMINATOR;
        return line;
    }
} // namespace frontend::fsd
