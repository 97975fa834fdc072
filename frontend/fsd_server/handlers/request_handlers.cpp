// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include "../fsd_defs/command.hpp"
#include "../packet/packet_utils.hpp"
#include "../protocol_const.hpp"
#include "command_handlers.hpp"

#include <spdlog/fmt/chrono.h>

#include <ctime>

namespace {
    using namespace frontend::fsd;

    constexpr std::string_view ATIS_VOICE = "V";
    constexpr std::string_view ATIS_TEXT = "T";
    constexpr std::string_view ATIS_END = "E";
    constexpr std::string_view METAR = "METAR";

    packet atis_line(const packet& request, std::string_view kind, std::string value) {
        return make_packet(packet_type::REQUEST,
                           fsd_command::CLIENT_RESPONSE,
                           request.destination,
                           request.source,
                           {std::string(query_type::ATIS), std::string(kind), std::move(value)});
    }

    // Voice server, the text lines, then an end marker counting every line sent.
    void handle_atis(handler_context& ctx, const connection_id& sender, const packet& pkt) {
        ctx.log->info("[Connection {}] CQ: ATIS request from {} to {}",
                      connection_string(sender),
                      pkt.source,
                      pkt.destination);

        send_reply(ctx, sender, atis_line(pkt, ATIS_VOICE, std::string(ATIS_VOICE_SERVER)));
        for (auto line : ATIS_LINES) {
            send_reply(ctx, sender, atis_line(pkt, ATIS_TEXT, std::string(line)));
        }
        send_reply(ctx, sender, atis_line(pkt, ATIS_END, std::to_string(ATIS_LINES.size() + 2)));
    }

    // ATC:   $CR(requestee):(requester):RN:(real name):(sector file):(rating)
    // Pilot: $CR(requestee):(requester):RN:(real name)::(rating)
    void handle_real_name(handler_context& ctx, const connection_id& sender, const packet& pkt) {
        auto requestee = ctx.registry.get(sender);
        if (!requestee.has_value() || !requestee->callsign.has_value()) {
            ctx.log->debug("[Connection {}] CQ: RN for an unidentified session", connection_string(sender));
            return;
        }

        auto real_name = requestee->real_name.value_or(std::string());
        auto rating = std::to_string(requestee->rating.value_or(0));

        std::vector<std::string> data;
        switch (requestee->type.value_or(registry::client_type::OBSERVER)) {
            case registry::client_type::ATC: {
                std::string sector_file;
                data = {std::string(query_type::REAL_NAME), real_name, sector_file, rating};
                break;
            }
            case registry::client_type::PILOT:
                data = {std::string(query_type::REAL_NAME), real_name, std::string(), rating};
                break;
            case registry::client_type::OBSERVER:
                ctx.log->debug("[Connection {}] CQ: RN before login", connection_string(sender));
                return;
        }

        send_reply(ctx,
                   sender,
                   make_packet(packet_type::REQUEST,
                               fsd_command::CLIENT_RESPONSE,
                               *requestee->callsign,
                               pkt.source,
                               std::move(data)));
    }

    // #TM(callsign):DATA:(client string) PID=(id) ((real name)) IP=(ip) SYS_UID=(uid) FSVER=(sim) LT= LO= AL=
    void handle_system_info(handler_context& ctx, const connection_id& sender, const packet& pkt) {
        auto target = ctx.registry.find_by_callsign(pkt.destination);
        if (!target.has_value()) {
            ctx.log->warn("[Connection {}] CQ: INF for unknown client {}", connection_string(sender), pkt.destination);
            return;
        }

        auto pos = target->last_position.value_or(registry::position{
            .latitude = INF_DEFAULT_LATITUDE,
            .longitude = INF_DEFAULT_LONGITUDE,
            .altitude = INF_DEFAULT_ALTITUDE,
        });
        auto simulator = target->type == registry::client_type::ATC ? std::string_view() : INF_PILOT_SIMULATOR;

        auto info = fmt::format("{} PID=({}) (({})) IP=({}) SYS_UID={} FSVER={} LT={} LO={} AL={}",
                                target->client_string.value_or(std::string()),
                                target->network_id.value_or(std::string()),
                                target->real_name.value_or(std::string()),
                                target->id.address().to_string(),
                                INF_SYS_UID,
                                simulator,
                                pos.latitude,
                                pos.longitude,
                                pos.altitude);

        send_reply(ctx, sender, build_text_message(pkt.destination, SYSTEM_INFO_DESTINATION, info));
    }

    // Answered with $CQ rather than $CR, as clients expect.
    void handle_aircraft_config(handler_context& ctx, const connection_id& sender, const packet& pkt) {
        if (!ctx.registry.find_by_callsign(pkt.destination).has_value()) {
            ctx.log->warn("[Connection {}] CQ: ACC for unknown client {}", connection_string(sender), pkt.destination);
            return;
        }

        send_reply(ctx,
                   sender,
                   make_packet(packet_type::REQUEST,
                               fsd_command::CLIENT_QUERY,
                               pkt.destination,
                               pkt.source,
                               {std::string(query_type::AIRCRAFT_CONFIG), std::string(ACC_CONFIGURATION)}));
    }

    // DDHHMMZ in UTC
    std::string metar_time_group() {
        return fmt::format("{:%d%H%M}Z", fmt::gmtime(std::time(nullptr)));
    }
} // namespace

namespace frontend::fsd {
    void handle_request(handler_context& ctx, const connection_id& sender, packet& pkt) {
        ctx.log->debug("[Connection {}] CQ: {} -> {}", connection_string(sender), pkt.source, pkt.destination);

        if (pkt.data.empty()) {
            ctx.log->debug("[Connection {}] CQ: no query type, dropped", connection_string(sender));
            return;
        }

        const auto& kind = pkt.data[0];
        if (kind == query_type::ATIS) {
            handle_atis(ctx, sender, pkt);
        } else if (kind == query_type::REAL_NAME) {
            handle_real_name(ctx, sender, pkt);
        } else if (kind == query_type::SYSTEM_INFO) {
            handle_system_info(ctx, sender, pkt);
        } else if (kind == query_type::AIRCRAFT_CONFIG) {
            handle_aircraft_config(ctx, sender, pkt);
        } else {
            // CAPS and anything unknown go to the other clients unchanged
            send_relay(ctx, sender, std::move(pkt));
        }
    }

    void handle_response(handler_context& ctx, const connection_id& sender, packet& pkt) {
        ctx.log->debug("[Connection {}] CR: {} -> {}", connection_string(sender), pkt.source, pkt.destination);
        send_relay(ctx, sender, std::move(pkt));
    }

    // $AX(callsign):SERVER:METAR:(station)
    void handle_metar_request(handler_context& ctx, const connection_id& sender, packet& pkt) {
        if (pkt.data.size() < METAR_MIN_FIELDS) {
            ctx.log->warn("[Connection {}] AX: malformed METAR request from {}", connection_string(sender), pkt.source);
            return;
        }

        const auto& station = pkt.data[METAR_STATION_FIELD];
        ctx.log->info("[Connection {}] AX: METAR for {} requested by {}",
                      connection_string(sender),
                      station,
                      pkt.source);

        auto report = fmt::format("{} {} {}", station, metar_time_group(), METAR_BODY);
        send_reply(ctx,
                   sender,
                   make_packet(packet_type::REQUEST,
                               fsd_command::METAR_RESPONSE,
                               SERVER_SOURCE,
                               pkt.source,
                               {std::string(METAR), std::move(report)}));
    }
} // namespace frontend::fsd
