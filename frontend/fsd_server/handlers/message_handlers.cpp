// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include "../packet/packet_utils.hpp"
#include "command_handlers.hpp"

namespace {
    constexpr std::string_view FLIGHT_PLAN_MARKER = "FP";
    constexpr std::string_view FLIGHT_PLAN_GET = "GET";

    // #TM(callsign):(destination):FP:(flight plan callsign):GET
    bool is_flight_plan_get(const frontend::fsd::packet& pkt) {
        return pkt.data.size() == 3 && pkt.data[0] == FLIGHT_PLAN_MARKER && pkt.data[2] == FLIGHT_PLAN_GET;
    }
} // namespace

namespace frontend::fsd {
    void handle_text_message(handler_context& ctx, const connection_id& sender, packet& pkt) {
        ctx.log->debug("[Connection {}] TM: {} -> {}", connection_string(sender), pkt.source, pkt.destination);

        if (is_flight_plan_get(pkt)) {
            ctx.log->info("[Connection {}] TM: flight plan acknowledgment from {} for {}",
                          connection_string(sender),
                          pkt.source,
                          pkt.data[1]);
            send_reply(ctx, sender, build_flight_plan_ack(pkt.source, pkt.data[1]));
            return;
        }

        if (!pkt.data.empty()) {
            pkt.data = {unescape_message_text(pkt.data)};
        }
        send_relay(ctx, sender, std::move(pkt));
    }
} // namespace frontend::fsd
