// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include "../packet/packet_utils.hpp"
#include "command_handlers.hpp"

namespace frontend::fsd {
    void handle_flight_plan(handler_context& ctx, const connection_id& sender, packet& pkt) {
        ctx.log->info("[Connection {}] FP: flight plan from {}", connection_string(sender), pkt.source);

        auto callsign = pkt.source;
        send_relay(ctx, sender, std::move(pkt));
        send_reply(ctx, sender, build_flight_plan_ack(callsign, callsign));
    }
} // namespace frontend::fsd
