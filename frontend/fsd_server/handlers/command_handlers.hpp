// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include "../packet/packet.hpp"

#include "auth/auth_provider.hpp"
#include "broadcast/broadcast_bus.hpp"
#include "session/session_registry.hpp"
#include "utility/connection_uid.hpp"
#include "utility/logger.hpp"

#include <functional>

namespace frontend::fsd {
    // Everything a command handler may touch. Handlers never block on a socket: they only
    // mutate the registry and publish to the bus.
    struct handler_context {
        registry::session_registry& registry;
        broadcast::broadcast_bus& bus;
        const auth::whitelist_checker& whitelist;
        const auth::authenticator& authenticator;
        log_t log;
    };

    using handler_fn = std::function<void(handler_context&, const connection_id&, packet&)>;

    // Delivered to the requesting connection only.
    inline void send_reply(handler_context& ctx, const connection_id& sender, packet pkt) {
        ctx.bus.publish(broadcast::reply(sender, std::move(pkt)));
    }

    // Delivered to every other connection.
    inline void send_relay(handler_context& ctx, const connection_id& sender, packet pkt) {
        ctx.bus.publish(broadcast::relay(sender, std::move(pkt)));
    }

    // $ID
    void handle_identification(handler_context& ctx, const connection_id& sender, packet& pkt);
    // #AA, #AP
    void handle_login(handler_context& ctx, const connection_id& sender, packet& pkt);
    // #DA, #DP
    void handle_logoff(handler_context& ctx, const connection_id& sender, packet& pkt);

    // #TM
    void handle_text_message(handler_context& ctx, const connection_id& sender, packet& pkt);

    // $CQ with its CAPS, ATIS, RN, INF and ACC sub-types
    void handle_request(handler_context& ctx, const connection_id& sender, packet& pkt);
    // $CR
    void handle_response(handler_context& ctx, const connection_id& sender, packet& pkt);
    // $AX
    void handle_metar_request(handler_context& ctx, const connection_id& sender, packet& pkt);

    // N, S, Y updates
    void handle_position_update(handler_context& ctx, const connection_id& sender, packet& pkt);

    // $FP
    void handle_flight_plan(handler_context& ctx, const connection_id& sender, packet& pkt);
} // namespace frontend::fsd
