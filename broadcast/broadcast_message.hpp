// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include "frontend/fsd_server/packet/packet.hpp"
#include "utility/connection_uid.hpp"

#include <optional>
#include <variant>

namespace broadcast {
    // Asks the recipient connection to terminate.
    struct disconnect_signal {
        bool operator==(const disconnect_signal&) const = default;
    };

    using payload_t = std::variant<frontend::fsd::packet, disconnect_signal>;

    struct broadcast_message {
        connection_id origin;
        std::optional<connection_id> recipient;
        payload_t payload;

        bool is_disconnect() const noexcept { return std::holds_alternative<disconnect_signal>(payload); }
        const frontend::fsd::packet* packet() const noexcept { return std::get_if<frontend::fsd::packet>(&payload); }

        bool from_server() const noexcept { return is_server_connection_id(origin); }
    };

    // Delivered to every connection except the origin.
    inline broadcast_message relay(const connection_id& origin, frontend::fsd::packet pkt) {
        return broadcast_message{.origin = origin, .recipient = std::nullopt, .payload = std::move(pkt)};
    }

    // Delivered to every connection, the origin sentinel never matches a peer.
    inline broadcast_message announce(frontend::fsd::packet pkt) {
        return broadcast_message{.origin = server_connection_id(), .recipient = std::nullopt, .payload = std::move(pkt)};
    }

    // Delivered to the recipient only.
    inline broadcast_message reply(const connection_id& recipient, frontend::fsd::packet pkt) {
        return broadcast_message{.origin = server_connection_id(), .recipient = recipient, .payload = std::move(pkt)};
    }

    inline broadcast_message disconnect(const connection_id& target) {
        return broadcast_message{.origin = target, .recipient = target, .payload = disconnect_signal{}};
    }

    // Addressed messages reach their recipient only, which lets a disconnect reach the connection it
    // originated from. Everything else skips the connection it came from unless the server sent it.
    inline bool should_deliver(const connection_id& subscriber, const broadcast_message& msg) {
        if (msg.recipient.has_value()) {
            return *msg.recipient == subscriber;
        }
        if (msg.is_disconnect()) {
            return false;
        }
        return msg.from_server() || msg.origin != subscriber;
    }
} // namespace broadcast
