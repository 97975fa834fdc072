// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include "../dispatcher/dispatcher.hpp"

#include "broadcast/broadcast_bus.hpp"
#include "frontend/common/frontend_connection.hpp"
#include "session/session_registry.hpp"

#include <boost/asio.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace frontend::fsd {
    // One client socket. The reader feeds parsed packets to the dispatcher; the writer drains this
    // connection's bus subscription. Both run on the socket's strand.
    //
    // Packets are never dropped on a full request queue: the reader holds the packet and stops reading
    // until the dispatcher takes it, so TCP flow control pushes back on the client.
    class fsd_connection final : public frontend_connection {
    public:
        fsd_connection(boost::asio::ip::tcp::socket socket,
                       std::chrono::seconds read_timeout,
                       registry::session_registry& registry,
                       broadcast::broadcast_bus& bus,
                       dispatcher& dispatcher);

        // Sent on sockets refused by admission control.
        static std::string build_too_many_connections_error();

    protected:
        void start_impl() override;
        log_t& get_logger_impl() override;
        bool handle_line(std::string line) override;
        void on_finish() override;

    private:
        void send_server_ident();
        void drain_subscription();
        bool submit_pending();
        void retry_submit();

        registry::session_registry& registry_;
        broadcast::broadcast_bus& bus_;
        dispatcher& dispatcher_;
        std::shared_ptr<broadcast::subscription> subscription_;
        bool writing_ = false;
        std::optional<dispatch_request> pending_;
        boost::asio::steady_timer retry_timer_;
        log_t log_;
    };
} // namespace frontend::fsd
