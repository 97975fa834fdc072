// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include "connection/fsd_connection.hpp"
#include "dispatcher/dispatcher.hpp"

#include "auth/auth_provider.hpp"
#include "broadcast/broadcast_bus.hpp"
#include "config/server_config.hpp"
#include "frontend/common/frontend_server.hpp"
#include "session/session_registry.hpp"

#include <boost/asio.hpp>

#include <atomic>
#include <memory>

namespace frontend::fsd {
    class fsd_server final : public frontend_server<fsd_connection> {
    public:
        fsd_server(const config::server_config& config,
                   const auth::whitelist_checker& whitelist,
                   const auth::authenticator& authenticator);

        ~fsd_server() override;

        // Binds, then starts the dispatcher, the heartbeat and the accept loop.
        // Throws boost::system::system_error when the address cannot be bound.
        void start();
        void stop();

        registry::session_registry& sessions() noexcept { return registry_; }
        broadcast::broadcast_bus& bus() noexcept { return bus_; }

    protected:
        bool has_capacity() const override;
        std::shared_ptr<fsd_connection> make_connection(boost::asio::ip::tcp::socket socket) override;

    private:
        void schedule_heartbeat();

        config::server_config config_;
        registry::session_registry registry_;
        broadcast::broadcast_bus bus_;
        dispatcher dispatcher_;
        boost::asio::steady_timer heartbeat_timer_;
        std::atomic<bool> stopping_{false};
        log_t log_;
    };
} // namespace frontend::fsd
