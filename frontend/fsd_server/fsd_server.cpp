// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include "fsd_server.hpp"
#include "packet/packet_utils.hpp"

namespace {
    frontend::frontend_server_config transport_config(const config::server_config& config) {
        return frontend::frontend_server_config{
            .host = config.host,
            .port = config.port,
            .pool_size = config.pool_size,
        };
    }
} // namespace

namespace frontend::fsd {
    fsd_server::fsd_server(const config::server_config& config,
                           const auth::whitelist_checker& whitelist,
                           const auth::authenticator& authenticator)
        : frontend_server(transport_config(config))
        , config_(config)
        , bus_(config.bus_capacity)
        , dispatcher_(
              handler_context{
                  .registry = registry_,
                  .bus = bus_,
                  .whitelist = whitelist,
                  .authenticator = authenticator,
                  .log = get_logger(logger_tag::HANDLERS),
              },
              config.queue_capacity)
        , heartbeat_timer_(pool().ctx())
        , log_(get_logger(logger_tag::FSD_SERVER)) {}

    fsd_server::~fsd_server() { stop(); }

    void fsd_server::start() {
        log_->info("{} {} starting, max {} clients", config_.server_name, config_.server_version, config_.max_clients);
        dispatcher_.start();
        schedule_heartbeat();
        frontend_server::start();
    }

    void fsd_server::stop() {
        if (stopping_.exchange(true)) {
            return;
        }

        dispatcher_.stop();
        shutdown();
        // the pool is stopped here, nothing else touches the timer
        heartbeat_timer_.cancel();
    }

    bool fsd_server::has_capacity() const { return registry_.size() < config_.max_clients; }

    std::shared_ptr<fsd_connection> fsd_server::make_connection(boost::asio::ip::tcp::socket socket) {
        return std::make_shared<fsd_connection>(std::move(socket),
                                                config_.client_timeout,
                                                registry_,
                                                bus_,
                                                dispatcher_);
    }

    void fsd_server::schedule_heartbeat() {
        heartbeat_timer_.expires_after(config_.heartbeat_interval);
        heartbeat_timer_.async_wait([this](boost::system::error_code ec) {
            if (ec || stopping_.load()) {
                return;
            }

            auto delivered = bus_.publish(broadcast::announce(build_heartbeat()));
            log_->debug("Heartbeat sent to {} subscribers", delivered);
            schedule_heartbeat();
        });
    }
} // namespace frontend::fsd
