// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include "fsd_connection.hpp"
#include "../packet/packet_utils.hpp"
#include "../protocol_const.hpp"

namespace frontend::fsd {
    fsd_connection::fsd_connection(boost::asio::ip::tcp::socket socket,
                                   std::chrono::seconds read_timeout,
                                   registry::session_registry& registry,
                                   broadcast::broadcast_bus& bus,
                                   dispatcher& dispatcher)
        : frontend_connection(std::move(socket), read_timeout)
        , registry_(registry)
        , bus_(bus)
        , dispatcher_(dispatcher)
        , retry_timer_(socket_.get_executor())
        , log_(get_logger(logger_tag::FSD_CONNECTION)) {}

    std::string fsd_connection::build_too_many_connections_error() {
        return format(build_error(UNKNOWN_CALLSIGN, fsd_error::SERVER_FULL, "", error_text::SERVER_FULL));
    }

    log_t& fsd_connection::get_logger_impl() { return log_; }

    // The session exists before the subscription, so nothing addressed to it can be missed.
    void fsd_connection::start_impl() {
        registry_.register_session(id_);
        subscription_ = bus_.subscribe(id_);

        std::weak_ptr<fsd_connection> weak = shared_from_base<fsd_connection>();
        subscription_->set_notify([weak, executor = socket_.get_executor()]() {
            boost::asio::post(executor, [weak]() {
                if (auto self = weak.lock(); self) {
                    self->drain_subscription();
                }
            });
        });

        send_server_ident();
    }

    // Written straight to the socket; the reader and the writer start once it is out.
    void fsd_connection::send_server_ident() {
        auto ident = build_server_ident(generate_token(TOKEN_LENGTH));
        log_->debug("[Connection {}] SEND: {}", connection_string(id_), ident.to_string());

        writing_ = true;
        write_line(format(ident), [this]() {
            writing_ = false;
            read_line();
            drain_subscription();
        });
    }

    void fsd_connection::drain_subscription() {
        if (writing_ || finished() || !subscription_) {
            return;
        }

        while (auto received = subscription_->try_recv()) {
            if (auto* lag = std::get_if<broadcast::lagged>(&*received); lag) {
                log_->warn("[Connection {}] SEND: lagged behind, {} messages skipped",
                           connection_string(id_),
                           lag->skipped);
                continue;
            }

            const auto& msg = std::get<broadcast::message_ptr>(*received);
            if (!broadcast::should_deliver(id_, *msg)) {
                continue;
            }

            if (msg->is_disconnect()) {
                log_->info("[Connection {}] SEND: disconnect requested", connection_string(id_));
                finish();
                return;
            }

            log_->debug("[Connection {}] SEND: {}", connection_string(id_), msg->packet()->to_string());
            writing_ = true;
            write_line(format(*msg->packet()), [this]() {
                writing_ = false;
                drain_subscription();
            });
            return;
        }
    }

    bool fsd_connection::handle_line(std::string line) {
        try {
            auto pkt = parse(line);
            log_->debug("[Connection {}] RECV: {}", connection_string(id_), pkt.to_string());
            pending_.emplace(dispatch_request{.sender = id_, .pkt = std::move(pkt)});
        } catch (const packet_error& e) {
            log_->warn("[Connection {}] RECV: dropped malformed line: {}", connection_string(id_), e.what());
            return true;
        }

        if (submit_pending()) {
            return true;
        }
        log_->warn("[Connection {}] RECV: request queue full, pausing reads", connection_string(id_));
        retry_submit();
        return false;
    }

    bool fsd_connection::submit_pending() {
        if (!dispatcher_.submit(*pending_)) {
            return false;
        }
        pending_.reset();
        return true;
    }

    void fsd_connection::retry_submit() {
        retry_timer_.expires_after(QUEUE_FULL_RETRY_INTERVAL);
        retry_timer_.async_wait(safe_callback([this](boost::system::error_code ec) {
            if (ec || finished()) {
                return;
            }
            if (!submit_pending()) {
                retry_submit();
                return;
            }
            log_->debug("[Connection {}] RECV: request queue drained, resuming reads", connection_string(id_));
            read_line();
        }));
    }

    void fsd_connection::on_finish() {
        retry_timer_.cancel();
        pending_.reset();
        subscription_.reset();
        registry_.remove(id_);
    }
} // namespace frontend::fsd
