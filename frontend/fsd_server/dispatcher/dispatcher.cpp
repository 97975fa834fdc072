// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include "dispatcher.hpp"
#include "../fsd_defs/command.hpp"

namespace frontend::fsd {
    dispatcher::dispatcher(handler_context ctx, size_t queue_capacity)
        : ctx_(std::move(ctx))
        , log_(get_logger(logger_tag::DISPATCHER))
        , worker_([this](dispatch_request& request) { process(request); }, queue_capacity) {
        register_default_handlers();
    }

    void dispatcher::register_default_handlers() {
        register_handler(fsd_command::CLIENT_IDENT, handle_identification);
        register_handler(fsd_command::ADD_ATC, handle_login);
        register_handler(fsd_command::ADD_PILOT, handle_login);
        register_handler(fsd_command::DELETE_ATC, handle_logoff);
        register_handler(fsd_command::DELETE_PILOT, handle_logoff);
        register_handler(fsd_command::TEXT_MESSAGE, handle_text_message);
        register_handler(fsd_command::CLIENT_QUERY, handle_request);
        register_handler(fsd_command::CLIENT_RESPONSE, handle_response);
        register_handler(fsd_command::METAR_REQUEST, handle_metar_request);
        register_handler(fsd_command::POSITION_NORMAL, handle_position_update);
        register_handler(fsd_command::POSITION_STANDBY, handle_position_update);
        register_handler(fsd_command::POSITION_IDENT, handle_position_update);
        register_handler(fsd_command::FLIGHT_PLAN, handle_flight_plan);
    }

    void dispatcher::register_handler(std::string_view command, handler_fn handler) {
        handlers_[std::string(command)] = std::move(handler);
    }

    void dispatcher::start() {
        worker_.start();
        log_->info("Dispatcher started with {} handlers", handlers_.size());
    }

    void dispatcher::stop() {
        worker_.stop();
        log_->info("Dispatcher stopped");
    }

    bool dispatcher::submit(dispatch_request& request) {
        if (!worker_.submit(request)) {
            log_->debug("[Connection {}] Request queue is full ({} pending)",
                        connection_string(request.sender),
                        worker_.pending());
            return false;
        }
        return true;
    }

    void dispatcher::process(dispatch_request& request) {
        auto it = handlers_.find(request.pkt.command);
        if (it == handlers_.end()) {
            log_->debug("[Connection {}] Unhandled command {}: {}",
                        connection_string(request.sender),
                        request.pkt.command,
                        request.pkt.to_string());
            return;
        }

        try {
            it->second(ctx_, request.sender, request.pkt);
        } catch (const std::exception& e) {
            log_->error("[Connection {}] Handler for {} failed: {}",
                        connection_string(request.sender),
                        request.pkt.command,
                        e.what());
        }
    }
} // namespace frontend::fsd
