// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include "../handlers/command_handlers.hpp"
#include "../packet/packet.hpp"

#include "utility/connection_uid.hpp"
#include "utility/logger.hpp"
#include "utility/worker.hpp"

#include <string>
#include <string_view>
#include <unordered_map>

namespace frontend::fsd {
    struct dispatch_request {
        connection_id sender;
        packet pkt;
    };

    // Single consumer of every connection's parsed packets. Requests run one at a time in
    // submission order, so packets from one connection are handled in the order they arrived.
    class dispatcher {
    public:
        dispatcher(handler_context ctx, size_t queue_capacity);

        dispatcher(const dispatcher&) = delete;
        dispatcher& operator=(const dispatcher&) = delete;

        void start();
        void stop();

        // Never blocks. Returns false when the request queue is full; request is then left untouched.
        bool submit(dispatch_request& request);

        // Runs the handler for one request on the calling thread.
        void process(dispatch_request& request);

        void register_handler(std::string_view command, handler_fn handler);

        size_t pending() const noexcept { return worker_.pending(); }

    private:
        void register_default_handlers();

        handler_context ctx_;
        std::unordered_map<std::string, handler_fn> handlers_;
        log_t log_;
        serial_worker<dispatch_request> worker_;
    };
} // namespace frontend::fsd
