// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <utility>

#include <boost/asio.hpp>

#include "auth/memory_user_store.hpp"
#include "config/server_config.hpp"
#include "frontend/fsd_server/fsd_server.hpp"
#include "utility/logger.hpp"

int main(int argc, char* argv[]) {
    config::config_loader loader;

    std::optional<config::server_config> loaded;
    try {
        loaded = loader.load(argc, argv);
    } catch (const config::config_error& e) {
        std::cerr << "Error parsing arguments: " << e.what() << "\n";
        loader.print_help(std::cerr);
        return 1;
    }

    // Show help message if requested
    if (!loaded.has_value()) {
        loader.print_help(std::cout);
        return 0;
    }
    const auto& config = *loaded;

    // Logging
    initialize_all_loggers(config.log_level, config.log_dir);
    auto log = get_logger(logger_tag::FSD_SERVER);

    auth::memory_user_store store;
    try {
        store.load(config.whitelist, config.users);
    } catch (const std::logic_error& e) {
        log->critical("Invalid user entry: {}", e.what());
        return 1;
    }

    try {
        frontend::fsd::fsd_server server(config, store, store);
        server.start();
        log->info("FSD server running on {}:{}", config.host, server.local_port());

        // Block until SIGINT or SIGTERM
        boost::asio::io_context signals_ctx;
        boost::asio::signal_set signals(signals_ctx, SIGINT, SIGTERM);
        signals.async_wait([&log](const boost::system::error_code& ec, int signal) {
            if (!ec) {
                log->info("Received signal {}, shutting down", signal);
            }
        });
        signals_ctx.run();

        server.stop();
    } catch (const std::exception& e) {
        log->critical("Failed to run FSD server: {}", e.what());
        spdlog::shutdown();
        return -1;
    }

    spdlog::shutdown();
    return 0;
}
