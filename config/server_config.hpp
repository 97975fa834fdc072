// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include <boost/program_options.hpp>
#include <spdlog/common.h>

#include <chrono>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace config {
    class config_error : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    // Loaded once at startup and never modified afterwards.
    struct server_config {
        std::string host = "0.0.0.0";
        uint16_t port = 6809;
        std::string server_name = "OtterFSD";
        std::string server_version = "0.1.0";
        size_t max_clients = 1000;
        size_t pool_size = std::thread::hardware_concurrency();
        std::chrono::milliseconds heartbeat_interval = std::chrono::seconds(30);
        size_t bus_capacity = 1000;
        size_t queue_capacity = 1000;
        std::chrono::seconds client_timeout = std::chrono::seconds(0); // 0 disables
        spdlog::level::level_enum log_level = spdlog::level::info;
        std::string log_dir;
        std::vector<std::string> whitelist;
        std::vector<std::string> users;
    };

    class config_loader {
    public:
        config_loader();

        // Command line, plus the file named by --config. Returns nullopt when --help was given.
        // Throws config_error on unknown options or invalid values.
        std::optional<server_config> load(int argc, const char* const argv[]);

        // INI-style settings only.
        server_config load(std::istream& settings);

        void print_help(std::ostream& out) const;

    private:
        server_config to_config(const boost::program_options::variables_map& vm) const;

        boost::program_options::options_description generic_;
        boost::program_options::options_description settings_;
    };
} // namespace config
