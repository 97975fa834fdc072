// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include "server_config.hpp"

#include <fstream>
#include <ostream>

namespace po = boost::program_options;

namespace {
    constexpr uint16_t DEFAULT_PORT = 6809;
    constexpr size_t DEFAULT_MAX_CLIENTS = 1000;
    constexpr uint32_t DEFAULT_HEARTBEAT_SEC = 30;
    constexpr size_t DEFAULT_CAPACITY = 1000;

    spdlog::level::level_enum parse_level(const std::string& name) {
        auto level = spdlog::level::from_str(name);
        if (level == spdlog::level::off && name != "off") {
            throw config::config_error("Unknown log level: " + name);
        }
        return level;
    }
} // namespace

namespace config {
    config_loader::config_loader()
        : generic_("Generic options")
        , settings_("Server options") {
        generic_.add_options()("help,h", "Show help message")
        ("config,c", po::value<std::string>(), "INI-style configuration file");

        settings_.add_options()
        ("host", po::value<std::string>()->default_value("0.0.0.0"), "Bind address")
        ("port", po::value<uint16_t>()->default_value(DEFAULT_PORT), "FSD port")
        ("server-name", po::value<std::string>()->default_value("OtterFSD"), "Server name")
        ("server-version", po::value<std::string>()->default_value("0.1.0"), "Server version")
        ("max-clients", po::value<size_t>()->default_value(DEFAULT_MAX_CLIENTS), "Maximum concurrent clients")
        ("threads", po::value<size_t>()->default_value(std::thread::hardware_concurrency()), "I/O threads")
        ("heartbeat-interval", po::value<uint32_t>()->default_value(DEFAULT_HEARTBEAT_SEC), "Heartbeat period, seconds")
        ("bus-capacity", po::value<size_t>()->default_value(DEFAULT_CAPACITY), "Per-connection broadcast backlog")
        ("queue-capacity", po::value<size_t>()->default_value(DEFAULT_CAPACITY), "Dispatcher request queue size")
        ("client-timeout", po::value<uint32_t>()->default_value(0), "Idle client timeout, seconds (0 disables)")
        ("log-level", po::value<std::string>()->default_value("info"), "trace, debug, info, warn, err, critical, off")
        ("log-dir", po::value<std::string>()->default_value(""), "Directory for log files (stdout only if empty)")
        ("whitelist", po::value<std::vector<std::string>>()->composing(), "Allowed client software id (repeatable)")
        ("user",
         po::value<std::vector<std::string>>()->composing(),
         "User account network_id:password:real name:atc_rating:pilot_rating (repeatable)");
    }

    std::optional<server_config> config_loader::load(int argc, const char* const argv[]) {
        po::options_description cmdline;
        cmdline.add(generic_).add(settings_);

        po::variables_map vm;
        try {
            po::store(po::parse_command_line(argc, argv, cmdline), vm);

            if (vm.count("help")) {
                return std::nullopt;
            }

            if (vm.count("config")) {
                auto path = vm["config"].as<std::string>();
                std::ifstream file(path);
                if (!file) {
                    throw config_error("Cannot open configuration file: " + path);
                }
                po::store(po::parse_config_file(file, settings_), vm);
            }
            po::notify(vm);
        } catch (const po::error& e) {
            throw config_error(e.what());
        }

        return to_config(vm);
    }

    server_config config_loader::load(std::istream& settings) {
        po::variables_map vm;
        try {
            po::store(po::parse_config_file(settings, settings_), vm);
            po::notify(vm);
        } catch (const po::error& e) {
            throw config_error(e.what());
        }
        return to_config(vm);
    }

    void config_loader::print_help(std::ostream& out) const { out << generic_ << "\n" << settings_ << "\n"; }

    server_config config_loader::to_config(const po::variables_map& vm) const {
        server_config cfg{
            .host = vm["host"].as<std::string>(),
            .port = vm["port"].as<uint16_t>(),
            .server_name = vm["server-name"].as<std::string>(),
            .server_version = vm["server-version"].as<std::string>(),
            .max_clients = vm["max-clients"].as<size_t>(),
            .pool_size = vm["threads"].as<size_t>(),
            .heartbeat_interval = std::chrono::seconds(vm["heartbeat-interval"].as<uint32_t>()),
            .bus_capacity = vm["bus-capacity"].as<size_t>(),
            .queue_capacity = vm["queue-capacity"].as<size_t>(),
            .client_timeout = std::chrono::seconds(vm["client-timeout"].as<uint32_t>()),
            .log_level = parse_level(vm["log-level"].as<std::string>()),
            .log_dir = vm["log-dir"].as<std::string>(),
        };

        if (vm.count("whitelist")) {
            cfg.whitelist = vm["whitelist"].as<std::vector<std::string>>();
        }
        if (vm.count("user")) {
            cfg.users = vm["user"].as<std::vector<std::string>>();
        }

        if (cfg.max_clients == 0) {
            throw config_error("max-clients must be positive");
        }
        if (cfg.heartbeat_interval.count() == 0) {
            throw config_error("heartbeat-interval must be positive");
        }
        if (cfg.bus_capacity == 0 || cfg.queue_capacity == 0) {
            throw config_error("bus-capacity and queue-capacity must be positive");
        }
        if (cfg.pool_size == 0) {
            cfg.pool_size = 1;
        }
        return cfg;
    }
} // namespace config
