// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include "config/server_config.hpp"

#include <catch2/catch.hpp>

#include <iterator>
#include <sstream>

using config::config_error;
using config::config_loader;

TEST_CASE("config_loader: defaults") {
    config_loader loader;
    const char* argv[] = {"otterfsd"};

    auto cfg = loader.load(1, argv);
    REQUIRE(cfg.has_value());
    REQUIRE(cfg->host == "0.0.0.0");
    REQUIRE(cfg->port == 6809);
    REQUIRE(cfg->max_clients == 1000);
    REQUIRE(cfg->heartbeat_interval == std::chrono::seconds(30));
    REQUIRE(cfg->client_timeout.count() == 0);
    REQUIRE(cfg->log_level == spdlog::level::info);
    REQUIRE(cfg->pool_size >= 1);
    REQUIRE(cfg->whitelist.empty());
    REQUIRE(cfg->users.empty());
}

TEST_CASE("config_loader: command line") {
    config_loader loader;
    const char* argv[] = {"otterfsd",
                          "--host",
                          "127.0.0.1",
                          "--port",
                          "7000",
                          "--max-clients",
                          "5",
                          "--log-level",
                          "debug",
                          "--whitelist",
                          "69d7",
                          "--whitelist",
                          "de1e",
                          "--user",
                          "1234567:secret:John Doe:5:3"};

    auto cfg = loader.load(static_cast<int>(std::size(argv)), argv);
    REQUIRE(cfg.has_value());
    REQUIRE(cfg->host == "127.0.0.1");
    REQUIRE(cfg->port == 7000);
    REQUIRE(cfg->max_clients == 5);
    REQUIRE(cfg->log_level == spdlog::level::debug);
    REQUIRE(cfg->whitelist == std::vector<std::string>{"69d7", "de1e"});
    REQUIRE(cfg->users == std::vector<std::string>{"1234567:secret:John Doe:5:3"});
}

TEST_CASE("config_loader: help") {
    config_loader loader;
    const char* argv[] = {"otterfsd", "--help"};

    REQUIRE_FALSE(loader.load(2, argv).has_value());

    std::ostringstream out;
    loader.print_help(out);
    REQUIRE(out.str().find("--max-clients") != std::string::npos);
}

TEST_CASE("config_loader: settings file") {
    config_loader loader;
    std::istringstream ini("port = 6810\n"
                           "server-name = Test FSD\n"
                           "heartbeat-interval = 5\n"
                           "client-timeout = 60\n"
                           "whitelist = 69d7\n"
                           "whitelist = de1e\n");

    auto cfg = loader.load(ini);
    REQUIRE(cfg.port == 6810);
    REQUIRE(cfg.server_name == "Test FSD");
    REQUIRE(cfg.heartbeat_interval == std::chrono::seconds(5));
    REQUIRE(cfg.client_timeout == std::chrono::seconds(60));
    REQUIRE(cfg.whitelist.size() == 2);
}

TEST_CASE("config_loader: invalid values") {
    config_loader loader;

    SECTION("unknown option") {
        const char* argv[] = {"otterfsd", "--no-such-option"};
        REQUIRE_THROWS_AS(loader.load(2, argv), config_error);
    }

    SECTION("port out of range") {
        const char* argv[] = {"otterfsd", "--port", "70000"};
        REQUIRE_THROWS_AS(loader.load(3, argv), config_error);
    }

    SECTION("zero clients") {
        const char* argv[] = {"otterfsd", "--max-clients", "0"};
        REQUIRE_THROWS_AS(loader.load(3, argv), config_error);
    }

    SECTION("unknown log level") {
        const char* argv[] = {"otterfsd", "--log-level", "loud"};
        REQUIRE_THROWS_AS(loader.load(3, argv), config_error);
    }

    SECTION("missing config file") {
        const char* argv[] = {"otterfsd", "--config", "/nonexistent/otterfsd.ini"};
        REQUIRE_THROWS_AS(loader.load(3, argv), config_error);
    }
}
