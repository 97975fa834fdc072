// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <array>
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

using log_t = std::shared_ptr<spdlog::logger>;

namespace logger_tag {
    inline constexpr std::string_view FSD_SERVER = "FsdServer";
    inline constexpr std::string_view FSD_CONNECTION = "FsdConnection";
    inline constexpr std::string_view DISPATCHER = "Dispatcher";
    inline constexpr std::string_view HANDLERS = "Handlers";
    inline constexpr std::string_view SESSION_REGISTRY = "SessionRegistry";
    inline constexpr std::string_view BROADCAST_BUS = "BroadcastBus";
    inline constexpr std::string_view AUTH = "Auth";
} // namespace logger_tag

inline constexpr std::string_view LOG_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] [pid %P tid %t] %v";

// we need named loggers, not the default one
inline log_t initialize_logger(std::string name, std::string prefix, spdlog::level::level_enum level) {
    if (auto log_ptr = spdlog::get(name); log_ptr) {
        // prevent creating two loggers with same name
        log_ptr->set_level(level);
        return log_ptr;
    }

    std::vector<spdlog::sink_ptr> sinks{std::make_shared<spdlog::sinks::stdout_color_sink_mt>()};
    if (!prefix.empty()) {
        std::filesystem::create_directories(prefix);
        if (prefix.back() != '/') {
            prefix += '/';
        }

        using namespace std::chrono;
        auto dtn = system_clock::now().time_since_epoch();
        auto file_name = fmt::format("{}{}-{}.txt", prefix, name, duration_cast<seconds>(dtn).count());
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(file_name, true));
    }

    auto logger = std::make_shared<spdlog::logger>(std::move(name), sinks.begin(), sinks.end());
    logger->set_pattern(std::string(LOG_PATTERN));
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);
    try {
        spdlog::register_logger(logger);
    } catch (const spdlog::spdlog_ex&) {
        // lost a registration race with another thread
        return spdlog::get(logger->name());
    }
    return logger;
}

inline void initialize_all_loggers(spdlog::level::level_enum level, const std::string& prefix = {}) {
    static constexpr std::array<std::string_view, 7> all_loggers = {
        logger_tag::FSD_SERVER,
        logger_tag::FSD_CONNECTION,
        logger_tag::DISPATCHER,
        logger_tag::HANDLERS,
        logger_tag::SESSION_REGISTRY,
        logger_tag::BROADCAST_BUS,
        logger_tag::AUTH,
    };

    for (auto tag : all_loggers) {
        initialize_logger(std::string(tag), prefix, level);
    }
    spdlog::flush_every(std::chrono::seconds(1));
}

// falls back to a stdout logger when initialize_all_loggers was never called (tests, tools)
inline log_t get_logger(std::string_view tag) {
    if (auto log_ptr = spdlog::get(std::string(tag)); log_ptr) {
        return log_ptr;
    }
    return initialize_logger(std::string(tag), {}, spdlog::level::info);
}
