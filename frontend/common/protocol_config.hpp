// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace frontend {
    inline constexpr size_t MAX_LINE_LENGTH = 64 * 1024; // one protocol line, terminator included
    inline constexpr std::chrono::milliseconds CONNECTION_EXCEPTION_TIMEOUT = std::chrono::milliseconds(100);
    // how often a reader paused on a full request queue tries again
    inline constexpr std::chrono::milliseconds QUEUE_FULL_RETRY_INTERVAL = std::chrono::milliseconds(1);

    struct frontend_server_config {
        std::string host = "0.0.0.0";
        uint16_t port = 0;
        size_t pool_size = 1;
    };
} // namespace frontend
