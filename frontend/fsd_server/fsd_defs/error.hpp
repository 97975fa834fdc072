// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace frontend::fsd {
    enum class fsd_error : uint16_t
    {
        OK = 0,
        INVALID_CREDENTIALS = 3,
        NO_FLIGHTPLAN = 8,
        SERVER_FULL = 12,
        UNAUTHORIZED_SOFTWARE = 16,
    };

    // Error codes travel as zero-padded three digit fields, e.g. "003".
    inline std::string error_code_string(fsd_error code) {
        auto value = std::to_string(static_cast<uint16_t>(code));
        if (value.size() < 3) {
            value.insert(0, 3 - value.size(), '0');
        }
        return value;
    }

    struct error_text {
        static constexpr std::string_view INVALID_CREDENTIALS = "Invalid credentials";
        static constexpr std::string_view NO_FLIGHTPLAN = "No flightplan";
        static constexpr std::string_view SERVER_FULL = "Too many clients connected";
        static constexpr std::string_view UNAUTHORIZED_SOFTWARE = "Unauthorized client software";
    };
} // namespace frontend::fsd
