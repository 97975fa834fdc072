// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace auth {
    struct user_record {
        std::string real_name;
        int32_t atc_rating = 1;
        int32_t pilot_rating = 1;
    };

    enum class auth_failure : uint8_t
    {
        INVALID_CREDENTIALS,
        USER_NOT_FOUND,
        CLIENT_NOT_WHITELISTED,
        OTHER,
    };

    inline const char* to_string(auth_failure failure) {
        switch (failure) {
            case auth_failure::INVALID_CREDENTIALS:
                return "Invalid credentials";
            case auth_failure::USER_NOT_FOUND:
                return "User not found";
            case auth_failure::CLIENT_NOT_WHITELISTED:
                return "Client not whitelisted";
            case auth_failure::OTHER:
                return "Authentication error";
        }
        return "Authentication error";
    }

    class auth_error : public std::runtime_error {
    public:
        explicit auth_error(auth_failure failure)
            : std::runtime_error(to_string(failure))
            , failure_(failure) {}

        auth_error(auth_failure failure, const std::string& detail)
            : std::runtime_error(std::string(to_string(failure)) + ": " + detail)
            , failure_(failure) {}

        auth_failure failure() const noexcept { return failure_; }

    private:
        auth_failure failure_;
    };

    // Allow-list of recognised client software identifiers.
    class whitelist_checker {
    public:
        virtual ~whitelist_checker() = default;
        virtual bool is_allowed(std::string_view client_software_id) const = 0;
    };

    class authenticator {
    public:
        virtual ~authenticator() = default;

        // Throws auth_error when the user is unknown or the password does not match.
        virtual user_record authenticate(std::string_view network_id, std::string_view password) const = 0;
    };
} // namespace auth
