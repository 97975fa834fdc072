// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include "auth_provider.hpp"
#include "utility/logger.hpp"

#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace auth {
    struct user_entry {
        std::string network_id;
        std::string password;
        user_record record;
    };

    // Parses "network_id:password:real name:atc_rating:pilot_rating"; ratings are optional.
    // Throws std::invalid_argument on malformed input.
    user_entry parse_user_entry(std::string_view entry);

    // Whitelist and user accounts held in memory, seeded from configuration.
    class memory_user_store final
        : public whitelist_checker
        , public authenticator {
    public:
        memory_user_store();

        void add_client(std::string client_software_id);
        void add_user(user_entry user);

        // Seeds the store from configuration values; throws std::invalid_argument on a bad user entry.
        void load(const std::vector<std::string>& client_ids, const std::vector<std::string>& users);

        bool is_allowed(std::string_view client_software_id) const override;
        user_record authenticate(std::string_view network_id, std::string_view password) const override;

        size_t user_count() const;

    private:
        mutable std::shared_mutex mutex_;
        std::unordered_set<std::string> whitelist_;
        std::unordered_map<std::string, user_entry> users_;
        log_t log_;
    };
} // namespace auth
