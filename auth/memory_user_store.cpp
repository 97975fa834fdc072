// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include "memory_user_store.hpp"

#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>

#include <cassert>
#include <vector>

namespace auth {
    user_entry parse_user_entry(std::string_view entry) {
        std::vector<std::string> parts;
        std::string raw(entry);
        boost::algorithm::split(parts, raw, [](char c) { return c == ':'; });
        for (auto& part : parts) {
            boost::algorithm::trim(part);
        }

        if (parts.size() < 3 || parts.size() > 5 || parts[0].empty()) {
            throw std::invalid_argument("user entry must be network_id:password:real name[:atc_rating[:pilot_rating]]: " +
                                        raw);
        }

        user_entry user{
            .network_id = parts[0],
            .password = parts[1],
            .record = user_record{.real_name = parts[2]},
        };
        if (parts.size() > 3) {
            user.record.atc_rating = std::stoi(parts[3]);
        }
        if (parts.size() > 4) {
            user.record.pilot_rating = std::stoi(parts[4]);
        }
        return user;
    }

    memory_user_store::memory_user_store()
        : log_(get_logger(logger_tag::AUTH)) {
        assert(log_ && "auth logger must be initialized");
    }

    void memory_user_store::add_client(std::string client_software_id) {
        std::unique_lock lock(mutex_);
        whitelist_.insert(std::move(client_software_id));
    }

    void memory_user_store::add_user(user_entry user) {
        std::unique_lock lock(mutex_);
        auto network_id = user.network_id;
        users_.insert_or_assign(std::move(network_id), std::move(user));
    }

    void memory_user_store::load(const std::vector<std::string>& client_ids, const std::vector<std::string>& users) {
        for (const auto& client_id : client_ids) {
            add_client(client_id);
        }
        for (const auto& line : users) {
            add_user(parse_user_entry(line));
        }
        log_->info("Loaded {} whitelisted clients and {} users", client_ids.size(), users.size());
    }

    bool memory_user_store::is_allowed(std::string_view client_software_id) const {
        std::shared_lock lock(mutex_);
        bool allowed = whitelist_.contains(std::string(client_software_id));
        if (!allowed) {
            log_->warn("Client ID not whitelisted: {}", client_software_id);
        }
        return allowed;
    }

    user_record memory_user_store::authenticate(std::string_view network_id, std::string_view password) const {
        std::shared_lock lock(mutex_);
        auto it = users_.find(std::string(network_id));
        if (it == users_.end()) {
            throw auth_error(auth_failure::USER_NOT_FOUND, std::string(network_id));
        }
        if (it->second.password != password) {
            log_->warn("Invalid password for user: {}", network_id);
            throw auth_error(auth_failure::INVALID_CREDENTIALS, std::string(network_id));
        }

        log_->info("User {} successfully authenticated", network_id);
        return it->second.record;
    }

    size_t memory_user_store::user_count() const {
        std::shared_lock lock(mutex_);
        return users_.size();
    }
} // namespace auth
