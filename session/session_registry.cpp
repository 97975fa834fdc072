// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include "session_registry.hpp"

#include <cassert>
#include <vector>

namespace registry {
    session_registry::session_registry()
        : log_(get_logger(logger_tag::SESSION_REGISTRY)) {
        assert(log_ && "session registry logger must be initialized");
    }

    session session_registry::register_session(const connection_id& id) {
        std::shared_ptr<entry> ent;
        {
            std::unique_lock lock(sessions_mutex_);
            auto [it, inserted] = sessions_.try_emplace(id, nullptr);
            if (inserted) {
                it->second = std::make_shared<entry>(id);
                log_->debug("Session registered for {}", connection_string(id));
            }
            ent = it->second;
        }

        std::lock_guard entry_lock(ent->mutex);
        return ent->value;
    }

    std::shared_ptr<session_registry::entry> session_registry::find_entry(const connection_id& id) const {
        std::shared_lock lock(sessions_mutex_);
        if (auto it = sessions_.find(id); it != sessions_.end()) {
            return it->second;
        }
        return nullptr;
    }

    std::optional<session> session_registry::get(const connection_id& id) const {
        auto ent = find_entry(id);
        if (!ent) {
            return std::nullopt;
        }

        std::lock_guard entry_lock(ent->mutex);
        if (ent->removed) {
            return std::nullopt;
        }
        return ent->value;
    }

    bool session_registry::mutate(const connection_id& id, const std::function<void(session&)>& fn) {
        auto ent = find_entry(id);
        if (!ent) {
            log_->debug("Mutation skipped, {} has no session", connection_string(id));
            return false;
        }

        std::lock_guard entry_lock(ent->mutex);
        if (ent->removed) {
            return false;
        }
        fn(ent->value);
        return true;
    }

    bool session_registry::index_callsign(const std::string& callsign, const connection_id& id) {
        if (!find_entry(id)) {
            log_->warn("Refusing to index callsign {} for {} without a session", callsign, connection_string(id));
            return false;
        }

        std::lock_guard lock(index_mutex_);
        callsign_index_.insert_or_assign(callsign, id);
        return true;
    }

    bool session_registry::unindex_callsign(const std::string& callsign) {
        std::lock_guard lock(index_mutex_);
        return callsign_index_.erase(callsign) > 0;
    }

    std::optional<connection_id> session_registry::resolve_callsign(const std::string& callsign) {
        connection_id id;
        {
            std::lock_guard lock(index_mutex_);
            auto it = callsign_index_.find(callsign);
            if (it == callsign_index_.end()) {
                return std::nullopt;
            }
            id = it->second;
        }

        if (find_entry(id)) {
            return id;
        }

        // stale: the connection went away without its callsign being unindexed
        std::lock_guard lock(index_mutex_);
        if (auto it = callsign_index_.find(callsign); it != callsign_index_.end() && it->second == id) {
            callsign_index_.erase(it);
            log_->debug("Dropped stale callsign {} -> {}", callsign, connection_string(id));
        }
        return std::nullopt;
    }

    std::optional<session> session_registry::find_by_callsign(const std::string& callsign) {
        if (auto id = resolve_callsign(callsign); id.has_value()) {
            if (auto found = get(*id); found.has_value()) {
                return found;
            }
        }

        std::vector<std::shared_ptr<entry>> entries;
        {
            std::shared_lock lock(sessions_mutex_);
            entries.reserve(sessions_.size());
            for (const auto& [id, ent] : sessions_) {
                entries.push_back(ent);
            }
        }

        for (const auto& ent : entries) {
            std::lock_guard entry_lock(ent->mutex);
            if (!ent->removed && ent->value.callsign == callsign) {
                return ent->value;
            }
        }
        return std::nullopt;
    }

    bool session_registry::remove(const connection_id& id) {
        std::shared_ptr<entry> ent;
        {
            std::unique_lock lock(sessions_mutex_);
            auto it = sessions_.find(id);
            if (it == sessions_.end()) {
                return false;
            }
            ent = std::move(it->second);
            sessions_.erase(it);
        }

        {
            std::lock_guard entry_lock(ent->mutex);
            ent->removed = true;
            ent->value.state = client_state::DISCONNECTED;
        }

        {
            std::lock_guard lock(index_mutex_);
            std::erase_if(callsign_index_, [&id](const auto& item) { return item.second == id; });
        }

        log_->debug("Session removed for {}", connection_string(id));
        return true;
    }

    size_t session_registry::size() const {
        std::shared_lock lock(sessions_mutex_);
        return sessions_.size();
    }

    size_t session_registry::indexed_callsigns() const {
        std::lock_guard lock(index_mutex_);
        return callsign_index_.size();
    }
} // namespace registry
