// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include "session.hpp"
#include "utility/logger.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace registry {
    // Sessions by connection plus a callsign -> connection index.
    //
    // The map lock is only held to find, insert or erase an entry; a session is mutated under its own
    // mutex, so handlers working on different connections never wait on each other. The callsign index
    // is eventually consistent with the primary map: a callsign whose connection is gone is dropped the
    // next time it is resolved.
    class session_registry {
    public:
        session_registry();

        session_registry(const session_registry&) = delete;
        session_registry& operator=(const session_registry&) = delete;

        // Creates a CONNECTED session; an existing session for the same connection is kept as is.
        session register_session(const connection_id& id);

        std::optional<session> get(const connection_id& id) const;

        // Applies fn under exclusive access to that one entry. Returns false when the session is gone.
        bool mutate(const connection_id& id, const std::function<void(session&)>& fn);

        // Returns false when the connection has no session (the index is left untouched).
        bool index_callsign(const std::string& callsign, const connection_id& id);
        bool unindex_callsign(const std::string& callsign);
        std::optional<connection_id> resolve_callsign(const std::string& callsign);
        // Index first, then a scan over sessions whose callsign was recorded at identification but
        // not indexed yet (identified, not logged in).
        std::optional<session> find_by_callsign(const std::string& callsign);

        // Also drops every callsign that points at this connection. Unknown ids are a no-op.
        bool remove(const connection_id& id);

        size_t size() const;
        size_t indexed_callsigns() const;

    private:
        struct entry {
            explicit entry(const connection_id& id)
                : value(id) {}

            std::mutex mutex;
            session value;
            bool removed = false;
        };

        std::shared_ptr<entry> find_entry(const connection_id& id) const;

        mutable std::shared_mutex sessions_mutex_;
        std::unordered_map<connection_id, std::shared_ptr<entry>, connection_id_hash> sessions_;

        mutable std::mutex index_mutex_;
        std::unordered_map<std::string, connection_id> callsign_index_;

        log_t log_;
    };
} // namespace registry
