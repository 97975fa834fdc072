// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 OtterStax

#pragma once

#include <boost/asio/ip/tcp.hpp>

#include <functional>
#include <string>

// A connection is identified by its remote transport endpoint for the socket's lifetime.
using connection_id = boost::asio::ip::tcp::endpoint;

template<typename T, typename... Rest>
void hash_combine(std::size_t& seed, const T& v, const Rest&... rest) {
    seed ^= std::hash<T>{}(v) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
    (hash_combine(seed, rest), ...);
}

struct connection_id_hash {
    std::size_t operator()(const connection_id& id) const {
        size_t combined_hash = 42;
        hash_combine(combined_hash, id.address().to_string(), id.port());
        return combined_hash;
    }
};

// Port 0 never belongs to an accepted peer, so it marks server-originated traffic.
inline connection_id server_connection_id() { return connection_id(boost::asio::ip::address_v4::any(), 0); }

inline bool is_server_connection_id(const connection_id& id) { return id.port() == 0; }

inline std::string connection_string(const connection_id& id) {
    return id.address().to_string() + ":" + std::to_string(id.port());
}
