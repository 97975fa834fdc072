// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include "broadcast_message.hpp"
#include "utility/logger.hpp"

#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <variant>
#include <vector>

namespace broadcast {
    using message_ptr = std::shared_ptr<const broadcast_message>;

    // Reported once in place of the messages a slow subscriber lost.
    struct lagged {
        uint64_t skipped = 0;
    };

    using received_t = std::variant<message_ptr, lagged>;

    // One consumer side of the bus. Holds at most `capacity` undelivered messages; when full the
    // oldest one is dropped and counted as lag.
    class subscription {
    public:
        using notify_t = std::function<void()>;

        subscription(connection_id owner, size_t capacity);

        subscription(const subscription&) = delete;
        subscription& operator=(const subscription&) = delete;

        const connection_id& owner() const noexcept { return owner_; }

        // Lag is reported before the messages that survived it.
        std::optional<received_t> try_recv();

        // Called after every push, from the publishing thread.
        void set_notify(notify_t notify);

        size_t backlog() const;

    private:
        friend class broadcast_bus;

        void push(const message_ptr& msg);

        connection_id owner_;
        size_t capacity_;

        mutable std::mutex mutex_;
        std::deque<message_ptr> queue_;
        uint64_t lagged_ = 0;
        notify_t notify_;
    };

    // Multi-producer fan-out. Publishing never blocks on a consumer.
    class broadcast_bus {
    public:
        explicit broadcast_bus(size_t capacity = 1000);

        broadcast_bus(const broadcast_bus&) = delete;
        broadcast_bus& operator=(const broadcast_bus&) = delete;

        // The bus keeps a weak reference; dropping the returned pointer unsubscribes.
        std::shared_ptr<subscription> subscribe(const connection_id& owner);

        // Returns the number of live subscribers the message was queued for.
        size_t publish(broadcast_message msg);

        size_t subscriber_count() const;
        size_t capacity() const noexcept { return capacity_; }

    private:
        size_t capacity_;
        mutable std::mutex mutex_;
        std::vector<std::weak_ptr<subscription>> subscribers_;
        log_t log_;
    };
} // namespace broadcast
