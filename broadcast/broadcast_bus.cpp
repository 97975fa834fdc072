// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include "broadcast_bus.hpp"

#include <algorithm>
#include <cassert>

namespace broadcast {
    subscription::subscription(connection_id owner, size_t capacity)
        : owner_(std::move(owner))
        , capacity_(std::max<size_t>(capacity, 1)) {}

    void subscription::push(const message_ptr& msg) {
        notify_t notify;
        {
            std::lock_guard lock(mutex_);
            if (queue_.size() >= capacity_) {
                queue_.pop_front();
                ++lagged_;
            }
            queue_.push_back(msg);
            notify = notify_;
        }

        if (notify) {
            notify();
        }
    }

    std::optional<received_t> subscription::try_recv() {
        std::lock_guard lock(mutex_);
        if (lagged_ > 0) {
            lagged report{.skipped = lagged_};
            lagged_ = 0;
            return report;
        }
        if (queue_.empty()) {
            return std::nullopt;
        }

        auto msg = std::move(queue_.front());
        queue_.pop_front();
        return msg;
    }

    void subscription::set_notify(notify_t notify) {
        std::lock_guard lock(mutex_);
        notify_ = std::move(notify);
    }

    size_t subscription::backlog() const {
        std::lock_guard lock(mutex_);
        return queue_.size();
    }

    broadcast_bus::broadcast_bus(size_t capacity)
        : capacity_(capacity)
        , log_(get_logger(logger_tag::BROADCAST_BUS)) {
        assert(log_ && "broadcast bus logger must be initialized");
    }

    std::shared_ptr<subscription> broadcast_bus::subscribe(const connection_id& owner) {
        auto sub = std::make_shared<subscription>(owner, capacity_);

        std::lock_guard lock(mutex_);
        std::erase_if(subscribers_, [](const auto& weak) { return weak.expired(); });
        subscribers_.push_back(sub);
        log_->debug("Subscribed {} ({} subscribers)", connection_string(owner), subscribers_.size());
        return sub;
    }

    size_t broadcast_bus::publish(broadcast_message msg) {
        auto shared_msg = std::make_shared<const broadcast_message>(std::move(msg));

        std::vector<std::shared_ptr<subscription>> targets;
        {
            std::lock_guard lock(mutex_);
            targets.reserve(subscribers_.size());
            std::erase_if(subscribers_, [&targets](const auto& weak) {
                auto sub = weak.lock();
                if (!sub) {
                    return true;
                }
                targets.push_back(std::move(sub));
                return false;
            });
        }

        // pushed outside the bus lock, notify callbacks may post work to other threads
        for (auto& sub : targets) {
            sub->push(shared_msg);
        }
        return targets.size();
    }

    size_t broadcast_bus::subscriber_count() const {
        std::lock_guard lock(mutex_);
        return std::count_if(subscribers_.begin(), subscribers_.end(), [](const auto& weak) {
            return !weak.expired();
        });
    }
} // namespace broadcast
