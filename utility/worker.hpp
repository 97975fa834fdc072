// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <queue>
#include <stop_token>
#include <thread>

// Bounded multi-producer queue. Producers never block: push fails when the queue is full and leaves
// the task with the caller, who decides whether to retry or give up.
template<typename Task>
class bounded_queue {
public:
    explicit bounded_queue(std::size_t max_size = 1000)
        : max_size_{max_size} {}

    bounded_queue(const bounded_queue&) = delete;
    bounded_queue& operator=(const bounded_queue&) = delete;
    bounded_queue(bounded_queue&&) = delete;
    bounded_queue& operator=(bounded_queue&&) = delete;

    bool push(Task& task) {
        {
            std::lock_guard<std::mutex> lk(m_);
            if (tasks_.size() >= max_size_) {
                return false;
            }
            tasks_.push(std::move(task));
        }
        cv_.notify_one();
        return true;
    }

    // Returns nullopt once stop is requested; queued tasks left behind are discarded by the owner.
    std::optional<Task> wait_and_pop(std::stop_token stop) {
        std::unique_lock<std::mutex> lk(m_);
        if (!cv_.wait(lk, stop, [this]() { return !tasks_.empty(); })) {
            return std::nullopt;
        }

        auto task = std::move(tasks_.front());
        tasks_.pop();
        return task;
    }

    std::optional<Task> try_pop() {
        std::lock_guard<std::mutex> lk(m_);
        if (tasks_.empty()) {
            return std::nullopt;
        }
        auto task = std::move(tasks_.front());
        tasks_.pop();
        return task;
    }

    void reset() {
        std::lock_guard<std::mutex> lk(m_);
        while (!tasks_.empty()) {
            tasks_.pop();
        }
    }

    std::size_t size() const noexcept {
        std::lock_guard<std::mutex> lk(m_);
        return tasks_.size();
    }

    std::size_t capacity() const noexcept { return max_size_; }

private:
    std::size_t max_size_;
    mutable std::mutex m_;
    std::condition_variable_any cv_;
    std::queue<Task> tasks_;
};

// Drains a bounded_queue on a single thread, so tasks run one at a time in submission order.
template<typename Task>
class serial_worker {
public:
    using handler_t = std::function<void(Task&)>;

    serial_worker(handler_t handler, std::size_t max_size)
        : tasks_(max_size)
        , handler_(std::move(handler)) {}

    serial_worker(const serial_worker&) = delete;
    serial_worker& operator=(const serial_worker&) = delete;

    void start() {
        if (worker_.joinable()) {
            return;
        }
        worker_ = std::jthread([this](std::stop_token stop) { process(stop); });
    }

    void stop() {
        if (worker_.joinable()) {
            worker_.request_stop();
            worker_.join();
        }
        tasks_.reset();
    }

    // task is moved from only when it was queued
    bool submit(Task& task) { return tasks_.push(task); }

    std::size_t pending() const noexcept { return tasks_.size(); }

    ~serial_worker() { stop(); }

private:
    void process(std::stop_token stop) {
        while (!stop.stop_requested()) {
            if (auto task_opt = tasks_.wait_and_pop(stop); task_opt) {
                handler_(*task_opt);
            }
        }
    }

    bounded_queue<Task> tasks_;
    handler_t handler_;
    std::jthread worker_;
};
