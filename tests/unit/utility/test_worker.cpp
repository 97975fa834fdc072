// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include "utility/worker.hpp"

#include <catch2/catch.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

TEST_CASE("bounded_queue: refuses when full") {
    bounded_queue<int> q(2);
    int one = 1, two = 2, three = 3;

    REQUIRE(q.push(one));
    REQUIRE(q.push(two));
    REQUIRE_FALSE(q.push(three));
    REQUIRE(q.size() == 2);
    REQUIRE(q.capacity() == 2);

    REQUIRE(q.try_pop() == 1);
    REQUIRE(q.push(three));
    REQUIRE(q.try_pop() == 2);
    REQUIRE(q.try_pop() == 3);
    REQUIRE_FALSE(q.try_pop().has_value());
}

TEST_CASE("bounded_queue: a refused task stays with the caller") {
    bounded_queue<std::string> q(1);
    std::string first = "first";
    std::string second = "second";

    REQUIRE(q.push(first));
    REQUIRE_FALSE(q.push(second));
    REQUIRE(second == "second");

    REQUIRE(q.try_pop() == "first");
    REQUIRE(q.push(second));
    REQUIRE(q.try_pop() == "second");
}

TEST_CASE("bounded_queue: wait_and_pop returns on stop") {
    bounded_queue<int> q(4);
    std::stop_source stop;

    std::atomic<bool> got_task{true};

    std::thread waiter([&]() { got_task = q.wait_and_pop(stop.get_token()).has_value(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    stop.request_stop();
    waiter.join();

    REQUIRE_FALSE(got_task.load());
}

TEST_CASE("serial_worker: runs tasks in order on one thread") {
    std::mutex m;
    std::vector<int> seen;
    std::vector<std::thread::id> threads;

    serial_worker<int> worker(
        [&](int& task) {
            std::lock_guard<std::mutex> lk(m);
            seen.push_back(task);
            threads.push_back(std::this_thread::get_id());
        },
        100);
    worker.start();

    for (int i = 0; i < 50; ++i) {
        int task = i;
        REQUIRE(worker.submit(task));
    }

    for (int i = 0; i < 200; ++i) {
        {
            std::lock_guard<std::mutex> lk(m);
            if (seen.size() == 50) {
                break;
            }
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    worker.stop();

    REQUIRE(seen.size() == 50);
    for (int i = 0; i < 50; ++i) {
        REQUIRE(seen[i] == i);
    }
    REQUIRE(std::all_of(threads.begin(), threads.end(), [&](auto id) { return id == threads.front(); }));
    REQUIRE(threads.front() != std::this_thread::get_id());
}

TEST_CASE("serial_worker: full queue rejects without blocking") {
    std::atomic<int> handled{0};
    serial_worker<int> worker([&handled](int&) { handled++; }, 3);

    // not started, nothing drains the queue
    std::vector<int> tasks{1, 2, 3, 4};
    REQUIRE(worker.submit(tasks[0]));
    REQUIRE(worker.submit(tasks[1]));
    REQUIRE(worker.submit(tasks[2]));
    REQUIRE_FALSE(worker.submit(tasks[3]));
    REQUIRE(worker.pending() == 3);

    worker.stop();
    REQUIRE(worker.pending() == 0);
    REQUIRE(handled.load() == 0);
}
