/**
 * @file test_task_queue.cpp
 * @brief Unit tests for the main-loop TaskQueue
 */

#include <catch2/catch_test_macros.hpp>
#include <shaderlay/task_queue.h>
#include <thread>
#include <vector>

using namespace shaderlay;

TEST_CASE("TaskQueue runs posted tasks in order", "[queue]") {
    TaskQueue queue;
    std::vector<int> order;

    queue.post([&] { order.push_back(1); });
    queue.post([&] { order.push_back(2); });
    queue.post([&] { order.push_back(3); });
    REQUIRE(queue.pending() == 3);

    REQUIRE(queue.drain(0.0) == 3);
    REQUIRE(order == std::vector<int>{1, 2, 3});
    REQUIRE(queue.pending() == 0);
}

TEST_CASE("TaskQueue defers tasks posted while draining", "[queue]") {
    TaskQueue queue;
    int inner = 0;

    queue.post([&] {
        queue.post([&] { inner++; });
    });

    REQUIRE(queue.drain(0.0) == 1);
    REQUIRE(inner == 0);
    REQUIRE(queue.drain(0.0) == 1);
    REQUIRE(inner == 1);
}

TEST_CASE("TaskQueue delayed tasks", "[queue]") {
    TaskQueue queue;
    queue.drain(1.0);

    bool ran = false;
    queue.postDelayed(0.1, [&] { ran = true; });

    SECTION("not due before the delay has passed") {
        queue.drain(1.05);
        REQUIRE_FALSE(ran);
        REQUIRE(queue.pending() == 1);
    }

    SECTION("due once the delay has passed") {
        queue.drain(1.05);
        queue.drain(1.1);
        REQUIRE(ran);
        REQUIRE(queue.pending() == 0);
    }
}

TEST_CASE("TaskQueue accepts posts from other threads", "[queue]") {
    TaskQueue queue;
    int count = 0;

    std::vector<std::thread> threads;
    for (int i = 0; i < 4; i++) {
        threads.emplace_back([&] {
            for (int j = 0; j < 25; j++) {
                queue.post([&] { count++; });
            }
        });
    }
    for (auto& t : threads) t.join();

    REQUIRE(queue.drain(0.0) == 100);
    REQUIRE(count == 100);
}
