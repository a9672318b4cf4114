// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "util/threadsafe_containers.hpp"
#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace gossipnet::util;

// ============================================================================
// BoundedQueue Tests
// ============================================================================

TEST_CASE("BoundedQueue: Basic operations", "[util][threadsafe][queue]") {
    BoundedQueue<std::string> queue(3);

    SECTION("FIFO order") {
        REQUIRE(queue.TryPush("a") == BoundedQueue<std::string>::PushResult::Ok);
        REQUIRE(queue.TryPush("b") == BoundedQueue<std::string>::PushResult::Ok);
        REQUIRE(queue.Size() == 2);
        REQUIRE(queue.Pop() == "a");
        REQUIRE(queue.TryPop() == "b");
        REQUIRE(queue.Size() == 0);
    }

    SECTION("Full queue rejects without blocking") {
        for (int i = 0; i < 3; ++i) {
            REQUIRE(queue.TryPush(std::to_string(i)) == BoundedQueue<std::string>::PushResult::Ok);
        }
        REQUIRE(queue.TryPush("x") == BoundedQueue<std::string>::PushResult::Full);
        REQUIRE(queue.Size() == queue.Capacity());

        // Space frees up after a pop
        REQUIRE(queue.TryPop() == "0");
        REQUIRE(queue.TryPush("x") == BoundedQueue<std::string>::PushResult::Ok);
    }

    SECTION("TryPop on empty queue") {
        REQUIRE_FALSE(queue.TryPop().has_value());
    }

    SECTION("Close discards items and rejects pushes") {
        queue.TryPush("a");
        queue.Close();
        REQUIRE(queue.IsClosed());
        REQUIRE(queue.Size() == 0);
        REQUIRE_FALSE(queue.Pop().has_value());
        REQUIRE(queue.TryPush("b") == BoundedQueue<std::string>::PushResult::Closed);

        // Idempotent
        queue.Close();
        REQUIRE(queue.IsClosed());
    }
}

TEST_CASE("BoundedQueue: Close wakes a blocked consumer", "[util][threadsafe][queue]") {
    BoundedQueue<int> queue(4);
    std::atomic<bool> returned{false};
    std::atomic<bool> got_item{false};

    std::thread consumer([&] {
        got_item = queue.Pop().has_value();
        returned = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    REQUIRE_FALSE(returned.load());
    queue.Close();
    consumer.join();
    REQUIRE(returned.load());
    REQUIRE_FALSE(got_item.load());
}

TEST_CASE("BoundedQueue: Concurrent producers", "[util][threadsafe][queue]") {
    constexpr int kProducers = 4;
    constexpr int kPerProducer = 250;
    BoundedQueue<int> queue(kProducers * kPerProducer);

    std::vector<std::thread> producers;
    for (int p = 0; p < kProducers; ++p) {
        producers.emplace_back([&queue, p] {
            for (int i = 0; i < kPerProducer; ++i) {
                queue.TryPush(p * kPerProducer + i);
            }
        });
    }
    for (auto& t : producers) {
        t.join();
    }
    REQUIRE(queue.Size() == static_cast<size_t>(kProducers * kPerProducer));

    // Per-producer order is preserved
    std::vector<int> last(kProducers, -1);
    while (auto item = queue.TryPop()) {
        const int producer = *item / kPerProducer;
        REQUIRE(*item > last[producer]);
        last[producer] = *item;
    }
}
