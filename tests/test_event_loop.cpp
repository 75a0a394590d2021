#include <catch2/catch_test_macros.hpp>

#include "rtvoice/core/event_loop.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

using rtvoice::EventLoop;
using rtvoice::LifetimeToken;

TEST_CASE("poll runs posted tasks in order") {
    EventLoop loop;
    std::vector<int> order;
    loop.post([&]() { order.push_back(1); });
    loop.post([&]() { order.push_back(2); });
    REQUIRE(loop.poll() == 2);
    REQUIRE(order == std::vector<int>{1, 2});
    REQUIRE(loop.pending() == 0);
}

TEST_CASE("tasks posted by tasks run in the same poll") {
    EventLoop loop;
    int runs = 0;
    loop.post([&]() {
        ++runs;
        loop.post([&]() { ++runs; });
    });
    REQUIRE(loop.poll() == 2);
    REQUIRE(runs == 2);
}

TEST_CASE("delayed tasks wait for their deadline") {
    EventLoop loop;
    int runs = 0;
    loop.post_after(std::chrono::milliseconds(500), [&]() { ++runs; });
    const auto now = EventLoop::Clock::now();
    REQUIRE(loop.poll(now) == 0);
    REQUIRE(loop.pending() == 1);
    REQUIRE(loop.poll(now + std::chrono::milliseconds(600)) == 1);
    REQUIRE(runs == 1);
}

TEST_CASE("a throwing task does not stop the loop") {
    EventLoop loop;
    int runs = 0;
    loop.post([]() { throw std::runtime_error("boom"); });
    loop.post([&]() { ++runs; });
    REQUIRE(loop.poll() == 2);
    REQUIRE(runs == 1);
}

TEST_CASE("guarded tasks become no-ops after the token is destroyed") {
    EventLoop loop;
    int runs = 0;
    auto token = std::make_unique<LifetimeToken>();
    loop.post(token->guard([&]() { ++runs; }));
    token.reset();
    loop.poll();
    REQUIRE(runs == 0);
}

TEST_CASE("run processes work posted from another thread until stopped") {
    EventLoop loop;
    int runs = 0;
    std::thread producer([&]() {
        loop.post([&]() { ++runs; });
        loop.post_after(std::chrono::milliseconds(20), [&]() {
            ++runs;
            loop.stop();
        });
    });
    loop.run();
    producer.join();
    REQUIRE(runs == 2);
    REQUIRE(loop.stopped());
}
