// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <livecap/core/stopper.hpp>
#include <chrono>
#include <thread>

using namespace livecap::core;
using namespace std::chrono_literals;

TEST_CASE("Stopper - initial state", "[stopper]") {
    Stopper stopper;
    CHECK_FALSE(stopper.stopped());
    CHECK_FALSE(stopper.token().stop_requested());
}

TEST_CASE("Stopper::wait_until", "[stopper]") {
    Stopper stopper;

    SECTION("Times out while running") {
        auto start = Stopper::Clock::now();
        CHECK_FALSE(stopper.wait_until(start + 20ms));
        CHECK(Stopper::Clock::now() - start >= 20ms);
    }

    SECTION("Returns at once when already stopped") {
        stopper.stop();
        auto start = Stopper::Clock::now();
        CHECK(stopper.wait_until(start + 10s));
        CHECK(Stopper::Clock::now() - start < 5s);
    }

    SECTION("Woken by stop from another thread") {
        std::jthread stopping([stopper]() mutable {
            std::this_thread::sleep_for(20ms);
            stopper.stop();
        });
        auto start = Stopper::Clock::now();
        CHECK(stopper.wait_until(start + 10s));
        CHECK(Stopper::Clock::now() - start < 5s);
    }
}

TEST_CASE("Stopper::wait", "[stopper]") {
    Stopper stopper;
    std::jthread stopping([stopper]() mutable {
        std::this_thread::sleep_for(10ms);
        stopper.stop();
    });
    stopper.wait();
    CHECK(stopper.stopped());
}

TEST_CASE("Stopper - copies share state", "[stopper]") {
    Stopper a;
    Stopper b = a;

    b.stop();
    CHECK(a.stopped());
    CHECK(b.stopped());
    CHECK(a.token().stop_requested());
}

TEST_CASE("Stopper::stop is idempotent", "[stopper]") {
    Stopper stopper;
    stopper.stop();
    stopper.stop();
    CHECK(stopper.stopped());
    CHECK(stopper.wait_until(Stopper::Clock::now()));
}

TEST_CASE("Stopper::token", "[stopper]") {
    Stopper stopper;
    auto token = stopper.token();
    bool fired = false;
    std::stop_callback on_stop(token, [&fired] { fired = true; });

    CHECK_FALSE(fired);
    stopper.stop();
    CHECK(fired);
    CHECK(token.stop_requested());
}
