/*
 * Unit tests for intensity throttling
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <cminer/mining/throttle.hpp>

#include <atomic>
#include <chrono>

using namespace cminer::mining;
using namespace std::chrono;

TEST_SUITE("Throttle") {
    TEST_CASE("full intensity never pauses") {
        CHECK(Throttle::pause_for(milliseconds(10), 100) == nanoseconds(0));
        CHECK(Throttle::pause_for(milliseconds(10), 150) == nanoseconds(0));
    }

    TEST_CASE("pause keeps busy / (busy + pause) at the intensity") {
        CHECK(Throttle::pause_for(milliseconds(10), 50) == milliseconds(10));
        CHECK(Throttle::pause_for(milliseconds(10), 25) == milliseconds(30));
        CHECK(Throttle::pause_for(milliseconds(30), 75) == milliseconds(10));
        CHECK(Throttle::pause_for(milliseconds(1), 1) == milliseconds(99));
        // Below 1 is treated as 1
        CHECK(Throttle::pause_for(milliseconds(1), -5) == milliseconds(99));
        CHECK(Throttle::pause_for(nanoseconds(0), 50) == nanoseconds(0));
    }

    TEST_CASE("sleep is interruptible") {
        std::atomic<int> checks{0};
        auto start = steady_clock::now();
        bool completed = Throttle::sleep(seconds(5), [&]{ return ++checks > 2; }, milliseconds(10));
        CHECK_FALSE(completed);
        CHECK(steady_clock::now() - start < seconds(1));
    }

    TEST_CASE("sleep completes when not interrupted") {
        auto start = steady_clock::now();
        CHECK(Throttle::sleep(milliseconds(60), []{ return false; }));
        CHECK(steady_clock::now() - start >= milliseconds(60));
    }

    TEST_CASE("measured duty cycle at 50%") {
        // Busy spin for a fixed slice, then pause as a worker would
        nanoseconds busy_total{0};
        auto start = steady_clock::now();
        for (int i = 0; i < 20; ++i) {
            auto t0 = steady_clock::now();
            while (steady_clock::now() - t0 < milliseconds(5)) {
            }
            auto busy = steady_clock::now() - t0;
            busy_total += busy;
            Throttle::sleep(Throttle::pause_for(busy, 50), []{ return false; });
        }
        const double wall = duration<double>(steady_clock::now() - start).count();
        const double duty = duration<double>(busy_total).count() / wall;
        CHECK(duty >= 0.40);
        CHECK(duty <= 0.60);
    }
}
