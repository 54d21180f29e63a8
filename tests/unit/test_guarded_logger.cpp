/*
 * Unit tests for the detachable logger guard
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <cminer/logging/guarded_logger.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

#include "support/recording_logger.hpp"

using namespace cminer;

TEST_SUITE("GuardedLogger") {
    TEST_CASE("forwards every level while attached") {
        test::RecordingLogger target;
        logging::GuardedLogger guard(target);
        guard.info("one");
        guard.warn("two");
        guard.error("three");
        guard.debug("four");
        CHECK(guard.attached());
        CHECK(target.contains("[INFO] one"));
        CHECK(target.contains("[WARN] two"));
        CHECK(target.contains("[ERROR] three"));
        CHECK(target.contains("[DEBUG] four"));
    }

    TEST_CASE("drops lines after detach") {
        auto target = std::make_unique<test::RecordingLogger>();
        auto guard = std::make_shared<logging::GuardedLogger>(*target);
        guard->info("before");
        guard->detach();
        CHECK_FALSE(guard->attached());
        CHECK(target->lines().size() == 1);

        target.reset();
        guard->error("after the target is gone");
        guard->detach();
        CHECK_FALSE(guard->attached());
    }

    TEST_CASE("detach waits for writers on other threads") {
        auto target = std::make_unique<test::RecordingLogger>();
        auto guard = std::make_shared<logging::GuardedLogger>(*target);
        std::atomic<bool> go{true};
        std::vector<std::thread> writers;
        for (int i = 0; i < 4; ++i) {
            writers.emplace_back([guard, &go]{
                while (go.load()) guard->debug("tick");
            });
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        guard->detach();
        const auto seen = target->count("tick");
        target.reset();
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        go = false;
        for (auto& t : writers) t.join();
        CHECK(seen > 0);
    }
}
