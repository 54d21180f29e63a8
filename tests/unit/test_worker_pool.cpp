/*
 * Unit tests for worker pool lifecycle, supervision and detached workers
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <cminer/mining/worker_pool.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>

#include "support/fake_pool.hpp"
#include "support/genesis.hpp"
#include "support/recording_logger.hpp"

using namespace cminer;
using namespace cminer::mining;
using namespace std::chrono;

namespace {

// Every hash meets every target; blocks while 'hold' is set and not released.
class GateHasher : public crypto::Hasher {
public:
    crypto::Hash256 hash(const std::uint8_t*, std::size_t) const override {
        entered.fetch_add(1);
        while (hold.load() && !release.load()) std::this_thread::sleep_for(milliseconds(1));
        finished.fetch_add(1);
        crypto::Hash256 h;
        h.fill(0);
        return h;
    }
    crypto::Algorithm algorithm() const override { return crypto::Algorithm::Sha256d; }

    std::atomic<bool> hold{false};
    std::atomic<bool> release{false};
    mutable std::atomic<int> entered{0};
    mutable std::atomic<int> finished{0};
};

// Meets no target.
class MissHasher : public crypto::Hasher {
public:
    crypto::Hash256 hash(const std::uint8_t*, std::size_t) const override {
        crypto::Hash256 h;
        h.fill(0xff);
        return h;
    }
    crypto::Algorithm algorithm() const override { return crypto::Algorithm::Sha256d; }
};

class FaultyHasher : public crypto::Hasher {
public:
    crypto::Hash256 hash(const std::uint8_t*, std::size_t) const override {
        throw std::runtime_error("hash unit fault");
    }
    crypto::Algorithm algorithm() const override { return crypto::Algorithm::Sha256d; }
};

std::shared_ptr<pool::JobStore> store_with_job() {
    auto jobs = std::make_shared<pool::JobStore>(crypto::Algorithm::Sha256d);
    jobs->set_extranonce(test::kGenesisExtranonce1, 4);
    jobs->set_job(test::genesis_job("j1"));
    return jobs;
}

WorkerPoolOptions one_thread() {
    WorkerPoolOptions o;
    o.threads = 1;
    o.batch_size = 16;
    return o;
}

} // namespace

TEST_SUITE("WorkerPool") {
    TEST_CASE("stop detaches a stuck worker and cuts it off from the logger") {
        auto log = std::make_unique<test::RecordingLogger>();
        auto hasher = std::make_shared<GateHasher>();
        hasher->hold = true;
        auto shares = std::make_shared<pool::ShareQueue>(16);

        {
            WorkerPool workers(*log, store_with_job(), shares, hasher, one_thread());
            workers.start();
            REQUIRE(test::wait_until([&]{ return hasher->entered.load() >= 1; }, seconds(5)));

            CHECK_FALSE(workers.stop(milliseconds(50)));
            CHECK(log->contains("did not exit within 50 ms"));
        }

        // The share found after release would be logged; the logger no longer exists
        log.reset();
        hasher->release = true;
        CHECK(test::wait_until([&]{ return hasher->finished.load() >= 1; }, seconds(5)));
        std::this_thread::sleep_for(milliseconds(100));
    }

    TEST_CASE("a pool stopped with a detached worker can start again") {
        test::RecordingLogger log;
        auto hasher = std::make_shared<GateHasher>();
        hasher->hold = true;
        auto shares = std::make_shared<pool::ShareQueue>(1024);
        WorkerPool workers(log, store_with_job(), shares, hasher, one_thread());

        workers.start();
        REQUIRE(test::wait_until([&]{ return hasher->entered.load() >= 1; }, seconds(5)));
        CHECK_FALSE(workers.stop(milliseconds(20)));

        hasher->release = true;
        workers.set_intensity(50);
        workers.start();
        CHECK(workers.intensity() == 50);
        // The new worker logs through a fresh, attached guard
        CHECK(test::wait_until([&]{ return log.count("found share") > 0; }, seconds(5)));
        CHECK(workers.stop(seconds(2)));
    }

    TEST_CASE("totals survive stop") {
        test::RecordingLogger log;
        auto shares = std::make_shared<pool::ShareQueue>(16);
        WorkerPool workers(log, store_with_job(), shares, std::make_shared<MissHasher>(), one_thread());

        workers.start();
        REQUIRE(test::wait_until([&]{ return workers.totals().hashes > 0; }, seconds(5)));
        CHECK(workers.totals().live == 1);
        CHECK(workers.stop(seconds(2)));

        auto t = workers.totals();
        CHECK(t.hashes > 0);
        CHECK(t.shares_found == 0);
        CHECK(t.live == 0);
    }

    TEST_CASE("failed workers are restarted until the limit") {
        test::RecordingLogger log;
        auto shares = std::make_shared<pool::ShareQueue>(16);
        auto opts = one_thread();
        opts.max_restarts = 2;
        WorkerPool workers(log, store_with_job(), shares, std::make_shared<FaultyHasher>(), opts);

        workers.start();
        CHECK(test::wait_until([&]{
            workers.supervise(seconds(5));
            return log.contains("restart limit reached");
        }, seconds(5)));
        CHECK(workers.restarts() == 2);
        CHECK(log.count("hash unit fault") >= 3);
        CHECK(workers.totals().live == 0);
        CHECK(workers.stop(seconds(1)));
    }

    TEST_CASE("intensity is clamped") {
        test::RecordingLogger log;
        auto shares = std::make_shared<pool::ShareQueue>(16);
        WorkerPool workers(log, store_with_job(), shares, std::make_shared<MissHasher>(), one_thread());
        workers.set_intensity(150);
        CHECK(workers.intensity() == 100);
        workers.set_intensity(-5);
        CHECK(workers.intensity() == 0);
    }

    TEST_CASE("invalid options are rejected") {
        test::RecordingLogger log;
        auto shares = std::make_shared<pool::ShareQueue>(16);
        auto opts = one_thread();
        opts.threads = 0;
        CHECK_THROWS_AS((WorkerPool(log, store_with_job(), shares, std::make_shared<MissHasher>(), opts)),
                        std::invalid_argument);
    }
}
