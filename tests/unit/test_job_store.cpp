/*
 * Unit tests for the shared work snapshot store
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <cminer/pool/job_store.hpp>

#include <atomic>
#include <thread>
#include <vector>

#include "support/genesis.hpp"

using namespace cminer;
using namespace cminer::pool;

TEST_SUITE("JobStore") {
    TEST_CASE("defaults") {
        JobStore store(crypto::Algorithm::Scrypt);
        auto s = store.snapshot();
        REQUIRE(s);
        CHECK_FALSE(s->job);
        CHECK_FALSE(s->builder);
        CHECK(s->difficulty == 1.0);
        CHECK(s->pool_target == crypto::diff1_target(crypto::Algorithm::Scrypt));
        CHECK(s->extranonce1.empty());
        CHECK(store.algorithm() == crypto::Algorithm::Scrypt);
    }

    TEST_CASE("set_job publishes a new snapshot") {
        JobStore store(crypto::Algorithm::Sha256d);
        store.set_extranonce(test::kGenesisExtranonce1, 4);
        const auto v0 = store.version();
        const auto before = store.snapshot();

        store.set_job(test::genesis_job("j1"));
        CHECK(store.version() > v0);

        auto s = store.snapshot();
        REQUIRE(s->job);
        REQUIRE(s->builder);
        CHECK(s->job->job_id == "j1");
        CHECK(s->job_extranonce2_size == 4);
        CHECK(s->network_target == crypto::compact_bits_to_target(0x1d00ffff));
        // Readers holding the old snapshot keep it intact
        CHECK_FALSE(before->job);

        store.set_job(test::genesis_job("j2"));
        CHECK(store.snapshot()->job_seq > s->job_seq);
    }

    TEST_CASE("set_difficulty recomputes the pool target") {
        JobStore store(crypto::Algorithm::Scrypt);
        store.set_difficulty(16.0);
        auto s = store.snapshot();
        CHECK(s->difficulty == 16.0);
        CHECK(s->pool_target == crypto::difficulty_to_target(16.0, crypto::Algorithm::Scrypt));

        const auto v = store.version();
        CHECK_THROWS_AS(store.set_difficulty(0.0), std::invalid_argument);
        CHECK_THROWS_AS(store.set_difficulty(-3.0), std::invalid_argument);
        CHECK(store.version() == v);
        CHECK(store.snapshot()->difficulty == 16.0);
    }

    TEST_CASE("set_extranonce applies to later jobs only") {
        JobStore store(crypto::Algorithm::Sha256d);
        store.set_extranonce("aaaaaaaa", 4);
        store.set_job(test::genesis_job("j1"));
        auto first = store.snapshot();

        store.set_extranonce("bbbbbbbb", 8);
        auto mid = store.snapshot();
        CHECK(mid->job_seq == first->job_seq);
        CHECK(mid->job_extranonce2_size == 4);
        CHECK(mid->extranonce2_size == 8);

        store.set_job(test::genesis_job("j2"));
        auto second = store.snapshot();
        CHECK(second->job_extranonce2_size == 8);
        CHECK(second->builder->merkle_root("0000000000000000") != first->builder->merkle_root("0000000000000000"));

        CHECK_THROWS_AS(store.set_extranonce("00", 17), std::invalid_argument);
        CHECK_THROWS_AS(store.set_extranonce("00", -1), std::invalid_argument);
    }

    TEST_CASE("a job that cannot be built leaves the snapshot unchanged") {
        JobStore store(crypto::Algorithm::Sha256d);
        store.set_extranonce("00000000", 4);
        store.set_job(test::genesis_job("good"));
        const auto v = store.version();

        auto bad = test::genesis_job("bad");
        bad.coinbase1 = "xyz";
        CHECK_THROWS_AS(store.set_job(bad), std::invalid_argument);
        CHECK(store.version() == v);
        CHECK(store.snapshot()->job->job_id == "good");
    }

    TEST_CASE("reset returns to defaults") {
        JobStore store(crypto::Algorithm::Scrypt);
        store.set_extranonce("00000000", 4);
        store.set_difficulty(8.0);
        store.set_job(test::genesis_job());
        store.reset();
        auto s = store.snapshot();
        CHECK_FALSE(s->job);
        CHECK(s->difficulty == 1.0);
        CHECK(s->extranonce1.empty());
    }

    TEST_CASE("concurrent readers see consistent snapshots") {
        JobStore store(crypto::Algorithm::Sha256d);
        store.set_extranonce("00000000", 4);
        std::atomic<bool> done{false};
        std::atomic<int> bad{0};

        std::vector<std::thread> readers;
        for (int i = 0; i < 4; ++i) {
            readers.emplace_back([&]{
                while (!done.load()) {
                    auto s = store.snapshot();
                    if (static_cast<bool>(s->job) != static_cast<bool>(s->builder)) ++bad;
                }
            });
        }
        for (int i = 0; i < 200; ++i) {
            store.set_job(test::genesis_job("j" + std::to_string(i)));
            store.set_difficulty(1.0 + i);
        }
        done = true;
        for (auto& t : readers) t.join();
        CHECK(bad.load() == 0);
        CHECK(store.snapshot()->job->job_id == "j199");
    }
}
