/*
 * Unit tests for mining job parser and header construction
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <cminer/pool/mining_job.hpp>
#include <cminer/crypto/hex.hpp>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "support/genesis.hpp"

using namespace cminer::pool;
using cminer::crypto::bytes_to_hex;
using json = nlohmann::json;

namespace {

json realistic_params() {
    return json::array({
        "1f4a",
        "4d16b6f85af6e2198f44ae2a6de67f78487ae5611b77c6c0440b921e00000000",
        "01000000010000000000000000000000000000000000000000000000000000000000000000ffffffff20020862062f503253482f04b8864e5008",
        "072f736c7573682f000000000100f2052a010000001976a914d23fcdf86f7e756a64a7a9688ef9903327048ed988ac00000000",
        json::array({"55b9a5e4c4e8a1c1bf4e3c73d6a3c3b6e5e4f2d1c0b9a8f7e6d5c4b3a2918070",
                     "8a7b6c5d4e3f2a1b0c9d8e7f6a5b4c3d2e1f0a9b8c7d6e5f4a3b2c1d0e9f8a7b"}),
        "20000000",
        "1a0ccaa1",
        "69098232",
        false
    });
}

} // namespace

TEST_SUITE("Mining Job Parser") {
    TEST_CASE("parse_mining_notify - valid complete job") {
        auto job_opt = parse_mining_notify(realistic_params());
        REQUIRE(job_opt.has_value());

        const auto& job = *job_opt;
        CHECK(job.job_id == "1f4a");
        CHECK(job.prev_hash.size() == 64);
        CHECK(job.merkle_branch.size() == 2);
        CHECK(job.version == "20000000");
        CHECK(job.nbits == "1a0ccaa1");
        CHECK(job.ntime == "69098232");
        CHECK(job.clean_jobs == false);
        CHECK(job.nbits_value() == 0x1a0ccaa1u);
    }

    TEST_CASE("parse_mining_notify - clean_jobs true") {
        auto params = realistic_params();
        params[8] = true;
        auto job_opt = parse_mining_notify(params);
        REQUIRE(job_opt.has_value());
        CHECK(job_opt->clean_jobs);
    }

    TEST_CASE("parse_mining_notify - empty merkle branch") {
        auto params = realistic_params();
        params[4] = json::array();
        auto job_opt = parse_mining_notify(params);
        REQUIRE(job_opt.has_value());
        CHECK(job_opt->merkle_branch.empty());
    }

    TEST_CASE("parse_mining_notify - too few params") {
        std::string err;
        json params = json::array({"job123", "prevhash", "coinb1"});
        CHECK_FALSE(parse_mining_notify(params, &err).has_value());
        CHECK(err.find("9 params") != std::string::npos);
    }

    TEST_CASE("parse_mining_notify - wrong types") {
        auto params = realistic_params();
        params[4] = "not_an_array";
        CHECK_FALSE(parse_mining_notify(params).has_value());

        params = realistic_params();
        params[8] = "true";
        CHECK_FALSE(parse_mining_notify(params).has_value());

        params = realistic_params();
        params[0] = 12345;
        CHECK_FALSE(parse_mining_notify(params).has_value());

        CHECK_FALSE(parse_mining_notify(json::object()).has_value());
    }

    TEST_CASE("parse_mining_notify - bad hex and sizes") {
        std::string err;
        auto params = realistic_params();
        params[1] = "zz16b6f85af6e2198f44ae2a6de67f78487ae5611b77c6c0440b921e00000000";
        CHECK_FALSE(parse_mining_notify(params, &err).has_value());
        CHECK(err.find("prevhash") != std::string::npos);

        params = realistic_params();
        params[1] = "00";
        CHECK_FALSE(parse_mining_notify(params).has_value());

        params = realistic_params();
        params[5] = "200000";
        CHECK_FALSE(parse_mining_notify(params, &err).has_value());
        CHECK(err.find("version") != std::string::npos);

        params = realistic_params();
        params[2] = "abc";
        CHECK_FALSE(parse_mining_notify(params).has_value());

        params = realistic_params();
        params[4] = json::array({"00ff"});
        CHECK_FALSE(parse_mining_notify(params).has_value());
    }
}

TEST_SUITE("Header Builder") {
    TEST_CASE("genesis block header is reproduced byte for byte") {
        auto job = cminer::test::genesis_job();
        HeaderBuilder builder(job, cminer::test::kGenesisExtranonce1);

        CHECK(bytes_to_hex(builder.merkle_root(cminer::test::kGenesisExtranonce2)) == cminer::test::kGenesisMerkleRoot);

        auto header = builder.build(cminer::test::kGenesisExtranonce2);
        HeaderBuilder::set_nonce(header, cminer::test::kGenesisNonce);
        CHECK(bytes_to_hex(header) == cminer::test::kGenesisHeader);
    }

    TEST_CASE("header is deterministic for a fixed extranonce2 and nonce") {
        auto job = parse_mining_notify(realistic_params());
        REQUIRE(job.has_value());
        HeaderBuilder a(*job, "f8002c90");
        HeaderBuilder b(*job, "f8002c90");

        auto h1 = a.build("00000001");
        auto h2 = a.build("00000001");
        auto h3 = b.build("00000001");
        HeaderBuilder::set_nonce(h1, 0xdeadbeef);
        HeaderBuilder::set_nonce(h2, 0xdeadbeef);
        HeaderBuilder::set_nonce(h3, 0xdeadbeef);
        CHECK(h1 == h2);
        CHECK(h1 == h3);

        auto other = a.build("00000002");
        HeaderBuilder::set_nonce(other, 0xdeadbeef);
        CHECK(other != h1);
    }

    TEST_CASE("field layout") {
        auto params = realistic_params();
        std::string prev;
        for (int i = 1; i <= 32; ++i) prev += fmt::format("{:02x}", i);
        params[1] = prev;
        auto job = parse_mining_notify(params);
        REQUIRE(job.has_value());

        auto header = HeaderBuilder(*job, "00").build("00000000");
        // version 0x20000000 little-endian
        CHECK(header[0] == 0x00);
        CHECK(header[3] == 0x20);
        // prevhash words are byte-swapped: 01020304 -> 04030201
        CHECK(header[4] == 0x04);
        CHECK(header[7] == 0x01);
        CHECK(header[8] == 0x08);
        CHECK(header[35] == 0x1d);
        // ntime 0x69098232 and nbits 0x1a0ccaa1 little-endian
        CHECK(header[68] == 0x32);
        CHECK(header[71] == 0x69);
        CHECK(header[72] == 0xa1);
        CHECK(header[75] == 0x1a);
        // nonce left zero, then little-endian
        CHECK(header[76] == 0);
        HeaderBuilder::set_nonce(header, 0x11223344);
        CHECK(header[76] == 0x44);
        CHECK(header[79] == 0x11);
    }

    TEST_CASE("rejects bad extranonce1") {
        auto job = cminer::test::genesis_job();
        CHECK_THROWS_AS(HeaderBuilder(job, "xyz"), std::invalid_argument);
    }
}

TEST_SUITE("Extranonce2") {
    TEST_CASE("format_extranonce2 is big-endian hex of the requested size") {
        CHECK(format_extranonce2(0, 4) == "00000000");
        CHECK(format_extranonce2(1, 4) == "00000001");
        CHECK(format_extranonce2(cminer::test::kGenesisExtranonce2Value, 4) == cminer::test::kGenesisExtranonce2);
        CHECK(format_extranonce2(0x0102, 2) == "0102");
        CHECK(format_extranonce2(5, 10) == "00000000000000000005");
        CHECK(format_extranonce2(5, 0).empty());
    }

    TEST_CASE("max_extranonce2") {
        CHECK(max_extranonce2(0) == 0);
        CHECK(max_extranonce2(1) == 0xff);
        CHECK(max_extranonce2(4) == 0xffffffffULL);
        CHECK(max_extranonce2(8) == 0xffffffffffffffffULL);
        CHECK(max_extranonce2(12) == 0xffffffffffffffffULL);
    }
}
