/*
 * Unit tests for hash rate metering and stats formatting
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <cminer/stats.hpp>

#include "support/recording_logger.hpp"

using namespace cminer;
using namespace std::chrono;

TEST_SUITE("HashrateMeter") {
    TEST_CASE("needs two samples") {
        HashrateMeter m;
        CHECK(m.rate() == 0.0);
        m.add_sample(steady_clock::now(), 100);
        CHECK(m.rate() == 0.0);
    }

    TEST_CASE("rate over the window") {
        HashrateMeter m(seconds(10));
        auto t0 = steady_clock::time_point{} + hours(1);
        m.add_sample(t0, 0);
        m.add_sample(t0 + seconds(1), 1000);
        m.add_sample(t0 + seconds(2), 2000);
        CHECK(m.rate() == doctest::Approx(1000.0));
    }

    TEST_CASE("old samples fall out of the window") {
        HashrateMeter m(seconds(2));
        auto t0 = steady_clock::time_point{} + hours(1);
        // Fast start, then a slower steady rate
        m.add_sample(t0, 0);
        m.add_sample(t0 + seconds(1), 100000);
        for (int i = 2; i <= 10; ++i) m.add_sample(t0 + seconds(i), 100000 + (i - 1) * 10);
        CHECK(m.rate() == doctest::Approx(10.0));
    }

    TEST_CASE("reset") {
        HashrateMeter m;
        auto t0 = steady_clock::now();
        m.add_sample(t0, 0);
        m.add_sample(t0 + seconds(1), 50);
        m.reset();
        CHECK(m.rate() == 0.0);
    }
}

TEST_SUITE("Formatting") {
    TEST_CASE("format_hashrate units") {
        CHECK(format_hashrate(0) == "0.00 H/s");
        CHECK(format_hashrate(999.5) == "999.50 H/s");
        CHECK(format_hashrate(1500) == "1.50 KH/s");
        CHECK(format_hashrate(2.5e6) == "2.50 MH/s");
        CHECK(format_hashrate(3e9) == "3.00 GH/s");
    }

    TEST_CASE("format_uptime") {
        CHECK(format_uptime(seconds(0)) == "00:00:00");
        CHECK(format_uptime(seconds(61)) == "00:01:01");
        CHECK(format_uptime(seconds(3600 * 27 + 5)) == "27:00:05");
    }

    TEST_CASE("format_stats carries the counters") {
        EngineStats s;
        s.hashrate = 1500;
        s.accepted = 3;
        s.rejected = 1;
        s.stale = 2;
        s.connection = pool::ConnectionState::Authorized;
        s.difficulty = 0.5;
        s.threads = 4;
        s.live_workers = 4;
        s.intensity = 80;
        s.job_id = "abc";
        auto line = format_stats(s);
        CHECK(line.find("1.50 KH/s") != std::string::npos);
        CHECK(line.find("A:3 R:1 S:2") != std::string::npos);
        CHECK(line.find("Authorized") != std::string::npos);
        CHECK(line.find("4/4 thr @ 80%") != std::string::npos);
        CHECK(line.find("job abc") != std::string::npos);

        s.job_id.clear();
        CHECK(format_stats(s).find("(no job)") != std::string::npos);
    }

    TEST_CASE("LogStatsSink writes one info line") {
        test::RecordingLogger log;
        LogStatsSink sink(log);
        EngineStats s;
        s.accepted = 7;
        sink.publish(s);
        REQUIRE(log.lines().size() == 1);
        CHECK(log.contains("[INFO]"));
        CHECK(log.contains("A:7"));
    }
}
