/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <string>
#include <utility>

#include "cminer/logging/logger.hpp"
#include "cminer/pool/stratum.hpp"

namespace cminer {

// Snapshot published by the engine at every stats tick.
struct EngineStats {
    bool running{false};
    std::uint64_t hashes{0};
    std::uint64_t shares_found{0};
    std::uint64_t accepted{0};
    std::uint64_t rejected{0};
    std::uint64_t stale{0};
    std::uint64_t block_candidates{0};
    double hashrate{0.0};          // H/s over the sliding window
    double accepted_hashrate{0.0}; // estimate from accepted share difficulty
    std::chrono::seconds uptime{0};
    int intensity{0};
    unsigned threads{0};
    unsigned live_workers{0};
    unsigned worker_restarts{0};
    pool::ConnectionState connection{pool::ConnectionState::Disconnected};
    std::uint64_t reconnects{0};
    double difficulty{1.0};
    std::string job_id;
};

// Hash rate over a sliding time window of cumulative hash counts.
class HashrateMeter {
public:
    explicit HashrateMeter(std::chrono::milliseconds window = std::chrono::seconds(10))
        : window_(window) {}

    void add_sample(std::chrono::steady_clock::time_point when, std::uint64_t total_hashes);
    double rate() const;
    void reset() { samples_.clear(); }

private:
    std::chrono::milliseconds window_;
    std::deque<std::pair<std::chrono::steady_clock::time_point, std::uint64_t>> samples_;
};

// Receives engine snapshots, called from the engine's monitor thread.
class StatsSink {
public:
    virtual ~StatsSink() = default;
    virtual void publish(const EngineStats& stats) = 0;
};

// Prints one compact line per snapshot through the logger.
class LogStatsSink : public StatsSink {
public:
    explicit LogStatsSink(cminer::logging::Logger& log) : log_(log) {}
    void publish(const EngineStats& stats) override;

private:
    cminer::logging::Logger& log_;
};

std::string format_hashrate(double hashes_per_second);
std::string format_uptime(std::chrono::seconds uptime);
std::string format_stats(const EngineStats& stats);

} // namespace cminer
