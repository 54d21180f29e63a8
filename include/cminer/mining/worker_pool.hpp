/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

#include "cminer/mining/cpu_worker.hpp"

namespace cminer {
namespace mining {

struct WorkerPoolOptions {
    unsigned threads{1};
    std::uint32_t batch_size{64};
    int intensity{100};
    int max_restarts{5};
};

struct WorkerTotals {
    std::uint64_t hashes{0};
    std::uint64_t shares_found{0};
    std::uint64_t block_candidates{0};
    unsigned live{0};
};

/**
 * Owns the mining threads. Worker i sweeps partition_nonce_space(threads)[i].
 */
class WorkerPool {
public:
    WorkerPool(cminer::logging::Logger& log,
               std::shared_ptr<pool::JobStore> jobs,
               std::shared_ptr<pool::ShareQueue> shares,
               std::shared_ptr<const crypto::Hasher> hasher,
               WorkerPoolOptions opts);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    void start();

    // Cancels every worker and waits up to 'timeout' in total. Workers still
    // running afterwards are detached and log nothing more. Returns true when
    // all of them exited.
    bool stop(std::chrono::milliseconds timeout);

    // Clamped to [0, 100]; takes effect after the current batch.
    void set_intensity(int intensity);
    int intensity() const;

    unsigned thread_count() const { return opts_.threads; }
    unsigned restarts() const;
    WorkerTotals totals() const;

    // Restarts workers that died with an exception (up to max_restarts in
    // total) and warns once about workers whose heartbeat stopped moving.
    void supervise(std::chrono::milliseconds heartbeat_timeout);

private:
    struct Slot {
        std::unique_ptr<CpuWorker> worker;
        std::uint64_t last_heartbeat{0};
        std::chrono::steady_clock::time_point last_progress{};
        bool stall_reported{false};
        bool retired{false};
    };

    std::shared_ptr<WorkerShared> fresh_shared_() const;

    cminer::logging::Logger& log_;
    WorkerPoolOptions opts_;
    std::shared_ptr<WorkerShared> shared_;

    mutable std::mutex mutex_;
    std::vector<Slot> slots_;
    unsigned restarts_{0};
    WorkerTotals finished_; // counters of workers released by stop()
    bool started_{false};
};

} // namespace mining
} // namespace cminer
