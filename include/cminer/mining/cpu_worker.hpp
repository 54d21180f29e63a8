/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "cminer/crypto/hasher.hpp"
#include "cminer/logging/guarded_logger.hpp"
#include "cminer/mining/nonce_range.hpp"
#include "cminer/mining/worker.hpp"
#include "cminer/pool/job_store.hpp"
#include "cminer/pool/share_queue.hpp"

namespace cminer {
namespace mining {

// State common to every worker of a pool. A detached worker keeps it alive,
// so the log is a guard the pool cuts off when it stops.
struct WorkerShared {
    WorkerShared(std::shared_ptr<cminer::logging::GuardedLogger> logger,
                 std::shared_ptr<pool::JobStore> job_store,
                 std::shared_ptr<pool::ShareQueue> share_queue,
                 std::shared_ptr<const crypto::Hasher> pow)
        : log(std::move(logger)), jobs(std::move(job_store)), shares(std::move(share_queue)), hasher(std::move(pow)) {}

    std::shared_ptr<cminer::logging::GuardedLogger> log;
    std::shared_ptr<pool::JobStore> jobs;
    std::shared_ptr<pool::ShareQueue> shares;
    std::shared_ptr<const crypto::Hasher> hasher;
    std::atomic<bool> stop{false};
    std::atomic<int> intensity{100};
    std::uint32_t batch_size{64};
};

// Per-worker counters. Outlives the thread and survives a restart.
struct WorkerState {
    std::atomic<std::uint64_t> hashes{0};
    std::atomic<std::uint64_t> shares_found{0};
    std::atomic<std::uint64_t> block_candidates{0};
    std::atomic<std::uint64_t> heartbeat{0};
    std::atomic<bool> running{false};
    std::atomic<bool> failed{false};
    std::atomic<bool> cancel{false};

    void set_error(std::string msg) {
        std::lock_guard<std::mutex> lock(mutex_);
        error_ = std::move(msg);
    }
    std::string last_error() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return error_;
    }

private:
    mutable std::mutex mutex_;
    std::string error_;
};

/**
 * One OS thread sweeping its nonce range across every extranonce2 value of
 * the current job. The thread owns shared_ptr copies of everything it uses,
 * so a worker detached after a join timeout never touches freed memory.
 */
class CpuWorker : public Worker {
public:
    CpuWorker(int id, NonceRange range, std::shared_ptr<WorkerShared> shared,
              std::shared_ptr<WorkerState> state = std::make_shared<WorkerState>());
    ~CpuWorker() override;

    CpuWorker(const CpuWorker&) = delete;
    CpuWorker& operator=(const CpuWorker&) = delete;

    void start() override;
    void stop() override;
    bool join_for(std::chrono::milliseconds timeout) override;

    int id() const { return id_; }
    const NonceRange& range() const { return range_; }
    const std::shared_ptr<WorkerState>& state() const { return state_; }

private:
    static void mine_(int id, NonceRange range,
                      std::shared_ptr<WorkerShared> shared,
                      std::shared_ptr<WorkerState> state);

    int id_;
    NonceRange range_;
    std::shared_ptr<WorkerShared> shared_;
    std::shared_ptr<WorkerState> state_;
    std::thread thread_;
};

} // namespace mining
} // namespace cminer
