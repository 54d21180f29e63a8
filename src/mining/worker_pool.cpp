/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "cminer/mining/worker_pool.hpp"

#include <algorithm>
#include <stdexcept>

#include <fmt/format.h>

namespace cminer {
namespace mining {

WorkerPool::WorkerPool(cminer::logging::Logger& log,
                       std::shared_ptr<pool::JobStore> jobs,
                       std::shared_ptr<pool::ShareQueue> shares,
                       std::shared_ptr<const crypto::Hasher> hasher,
                       WorkerPoolOptions opts)
    : log_(log)
    , opts_(opts)
    , shared_(std::make_shared<WorkerShared>(std::make_shared<cminer::logging::GuardedLogger>(log),
                                             std::move(jobs), std::move(shares), std::move(hasher))) {
    if (opts_.threads == 0) throw std::invalid_argument("worker pool needs at least one thread");
    if (opts_.batch_size == 0) throw std::invalid_argument("batch size must be positive");
    if (!shared_->jobs || !shared_->shares || !shared_->hasher) {
        throw std::invalid_argument("worker pool requires a job store, a share queue and a hasher");
    }
    shared_->batch_size = opts_.batch_size;
    shared_->intensity.store(std::clamp(opts_.intensity, 0, 100));
}

WorkerPool::~WorkerPool() {
    stop(std::chrono::milliseconds(0));
}

void WorkerPool::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (started_) return;
    started_ = true;
    shared_->stop.store(false);

    const auto ranges = partition_nonce_space(opts_.threads);
    const auto now = std::chrono::steady_clock::now();
    slots_.clear();
    slots_.reserve(ranges.size());
    for (std::size_t i = 0; i < ranges.size(); ++i) {
        Slot slot;
        slot.worker = std::make_unique<CpuWorker>(static_cast<int>(i), ranges[i], shared_);
        slot.last_progress = now;
        slot.worker->start();
        slots_.push_back(std::move(slot));
    }
    log_.info(fmt::format("Started {} worker thread(s), intensity {}%, batch {}",
                          opts_.threads, shared_->intensity.load(), opts_.batch_size));
}

bool WorkerPool::stop(std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!started_) return true;
    started_ = false;

    shared_->stop.store(true);
    for (auto& slot : slots_) slot.worker->stop();

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    bool all_joined = true;
    for (auto& slot : slots_) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (!slot.worker->join_for(std::max(left, std::chrono::milliseconds(0)))) {
            all_joined = false;
            log_.warn(fmt::format("Worker {} did not exit within {} ms, detaching", slot.worker->id(), timeout.count()));
        }
    }
    for (const auto& slot : slots_) {
        const auto& st = slot.worker->state();
        finished_.hashes += st->hashes.load(std::memory_order_relaxed);
        finished_.shares_found += st->shares_found.load(std::memory_order_relaxed);
        finished_.block_candidates += st->block_candidates.load(std::memory_order_relaxed);
    }
    // Destroying a CpuWorker detaches a thread that is still running
    slots_.clear();
    if (!all_joined) {
        // Detached threads keep the old state; none of them may reach 'log_' once we return
        shared_->log->detach();
        shared_ = fresh_shared_();
    }
    return all_joined;
}

std::shared_ptr<WorkerShared> WorkerPool::fresh_shared_() const {
    auto next = std::make_shared<WorkerShared>(std::make_shared<cminer::logging::GuardedLogger>(log_),
                                               shared_->jobs, shared_->shares, shared_->hasher);
    next->batch_size = shared_->batch_size;
    next->intensity.store(shared_->intensity.load());
    return next;
}

void WorkerPool::set_intensity(int intensity) {
    std::lock_guard<std::mutex> lock(mutex_);
    shared_->intensity.store(std::clamp(intensity, 0, 100));
}

int WorkerPool::intensity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return shared_->intensity.load();
}

unsigned WorkerPool::restarts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return restarts_;
}

WorkerTotals WorkerPool::totals() const {
    std::lock_guard<std::mutex> lock(mutex_);
    WorkerTotals t = finished_;
    for (const auto& slot : slots_) {
        const auto& st = slot.worker->state();
        t.hashes += st->hashes.load(std::memory_order_relaxed);
        t.shares_found += st->shares_found.load(std::memory_order_relaxed);
        t.block_candidates += st->block_candidates.load(std::memory_order_relaxed);
        if (st->running.load() && !st->failed.load()) ++t.live;
    }
    return t;
}

void WorkerPool::supervise(std::chrono::milliseconds heartbeat_timeout) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!started_) return;

    const auto now = std::chrono::steady_clock::now();
    for (auto& slot : slots_) {
        if (slot.retired) continue;
        auto state = slot.worker->state();

        if (state->failed.load() && !state->running.load()) {
            if (restarts_ >= static_cast<unsigned>(std::max(opts_.max_restarts, 0))) {
                slot.retired = true;
                log_.error(fmt::format("Worker {} failed ({}); restart limit reached, continuing degraded",
                                       slot.worker->id(), state->last_error()));
                continue;
            }
            const int id = slot.worker->id();
            const auto range = slot.worker->range();
            // Joins the exited thread; counters carry over through the shared state
            slot.worker = std::make_unique<CpuWorker>(id, range, shared_, state);
            slot.worker->start();
            ++restarts_;
            slot.last_progress = now;
            slot.stall_reported = false;
            log_.warn(fmt::format("Worker {} restarted after error: {}", id, state->last_error()));
            continue;
        }

        const auto beat = state->heartbeat.load(std::memory_order_relaxed);
        if (beat != slot.last_heartbeat) {
            slot.last_heartbeat = beat;
            slot.last_progress = now;
            slot.stall_reported = false;
        } else if (!slot.stall_reported && now - slot.last_progress >= heartbeat_timeout) {
            slot.stall_reported = true;
            log_.warn(fmt::format("Worker {} heartbeat stalled for {} ms",
                                  slot.worker->id(),
                                  std::chrono::duration_cast<std::chrono::milliseconds>(now - slot.last_progress).count()));
        }
    }
}

} // namespace mining
} // namespace cminer
