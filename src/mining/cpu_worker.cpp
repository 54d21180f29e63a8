/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "cminer/mining/cpu_worker.hpp"
#include "cminer/mining/throttle.hpp"
#include "cminer/crypto/difficulty.hpp"

#include <fmt/format.h>

namespace cminer {
namespace mining {

namespace {

constexpr std::chrono::milliseconds kIdleTick{50};
constexpr std::chrono::milliseconds kPushWait{50};

} // namespace

CpuWorker::CpuWorker(int id, NonceRange range, std::shared_ptr<WorkerShared> shared,
                     std::shared_ptr<WorkerState> state)
    : id_(id), range_(range), shared_(std::move(shared)), state_(std::move(state)) {}

CpuWorker::~CpuWorker() {
    stop();
    if (thread_.joinable()) {
        if (state_->running.load()) {
            thread_.detach();
        } else {
            thread_.join();
        }
    }
}

void CpuWorker::start() {
    if (thread_.joinable()) return;
    state_->cancel.store(false);
    state_->failed.store(false);
    state_->running.store(true);
    thread_ = std::thread(&CpuWorker::mine_, id_, range_, shared_, state_);
}

void CpuWorker::stop() {
    state_->cancel.store(true);
}

bool CpuWorker::join_for(std::chrono::milliseconds timeout) {
    if (!thread_.joinable()) return true;

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (state_->running.load() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    if (state_->running.load()) {
        return false;
    }
    thread_.join();
    return true;
}

void CpuWorker::mine_(int id, NonceRange range,
                      std::shared_ptr<WorkerShared> shared,
                      std::shared_ptr<WorkerState> state) {
    auto cancelled = [&]{ return shared->stop.load(std::memory_order_relaxed) || state->cancel.load(std::memory_order_relaxed); };

    try {
        std::shared_ptr<const pool::WorkSnapshot> snap;
        std::uint64_t seen_version = 0;
        bool have_version = false;
        std::uint64_t job_seq = 0;

        pool::BlockHeader header{};
        std::uint64_t extranonce2 = 0;
        std::string extranonce2_hex;
        std::uint32_t nonce = range.first;
        bool exhausted = false;

        auto load_header = [&]{
            extranonce2_hex = pool::format_extranonce2(extranonce2, snap->job_extranonce2_size);
            header = snap->builder->build(extranonce2_hex);
            nonce = range.first;
        };

        // Interrupts sleeps on stop or new work, and keeps the heartbeat alive.
        auto interrupted = [&]{
            state->heartbeat.fetch_add(1, std::memory_order_relaxed);
            return cancelled() || shared->jobs->version() != seen_version;
        };

        while (!cancelled()) {
            state->heartbeat.fetch_add(1, std::memory_order_relaxed);

            const auto version = shared->jobs->version();
            if (!have_version || version != seen_version) {
                seen_version = version;
                have_version = true;
                snap = shared->jobs->snapshot();
                if (snap->job && snap->job_seq != job_seq) {
                    job_seq = snap->job_seq;
                    extranonce2 = 0;
                    exhausted = false;
                    load_header();
                } else if (!snap->job) {
                    job_seq = 0;
                }
            }

            const int intensity = shared->intensity.load(std::memory_order_relaxed);
            if (!snap->job || exhausted || intensity <= 0) {
                Throttle::sleep(kIdleTick, interrupted);
                continue;
            }

            const auto batch_start = std::chrono::steady_clock::now();
            for (std::uint32_t i = 0; i < shared->batch_size && !cancelled(); ++i) {
                pool::HeaderBuilder::set_nonce(header, nonce);
                const auto hash = shared->hasher->hash(header.data(), header.size());
                state->hashes.fetch_add(1, std::memory_order_relaxed);

                if (crypto::hash_meets_target(hash, snap->pool_target)) {
                    pool::Share share;
                    share.job_id = snap->job->job_id;
                    share.extranonce2 = extranonce2_hex;
                    share.ntime = snap->job->ntime;
                    share.nonce = fmt::format("{:08x}", nonce);
                    share.difficulty = snap->difficulty;
                    share.worker_id = id;
                    state->shares_found.fetch_add(1, std::memory_order_relaxed);

                    if (crypto::hash_meets_target(hash, snap->network_target)) {
                        state->block_candidates.fetch_add(1, std::memory_order_relaxed);
                        shared->log->info(fmt::format("Worker {} found a block candidate! job={} nonce={}",
                                                     id, share.job_id, share.nonce));
                    } else {
                        shared->log->debug(fmt::format("Worker {} found share job={} nonce={}",
                                                      id, share.job_id, share.nonce));
                    }

                    // Blocks while the queue is full
                    while (!shared->shares->push_for(share, kPushWait)) {
                        if (cancelled() || shared->shares->is_shutdown()) break;
                        state->heartbeat.fetch_add(1, std::memory_order_relaxed);
                    }
                }

                if (nonce != range.last) {
                    ++nonce;
                    continue;
                }
                if (extranonce2 < pool::max_extranonce2(snap->job_extranonce2_size)) {
                    ++extranonce2;
                    load_header();
                } else {
                    exhausted = true;
                    shared->log->warn(fmt::format("Worker {} exhausted job {}, waiting for new work",
                                                 id, snap->job->job_id));
                    break;
                }
            }

            if (intensity < 100) {
                const auto busy = std::chrono::steady_clock::now() - batch_start;
                Throttle::sleep(Throttle::pause_for(busy, intensity), interrupted);
            }
        }
    } catch (const std::exception& e) {
        state->set_error(e.what());
        state->failed.store(true);
        shared->log->error(fmt::format("Worker {} error: {}", id, e.what()));
    }

    state->running.store(false);
}

} // namespace mining
} // namespace cminer
