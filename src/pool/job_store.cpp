/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include <cminer/pool/job_store.hpp>

#include <stdexcept>

namespace cminer::pool {

namespace {

std::shared_ptr<WorkSnapshot> default_snapshot(crypto::Algorithm algo) {
    auto s = std::make_shared<WorkSnapshot>();
    s->difficulty = 1.0;
    s->pool_target = crypto::difficulty_to_target(1.0, algo);
    return s;
}

} // namespace

JobStore::JobStore(crypto::Algorithm algo)
    : algo_(algo), current_(default_snapshot(algo)) {}

std::shared_ptr<const WorkSnapshot> JobStore::snapshot() const {
    return std::atomic_load(&current_);
}

void JobStore::publish_(std::shared_ptr<const WorkSnapshot> next) {
    std::atomic_store(&current_, std::move(next));
    version_.fetch_add(1, std::memory_order_acq_rel);
}

void JobStore::set_job(const MiningJob& job) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    auto prev = std::atomic_load(&current_);
    auto next = std::make_shared<WorkSnapshot>(*prev);

    // Build first so a bad job leaves the previous snapshot in place
    next->builder = std::make_shared<const HeaderBuilder>(job, prev->extranonce1);
    next->job = std::make_shared<const MiningJob>(job);
    next->job_seq = ++next_job_seq_;
    next->job_extranonce2_size = prev->extranonce2_size;
    next->network_target = crypto::compact_bits_to_target(job.nbits_value());
    publish_(std::move(next));
}

void JobStore::set_difficulty(double difficulty) {
    // difficulty_to_target validates before anything is published
    auto target = crypto::difficulty_to_target(difficulty, algo_);

    std::lock_guard<std::mutex> lock(write_mutex_);
    auto next = std::make_shared<WorkSnapshot>(*std::atomic_load(&current_));
    next->difficulty = difficulty;
    next->pool_target = target;
    publish_(std::move(next));
}

void JobStore::set_extranonce(const std::string& extranonce1, int extranonce2_size) {
    if (extranonce2_size < 0 || extranonce2_size > 16) {
        throw std::invalid_argument("extranonce2_size out of range");
    }
    std::lock_guard<std::mutex> lock(write_mutex_);
    auto next = std::make_shared<WorkSnapshot>(*std::atomic_load(&current_));
    next->extranonce1 = extranonce1;
    next->extranonce2_size = extranonce2_size;
    publish_(std::move(next));
}

void JobStore::reset() {
    std::lock_guard<std::mutex> lock(write_mutex_);
    publish_(default_snapshot(algo_));
}

} // namespace cminer::pool
