/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include <cminer/crypto/difficulty.hpp>
#include <cminer/crypto/hasher.hpp>
#include <cminer/pool/mining_job.hpp>

namespace cminer::pool {

// Immutable view of the current work. Replaced as a whole, never mutated.
struct WorkSnapshot {
    std::shared_ptr<const MiningJob> job;         // null until the first notify
    std::shared_ptr<const HeaderBuilder> builder; // null when job is null
    std::uint64_t job_seq{0};                     // changes with every new job
    int job_extranonce2_size{0};                  // size the current job was built with
    double difficulty{1.0};
    crypto::Target pool_target;
    crypto::Target network_target;
    std::string extranonce1;                      // for jobs received from now on
    int extranonce2_size{0};
};

/**
 * Holds the active job and pool target for one connection.
 *
 * Written by the network thread only; read by workers through snapshot(),
 * which is a lock-free atomic load of a shared_ptr.
 */
class JobStore {
public:
    explicit JobStore(crypto::Algorithm algo);

    std::shared_ptr<const WorkSnapshot> snapshot() const;

    // Bumped on every publish (job, difficulty, extranonce or reset).
    std::uint64_t version() const { return version_.load(std::memory_order_acquire); }

    // Throws std::invalid_argument when the job cannot be turned into headers.
    void set_job(const MiningJob& job);

    // Throws std::invalid_argument for non-positive or non-finite difficulty.
    void set_difficulty(double difficulty);

    // Takes effect for jobs received afterwards.
    void set_extranonce(const std::string& extranonce1, int extranonce2_size);

    // Back to defaults: no job, difficulty 1.0, no extranonce.
    void reset();

    crypto::Algorithm algorithm() const { return algo_; }

private:
    void publish_(std::shared_ptr<const WorkSnapshot> next);

    crypto::Algorithm algo_;
    std::mutex write_mutex_;
    std::shared_ptr<const WorkSnapshot> current_;
    std::atomic<std::uint64_t> version_{0};
    std::uint64_t next_job_seq_{0};
};

} // namespace cminer::pool
