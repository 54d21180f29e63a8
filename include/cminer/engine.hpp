/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>

#include "cminer/config/types.hpp"
#include "cminer/crypto/hasher.hpp"
#include "cminer/logging/guarded_logger.hpp"
#include "cminer/logging/logger.hpp"
#include "cminer/mining/worker_pool.hpp"
#include "cminer/pool/job_store.hpp"
#include "cminer/pool/reconnect.hpp"
#include "cminer/pool/share_queue.hpp"
#include "cminer/pool/stratum.hpp"
#include "cminer/stats.hpp"

namespace cminer {

enum class EngineError {
    None,
    AlreadyRunning,
    InvalidConfig,
    AuthorizationRejected
};

std::string_view to_string(EngineError error);

struct StartResult {
    bool ok{false};
    EngineError error{EngineError::None};
    std::string message;
};

/**
 * Owns one mining session: job store, share queue, Stratum client,
 * reconnect loop, worker pool and stats monitor. No process-wide state, so
 * several engines can run side by side.
 */
class Engine {
public:
    // 'hasher' replaces the one selected by the configured algorithm.
    explicit Engine(cminer::logging::Logger& log,
                    std::shared_ptr<StatsSink> sink = nullptr,
                    std::shared_ptr<const crypto::Hasher> hasher = nullptr);
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    // Validates the config, waits for the first connection attempt and, unless
    // the pool rejected the credentials, starts mining.
    StartResult start(const config::MinerConfig& cfg);

    // Idempotent. Returns once workers and the network thread exited or the
    // join timeout expired. Nothing logs to the caller's logger afterwards.
    void stop();

    // Live counters while running; final counters after stop().
    EngineStats status() const;

    void set_intensity(int intensity);
    bool running() const { return running_.load(); }

    // True once the pool rejected the credentials and the auth policy is
    // fatal. The work is withdrawn by then; the caller should stop().
    bool failed() const;

private:
    void monitor_loop_();
    EngineStats build_stats_() const; // requires state_mutex_

    cminer::logging::Logger& log_;
    std::shared_ptr<StatsSink> sink_;
    std::shared_ptr<const crypto::Hasher> hasher_override_;

    std::mutex lifecycle_mutex_; // serializes start() and stop()
    std::atomic<bool> running_{false};

    mutable std::mutex state_mutex_;
    config::MinerConfig cfg_;
    crypto::Algorithm algo_{crypto::Algorithm::Scrypt};
    std::shared_ptr<pool::JobStore> jobs_;
    std::shared_ptr<pool::ShareQueue> shares_;
    std::shared_ptr<pool::StratumClient> client_;
    std::shared_ptr<pool::ReconnectManager> manager_;
    std::unique_ptr<mining::WorkerPool> workers_;
    std::chrono::steady_clock::time_point started_at_{};
    HashrateMeter meter_;
    EngineStats final_stats_;

    std::thread net_thread_;
    std::shared_ptr<std::atomic<bool>> net_done_;
    std::shared_ptr<logging::GuardedLogger> session_log_;

    std::thread monitor_thread_;
    std::mutex monitor_mutex_;
    std::condition_variable monitor_cv_;
    bool monitor_stop_{false};
};

} // namespace cminer
