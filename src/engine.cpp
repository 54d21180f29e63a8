/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "cminer/engine.hpp"
#include "cminer/config/loader.hpp"
#include "cminer/crypto/difficulty.hpp"
#include "cminer/mining/cpu_topology.hpp"

#include <algorithm>
#include <future>
#include <stdexcept>

#include <fmt/format.h>

namespace cminer {

namespace {

std::string join_errors(const std::vector<std::string>& errors) {
    std::string out;
    for (const auto& e : errors) {
        if (!out.empty()) out += "; ";
        out += e;
    }
    return out;
}

StartResult failure(EngineError error, std::string message) {
    StartResult r;
    r.error = error;
    r.message = std::move(message);
    return r;
}

// Wait for a thread that flags 'done' on exit; detach it after 'timeout'.
bool join_or_detach(std::thread& t, const std::atomic<bool>& done, std::chrono::milliseconds timeout) {
    if (!t.joinable()) return true;
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!done.load() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    if (!done.load()) {
        t.detach();
        return false;
    }
    t.join();
    return true;
}

} // namespace

std::string_view to_string(EngineError error) {
    switch (error) {
        case EngineError::None: return "none";
        case EngineError::AlreadyRunning: return "already running";
        case EngineError::InvalidConfig: return "invalid configuration";
        case EngineError::AuthorizationRejected: return "authorization rejected";
    }
    return "unknown";
}

Engine::Engine(cminer::logging::Logger& log,
               std::shared_ptr<StatsSink> sink,
               std::shared_ptr<const crypto::Hasher> hasher)
    : log_(log), sink_(std::move(sink)), hasher_override_(std::move(hasher)) {}

Engine::~Engine() {
    stop();
}

StartResult Engine::start(const config::MinerConfig& cfg) {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    if (running_.load()) return failure(EngineError::AlreadyRunning, "engine is already running");

    auto errors = config::validate_final(cfg);
    if (!errors.empty()) return failure(EngineError::InvalidConfig, join_errors(errors));

    std::string host, port;
    if (!config::split_host_port(cfg.url, host, port)) {
        return failure(EngineError::InvalidConfig, "url must be host:port");
    }
    const auto algo = crypto::parse_algorithm(cfg.algo);
    if (!algo) return failure(EngineError::InvalidConfig, fmt::format("unknown algorithm '{}'", cfg.algo));

    std::shared_ptr<const crypto::Hasher> hasher = hasher_override_;
    if (!hasher) {
        try {
            hasher = crypto::make_hasher({*algo, cfg.scrypt_n, cfg.scrypt_r, cfg.scrypt_p});
        } catch (const std::invalid_argument& e) {
            return failure(EngineError::InvalidConfig, e.what());
        }
    }

    const unsigned threads = cfg.threads > 0 ? static_cast<unsigned>(cfg.threads) : mining::physical_core_count();

    // Every thread of this session logs through 'session_log'; stop() cuts it
    // off so a thread detached after a join timeout never reaches 'log_'.
    auto session_log = std::make_shared<logging::GuardedLogger>(log_);
    auto jobs = std::make_shared<pool::JobStore>(*algo);
    auto shares = std::make_shared<pool::ShareQueue>(cfg.share_queue_capacity);

    pool::StratumOptions so;
    so.host = host;
    so.port = port;
    so.user = cfg.user;
    so.pass = cfg.pass;
    so.client = cfg.client;
    so.connect_timeout = std::chrono::milliseconds(cfg.connect_timeout_ms);
    so.handshake_timeout = std::chrono::milliseconds(cfg.handshake_timeout_ms);
    so.max_malformed = cfg.max_malformed;
    auto client = std::make_shared<pool::StratumClient>(*session_log, so, jobs);

    pool::ReconnectOptions ro;
    ro.backoff_initial = std::chrono::milliseconds(cfg.backoff_initial_ms);
    ro.backoff_max = std::chrono::milliseconds(cfg.backoff_max_ms);
    ro.backoff_reset_after = std::chrono::milliseconds(cfg.backoff_reset_after_ms);
    ro.poll_interval = std::chrono::milliseconds(cfg.poll_interval_ms);
    ro.auth_policy = cfg.retry_on_auth_failure ? pool::AuthFailurePolicy::Retry : pool::AuthFailurePolicy::Fatal;
    auto manager = std::make_shared<pool::ReconnectManager>(*session_log, client, shares, ro);

    mining::WorkerPoolOptions wo;
    wo.threads = threads;
    wo.batch_size = cfg.batch_size;
    wo.intensity = cfg.intensity;
    wo.max_restarts = cfg.max_worker_restarts;
    auto workers = std::make_unique<mining::WorkerPool>(*session_log, jobs, shares, hasher, wo);

    log_.info(fmt::format("Starting engine: {} on {}:{} as {}, {} thread(s), intensity {}%",
                          crypto::algorithm_name(*algo), host, port, cfg.user, threads, cfg.intensity));

    // The manager and the client refer to *session_log, so they go first
    auto net_done = std::make_shared<std::atomic<bool>>(false);
    auto first = manager->first_attempt();
    std::thread net_thread([manager, net_done, session_log]() mutable {
        try {
            manager->run();
        } catch (const std::exception& e) {
            session_log->error(fmt::format("Network thread error: {}", e.what()));
        }
        manager.reset();
        net_done->store(true);
    });

    const auto first_wait = so.connect_timeout + so.handshake_timeout + std::chrono::seconds(1);
    if (first.wait_for(first_wait) == std::future_status::ready) {
        const auto hs = first.get();
        if (hs.error == pool::ProtocolError::AuthorizationRejected && !cfg.retry_on_auth_failure) {
            manager->request_stop();
            const auto join_timeout = std::chrono::milliseconds(cfg.join_timeout_ms);
            if (!join_or_detach(net_thread, *net_done, join_timeout)) {
                log_.warn("Network thread did not exit in time, detaching");
            }
            session_log->detach();
            return failure(EngineError::AuthorizationRejected, hs.error_msg);
        }
        if (!hs.success) {
            log_.warn(fmt::format("First connection attempt failed ({}), retrying in the background",
                                  hs.error_msg));
        }
    } else {
        log_.warn("No answer from the pool yet, mining starts once a job arrives");
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        cfg_ = cfg;
        algo_ = *algo;
        jobs_ = jobs;
        shares_ = shares;
        client_ = client;
        manager_ = manager;
        workers_ = std::move(workers);
        started_at_ = std::chrono::steady_clock::now();
        meter_.reset();
        meter_.add_sample(started_at_, 0);
        final_stats_ = EngineStats{};
        net_thread_ = std::move(net_thread);
        net_done_ = net_done;
        session_log_ = session_log;
        workers_->start();
    }

    {
        std::lock_guard<std::mutex> lock(monitor_mutex_);
        monitor_stop_ = false;
    }
    monitor_thread_ = std::thread(&Engine::monitor_loop_, this);
    running_.store(true);
    return StartResult{true, EngineError::None, {}};
}

void Engine::stop() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    if (!running_.load()) return;
    log_.info("Stopping engine");

    {
        std::lock_guard<std::mutex> lock(monitor_mutex_);
        monitor_stop_ = true;
    }
    monitor_cv_.notify_all();
    if (monitor_thread_.joinable()) monitor_thread_.join();

    const auto join_timeout = std::chrono::milliseconds(cfg_.join_timeout_ms);
    const auto deadline = std::chrono::steady_clock::now() + join_timeout;

    // Workers and the network thread wind down in parallel under one deadline.
    // The queue shutdown unblocks workers waiting on a full queue.
    shares_->shutdown();
    manager_->request_stop();
    if (!workers_->stop(join_timeout)) {
        log_.warn("Some workers did not stop in time and were detached");
    }

    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    if (!join_or_detach(net_thread_, *net_done_, std::max(left, std::chrono::milliseconds(0)))) {
        log_.warn("Network thread did not exit in time, detaching");
    }
    session_log_->detach();

    std::lock_guard<std::mutex> lock(state_mutex_);
    final_stats_ = build_stats_();
    final_stats_.running = false;
    workers_.reset();
    manager_.reset();
    client_.reset();
    shares_.reset();
    jobs_.reset();
    net_done_.reset();
    session_log_.reset();
    running_.store(false);
    log_.info(fmt::format("Engine stopped: {} accepted, {} rejected, {} stale",
                          final_stats_.accepted, final_stats_.rejected, final_stats_.stale));
}

EngineStats Engine::status() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!workers_) return final_stats_;
    return build_stats_();
}

bool Engine::failed() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return manager_ && manager_->fatal();
}

void Engine::set_intensity(int intensity) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    cfg_.intensity = std::clamp(intensity, 0, 100);
    if (workers_) workers_->set_intensity(cfg_.intensity);
    log_.info(fmt::format("Intensity set to {}%", cfg_.intensity));
}

EngineStats Engine::build_stats_() const {
    EngineStats s;
    s.running = true;
    const auto totals = workers_->totals();
    const auto shares = client_->counters();
    const auto snap = jobs_->snapshot();

    s.hashes = totals.hashes;
    s.shares_found = totals.shares_found;
    s.block_candidates = totals.block_candidates;
    s.live_workers = totals.live;
    s.threads = workers_->thread_count();
    s.worker_restarts = workers_->restarts();
    s.intensity = workers_->intensity();
    s.accepted = shares.accepted;
    s.rejected = shares.rejected;
    s.stale = shares.stale;
    s.connection = client_->state();
    s.reconnects = manager_->reconnects();
    s.difficulty = snap->difficulty;
    if (snap->job) s.job_id = snap->job->job_id;

    const auto elapsed = std::chrono::steady_clock::now() - started_at_;
    s.uptime = std::chrono::duration_cast<std::chrono::seconds>(elapsed);
    s.hashrate = meter_.rate();
    const double secs = std::chrono::duration<double>(elapsed).count();
    if (secs > 0.0) {
        s.accepted_hashrate = shares.accepted_difficulty * crypto::hashes_per_share(algo_) / secs;
    }
    return s;
}

void Engine::monitor_loop_() {
    const auto interval = std::chrono::milliseconds(cfg_.stats_interval_ms);
    const auto heartbeat_timeout = std::chrono::milliseconds(cfg_.heartbeat_timeout_ms);
    bool fatal_reported = false;

    std::unique_lock<std::mutex> lk(monitor_mutex_);
    while (!monitor_cv_.wait_for(lk, interval, [this]{ return monitor_stop_; })) {
        lk.unlock();
        EngineStats snapshot;
        bool fatal = false;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            workers_->supervise(heartbeat_timeout);
            meter_.add_sample(std::chrono::steady_clock::now(), workers_->totals().hashes);
            snapshot = build_stats_();
            fatal = manager_->fatal();
        }
        if (fatal && !fatal_reported) {
            fatal_reported = true;
            log_.error("Pool rejected the credentials; mining is halted until the engine is restarted");
        }
        if (sink_) {
            try {
                sink_->publish(snapshot);
            } catch (const std::exception& e) {
                log_.warn(fmt::format("Stats sink error: {}", e.what()));
            }
        }
        lk.lock();
    }
}

} // namespace cminer
