/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <cminer/logging/logger.hpp>
#include <cminer/pool/share_queue.hpp>
#include <cminer/pool/stratum.hpp>

namespace cminer::pool {

/**
 * Exponential reconnect delay: initial, 2x, 4x, ... capped at max.
 * Resets to initial once a session lasted at least reset_after.
 */
class Backoff {
public:
    Backoff(std::chrono::milliseconds initial,
            std::chrono::milliseconds max,
            std::chrono::milliseconds reset_after);

    // Delay to wait now; the following call returns the next step.
    std::chrono::milliseconds next_delay();
    std::chrono::milliseconds peek() const { return current_; }

    void reset();
    void on_session_end(std::chrono::milliseconds session_length);

    int attempts() const { return attempts_; }

private:
    std::chrono::milliseconds initial_;
    std::chrono::milliseconds max_;
    std::chrono::milliseconds reset_after_;
    std::chrono::milliseconds current_;
    int attempts_{0};
};

enum class AuthFailurePolicy {
    Fatal, // report and stop the loop
    Retry  // treat like any other connection error
};

struct ReconnectOptions {
    std::chrono::milliseconds backoff_initial{1000};
    std::chrono::milliseconds backoff_max{60000};
    std::chrono::milliseconds backoff_reset_after{60000};
    std::chrono::milliseconds poll_interval{100};
    AuthFailurePolicy auth_policy{AuthFailurePolicy::Fatal};
};

/**
 * Body of the network thread: connect, then alternate between submitting
 * queued shares and polling the pool until the session fails, then back
 * off and connect again. run() returns after request_stop() or a fatal
 * authorization failure.
 */
class ReconnectManager {
public:
    ReconnectManager(cminer::logging::Logger& log,
                     std::shared_ptr<StratumClient> client,
                     std::shared_ptr<ShareQueue> shares,
                     ReconnectOptions opts);

    void run();

    // Wakes a pending backoff wait and closes the client. Thread-safe.
    void request_stop();
    bool stop_requested() const;

    // Outcome of the first connect() of run().
    std::shared_future<HandshakeResult> first_attempt() const { return first_future_; }

    // Connection attempts after the first.
    std::uint64_t reconnects() const { return reconnects_.load(std::memory_order_relaxed); }
    bool fatal() const { return fatal_.load(std::memory_order_acquire); }
    bool running() const { return running_.load(std::memory_order_acquire); }
    std::string last_error() const;

    const std::shared_ptr<StratumClient>& client() const { return client_; }

private:
    // Returns the delay requested by the pool through client.reconnect.
    std::optional<std::chrono::milliseconds> session_();
    bool wait_(std::chrono::milliseconds delay);
    void set_error_(std::string msg);

    cminer::logging::Logger& log_;
    std::shared_ptr<StratumClient> client_;
    std::shared_ptr<ShareQueue> shares_;
    ReconnectOptions opts_;
    Backoff backoff_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_{false};
    std::string last_error_;

    std::promise<HandshakeResult> first_promise_;
    std::shared_future<HandshakeResult> first_future_;
    std::atomic<std::uint64_t> reconnects_{0};
    std::atomic<bool> fatal_{false};
    std::atomic<bool> running_{false};
};

} // namespace cminer::pool
