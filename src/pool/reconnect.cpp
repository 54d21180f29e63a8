/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include <cminer/pool/reconnect.hpp>

#include <algorithm>
#include <stdexcept>
#include <variant>

#include <fmt/format.h>

namespace cminer::pool {

Backoff::Backoff(std::chrono::milliseconds initial,
                 std::chrono::milliseconds max,
                 std::chrono::milliseconds reset_after)
    : initial_(initial), max_(std::max(initial, max)), reset_after_(reset_after), current_(initial) {
    if (initial.count() <= 0) throw std::invalid_argument("backoff initial delay must be positive");
}

std::chrono::milliseconds Backoff::next_delay() {
    auto delay = current_;
    current_ = (current_ > max_ / 2) ? max_ : current_ * 2;
    ++attempts_;
    return delay;
}

void Backoff::reset() {
    current_ = initial_;
    attempts_ = 0;
}

void Backoff::on_session_end(std::chrono::milliseconds session_length) {
    if (session_length >= reset_after_) reset();
}

ReconnectManager::ReconnectManager(cminer::logging::Logger& log,
                                   std::shared_ptr<StratumClient> client,
                                   std::shared_ptr<ShareQueue> shares,
                                   ReconnectOptions opts)
    : log_(log)
    , client_(std::move(client))
    , shares_(std::move(shares))
    , opts_(opts)
    , backoff_(opts.backoff_initial, opts.backoff_max, opts.backoff_reset_after)
    , first_future_(first_promise_.get_future().share()) {
    if (!client_ || !shares_) throw std::invalid_argument("ReconnectManager requires a client and a share queue");
}

bool ReconnectManager::stop_requested() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stop_;
}

void ReconnectManager::request_stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = true;
    }
    cv_.notify_all();
    client_->close();
}

std::string ReconnectManager::last_error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_error_;
}

void ReconnectManager::set_error_(std::string msg) {
    std::lock_guard<std::mutex> lock(mutex_);
    last_error_ = std::move(msg);
}

bool ReconnectManager::wait_(std::chrono::milliseconds delay) {
    std::unique_lock<std::mutex> lock(mutex_);
    return !cv_.wait_for(lock, delay, [this]{ return stop_; });
}

void ReconnectManager::run() {
    running_.store(true, std::memory_order_release);
    bool first = true;

    while (!stop_requested()) {
        if (!first) reconnects_.fetch_add(1, std::memory_order_relaxed);

        auto hs = client_->connect();
        if (first) {
            first_promise_.set_value(hs);
            first = false;
        }

        std::chrono::milliseconds delay{0};
        if (hs.success) {
            if (auto dropped = shares_->clear(); dropped > 0) {
                log_.info(fmt::format("Discarded {} share(s) from the previous connection", dropped));
            }
            const auto started = std::chrono::steady_clock::now();
            const auto requested = session_();
            client_->withdraw_work();
            backoff_.on_session_end(std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - started));
            if (stop_requested()) break;
            delay = requested ? *requested : backoff_.next_delay();
        } else {
            // A notify may have arrived before the handshake failed
            client_->withdraw_work();
            if (hs.error == ProtocolError::Shutdown) break;
            set_error_(hs.error_msg);
            if (hs.error == ProtocolError::AuthorizationRejected && opts_.auth_policy == AuthFailurePolicy::Fatal) {
                fatal_.store(true, std::memory_order_release);
                log_.error(fmt::format("Authorization rejected, not retrying: {}", hs.error_msg));
                break;
            }
            delay = backoff_.next_delay();
        }

        log_.warn(fmt::format("Reconnecting in {} ms", delay.count()));
        if (!wait_(delay)) break;
    }

    if (first) {
        HandshakeResult aborted;
        aborted.error = ProtocolError::Shutdown;
        aborted.error_msg = "stopped before the first connection attempt";
        first_promise_.set_value(aborted);
    }
    client_->close();
    running_.store(false, std::memory_order_release);
    log_.debug("Network loop finished");
}

std::optional<std::chrono::milliseconds> ReconnectManager::session_() {
    while (!stop_requested()) {
        Share share;
        while (shares_->try_pop(share)) {
            auto r = client_->submit(share);
            if (r.error == ProtocolError::Shutdown) return std::nullopt;
            if (r.error != ProtocolError::None) {
                set_error_(r.error_msg);
                return std::nullopt;
            }
        }

        auto p = client_->poll(opts_.poll_interval);
        if (p.error == ProtocolError::Shutdown) return std::nullopt;
        if (p.error != ProtocolError::None) {
            set_error_(p.error_msg);
            return std::nullopt;
        }
        if (p.message) {
            if (auto* rc = std::get_if<ReconnectMessage>(&*p.message)) {
                client_->close();
                return std::chrono::milliseconds(std::chrono::seconds(std::max(rc->wait_seconds, 0)));
            }
        }
    }
    return std::nullopt;
}

} // namespace cminer::pool
