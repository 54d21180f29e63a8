/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include <cminer/pool/stratum.hpp>
#include <cminer/pool/stratum_messages.hpp>
#include <cminer/crypto/hex.hpp>

#include <array>
#include <stdexcept>

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/connect.hpp>
#include <asio/error.hpp>
#include <asio/post.hpp>
#include <asio/write.hpp>

#include <fmt/format.h>

using namespace std::literals;

namespace cminer::pool {

namespace {

constexpr std::size_t kMaxRememberedJobs = 16;

std::chrono::milliseconds remaining(std::chrono::steady_clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    return left.count() > 0 ? left : 0ms;
}

} // namespace

bool is_allowed_transition(ConnectionState from, ConnectionState to) {
    using S = ConnectionState;
    if (from == to) return true;
    switch (from) {
        case S::Disconnected: return to == S::Connecting || to == S::ShuttingDown;
        case S::Connecting: return to == S::Subscribed || to == S::Error || to == S::ShuttingDown;
        case S::Subscribed: return to == S::Authorized || to == S::Error || to == S::ShuttingDown;
        case S::Authorized: return to == S::Error || to == S::ShuttingDown;
        case S::ShuttingDown: return to == S::Disconnected;
        case S::Error: return to == S::Connecting || to == S::ShuttingDown;
    }
    return false;
}

std::string_view to_string(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return "Disconnected";
        case ConnectionState::Connecting: return "Connecting";
        case ConnectionState::Subscribed: return "Subscribed";
        case ConnectionState::Authorized: return "Authorized";
        case ConnectionState::ShuttingDown: return "ShuttingDown";
        case ConnectionState::Error: return "Error";
    }
    return "Unknown";
}

std::string_view to_string(ProtocolError error) {
    switch (error) {
        case ProtocolError::None: return "none";
        case ProtocolError::ResolveFailed: return "resolve failed";
        case ProtocolError::ConnectionRefused: return "connection refused";
        case ProtocolError::Timeout: return "timeout";
        case ProtocolError::MalformedResponse: return "malformed response";
        case ProtocolError::AuthorizationRejected: return "authorization rejected";
        case ProtocolError::ConnectionLost: return "connection lost";
        case ProtocolError::Shutdown: return "shutdown";
    }
    return "unknown";
}

struct StratumClient::Io {
    asio::io_context ioc;
    asio::ip::tcp::resolver resolver{ioc};
    asio::ip::tcp::socket socket{ioc};
    std::array<char, 4096> read_buf{};
};

StratumClient::StratumClient(cminer::logging::Logger& log, StratumOptions opts, std::shared_ptr<JobStore> jobs)
    : log_(log), opts_(std::move(opts)), jobs_(std::move(jobs)), io_(std::make_unique<Io>()) {
    if (!jobs_) throw std::invalid_argument("StratumClient requires a JobStore");
}

StratumClient::~StratumClient() {
    std::error_code ignored;
    io_->socket.close(ignored);
}

bool StratumClient::transition(ConnectionState next) {
    auto cur = state_.load(std::memory_order_acquire);
    do {
        if (!is_allowed_transition(cur, next)) return false;
    } while (!state_.compare_exchange_weak(cur, next, std::memory_order_acq_rel));
    return true;
}

ShareCounters StratumClient::counters() const {
    ShareCounters c;
    c.submitted = submitted_.load(std::memory_order_relaxed);
    c.accepted = accepted_.load(std::memory_order_relaxed);
    c.rejected = rejected_.load(std::memory_order_relaxed);
    c.stale = stale_.load(std::memory_order_relaxed);
    std::lock_guard<std::mutex> lock(diff_mutex_);
    c.accepted_difficulty = accepted_difficulty_;
    return c;
}

// Runs queued operations for at most 'timeout'. On expiry the pending
// operations are cancelled (completing with operation_aborted) and drained.
bool StratumClient::run_io_(std::chrono::milliseconds timeout) {
    io_->ioc.restart();
    io_->ioc.run_for(timeout);
    if (io_->ioc.stopped()) return true;

    std::error_code ignored;
    io_->socket.cancel(ignored);
    io_->resolver.cancel();
    io_->ioc.restart();
    io_->ioc.run();
    return false;
}

void StratumClient::service_posted_() {
    io_->ioc.restart();
    io_->ioc.poll();
}

void StratumClient::close_socket_() {
    std::error_code ignored;
    if (io_->socket.is_open()) {
        io_->socket.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
        io_->socket.close(ignored);
    }
    if (state() == ConnectionState::ShuttingDown) {
        transition(ConnectionState::Disconnected);
        log_.debug("Stratum: socket closed");
    }
}

void StratumClient::close() {
    if (!transition(ConnectionState::ShuttingDown)) return;
    if (std::this_thread::get_id() == owner_.load()) {
        close_socket_();
    } else {
        asio::post(io_->ioc, [this]{ close_socket_(); });
    }
}

void StratumClient::withdraw_work() {
    if (jobs_->snapshot()->job) log_.debug("Stratum: session over, work withdrawn");
    jobs_->reset();
}

void StratumClient::begin_session_() {
    close_socket_();
    lines_.clear();
    pending_.clear();
    pending_count_.store(0, std::memory_order_relaxed);
    valid_jobs_.clear();
    malformed_ = 0;
    jobs_->reset();
}

HandshakeResult StratumClient::fail_(HandshakeResult result, ProtocolError error, std::string msg) {
    result.success = false;
    result.error = error;
    result.error_msg = std::move(msg);

    std::error_code ignored;
    io_->socket.close(ignored);
    if (error == ProtocolError::Shutdown || is_expected_socket_error(state())) {
        log_.debug(fmt::format("Stratum: connect aborted: {}", result.error_msg));
    } else {
        transition(ConnectionState::Error);
        log_.warn(fmt::format("Stratum: connect to {}:{} failed ({}): {}",
                              opts_.host, opts_.port, to_string(error), result.error_msg));
    }
    return result;
}

HandshakeResult StratumClient::connect() {
    HandshakeResult result;
    owner_.store(std::this_thread::get_id());

    if (state() == ConnectionState::ShuttingDown) {
        service_posted_();
        return fail_(result, ProtocolError::Shutdown, "client is shutting down");
    }
    begin_session_();
    if (!transition(ConnectionState::Connecting)) {
        return fail_(result, ProtocolError::Shutdown, "client is shutting down");
    }
    log_.info(fmt::format("Stratum: connecting to {}:{}", opts_.host, opts_.port));

    const auto connect_deadline = std::chrono::steady_clock::now() + opts_.connect_timeout;

    std::error_code ec;
    asio::ip::tcp::resolver::results_type endpoints;
    io_->resolver.async_resolve(opts_.host, opts_.port,
        [&](const std::error_code& e, asio::ip::tcp::resolver::results_type r){
            ec = e;
            endpoints = std::move(r);
        });
    run_io_(remaining(connect_deadline));
    if (is_expected_socket_error(state())) return fail_(result, ProtocolError::Shutdown, "closed while resolving");
    if (ec == asio::error::operation_aborted) return fail_(result, ProtocolError::Timeout, "resolve timed out");
    if (ec) return fail_(result, ProtocolError::ResolveFailed, "resolve: " + ec.message());

    asio::async_connect(io_->socket, endpoints,
        [&](const std::error_code& e, const asio::ip::tcp::endpoint&){ ec = e; });
    run_io_(remaining(connect_deadline));
    if (is_expected_socket_error(state())) return fail_(result, ProtocolError::Shutdown, "closed while connecting");
    if (ec == asio::error::operation_aborted) return fail_(result, ProtocolError::Timeout, "connect timed out");
    if (ec) return fail_(result, ProtocolError::ConnectionRefused, "connect: " + ec.message());

    std::error_code opt_ec;
    io_->socket.set_option(asio::ip::tcp::no_delay(true), opt_ec);

    const auto deadline = std::chrono::steady_clock::now() + opts_.handshake_timeout;

    // mining.subscribe
    const auto sub_id = next_id_++;
    if (auto wec = send_line(stratum_messages::build_subscribe(opts_.client, sub_id))) {
        return fail_(result, ProtocolError::ConnectionLost, "write subscribe: " + wec.message());
    }
    ResponseMessage sub;
    auto pr = await_response_(sub_id, deadline, sub);
    if (pr.error != ProtocolError::None) return fail_(result, pr.error, "subscribe: " + pr.error_msg);
    if (sub.error) {
        return fail_(result, ProtocolError::MalformedResponse, "subscribe returned error: " + describe_error(*sub.error));
    }
    const auto& r = sub.result;
    if (!r.is_array() || r.size() < 3 || !r[1].is_string() || !r[2].is_number_integer()) {
        return fail_(result, ProtocolError::MalformedResponse, "subscribe result invalid: " + r.dump());
    }
    result.extranonce1 = r[1].get<std::string>();
    result.extranonce2_size = r[2].get<int>();
    if (!crypto::is_hex(result.extranonce1) || result.extranonce2_size < 0 || result.extranonce2_size > 16) {
        return fail_(result, ProtocolError::MalformedResponse, "subscribe result has bad extranonce");
    }
    jobs_->set_extranonce(result.extranonce1, result.extranonce2_size);
    if (!transition(ConnectionState::Subscribed)) return fail_(result, ProtocolError::Shutdown, "closed during handshake");
    log_.info(fmt::format("Stratum: subscribed, extranonce1={} extranonce2_size={}",
                          result.extranonce1, result.extranonce2_size));

    // mining.authorize
    const auto auth_id = next_id_++;
    if (auto wec = send_line(stratum_messages::build_authorize(opts_.user, opts_.pass, auth_id))) {
        return fail_(result, ProtocolError::ConnectionLost, "write authorize: " + wec.message());
    }
    ResponseMessage auth;
    pr = await_response_(auth_id, deadline, auth);
    if (pr.error != ProtocolError::None) return fail_(result, pr.error, "authorize: " + pr.error_msg);
    if (!auth.accepted()) {
        auto why = auth.error ? describe_error(*auth.error) : std::string("result is not true");
        return fail_(result, ProtocolError::AuthorizationRejected, fmt::format("worker '{}' rejected: {}", opts_.user, why));
    }
    if (!transition(ConnectionState::Authorized)) return fail_(result, ProtocolError::Shutdown, "closed during handshake");

    log_.info(fmt::format("Stratum: authorized as {}", opts_.user));
    result.success = true;
    return result;
}

HandshakeResult StratumClient::probe() {
    auto result = connect();
    close();
    return result;
}

PollResult StratumClient::await_response_(std::uint64_t id, std::chrono::steady_clock::time_point deadline,
                                          ResponseMessage& out) {
    for (;;) {
        auto left = remaining(deadline);
        if (left.count() == 0) {
            PollResult timeout;
            timeout.error = ProtocolError::Timeout;
            timeout.error_msg = "no response before the handshake deadline";
            return timeout;
        }
        auto p = poll(left);
        if (p.error != ProtocolError::None) return p;
        if (!p.message) continue;
        if (auto* resp = std::get_if<ResponseMessage>(&*p.message); resp && resp->id == id) {
            out = *resp;
            return {};
        }
    }
}

PollResult StratumClient::poll(std::chrono::milliseconds timeout) {
    PollResult out;
    if (state() == ConnectionState::ShuttingDown) {
        service_posted_();
        out.error = ProtocolError::Shutdown;
        return out;
    }

    bool read_done = false;
    for (;;) {
        while (auto line = lines_.next_line()) {
            log_.debug(fmt::format("<- {}", *line));
            if (auto msg = handle_line(*line)) {
                out.message = std::move(msg);
                return out;
            }
            if (opts_.max_malformed > 0 && malformed_ > opts_.max_malformed) {
                out.error = ProtocolError::ConnectionLost;
                out.error_msg = fmt::format("{} consecutive malformed lines", malformed_);
                log_.error(fmt::format("Stratum: {}, dropping connection", out.error_msg));
                transition(ConnectionState::Error);
                close_socket_();
                return out;
            }
        }
        if (read_done) return out;
        if (lines_.overflows() > 0) {
            out.error = ProtocolError::ConnectionLost;
            out.error_msg = "line exceeds the maximum length";
            transition(ConnectionState::Error);
            close_socket_();
            return out;
        }
        if (!io_->socket.is_open()) {
            out.error = is_expected_socket_error(state()) ? ProtocolError::Shutdown : ProtocolError::ConnectionLost;
            out.error_msg = "socket is closed";
            return out;
        }

        std::error_code ec;
        std::size_t n = 0;
        io_->socket.async_read_some(asio::buffer(io_->read_buf),
            [&](const std::error_code& e, std::size_t len){ ec = e; n = len; });
        run_io_(timeout);

        if (is_expected_socket_error(state())) {
            if (ec) log_.debug(fmt::format("Stratum: read ended during shutdown: {}", ec.message()));
            out.error = ProtocolError::Shutdown;
            return out;
        }
        if (ec == asio::error::operation_aborted) return out; // timeout, nothing to report
        if (ec) {
            out.error = ProtocolError::ConnectionLost;
            out.error_msg = ec == asio::error::eof ? "pool closed the connection" : ec.message();
            log_.warn(fmt::format("Stratum: {}", out.error_msg));
            transition(ConnectionState::Error);
            close_socket_();
            return out;
        }
        lines_.append(io_->read_buf.data(), n);
        read_done = true;
    }
}

std::error_code StratumClient::send_line(const std::string& line) {
    log_.debug(fmt::format("-> {}", std::string_view(line).substr(0, line.size() - 1)));
    std::error_code ec;
    asio::async_write(io_->socket, asio::buffer(line),
        [&](const std::error_code& e, std::size_t){ ec = e; });
    run_io_(opts_.handshake_timeout);
    if (ec == asio::error::operation_aborted) return asio::error::timed_out;
    return ec;
}

SubmitResult StratumClient::submit(const Share& share) {
    SubmitResult r;
    const auto st = state();
    if (st != ConnectionState::Authorized) {
        r.error = is_expected_socket_error(st) ? ProtocolError::Shutdown : ProtocolError::ConnectionLost;
        r.error_msg = fmt::format("not authorized (state {})", to_string(st));
        return r;
    }
    if (!is_valid_job_(share.job_id)) {
        stale_.fetch_add(1, std::memory_order_relaxed);
        r.stale = true;
        log_.info(fmt::format("Stratum: dropping stale share for job {}", share.job_id));
        return r;
    }

    r.id = next_id_++;
    auto ec = send_line(stratum_messages::build_submit(opts_.user, share.job_id, share.extranonce2,
                                                        share.ntime, share.nonce, r.id));
    if (ec) {
        if (is_expected_socket_error(state())) {
            r.error = ProtocolError::Shutdown;
            log_.debug(fmt::format("Stratum: submit aborted by shutdown: {}", ec.message()));
        } else {
            r.error = ProtocolError::ConnectionLost;
            log_.warn(fmt::format("Stratum: submit failed: {}", ec.message()));
            transition(ConnectionState::Error);
            close_socket_();
        }
        r.error_msg = ec.message();
        return r;
    }

    pending_[r.id] = share.difficulty;
    pending_count_.store(pending_.size(), std::memory_order_relaxed);
    submitted_.fetch_add(1, std::memory_order_relaxed);
    r.sent = true;
    log_.debug(fmt::format("Stratum: submitted share id={} job={} nonce={}", r.id, share.job_id, share.nonce));
    return r;
}

std::optional<ServerMessage> StratumClient::handle_line(const std::string& line) {
    auto decoded = decode_server_message(line);
    if (!decoded.message) {
        ++malformed_;
        log_.warn(fmt::format("Stratum: skipping malformed line ({}): {}", decoded.error, line.substr(0, 200)));
        return std::nullopt;
    }
    malformed_ = 0;
    apply_(*decoded.message);
    return decoded.message;
}

void StratumClient::apply_(const ServerMessage& msg) {
    if (auto* notify = std::get_if<NotifyMessage>(&msg)) {
        const auto& job = notify->job;
        try {
            jobs_->set_job(job);
        } catch (const std::invalid_argument& e) {
            log_.warn(fmt::format("Stratum: ignoring job {}: {}", job.job_id, e.what()));
            return;
        }
        remember_job_(job.job_id, job.clean_jobs);
        log_.info(fmt::format("Stratum: new job {} (clean={}, branches={})",
                              job.job_id, job.clean_jobs, job.merkle_branch.size()));
    } else if (auto* diff = std::get_if<SetDifficultyMessage>(&msg)) {
        try {
            jobs_->set_difficulty(diff->difficulty);
            log_.info(fmt::format("Stratum: pool difficulty {}", diff->difficulty));
        } catch (const std::invalid_argument& e) {
            log_.warn(fmt::format("Stratum: ignoring difficulty: {}", e.what()));
        }
    } else if (auto* en = std::get_if<SetExtranonceMessage>(&msg)) {
        try {
            jobs_->set_extranonce(en->extranonce1, en->extranonce2_size);
            log_.info(fmt::format("Stratum: extranonce1={} extranonce2_size={} (next job)",
                                  en->extranonce1, en->extranonce2_size));
        } catch (const std::invalid_argument& e) {
            log_.warn(fmt::format("Stratum: ignoring set_extranonce: {}", e.what()));
        }
    } else if (auto* rc = std::get_if<ReconnectMessage>(&msg)) {
        log_.info(fmt::format("Stratum: pool requested reconnect (host='{}' port='{}' wait={}s)",
                              rc->host, rc->port, rc->wait_seconds));
    } else if (auto* show = std::get_if<ShowMessage>(&msg)) {
        log_.info(fmt::format("Pool message: {}", show->text));
    } else if (auto* resp = std::get_if<ResponseMessage>(&msg)) {
        settle_(*resp);
    } else if (auto* unknown = std::get_if<UnknownMessage>(&msg)) {
        log_.debug(fmt::format("Stratum: ignoring unknown method {}", unknown->method));
    }
}

void StratumClient::settle_(const ResponseMessage& response) {
    auto it = pending_.find(response.id);
    if (it == pending_.end()) return;
    const double difficulty = it->second;
    pending_.erase(it);
    pending_count_.store(pending_.size(), std::memory_order_relaxed);

    if (response.accepted()) {
        const auto n = accepted_.fetch_add(1, std::memory_order_relaxed) + 1;
        {
            std::lock_guard<std::mutex> lock(diff_mutex_);
            accepted_difficulty_ += difficulty;
        }
        log_.info(fmt::format("Share accepted ({} accepted, {} rejected)",
                              n, rejected_.load(std::memory_order_relaxed)));
    } else {
        const auto n = rejected_.fetch_add(1, std::memory_order_relaxed) + 1;
        auto why = response.error ? describe_error(*response.error) : std::string("rejected");
        log_.warn(fmt::format("Share rejected: {} ({} accepted, {} rejected)",
                              why, accepted_.load(std::memory_order_relaxed), n));
    }
}

void StratumClient::remember_job_(const std::string& job_id, bool clean) {
    if (clean) valid_jobs_.clear();
    valid_jobs_.push_back(job_id);
    while (valid_jobs_.size() > kMaxRememberedJobs) valid_jobs_.pop_front();
}

bool StratumClient::is_valid_job_(const std::string& job_id) const {
    for (const auto& id : valid_jobs_) {
        if (id == job_id) return true;
    }
    return false;
}

} // namespace cminer::pool
