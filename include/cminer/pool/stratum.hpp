/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <unordered_map>

#include <cminer/logging/logger.hpp>
#include <cminer/pool/job_store.hpp>
#include <cminer/pool/line_buffer.hpp>
#include <cminer/pool/messages.hpp>
#include <cminer/pool/share.hpp>

namespace cminer::pool {

enum class ConnectionState {
    Disconnected,
    Connecting,
    Subscribed,
    Authorized,
    ShuttingDown,
    Error
};

std::string_view to_string(ConnectionState state);

// Disconnected -> Connecting -> Subscribed -> Authorized, any live state ->
// Error or ShuttingDown, Error -> Connecting, ShuttingDown -> Disconnected.
bool is_allowed_transition(ConnectionState from, ConnectionState to);

// Socket errors seen in these states are a consequence of close() and are
// logged at debug level only.
constexpr bool is_expected_socket_error(ConnectionState state) {
    return state == ConnectionState::ShuttingDown || state == ConnectionState::Disconnected;
}

enum class ProtocolError {
    None,
    ResolveFailed,
    ConnectionRefused,
    Timeout,
    MalformedResponse,
    AuthorizationRejected,
    ConnectionLost,
    Shutdown
};

std::string_view to_string(ProtocolError error);

struct StratumOptions {
    std::string host;
    std::string port;
    std::string user;
    std::string pass{"x"};
    std::string client{"cminer/" CMINER_VERSION};
    std::chrono::milliseconds connect_timeout{10000};
    std::chrono::milliseconds handshake_timeout{10000};
    int max_malformed{10};
};

// Result of handshake (subscribe + authorize)
struct HandshakeResult {
    bool success{false};
    ProtocolError error{ProtocolError::None};
    std::string extranonce1;
    int extranonce2_size{0};
    std::string error_msg;
};

struct PollResult {
    std::optional<ServerMessage> message; // empty on timeout or error
    ProtocolError error{ProtocolError::None};
    std::string error_msg;
};

struct SubmitResult {
    bool sent{false};
    bool stale{false}; // dropped locally, job no longer valid
    ProtocolError error{ProtocolError::None};
    std::uint64_t id{0};
    std::string error_msg;
};

struct ShareCounters {
    std::uint64_t submitted{0};
    std::uint64_t accepted{0};
    std::uint64_t rejected{0};
    std::uint64_t stale{0};
    double accepted_difficulty{0.0}; // sum of difficulty over accepted shares
};

/**
 * Stratum v1 client.
 *
 * connect(), poll() and submit() belong to a single network thread.
 * close(), state() and counters() may be called from any thread.
 * Every notification read by connect() or poll() is applied to the
 * JobStore before it is returned.
 */
class StratumClient {
public:
    StratumClient(cminer::logging::Logger& log, StratumOptions opts, std::shared_ptr<JobStore> jobs);
    virtual ~StratumClient();

    // Non-copyable
    StratumClient(const StratumClient&) = delete;
    StratumClient& operator=(const StratumClient&) = delete;

    // Resolve, connect, subscribe and authorize. Resets the JobStore.
    HandshakeResult connect();

    // One connect + handshake, then close.
    HandshakeResult probe();

    // Next message from the pool, waiting at most 'timeout' for data.
    PollResult poll(std::chrono::milliseconds timeout);

    // Send mining.submit; the verdict arrives later through poll().
    SubmitResult submit(const Share& share);

    // Enter ShuttingDown and release the socket. Thread-safe and idempotent.
    void close();

    // Drops the current job so workers idle until the next session's first
    // notify. Network thread only.
    void withdraw_work();

    ConnectionState state() const { return state_.load(std::memory_order_acquire); }
    ShareCounters counters() const;
    std::size_t pending_submits() const { return pending_count_.load(std::memory_order_relaxed); }
    const StratumOptions& options() const { return opts_; }

protected:
    // Write one request line. Network thread only.
    virtual std::error_code send_line(const std::string& line);

    // Decode and apply one line. Returns nullopt when the line is malformed.
    std::optional<ServerMessage> handle_line(const std::string& line);

    // Moves to 'next' when is_allowed_transition() permits it.
    bool transition(ConnectionState next);

private:
    struct Io;

    bool run_io_(std::chrono::milliseconds timeout);
    void service_posted_();
    void close_socket_();
    void begin_session_();
    PollResult await_response_(std::uint64_t id, std::chrono::steady_clock::time_point deadline,
                               ResponseMessage& out);
    HandshakeResult fail_(HandshakeResult result, ProtocolError error, std::string msg);
    void apply_(const ServerMessage& msg);
    void settle_(const ResponseMessage& response);
    void remember_job_(const std::string& job_id, bool clean);
    bool is_valid_job_(const std::string& job_id) const;

    cminer::logging::Logger& log_;
    StratumOptions opts_;
    std::shared_ptr<JobStore> jobs_;
    std::unique_ptr<Io> io_;
    LineBuffer lines_;

    std::atomic<ConnectionState> state_{ConnectionState::Disconnected};
    std::atomic<std::thread::id> owner_{};

    std::uint64_t next_id_{1};
    int malformed_{0};
    std::unordered_map<std::uint64_t, double> pending_; // submit id -> share difficulty
    std::atomic<std::size_t> pending_count_{0};
    std::deque<std::string> valid_jobs_;

    std::atomic<std::uint64_t> submitted_{0};
    std::atomic<std::uint64_t> accepted_{0};
    std::atomic<std::uint64_t> rejected_{0};
    std::atomic<std::uint64_t> stale_{0};
    mutable std::mutex diff_mutex_;
    double accepted_difficulty_{0.0};
};

} // namespace cminer::pool
