/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace cminer::config {

struct MinerConfig {
    std::string algo{"scrypt"};
    std::string url;               // host:port
    std::string user;
    std::string pass{"x"};
    std::string client{"cminer/" CMINER_VERSION};

    int threads{0};                // 0 = physical core count
    int intensity{100};            // percent, 0..100
    std::uint64_t scrypt_n{1024};
    std::uint32_t scrypt_r{1};
    std::uint32_t scrypt_p{1};
    std::uint32_t batch_size{64};

    int stats_interval_ms{2000};
    int connect_timeout_ms{10000};
    int handshake_timeout_ms{10000};
    int poll_interval_ms{100};
    int backoff_initial_ms{1000};
    int backoff_max_ms{60000};
    int backoff_reset_after_ms{60000};
    bool retry_on_auth_failure{false};
    int join_timeout_ms{2000};
    int heartbeat_timeout_ms{10000};
    std::uint32_t share_queue_capacity{256};
    int max_malformed{10};
    int max_worker_restarts{5};
};

struct ParseResult {
    std::optional<MinerConfig> cfg; // present when valid and ready to run
    std::string config_path{"cminer.conf"};
    bool show_only{false}; // true if --help/--version was printed
    bool debug{false};     // true if --debug was passed on CLI
    bool probe{false};     // true if --probe (handshake once and exit)
};

// Splits "host:port" (an optional "stratum+tcp://" prefix is ignored).
// Returns false when no port separator is present.
bool split_host_port(const std::string& url, std::string& host, std::string& port);

} // namespace cminer::config
