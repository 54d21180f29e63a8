/*
 * cminer: CPU pool miner
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#include <atomic>
#include <chrono>
#include <csignal>
#include <memory>
#include <string>
#include <thread>

#include <fmt/core.h>

#include <cminer/cli/args.hpp>
#include <cminer/config/types.hpp>
#include <cminer/crypto/hasher.hpp>
#include <cminer/engine.hpp>
#include <cminer/logging/fmt_logger.hpp>
#include <cminer/pool/job_store.hpp>
#include <cminer/pool/stratum.hpp>
#include <cminer/stats.hpp>

namespace {

std::atomic<bool> g_stop{false};

void handle_signal(int) {
    g_stop.store(true);
}

int run_probe(const cminer::config::MinerConfig& cfg, cminer::logging::Logger& log) {
    cminer::pool::StratumOptions so;
    if (!cminer::config::split_host_port(cfg.url, so.host, so.port)) {
        log.error("url must be host:port");
        return 1;
    }
    so.user = cfg.user;
    so.pass = cfg.pass;
    so.client = cfg.client;
    so.connect_timeout = std::chrono::milliseconds(cfg.connect_timeout_ms);
    so.handshake_timeout = std::chrono::milliseconds(cfg.handshake_timeout_ms);
    so.max_malformed = cfg.max_malformed;

    const auto algo = cminer::crypto::parse_algorithm(cfg.algo).value_or(cminer::crypto::Algorithm::Scrypt);
    auto jobs = std::make_shared<cminer::pool::JobStore>(algo);
    cminer::pool::StratumClient client(log, so, jobs);
    const auto result = client.probe();
    if (!result.success) {
        log.error(fmt::format("Probe failed ({}): {}", cminer::pool::to_string(result.error), result.error_msg));
        return 1;
    }
    const auto snap = jobs->snapshot();
    log.info(fmt::format("Probe OK: extranonce1={} extranonce2_size={} difficulty={} job={}",
                         result.extranonce1, result.extranonce2_size, snap->difficulty,
                         snap->job ? snap->job->job_id : std::string("(none yet)")));
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    cminer::logging::FmtLogger log;

    auto parsed = cminer::cli::parse(argc, argv, log);
    if (parsed.show_only) {
        return 0;
    }
    if (!parsed.cfg.has_value()) {
        return 1;
    }
    log.set_debug(parsed.debug);
    const auto& cfg = *parsed.cfg;

    log.info(fmt::format("cminer v{}", CMINER_VERSION));
    log.info(fmt::format("  algo      : {}", cfg.algo));
    log.info(fmt::format("  url       : {}", cfg.url));
    log.info(fmt::format("  user      : {}", cfg.user));
    log.info(fmt::format("  threads   : {}", cfg.threads > 0 ? std::to_string(cfg.threads) : std::string("auto")));
    log.info(fmt::format("  intensity : {}%", cfg.intensity));

    if (parsed.probe) {
        return run_probe(cfg, log);
    }

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    cminer::Engine engine(log, std::make_shared<cminer::LogStatsSink>(log));
    const auto started = engine.start(cfg);
    if (!started.ok) {
        log.error(fmt::format("Engine failed to start ({}): {}", cminer::to_string(started.error), started.message));
        return 2;
    }

    while (!g_stop.load() && !engine.failed()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    const bool failed = engine.failed();
    if (failed) {
        log.error("Pool rejected the credentials, exiting");
    } else {
        log.info("Signal received, shutting down");
    }
    engine.stop();

    const auto final_stats = engine.status();
    log.info(fmt::format("Session: {} hashes, {} accepted, {} rejected, {} stale, uptime {}",
                         final_stats.hashes, final_stats.accepted, final_stats.rejected,
                         final_stats.stale, cminer::format_uptime(final_stats.uptime)));
    return failed ? 2 : 0;
}
