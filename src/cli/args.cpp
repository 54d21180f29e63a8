/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include <cminer/cli/args.hpp>
#include <cminer/config/loader.hpp>

#include <string>
#include <utility>
#include <vector>

#include <cxxopts.hpp>
#include <fmt/core.h>

namespace cminer::cli {

namespace {

// CLI flag -> config key, for flags that take a value.
const std::vector<std::pair<std::string, std::string>>& value_flags() {
    static const std::vector<std::pair<std::string, std::string>> flags = {
        {"algo", "algo"},
        {"url", "url"},
        {"user", "user"},
        {"pass", "pass"},
        {"threads", "threads"},
        {"intensity", "intensity"},
        {"scrypt-n", "scrypt_n"},
        {"scrypt-r", "scrypt_r"},
        {"scrypt-p", "scrypt_p"},
        {"batch-size", "batch_size"},
        {"stats-interval", "stats_interval_ms"},
        {"join-timeout", "join_timeout_ms"},
    };
    return flags;
}

void report(cminer::logging::Logger& log, const char* what, const std::vector<std::string>& errors) {
    for (const auto& e : errors) log.error(fmt::format("{}: {}", what, e));
}

} // namespace

cminer::config::ParseResult parse(int argc, char** argv, cminer::logging::Logger& log) {
    cminer::config::ParseResult pr;
    cxxopts::Options options("cminer", "CPU pool miner (Stratum v1, scrypt / sha256d)");
    options.add_options()
        ("a,algo",      "Mining algorithm: scrypt or sha256d", cxxopts::value<std::string>())
        ("o,url",       "Pool URL (host:port)", cxxopts::value<std::string>())
        ("u,user",      "Wallet[.RIG]", cxxopts::value<std::string>())
        ("p,pass",      "Pool password", cxxopts::value<std::string>())
        ("t,threads",   "Worker threads (0 = one per physical core)", cxxopts::value<std::string>())
        ("i,intensity", "Duty cycle percent, 0-100", cxxopts::value<std::string>())
        ("scrypt-n",    "Scrypt N", cxxopts::value<std::string>())
        ("scrypt-r",    "Scrypt r", cxxopts::value<std::string>())
        ("scrypt-p",    "Scrypt p", cxxopts::value<std::string>())
        ("batch-size",  "Hashes per batch between job checks", cxxopts::value<std::string>())
        ("stats-interval", "Stats interval in ms", cxxopts::value<std::string>())
        ("join-timeout",   "Shutdown join timeout in ms", cxxopts::value<std::string>())
        ("retry-auth",  "Keep retrying when the pool rejects the credentials")
        ("c,config",    "Path to config file (cminer.conf)", cxxopts::value<std::string>()->default_value("cminer.conf"))
        ("d,debug",     "Enable debug logging")
        ("probe",       "Connect, subscribe and authorize once, then exit")
        ("v,version",   "Show version and exit")
        ("h,help",      "Show help and exit");

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            log.info(options.help());
            pr.show_only = true;
            return pr;
        }
        if (result.count("version")) {
            log.info(fmt::format("cminer v{}", CMINER_VERSION));
            pr.show_only = true;
            return pr;
        }

        pr.config_path = result["config"].as<std::string>();
        pr.debug = result.count("debug") > 0;
        pr.probe = result.count("probe") > 0;

        cminer::config::MinerConfig cfg;
        auto errs = cminer::config::load_from_file(cfg, pr.config_path);
        if (!errs.empty()) {
            report(log, pr.config_path.c_str(), errs);
            return pr;
        }
        errs = cminer::config::apply_env_overrides(cfg);
        if (!errs.empty()) {
            report(log, "environment", errs);
            return pr;
        }

        for (const auto& [flag, key] : value_flags()) {
            if (!result.count(flag)) continue;
            if (auto e = cminer::config::apply_option(cfg, key, result[flag].as<std::string>())) {
                errs.push_back(fmt::format("--{}: {}", flag, *e));
            }
        }
        if (result.count("retry-auth")) cfg.retry_on_auth_failure = true;
        if (!errs.empty()) {
            report(log, "Argument error", errs);
            return pr;
        }

        errs = cminer::config::validate_final(cfg);
        if (!errs.empty()) {
            report(log, "Invalid configuration", errs);
            log.info(options.help());
            return pr;
        }
        pr.cfg = cfg;
    } catch (const std::exception& e) {
        log.error(fmt::format("Argument error: {}\n\n{}", e.what(), options.help()));
        return pr;
    }
    return pr;
}

} // namespace cminer::cli
