/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include <cminer/config/loader.hpp>

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <optional>
#include <sstream>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include <cminer/config/validator.hpp>

namespace cminer::config {

namespace {

enum class Kind { String, Int, Bool };

std::optional<Kind> kind_of(const std::string& key) {
    if (key == "algo" || key == "url" || key == "user" || key == "pass" || key == "client")
        return Kind::String;
    if (key == "retry_on_auth_failure")
        return Kind::Bool;
    if (key == "threads" || key == "intensity" || key == "scrypt_n" || key == "scrypt_r" ||
        key == "scrypt_p" || key == "batch_size" || key == "stats_interval_ms" ||
        key == "connect_timeout_ms" || key == "handshake_timeout_ms" ||
        key == "poll_interval_ms" || key == "backoff_initial_ms" || key == "backoff_max_ms" ||
        key == "backoff_reset_after_ms" || key == "join_timeout_ms" ||
        key == "heartbeat_timeout_ms" || key == "share_queue_capacity" ||
        key == "max_malformed" || key == "max_worker_restarts")
        return Kind::Int;
    return std::nullopt;
}

std::optional<long long> parse_int(const std::string& s) {
    if (s.empty()) return std::nullopt;
    try {
        std::size_t pos = 0;
        long long v = std::stoll(s, &pos, 10);
        if (pos != s.size()) return std::nullopt;
        return v;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<bool> parse_bool(const std::string& s) {
    if (s == "true" || s == "1" || s == "yes" || s == "on") return true;
    if (s == "false" || s == "0" || s == "no" || s == "off") return false;
    return std::nullopt;
}

template <typename T>
bool assign_int(T& dst, long long v) {
    if (v < static_cast<long long>(std::numeric_limits<T>::min())) return false;
    if (v > 0 && static_cast<unsigned long long>(v) > static_cast<unsigned long long>(std::numeric_limits<T>::max()))
        return false;
    dst = static_cast<T>(v);
    return true;
}

bool set_int(MinerConfig& cfg, const std::string& key, long long v) {
    if (key == "threads") return assign_int(cfg.threads, v);
    if (key == "intensity") return assign_int(cfg.intensity, v);
    if (key == "scrypt_n") return assign_int(cfg.scrypt_n, v);
    if (key == "scrypt_r") return assign_int(cfg.scrypt_r, v);
    if (key == "scrypt_p") return assign_int(cfg.scrypt_p, v);
    if (key == "batch_size") return assign_int(cfg.batch_size, v);
    if (key == "stats_interval_ms") return assign_int(cfg.stats_interval_ms, v);
    if (key == "connect_timeout_ms") return assign_int(cfg.connect_timeout_ms, v);
    if (key == "handshake_timeout_ms") return assign_int(cfg.handshake_timeout_ms, v);
    if (key == "poll_interval_ms") return assign_int(cfg.poll_interval_ms, v);
    if (key == "backoff_initial_ms") return assign_int(cfg.backoff_initial_ms, v);
    if (key == "backoff_max_ms") return assign_int(cfg.backoff_max_ms, v);
    if (key == "backoff_reset_after_ms") return assign_int(cfg.backoff_reset_after_ms, v);
    if (key == "join_timeout_ms") return assign_int(cfg.join_timeout_ms, v);
    if (key == "heartbeat_timeout_ms") return assign_int(cfg.heartbeat_timeout_ms, v);
    if (key == "share_queue_capacity") return assign_int(cfg.share_queue_capacity, v);
    if (key == "max_malformed") return assign_int(cfg.max_malformed, v);
    if (key == "max_worker_restarts") return assign_int(cfg.max_worker_restarts, v);
    return false;
}

void set_string(MinerConfig& cfg, const std::string& key, const std::string& v) {
    if (key == "algo") cfg.algo = v;
    else if (key == "url") cfg.url = v;
    else if (key == "user") cfg.user = v;
    else if (key == "pass") cfg.pass = v;
    else if (key == "client") cfg.client = v;
}

// Assigns a textual value (key=value files and environment variables).
std::optional<std::string> assign_text(MinerConfig& cfg, const std::string& key, const std::string& val) {
    auto kind = kind_of(key);
    if (!kind) return std::nullopt; // unknown keys are ignored
    switch (*kind) {
        case Kind::String:
            set_string(cfg, key, val);
            return std::nullopt;
        case Kind::Bool: {
            auto b = parse_bool(val);
            if (!b) return fmt::format("'{}' must be a boolean, got '{}'", key, val);
            cfg.retry_on_auth_failure = *b;
            return std::nullopt;
        }
        case Kind::Int: {
            auto v = parse_int(val);
            if (!v || !set_int(cfg, key, *v)) return fmt::format("'{}' must be an integer in range, got '{}'", key, val);
            return std::nullopt;
        }
    }
    return std::nullopt;
}

std::string trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return {};
    auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

std::vector<std::string> load_key_value(MinerConfig& cfg, const std::string& text) {
    std::vector<std::string> errs;
    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        std::string key = trim(line.substr(0, eq));
        std::string val = trim(line.substr(eq + 1));
        if (auto e = assign_text(cfg, key, val)) errs.push_back(*e);
    }
    return errs;
}

std::vector<std::string> load_json(MinerConfig& cfg, const std::string& text) {
    std::vector<std::string> errs;
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::exception& ex) {
        errs.push_back(fmt::format("Failed to read config: {}", ex.what()));
        return errs;
    }
    if (!j.is_object()) {
        errs.push_back("config must be a JSON object");
        return errs;
    }

    for (auto it = j.begin(); it != j.end(); ++it) {
        auto kind = kind_of(it.key());
        if (!kind) continue;
        const auto& v = it.value();
        switch (*kind) {
            case Kind::String:
                if (!v.is_string()) errs.push_back(fmt::format("'{}' must be a string", it.key()));
                break;
            case Kind::Bool:
                if (!v.is_boolean()) errs.push_back(fmt::format("'{}' must be a boolean", it.key()));
                break;
            case Kind::Int:
                if (!v.is_number_integer()) errs.push_back(fmt::format("'{}' must be an integer", it.key()));
                break;
        }
    }
    if (j.contains("algo") && j.at("algo").is_string() && !is_known_algo(j.at("algo").get<std::string>())) {
        errs.push_back("algo must be 'scrypt' or 'sha256d'");
    }
    if (j.contains("url") && j.at("url").is_string()) {
        std::string e;
        if (!validate_host_port(j.at("url").get<std::string>(), e)) errs.push_back(e);
    }
    if (!errs.empty()) return errs;

    MinerConfig staged = cfg;
    for (auto it = j.begin(); it != j.end(); ++it) {
        auto kind = kind_of(it.key());
        if (!kind) continue;
        const auto& v = it.value();
        if (*kind == Kind::String) {
            set_string(staged, it.key(), v.get<std::string>());
        } else if (*kind == Kind::Bool) {
            staged.retry_on_auth_failure = v.get<bool>();
        } else if (!set_int(staged, it.key(), v.get<long long>())) {
            errs.push_back(fmt::format("'{}' out of range", it.key()));
        }
    }
    if (errs.empty()) cfg = staged;
    return errs;
}

} // namespace

std::vector<std::string> load_from_text(MinerConfig& cfg, const std::string& text) {
    auto first_non_space = text.find_first_not_of(" \t\n\r");
    if (first_non_space == std::string::npos) return {};
    if (text[first_non_space] == '{') return load_json(cfg, text);

    MinerConfig staged = cfg;
    auto errs = load_key_value(staged, text);
    if (errs.empty()) cfg = staged;
    return errs;
}

std::optional<std::string> apply_option(MinerConfig& cfg, const std::string& key, const std::string& value) {
    if (!kind_of(key)) return fmt::format("unknown option '{}'", key);
    return assign_text(cfg, key, value);
}

std::vector<std::string> load_from_file(MinerConfig& cfg, const std::string& path) {
    std::ifstream in(path);
    if (!in.good()) return {}; // optional

    std::stringstream buffer;
    buffer << in.rdbuf();
    return load_from_text(cfg, buffer.str());
}

std::vector<std::string> apply_env_overrides(MinerConfig& cfg) {
    static const char* const keys[] = {
        "algo", "url", "user", "pass", "threads", "intensity", "scrypt_n", "scrypt_r", "scrypt_p",
        "batch_size", "stats_interval_ms", "backoff_initial_ms", "backoff_max_ms",
        "backoff_reset_after_ms", "retry_on_auth_failure", "join_timeout_ms"};
    std::vector<std::string> errs;
    for (const char* key : keys) {
        std::string name = "CMINER_";
        for (const char* c = key; *c; ++c) name.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(*c))));
        if (const char* v = std::getenv(name.c_str())) {
            if (auto e = assign_text(cfg, key, v)) errs.push_back(fmt::format("{}: {}", name, *e));
        }
    }
    return errs;
}

std::vector<std::string> validate_final(const MinerConfig& cfg) {
    std::vector<std::string> errs;
    if (!is_known_algo(cfg.algo)) errs.push_back("algo must be 'scrypt' or 'sha256d'");
    if (cfg.url.empty()) errs.push_back("url is required");
    if (cfg.user.empty()) errs.push_back("user is required");
    if (!cfg.url.empty()) {
        std::string e;
        if (!validate_host_port(cfg.url, e)) errs.push_back(e);
    }
    if (cfg.threads < 0) errs.push_back("threads must be >= 0");
    if (cfg.intensity < 0 || cfg.intensity > 100) errs.push_back("intensity must be within 0-100");
    if (cfg.algo == "scrypt") {
        if (cfg.scrypt_n < 2 || (cfg.scrypt_n & (cfg.scrypt_n - 1)) != 0)
            errs.push_back("scrypt_n must be a power of two >= 2");
        if (cfg.scrypt_r == 0 || cfg.scrypt_p == 0) errs.push_back("scrypt_r and scrypt_p must be >= 1");
    }
    if (cfg.batch_size == 0) errs.push_back("batch_size must be >= 1");
    if (cfg.share_queue_capacity == 0) errs.push_back("share_queue_capacity must be >= 1");
    if (cfg.stats_interval_ms <= 0) errs.push_back("stats_interval_ms must be > 0");
    if (cfg.connect_timeout_ms <= 0 || cfg.handshake_timeout_ms <= 0 || cfg.poll_interval_ms <= 0)
        errs.push_back("timeouts must be > 0");
    if (cfg.backoff_initial_ms <= 0 || cfg.backoff_max_ms < cfg.backoff_initial_ms)
        errs.push_back("backoff_initial_ms must be > 0 and <= backoff_max_ms");
    if (cfg.join_timeout_ms <= 0) errs.push_back("join_timeout_ms must be > 0");
    if (cfg.heartbeat_timeout_ms <= 0) errs.push_back("heartbeat_timeout_ms must be > 0");
    if (cfg.max_malformed < 0 || cfg.max_worker_restarts < 0)
        errs.push_back("max_malformed and max_worker_restarts must be >= 0");
    return errs;
}

bool split_host_port(const std::string& url, std::string& host, std::string& port) {
    std::string u = url;
    const std::string scheme = "stratum+tcp://";
    if (u.compare(0, scheme.size(), scheme) == 0) u = u.substr(scheme.size());
    auto pos = u.rfind(':');
    if (pos == std::string::npos) return false;
    host = u.substr(0, pos);
    port = u.substr(pos + 1);
    return true;
}

} // namespace cminer::config
