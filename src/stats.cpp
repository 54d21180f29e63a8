/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "cminer/stats.hpp"

#include <fmt/format.h>

namespace cminer {

void HashrateMeter::add_sample(std::chrono::steady_clock::time_point when, std::uint64_t total_hashes) {
    samples_.emplace_back(when, total_hashes);
    // Keep one sample older than the window as the baseline
    while (samples_.size() > 2 && when - samples_[1].first >= window_) {
        samples_.pop_front();
    }
}

double HashrateMeter::rate() const {
    if (samples_.size() < 2) return 0.0;
    const auto& first = samples_.front();
    const auto& last = samples_.back();
    const double secs = std::chrono::duration<double>(last.first - first.first).count();
    if (secs <= 0.0 || last.second < first.second) return 0.0;
    return static_cast<double>(last.second - first.second) / secs;
}

std::string format_hashrate(double h) {
    if (h < 1000) return fmt::format("{:.2f} H/s", h);
    if (h < 1e6) return fmt::format("{:.2f} KH/s", h / 1e3);
    if (h < 1e9) return fmt::format("{:.2f} MH/s", h / 1e6);
    return fmt::format("{:.2f} GH/s", h / 1e9);
}

std::string format_uptime(std::chrono::seconds uptime) {
    const auto s = uptime.count();
    return fmt::format("{:02}:{:02}:{:02}", s / 3600, (s / 60) % 60, s % 60);
}

std::string format_stats(const EngineStats& s) {
    return fmt::format("{} | pool {} | A:{} R:{} S:{} | {} | diff {:g} | {}/{} thr @ {}% | {} {}",
                       format_hashrate(s.hashrate),
                       format_hashrate(s.accepted_hashrate),
                       s.accepted, s.rejected, s.stale,
                       pool::to_string(s.connection),
                       s.difficulty,
                       s.live_workers, s.threads, s.intensity,
                       format_uptime(s.uptime),
                       s.job_id.empty() ? std::string("(no job)") : "job " + s.job_id);
}

void LogStatsSink::publish(const EngineStats& stats) {
    log_.info(format_stats(stats));
}

} // namespace cminer
