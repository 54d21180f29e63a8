/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <cminer/logging/logger.hpp>

#include <atomic>
#include <cstdio>
#include <mutex>
#include <string>

namespace cminer::logging {

// Timestamped "[HH:MM:SS]" prefix in local time.
std::string now_hms();

// Prints "[HH:MM:SS] [LEVEL] msg" lines. Safe to share between threads.
class FmtLogger : public Logger {
public:
    explicit FmtLogger(bool enable_debug = false) : enable_debug_(enable_debug) {}
    void info(std::string_view msg) override;
    void warn(std::string_view msg) override;
    void error(std::string_view msg) override;
    void debug(std::string_view msg) override;

    void set_debug(bool v) { enable_debug_.store(v); }

private:
    void print_line(std::FILE* out, std::string_view level, std::string_view msg);

    std::atomic<bool> enable_debug_{false};
    std::mutex out_mutex_;
};

// Discards everything. Used where a Logger& is required but output is not.
class NullLogger : public Logger {
public:
    void info(std::string_view) override {}
    void warn(std::string_view) override {}
    void error(std::string_view) override {}
    void debug(std::string_view) override {}
};

} // namespace cminer::logging
