/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <cminer/logging/logger.hpp>

#include <mutex>

namespace cminer::logging {

/**
 * Forwards to a borrowed Logger until detach() is called; afterwards every
 * line is dropped. Threads that may outlive the owner of the target keep
 * this through a shared_ptr instead of holding the target by reference.
 */
class GuardedLogger : public Logger {
public:
    explicit GuardedLogger(Logger& target) : target_(&target) {}

    void info(std::string_view msg) override;
    void warn(std::string_view msg) override;
    void error(std::string_view msg) override;
    void debug(std::string_view msg) override;

    // Waits for a line in flight, then cuts the target off for good.
    void detach();
    bool attached() const;

private:
    template <typename Fn>
    void forward_(Fn&& fn);

    mutable std::mutex mutex_;
    Logger* target_;
};

} // namespace cminer::logging
