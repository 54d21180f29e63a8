/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <chrono>

namespace cminer::mining {

class Worker {
public:
    virtual ~Worker() = default;
    virtual void start() = 0;
    // Request a cooperative stop; does not wait.
    virtual void stop() = 0;
    // Wait for the thread to exit; false if it is still running after 'timeout'.
    virtual bool join_for(std::chrono::milliseconds timeout) = 0;
};

} // namespace cminer::mining
