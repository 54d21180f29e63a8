/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <string>

namespace cminer::pool {

// A share found by a worker, ready for submission.
// Fields match Stratum submission parameter types (strings).
struct Share {
    std::string job_id;
    std::string extranonce2;
    std::string ntime;
    std::string nonce;       // 8 hex digits
    double difficulty{1.0};  // pool difficulty the share was found at
    int worker_id{-1};
};

} // namespace cminer::pool
