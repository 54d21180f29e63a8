/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <cstdint>
#include <string>

namespace cminer::pool::stratum_messages {

// Build a mining.subscribe request line (JSON + \n)
std::string build_subscribe(std::string client, std::uint64_t id);

// Build a mining.authorize request line (JSON + \n)
std::string build_authorize(std::string user, std::string pass, std::uint64_t id);

// Build a mining.submit request line (JSON + \n)
std::string build_submit(std::string user, std::string job_id, std::string extranonce2,
                         std::string ntime, std::string nonce, std::uint64_t id);

} // namespace cminer::pool::stratum_messages
