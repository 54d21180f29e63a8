/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <cminer/config/types.hpp>
#include <cminer/logging/logger.hpp>

namespace cminer::cli {

// Parse CLI using cxxopts, then layer defaults < config file < CMINER_* env <
// CLI flags. Writes help/version and every error through the provided logger.
cminer::config::ParseResult parse(int argc, char** argv, cminer::logging::Logger& log);

} // namespace cminer::cli
