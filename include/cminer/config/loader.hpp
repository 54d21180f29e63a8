/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include <cminer/config/types.hpp>

namespace cminer::config {

// Read configuration from file (JSON or key=value). A missing file is not an
// error. Returns list of validation errors (empty if ok); on error cfg is untouched.
std::vector<std::string> load_from_file(MinerConfig& cfg, const std::string& path);

// Same as load_from_file but for text already in memory.
std::vector<std::string> load_from_text(MinerConfig& cfg, const std::string& text);

// Apply CMINER_* environment variables on top of current cfg.
std::vector<std::string> apply_env_overrides(MinerConfig& cfg);

// Set one option from its textual value (CLI flags). Returns an error for an
// unknown key or a value of the wrong type or range.
std::optional<std::string> apply_option(MinerConfig& cfg, const std::string& key, const std::string& value);

// Validate final config (url/user required, ranges). Returns list of errors.
std::vector<std::string> validate_final(const MinerConfig& cfg);

} // namespace cminer::config
