/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <filesystem>

namespace cminer::mining {

// Distinct (physical_package_id, core_id) pairs among the cpuN entries of a
// sysfs cpu directory. CPUs without topology files (offline) are skipped.
// Returns 0 when nothing could be read.
unsigned count_physical_cores(const std::filesystem::path& cpu_root);

// Physical cores of this machine; hardware_concurrency() where sysfs is not
// available. Never less than 1.
unsigned physical_core_count();

} // namespace cminer::mining
