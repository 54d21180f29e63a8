/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "cminer/mining/cpu_topology.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <set>
#include <string>
#include <thread>
#include <utility>

namespace cminer::mining {

namespace {

bool is_cpu_dir_name(const std::string& name) {
    if (name.size() < 4 || name.compare(0, 3, "cpu") != 0) return false;
    return std::all_of(name.begin() + 3, name.end(),
                       [](unsigned char c){ return std::isdigit(c) != 0; });
}

bool read_topology_int(const std::filesystem::path& path, int& out) {
    std::ifstream in(path);
    if (!in) return false;
    in >> out;
    return !in.fail();
}

} // namespace

unsigned count_physical_cores(const std::filesystem::path& cpu_root) {
    std::set<std::pair<int, int>> cores;
    std::error_code ec;
    std::filesystem::directory_iterator it(cpu_root, ec);
    for (; !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
        const auto& entry = *it;
        if (!entry.is_directory(ec) || !is_cpu_dir_name(entry.path().filename().string())) continue;

        int core_id = 0;
        int package_id = 0;
        if (!read_topology_int(entry.path() / "topology" / "core_id", core_id)) continue;
        if (!read_topology_int(entry.path() / "topology" / "physical_package_id", package_id)) package_id = 0;
        cores.emplace(package_id, core_id);
    }
    return static_cast<unsigned>(cores.size());
}

unsigned physical_core_count() {
    unsigned n = count_physical_cores("/sys/devices/system/cpu");
    if (n == 0) n = std::thread::hardware_concurrency();
    return std::max(n, 1u);
}

} // namespace cminer::mining
