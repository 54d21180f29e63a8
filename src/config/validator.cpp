/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include <cminer/config/validator.hpp>
#include <cminer/config/types.hpp>

#include <algorithm>
#include <cctype>

namespace cminer::config {

bool is_valid_hostname(const std::string& host, std::string& err) {
    if (host.empty()) { err = "empty hostname"; return false; }
    if (host.size() > 253) { err = "hostname too long (>253)"; return false; }
    std::size_t start = 0;
    while (start < host.size()) {
        auto dot = host.find('.', start);
        std::size_t end = (dot == std::string::npos) ? host.size() : dot;
        std::size_t len = end - start;
        if (len == 0) { err = "empty hostname label"; return false; }
        if (len > 63) { err = "hostname label too long (>63)"; return false; }
        if (host[start] == '-' || host[end-1] == '-') { err = "hostname label cannot start or end with '-'"; return false; }
        for (std::size_t i = start; i < end; ++i) {
            char c = host[i];
            if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '-')) {
                err = "hostname contains invalid characters"; return false; }
        }
        if (dot == std::string::npos) break;
        start = dot + 1;
    }
    return true;
}

bool validate_host_port(const std::string& url, std::string& err) {
    std::string host, port_s;
    if (!split_host_port(url, host, port_s) || port_s.empty()) {
        err = "url must be in the form host:port"; return false; }
    if (!std::all_of(port_s.begin(), port_s.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
        err = "url port must contain digits only"; return false; }
    if (port_s.size() > 5) { err = "port out of range (1-65535)"; return false; }
    unsigned long port = std::stoul(port_s);
    if (port == 0 || port > 65535UL) { err = "port out of range (1-65535)"; return false; }
    if (!is_valid_hostname(host, err)) return false;
    return true;
}

bool is_known_algo(const std::string& algo) {
    return algo == "scrypt" || algo == "sha256d";
}

} // namespace cminer::config
