/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include <cminer/pool/stratum_messages.hpp>

#include <nlohmann/json.hpp>

using nlohmann::json;

namespace cminer::pool::stratum_messages {

static inline std::string dump_line(const json& j) {
    std::string s = j.dump();
    s.push_back('\n');
    return s;
}

static json make_request(std::uint64_t id, const char* method, json params) {
    json j;
    j["id"] = id;
    j["method"] = method;
    j["params"] = std::move(params);
    return j;
}

std::string build_subscribe(std::string client, std::uint64_t id) {
    return dump_line(make_request(id, "mining.subscribe", json::array({ std::move(client) })));
}

std::string build_authorize(std::string user, std::string pass, std::uint64_t id) {
    return dump_line(make_request(id, "mining.authorize", json::array({ std::move(user), std::move(pass) })));
}

std::string build_submit(std::string user, std::string job_id, std::string extranonce2,
                         std::string ntime, std::string nonce, std::uint64_t id) {
    return dump_line(make_request(id, "mining.submit",
        json::array({ std::move(user), std::move(job_id), std::move(extranonce2),
                      std::move(ntime), std::move(nonce) })));
}

} // namespace cminer::pool::stratum_messages
