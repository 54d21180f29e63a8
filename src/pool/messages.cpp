/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "cminer/pool/messages.hpp"
#include "cminer/crypto/hex.hpp"

#include <cmath>

#include <fmt/format.h>

namespace cminer {
namespace pool {

using json = nlohmann::json;

namespace {

DecodeResult malformed(std::string why) {
    DecodeResult r;
    r.error = std::move(why);
    return r;
}

DecodeResult decoded(ServerMessage msg) {
    DecodeResult r;
    r.message = std::move(msg);
    return r;
}

// Accepts [code, message, traceback], {"code":..,"message":..} or a bare string.
StratumErrorInfo parse_error(const json& e) {
    StratumErrorInfo info;
    if (e.is_array()) {
        if (e.size() > 0 && e[0].is_number_integer()) info.code = e[0].get<int>();
        if (e.size() > 1 && e[1].is_string()) info.message = e[1].get<std::string>();
    } else if (e.is_object()) {
        if (e.contains("code") && e["code"].is_number_integer()) info.code = e["code"].get<int>();
        if (e.contains("message") && e["message"].is_string()) info.message = e["message"].get<std::string>();
    } else if (e.is_string()) {
        info.message = e.get<std::string>();
    } else {
        info.message = e.dump();
    }
    return info;
}

std::optional<std::uint64_t> parse_id(const json& id) {
    if (id.is_number_unsigned()) return id.get<std::uint64_t>();
    if (id.is_number_integer() && id.get<std::int64_t>() >= 0) return static_cast<std::uint64_t>(id.get<std::int64_t>());
    if (id.is_string()) {
        const auto s = id.get<std::string>();
        if (s.empty() || s.find_first_not_of("0123456789") != std::string::npos || s.size() > 19) return std::nullopt;
        return std::stoull(s);
    }
    return std::nullopt;
}

DecodeResult decode_notification(const std::string& method, const json& params) {
    if (method == "mining.notify") {
        std::string err;
        auto job = parse_mining_notify(params, &err);
        if (!job) return malformed("mining.notify: " + err);
        return decoded(NotifyMessage{std::move(*job)});
    }
    if (method == "mining.set_difficulty") {
        if (!params.is_array() || params.empty() || !params[0].is_number()) {
            return malformed("mining.set_difficulty: expected [number]");
        }
        double d = params[0].get<double>();
        if (!std::isfinite(d) || d <= 0.0) {
            return malformed(fmt::format("mining.set_difficulty: invalid difficulty {}", d));
        }
        return decoded(SetDifficultyMessage{d});
    }
    if (method == "mining.set_extranonce") {
        if (!params.is_array() || params.size() < 2 || !params[0].is_string() || !params[1].is_number_integer()) {
            return malformed("mining.set_extranonce: expected [string, int]");
        }
        SetExtranonceMessage m;
        m.extranonce1 = params[0].get<std::string>();
        m.extranonce2_size = params[1].get<int>();
        if (!crypto::is_hex(m.extranonce1) || m.extranonce2_size < 0 || m.extranonce2_size > 16) {
            return malformed("mining.set_extranonce: bad extranonce");
        }
        return decoded(std::move(m));
    }
    if (method == "client.reconnect") {
        ReconnectMessage m;
        if (params.is_array()) {
            if (params.size() > 0 && params[0].is_string()) m.host = params[0].get<std::string>();
            if (params.size() > 1) {
                if (params[1].is_string()) m.port = params[1].get<std::string>();
                else if (params[1].is_number_integer()) m.port = std::to_string(params[1].get<int>());
            }
            if (params.size() > 2 && params[2].is_number_integer()) m.wait_seconds = params[2].get<int>();
        }
        return decoded(std::move(m));
    }
    if (method == "client.show_message") {
        ShowMessage m;
        if (params.is_array() && !params.empty() && params[0].is_string()) m.text = params[0].get<std::string>();
        return decoded(std::move(m));
    }
    return decoded(UnknownMessage{method});
}

} // namespace

std::string describe_error(const StratumErrorInfo& error) {
    if (error.code >= 20 && error.code <= 25) {
        auto text = get_error_message(static_cast<StratumError>(error.code));
        if (!error.message.empty()) text += ": " + error.message;
        return text;
    }
    if (!error.message.empty()) return error.message;
    return fmt::format("error code {}", error.code);
}

DecodeResult decode_server_message(std::string_view line) {
    json j = json::parse(line.begin(), line.end(), nullptr, false);
    if (j.is_discarded()) return malformed("invalid JSON");
    if (!j.is_object()) return malformed("message is not a JSON object");

    if (j.contains("method")) {
        if (!j["method"].is_string()) return malformed("method is not a string");
        static const json empty = json::array();
        const json& params = j.contains("params") ? j["params"] : empty;
        return decode_notification(j["method"].get<std::string>(), params);
    }

    if (!j.contains("id")) return malformed("neither method nor id present");
    auto id = parse_id(j["id"]);
    if (!id) return malformed("response id is not a non-negative integer");

    ResponseMessage r;
    r.id = *id;
    if (j.contains("result")) r.result = j["result"];
    if (j.contains("error") && !j["error"].is_null()) r.error = parse_error(j["error"]);
    return decoded(std::move(r));
}

} // namespace pool
} // namespace cminer
