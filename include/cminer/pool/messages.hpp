/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <nlohmann/json.hpp>

#include <cminer/pool/mining_job.hpp>

namespace cminer {
namespace pool {

/**
 * Stratum error structure for parsing
 */
struct StratumErrorInfo {
    int code = 0;
    std::string message;
};

/**
 * Error codes defined by the Stratum protocol
 */
enum class StratumError {
    UNKNOWN = 20,
    JOB_NOT_FOUND = 21,
    DUPLICATE_SHARE = 22,
    LOW_DIFFICULTY = 23,
    UNAUTHORIZED = 24,
    NOT_SUBSCRIBED = 25
};

/**
 * Helper to convert error codes to human readable messages
 */
inline std::string get_error_message(StratumError code) {
    switch (code) {
        case StratumError::JOB_NOT_FOUND:
            return "Job not found (stale)";
        case StratumError::DUPLICATE_SHARE:
            return "Duplicate share";
        case StratumError::LOW_DIFFICULTY:
            return "Low difficulty share";
        case StratumError::UNAUTHORIZED:
            return "Unauthorized worker";
        case StratumError::NOT_SUBSCRIBED:
            return "Not subscribed";
        default:
            return "Unknown error";
    }
}

// Human readable reason for a pool error (code table first, then pool text).
std::string describe_error(const StratumErrorInfo& error);

// Server -> client messages
struct NotifyMessage {
    MiningJob job;
};

struct SetDifficultyMessage {
    double difficulty = 1.0;
};

struct SetExtranonceMessage {
    std::string extranonce1;
    int extranonce2_size = 0;
};

struct ReconnectMessage {
    std::string host;
    std::string port;
    int wait_seconds = 0;
};

struct ShowMessage {
    std::string text;
};

struct ResponseMessage {
    std::uint64_t id = 0;
    nlohmann::json result;
    std::optional<StratumErrorInfo> error;

    bool accepted() const { return !error && result.is_boolean() && result.get<bool>(); }
};

struct UnknownMessage {
    std::string method;
};

using ServerMessage = std::variant<NotifyMessage,
                                   SetDifficultyMessage,
                                   SetExtranonceMessage,
                                   ReconnectMessage,
                                   ShowMessage,
                                   ResponseMessage,
                                   UnknownMessage>;

struct DecodeResult {
    std::optional<ServerMessage> message;
    std::string error; // set when message is empty
};

// Decodes one line of pool output. Never throws.
DecodeResult decode_server_message(std::string_view line);

} // namespace pool
} // namespace cminer
