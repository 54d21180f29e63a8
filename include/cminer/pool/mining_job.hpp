/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include <cminer/crypto/sha256d.hpp>

namespace cminer::pool {

struct MiningJob {
    std::string job_id;
    std::string prev_hash;         // prevhash (hex, 32 bytes)
    std::string coinbase1;         // coinb1 (hex)
    std::string coinbase2;         // coinb2 (hex)
    std::vector<std::string> merkle_branch;  // array of merkle hashes
    std::string version;           // block version (hex, 4 bytes)
    std::string nbits;             // difficulty bits (hex, 4 bytes)
    std::string ntime;             // timestamp (hex, 4 bytes)
    bool clean_jobs{false};        // if true, discard old jobs

    std::uint32_t nbits_value() const;
};

// Parse mining.notify params array into MiningJob
// params format: [job_id, prevhash, coinb1, coinb2, merkle_branch[], version, nbits, ntime, clean]
// Returns nullopt (and fills 'error' when given) on a bad shape or bad hex.
std::optional<MiningJob> parse_mining_notify(const nlohmann::json& params, std::string* error = nullptr);

using BlockHeader = std::array<std::uint8_t, 80>;

/**
 * Decodes a job once and produces 80-byte headers for any extranonce2.
 *
 * Layout: version(LE) | prevhash (32-bit words byte-swapped) | merkle root |
 * ntime(LE) | nbits(LE) | nonce(LE). The nonce is left zero by build().
 */
class HeaderBuilder {
public:
    // Throws std::invalid_argument when the job or extranonce1 is not valid hex.
    HeaderBuilder(const MiningJob& job, const std::string& extranonce1);

    BlockHeader build(const std::string& extranonce2_hex) const;
    crypto::Hash256 merkle_root(const std::string& extranonce2_hex) const;

    static void set_nonce(BlockHeader& header, std::uint32_t nonce);

private:
    std::vector<std::uint8_t> coinbase1_;
    std::vector<std::uint8_t> extranonce1_;
    std::vector<std::uint8_t> coinbase2_;
    std::vector<crypto::Hash256> branches_;
    std::array<std::uint8_t, 4> version_{};
    std::array<std::uint8_t, 32> prev_hash_{};
    std::array<std::uint8_t, 4> ntime_{};
    std::array<std::uint8_t, 4> nbits_{};
};

// Big-endian hex of 'value', exactly 2*size digits (empty for size 0).
std::string format_extranonce2(std::uint64_t value, int size);

// Largest extranonce2 counter representable in 'size' bytes.
std::uint64_t max_extranonce2(int size);

} // namespace cminer::pool
