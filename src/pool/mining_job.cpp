/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include <cminer/pool/mining_job.hpp>
#include <cminer/crypto/hex.hpp>

#include <algorithm>
#include <limits>
#include <stdexcept>

#include <fmt/format.h>

using json = nlohmann::json;

namespace cminer::pool {

namespace {

bool fail(std::string* error, std::string msg) {
    if (error) *error = std::move(msg);
    return false;
}

bool check_hex_field(const std::string& name, const std::string& value, std::size_t bytes, std::string* error) {
    if (!crypto::is_hex(value)) return fail(error, fmt::format("{} is not hex", name));
    if (bytes != 0 && value.size() != bytes * 2) {
        return fail(error, fmt::format("{} must be {} bytes, got {}", name, bytes, value.size() / 2));
    }
    return true;
}

template <std::size_t N>
std::array<std::uint8_t, N> reversed_bytes(const std::string& hex) {
    auto bytes = crypto::hex_to_bytes(hex);
    if (bytes.size() != N) throw std::invalid_argument("unexpected field length");
    std::array<std::uint8_t, N> out{};
    std::reverse_copy(bytes.begin(), bytes.end(), out.begin());
    return out;
}

} // namespace

std::uint32_t MiningJob::nbits_value() const {
    return static_cast<std::uint32_t>(std::stoul(nbits, nullptr, 16));
}

std::optional<MiningJob> parse_mining_notify(const json& params, std::string* error) {
    // Stratum mining.notify params:
    // [0] job_id (string)
    // [1] prevhash (hex string)
    // [2] coinb1 (hex string)
    // [3] coinb2 (hex string)
    // [4] merkle_branch (array of hex strings)
    // [5] version (hex string)
    // [6] nbits (hex string)
    // [7] ntime (hex string)
    // [8] clean_jobs (bool)

    if (!params.is_array() || params.size() < 9) {
        fail(error, "mining.notify needs 9 params");
        return std::nullopt;
    }
    if (!params[4].is_array() || !params[8].is_boolean()) {
        fail(error, "mining.notify merkle_branch must be an array and clean_jobs a bool");
        return std::nullopt;
    }
    for (std::size_t i : {0u, 1u, 2u, 3u, 5u, 6u, 7u}) {
        if (!params[i].is_string()) {
            fail(error, fmt::format("mining.notify param {} must be a string", i));
            return std::nullopt;
        }
    }

    MiningJob job;
    job.job_id = params[0].get<std::string>();
    job.prev_hash = params[1].get<std::string>();
    job.coinbase1 = params[2].get<std::string>();
    job.coinbase2 = params[3].get<std::string>();
    for (const auto& branch : params[4]) {
        if (!branch.is_string()) {
            fail(error, "merkle branch entries must be strings");
            return std::nullopt;
        }
        job.merkle_branch.push_back(branch.get<std::string>());
    }
    job.version = params[5].get<std::string>();
    job.nbits = params[6].get<std::string>();
    job.ntime = params[7].get<std::string>();
    job.clean_jobs = params[8].get<bool>();

    if (job.job_id.empty()) {
        fail(error, "empty job_id");
        return std::nullopt;
    }
    if (!check_hex_field("prevhash", job.prev_hash, 32, error) ||
        !check_hex_field("coinb1", job.coinbase1, 0, error) ||
        !check_hex_field("coinb2", job.coinbase2, 0, error) ||
        !check_hex_field("version", job.version, 4, error) ||
        !check_hex_field("nbits", job.nbits, 4, error) ||
        !check_hex_field("ntime", job.ntime, 4, error)) {
        return std::nullopt;
    }
    for (const auto& branch : job.merkle_branch) {
        if (!check_hex_field("merkle branch", branch, 32, error)) return std::nullopt;
    }
    return job;
}

HeaderBuilder::HeaderBuilder(const MiningJob& job, const std::string& extranonce1)
    : coinbase1_(crypto::hex_to_bytes(job.coinbase1))
    , extranonce1_(crypto::hex_to_bytes(extranonce1))
    , coinbase2_(crypto::hex_to_bytes(job.coinbase2))
    , version_(reversed_bytes<4>(job.version))
    , ntime_(reversed_bytes<4>(job.ntime))
    , nbits_(reversed_bytes<4>(job.nbits)) {
    for (const auto& branch_hex : job.merkle_branch) {
        auto bytes = crypto::hex_to_bytes(branch_hex);
        if (bytes.size() != 32) throw std::invalid_argument("merkle branch must be 32 bytes");
        crypto::Hash256 h{};
        std::copy(bytes.begin(), bytes.end(), h.begin());
        branches_.push_back(h);
    }

    auto prev = crypto::hex_to_bytes(job.prev_hash);
    if (prev.size() != 32) throw std::invalid_argument("prevhash must be 32 bytes");
    // Stratum sends prevhash as eight 32-bit words in the wrong byte order
    for (std::size_t w = 0; w < 8; ++w) {
        for (std::size_t b = 0; b < 4; ++b) {
            prev_hash_[w * 4 + b] = prev[w * 4 + (3 - b)];
        }
    }
}

crypto::Hash256 HeaderBuilder::merkle_root(const std::string& extranonce2_hex) const {
    const auto extranonce2 = crypto::hex_to_bytes(extranonce2_hex);

    std::vector<std::uint8_t> coinbase;
    coinbase.reserve(coinbase1_.size() + extranonce1_.size() + extranonce2.size() + coinbase2_.size());
    coinbase.insert(coinbase.end(), coinbase1_.begin(), coinbase1_.end());
    coinbase.insert(coinbase.end(), extranonce1_.begin(), extranonce1_.end());
    coinbase.insert(coinbase.end(), extranonce2.begin(), extranonce2.end());
    coinbase.insert(coinbase.end(), coinbase2_.begin(), coinbase2_.end());

    crypto::Hash256 root = crypto::sha256d(coinbase);
    std::array<std::uint8_t, 64> concat{};
    for (const auto& branch : branches_) {
        std::copy(root.begin(), root.end(), concat.begin());
        std::copy(branch.begin(), branch.end(), concat.begin() + 32);
        root = crypto::sha256d(concat.data(), concat.size());
    }
    return root;
}

BlockHeader HeaderBuilder::build(const std::string& extranonce2_hex) const {
    BlockHeader header{};
    const auto root = merkle_root(extranonce2_hex);

    auto out = header.begin();
    out = std::copy(version_.begin(), version_.end(), out);
    out = std::copy(prev_hash_.begin(), prev_hash_.end(), out);
    out = std::copy(root.begin(), root.end(), out);
    out = std::copy(ntime_.begin(), ntime_.end(), out);
    std::copy(nbits_.begin(), nbits_.end(), out);
    return header;
}

void HeaderBuilder::set_nonce(BlockHeader& header, std::uint32_t nonce) {
    header[76] = static_cast<std::uint8_t>(nonce & 0xff);
    header[77] = static_cast<std::uint8_t>((nonce >> 8) & 0xff);
    header[78] = static_cast<std::uint8_t>((nonce >> 16) & 0xff);
    header[79] = static_cast<std::uint8_t>((nonce >> 24) & 0xff);
}

std::string format_extranonce2(std::uint64_t value, int size) {
    if (size <= 0) return {};
    std::string hex = fmt::format("{:016x}", value);
    const auto digits = static_cast<std::size_t>(size) * 2;
    if (digits <= hex.size()) return hex.substr(hex.size() - digits);
    return std::string(digits - hex.size(), '0') + hex;
}

std::uint64_t max_extranonce2(int size) {
    if (size <= 0) return 0;
    if (size >= 8) return std::numeric_limits<std::uint64_t>::max();
    return (std::uint64_t{1} << (8 * size)) - 1;
}

} // namespace cminer::pool
