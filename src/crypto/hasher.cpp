/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "cminer/crypto/hasher.hpp"

#include <openssl/evp.h>
#include <stdexcept>

#include <fmt/format.h>

namespace cminer {
namespace crypto {

std::optional<Algorithm> parse_algorithm(std::string_view name) {
    if (name == "scrypt") return Algorithm::Scrypt;
    if (name == "sha256d") return Algorithm::Sha256d;
    return std::nullopt;
}

std::string_view algorithm_name(Algorithm algo) {
    switch (algo) {
        case Algorithm::Scrypt: return "scrypt";
        case Algorithm::Sha256d: return "sha256d";
    }
    return "unknown";
}

ScryptHasher::ScryptHasher(std::uint64_t n, std::uint32_t r, std::uint32_t p)
    : n_(n), r_(r), p_(p) {
    if (n_ < 2 || (n_ & (n_ - 1)) != 0) {
        throw std::invalid_argument(fmt::format("scrypt N must be a power of two >= 2, got {}", n_));
    }
    if (r_ == 0 || p_ == 0) {
        throw std::invalid_argument("scrypt r and p must be >= 1");
    }
    // V array plus the per-lane B blocks, with headroom; OpenSSL rejects
    // parameters whose working set exceeds maxmem.
    maxmem_ = 128ULL * r_ * (n_ + p_ + 2) + (1ULL << 20);
}

Hash256 ScryptHasher::hash(const std::uint8_t* header, std::size_t len) const {
    Hash256 out{};
    if (EVP_PBE_scrypt(reinterpret_cast<const char*>(header), len,
                       header, len,
                       n_, r_, p_, maxmem_,
                       out.data(), out.size()) != 1) {
        throw std::runtime_error(fmt::format("EVP_PBE_scrypt failed (N={}, r={}, p={})", n_, r_, p_));
    }
    return out;
}

std::shared_ptr<const Hasher> make_hasher(const AlgorithmParams& params) {
    switch (params.algo) {
        case Algorithm::Scrypt:
            return std::make_shared<ScryptHasher>(params.n, params.r, params.p);
        case Algorithm::Sha256d:
            return std::make_shared<Sha256dHasher>();
    }
    throw std::invalid_argument("unknown algorithm");
}

} // namespace crypto
} // namespace cminer
