/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>

#include "cminer/crypto/sha256d.hpp"

namespace cminer {
namespace crypto {

enum class Algorithm {
    Scrypt,
    Sha256d
};

std::optional<Algorithm> parse_algorithm(std::string_view name);
std::string_view algorithm_name(Algorithm algo);

struct AlgorithmParams {
    Algorithm algo = Algorithm::Scrypt;
    std::uint64_t n = 1024;
    std::uint32_t r = 1;
    std::uint32_t p = 1;
};

/**
 * Proof-of-work hash over a serialized block header.
 * Implementations are stateless and may be called from any thread.
 */
class Hasher {
public:
    virtual ~Hasher() = default;
    virtual Hash256 hash(const std::uint8_t* header, std::size_t len) const = 0;
    virtual Algorithm algorithm() const = 0;
};

// scrypt(header, salt = header, N, r, p, dkLen = 32) through OpenSSL.
class ScryptHasher : public Hasher {
public:
    ScryptHasher(std::uint64_t n, std::uint32_t r, std::uint32_t p);
    Hash256 hash(const std::uint8_t* header, std::size_t len) const override;
    Algorithm algorithm() const override { return Algorithm::Scrypt; }

private:
    std::uint64_t n_;
    std::uint32_t r_;
    std::uint32_t p_;
    std::uint64_t maxmem_;
};

class Sha256dHasher : public Hasher {
public:
    Hash256 hash(const std::uint8_t* header, std::size_t len) const override {
        return sha256d(header, len);
    }
    Algorithm algorithm() const override { return Algorithm::Sha256d; }
};

std::shared_ptr<const Hasher> make_hasher(const AlgorithmParams& params);

} // namespace crypto
} // namespace cminer
