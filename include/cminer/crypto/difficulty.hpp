/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <cstdint>
#include <string>

#include <boost/multiprecision/cpp_int.hpp>

#include "cminer/crypto/hasher.hpp"

namespace cminer {
namespace crypto {

using Target = boost::multiprecision::uint256_t;

// Difficulty-1 target of the algorithm (scrypt: 0x0000ffff << 224,
// sha256d: 0x00000000ffff << 208).
Target diff1_target(Algorithm algo);

// Largest representable target, 2^256 - 1.
const Target& max_target();

/**
 * floor(diff1 / difficulty), computed exactly. Saturates at max_target().
 * Throws std::invalid_argument for non-positive or non-finite difficulty.
 */
Target difficulty_to_target(double difficulty, Algorithm algo);

/**
 * Expand compact "nBits" (0xEEMMMMMM) into a target.
 * Negative encodings yield 0; overflow saturates at max_target().
 */
Target compact_bits_to_target(std::uint32_t nbits);

// Interpret a 32-byte hash as a little-endian 256-bit integer.
Target hash_to_value(const Hash256& hash);

// hash (little-endian) <= target
bool hash_meets_target(const Hash256& hash, const Target& target);

// Display only.
double target_to_difficulty(const Target& target, Algorithm algo);

// Expected hashes per difficulty-1 share: 2^256 / (diff1 + 1).
double hashes_per_share(Algorithm algo);

// 64 lowercase hex digits, most significant first.
std::string target_to_hex(const Target& target);

} // namespace crypto
} // namespace cminer
