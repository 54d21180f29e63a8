/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <cstdint>
#include <vector>

namespace cminer::mining {

// Inclusive range [first, last] of 32-bit nonces.
struct NonceRange {
    std::uint32_t first{0};
    std::uint32_t last{0};

    std::uint64_t size() const { return std::uint64_t{last} - first + 1; }
    bool contains(std::uint32_t nonce) const { return nonce >= first && nonce <= last; }
};

/**
 * Split [0, 2^32) into 'parts' contiguous disjoint ranges in ascending order.
 * The first (2^32 mod parts) ranges are one nonce longer than the rest.
 * Throws std::invalid_argument for parts == 0 or parts > 2^32.
 */
std::vector<NonceRange> partition_nonce_space(std::uint64_t parts);

} // namespace cminer::mining
