/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace cminer {
namespace crypto {

using Hash256 = std::array<std::uint8_t, 32>;

/**
 * Compute double SHA256 hash (Bitcoin standard)
 * @param data Input data to hash
 * @param len Input length in bytes
 * @return 32-byte hash output, in digest byte order
 */
Hash256 sha256d(const std::uint8_t* data, std::size_t len);

inline Hash256 sha256d(const std::vector<std::uint8_t>& data) {
    return sha256d(data.data(), data.size());
}

} // namespace crypto
} // namespace cminer
