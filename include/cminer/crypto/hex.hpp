/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace cminer {
namespace crypto {

// True when 'hex' has an even number of [0-9a-fA-F] characters.
bool is_hex(std::string_view hex);

// Throws std::invalid_argument on odd length or non-hex characters.
std::vector<std::uint8_t> hex_to_bytes(std::string_view hex);

std::string bytes_to_hex(const std::uint8_t* data, std::size_t len);

template <typename Container>
std::string bytes_to_hex(const Container& bytes) {
    return bytes_to_hex(bytes.data(), bytes.size());
}

} // namespace crypto
} // namespace cminer
