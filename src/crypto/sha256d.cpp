/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "cminer/crypto/sha256d.hpp"
#include <openssl/evp.h>
#include <stdexcept>

namespace cminer {
namespace crypto {

static void sha256_once(const std::uint8_t* data, std::size_t len, std::uint8_t* out) {
    unsigned int out_len = 0;
    if (EVP_Digest(data, len, out, &out_len, EVP_sha256(), nullptr) != 1 || out_len != 32) {
        throw std::runtime_error("SHA256 digest failed");
    }
}

Hash256 sha256d(const std::uint8_t* data, std::size_t len) {
    Hash256 first{};
    sha256_once(data, len, first.data());

    Hash256 second{};
    sha256_once(first.data(), first.size(), second.data());
    return second;
}

} // namespace crypto
} // namespace cminer
