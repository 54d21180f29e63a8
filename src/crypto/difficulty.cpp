/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "cminer/crypto/difficulty.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>

#include <fmt/format.h>

namespace cminer {
namespace crypto {

using boost::multiprecision::cpp_int;

Target diff1_target(Algorithm algo) {
    switch (algo) {
        case Algorithm::Scrypt:
            return Target(0xffff) << 224;
        case Algorithm::Sha256d:
            return Target(0xffff) << 208;
    }
    throw std::invalid_argument("unknown algorithm");
}

const Target& max_target() {
    static const Target max = ~Target(0);
    return max;
}

static Target saturate(const cpp_int& value) {
    if (value > cpp_int(max_target())) return max_target();
    return static_cast<Target>(value);
}

Target difficulty_to_target(double difficulty, Algorithm algo) {
    if (!std::isfinite(difficulty) || difficulty <= 0.0) {
        throw std::invalid_argument(fmt::format("difficulty must be positive and finite, got {}", difficulty));
    }

    // difficulty == mantissa * 2^shift exactly, mantissa a 53-bit integer
    int exp = 0;
    const double frac = std::frexp(difficulty, &exp);
    const auto mantissa = static_cast<std::uint64_t>(std::ldexp(frac, std::numeric_limits<double>::digits));
    const int shift = exp - std::numeric_limits<double>::digits;

    const cpp_int diff1(diff1_target(algo));
    cpp_int quotient;
    if (shift >= 0) {
        quotient = (diff1 / mantissa) >> shift;
    } else {
        quotient = (diff1 << -shift) / mantissa;
    }
    return saturate(quotient);
}

Target compact_bits_to_target(std::uint32_t nbits) {
    const std::uint32_t exponent = nbits >> 24;
    const std::uint32_t mantissa = nbits & 0x007fffff;
    const bool negative = (nbits & 0x00800000) != 0;

    if (mantissa == 0 || negative) {
        return Target(0);
    }

    cpp_int value(mantissa);
    if (exponent <= 3) {
        value >>= 8 * (3 - exponent);
    } else {
        value <<= 8 * (exponent - 3);
    }
    return saturate(value);
}

Target hash_to_value(const Hash256& hash) {
    Target value = 0;
    for (int i = 31; i >= 0; --i) {
        value <<= 8;
        value |= hash[static_cast<std::size_t>(i)];
    }
    return value;
}

bool hash_meets_target(const Hash256& hash, const Target& target) {
    return hash_to_value(hash) <= target;
}

double target_to_difficulty(const Target& target, Algorithm algo) {
    if (target == 0) return std::numeric_limits<double>::infinity();
    return diff1_target(algo).convert_to<double>() / target.convert_to<double>();
}

double hashes_per_share(Algorithm algo) {
    return std::ldexp(1.0, 256) / (diff1_target(algo).convert_to<double>() + 1.0);
}

std::string target_to_hex(const Target& target) {
    static const char digits[] = "0123456789abcdef";
    std::string out(64, '0');
    Target v = target;
    for (int i = 63; i >= 0; --i) {
        out[static_cast<std::size_t>(i)] = digits[static_cast<unsigned>(v & 0x0f)];
        v >>= 4;
    }
    return out;
}

} // namespace crypto
} // namespace cminer
