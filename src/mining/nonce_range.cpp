/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include <cminer/mining/nonce_range.hpp>

#include <stdexcept>

namespace cminer::mining {

std::vector<NonceRange> partition_nonce_space(std::uint64_t parts) {
    constexpr std::uint64_t space = std::uint64_t{1} << 32;
    if (parts == 0 || parts > space) {
        throw std::invalid_argument("nonce space can not be split into that many parts");
    }

    const std::uint64_t base = space / parts;
    const std::uint64_t extra = space % parts;

    std::vector<NonceRange> out;
    out.reserve(static_cast<std::size_t>(parts));
    std::uint64_t next = 0;
    for (std::uint64_t i = 0; i < parts; ++i) {
        const std::uint64_t len = base + (i < extra ? 1 : 0);
        out.push_back(NonceRange{static_cast<std::uint32_t>(next),
                                 static_cast<std::uint32_t>(next + len - 1)});
        next += len;
    }
    return out;
}

} // namespace cminer::mining
