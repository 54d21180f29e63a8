/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace cminer::pool {

// Accumulates raw socket bytes and hands out complete '\n'-terminated lines.
class LineBuffer {
public:
    explicit LineBuffer(std::size_t max_line = 64 * 1024) : max_line_(max_line) {}

    void append(const char* data, std::size_t len);

    // Next complete line without the trailing "\r\n"/"\n"; blank lines are skipped.
    std::optional<std::string> next_line();

    // Bytes of an incomplete trailing line.
    std::size_t pending() const { return buf_.size() - pos_; }

    // Count of partial lines dropped because they exceeded max_line.
    std::size_t overflows() const { return overflows_; }

    void clear();

private:
    std::string buf_;
    std::size_t pos_{0};
    std::size_t max_line_;
    std::size_t overflows_{0};
};

} // namespace cminer::pool
