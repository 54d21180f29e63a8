/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include <cminer/pool/line_buffer.hpp>

namespace cminer::pool {

void LineBuffer::append(const char* data, std::size_t len) {
    if (pos_ > 0 && pos_ == buf_.size()) {
        buf_.clear();
        pos_ = 0;
    }
    buf_.append(data, len);

    // An unterminated line longer than the limit can never be parsed
    if (buf_.find('\n', pos_) == std::string::npos && pending() > max_line_) {
        buf_.clear();
        pos_ = 0;
        ++overflows_;
    }
}

std::optional<std::string> LineBuffer::next_line() {
    while (pos_ < buf_.size()) {
        auto nl = buf_.find('\n', pos_);
        if (nl == std::string::npos) break;

        std::string line = buf_.substr(pos_, nl - pos_);
        pos_ = nl + 1;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.find_first_not_of(" \t") == std::string::npos) continue;
        return line;
    }
    // Compact once consumed data dominates
    if (pos_ > 4096 && pos_ * 2 > buf_.size()) {
        buf_.erase(0, pos_);
        pos_ = 0;
    }
    return std::nullopt;
}

void LineBuffer::clear() {
    buf_.clear();
    pos_ = 0;
    overflows_ = 0;
}

} // namespace cminer::pool
