/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include <cminer/logging/guarded_logger.hpp>

namespace cminer::logging {

template <typename Fn>
void GuardedLogger::forward_(Fn&& fn) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (target_) fn(*target_);
}

void GuardedLogger::info(std::string_view msg) { forward_([msg](Logger& l){ l.info(msg); }); }
void GuardedLogger::warn(std::string_view msg) { forward_([msg](Logger& l){ l.warn(msg); }); }
void GuardedLogger::error(std::string_view msg) { forward_([msg](Logger& l){ l.error(msg); }); }
void GuardedLogger::debug(std::string_view msg) { forward_([msg](Logger& l){ l.debug(msg); }); }

void GuardedLogger::detach() {
    std::lock_guard<std::mutex> lock(mutex_);
    target_ = nullptr;
}

bool GuardedLogger::attached() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return target_ != nullptr;
}

} // namespace cminer::logging
