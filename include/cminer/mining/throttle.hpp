/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <algorithm>
#include <chrono>
#include <thread>

namespace cminer::mining {

/**
 * Duty-cycle throttling. A worker hashes one batch, measures how long it
 * took ('busy') and then sleeps pause_for(busy, intensity), so that the
 * fraction of wall-clock time spent hashing is intensity / 100.
 */
struct Throttle {
    static constexpr std::chrono::milliseconds kSlice{50};

    // busy * (100 - intensity) / intensity; zero at 100. Intensity 0 means
    // paused and is handled by the caller.
    static std::chrono::nanoseconds pause_for(std::chrono::nanoseconds busy, int intensity) {
        if (intensity >= 100 || busy.count() <= 0) return std::chrono::nanoseconds{0};
        intensity = std::max(intensity, 1);
        return busy * (100 - intensity) / intensity;
    }

    // Sleeps 'total' in slices of at most 'slice'. Returns false as soon as
    // interrupted() returns true (checked before every slice).
    template <typename Pred>
    static bool sleep(std::chrono::nanoseconds total, Pred&& interrupted,
                      std::chrono::nanoseconds slice = kSlice) {
        const auto deadline = std::chrono::steady_clock::now() + total;
        for (;;) {
            if (interrupted()) return false;
            const auto now = std::chrono::steady_clock::now();
            if (now >= deadline) return true;
            std::this_thread::sleep_for(std::min<std::chrono::nanoseconds>(deadline - now, slice));
        }
    }
};

} // namespace cminer::mining
