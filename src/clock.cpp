/*
 * quay - Leased Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "quay/clock.hpp"

namespace quay {

TimePoint SystemClock::now() const {
    return std::chrono::system_clock::now();
}

ManualClock::ManualClock(TimePoint start) noexcept : now_(start) {}

TimePoint ManualClock::now() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return now_;
}

void ManualClock::advance(Millis delta) {
    std::lock_guard<std::mutex> lock(mutex_);
    now_ += delta;
}

void ManualClock::set(TimePoint tp) {
    std::lock_guard<std::mutex> lock(mutex_);
    now_ = tp;
}

} // namespace quay
