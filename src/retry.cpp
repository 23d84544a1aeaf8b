/*
 * quay - Leased Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "quay/retry.hpp"
#include <algorithm>
#include <cmath>

namespace quay {

namespace {
std::uint32_t seedFor(const RetryConfig& config) {
    if (config.seed != 0) {
        return config.seed;
    }
    std::random_device rd;
    return rd();
}
}

RetryPolicy::RetryPolicy(const RetryConfig& config) : config_(config), rng_(seedFor(config)) {}

Millis RetryPolicy::nominalDelay(int attempts) const noexcept {
    const double base = static_cast<double>(config_.base.count());
    const double cap = static_cast<double>(config_.max.count());
    // 2^63 overflows long before it matters; clamp the exponent.
    const int exponent = std::clamp(attempts, 0, 62);
    const double raw = base * std::ldexp(1.0, exponent);
    return Millis(static_cast<Millis::rep>(std::min(raw, cap)));
}

Millis RetryPolicy::delayFor(int attempts) {
    const double nominal = static_cast<double>(nominalDelay(attempts).count());
    if (config_.jitter <= 0.0) {
        return Millis(static_cast<Millis::rep>(nominal));
    }
    double factor = 1.0;
    {
        std::lock_guard<std::mutex> lock(rngMutex_);
        std::uniform_real_distribution<double> dist(1.0 - config_.jitter, 1.0 + config_.jitter);
        factor = dist(rng_);
    }
    return Millis(static_cast<Millis::rep>(std::llround(nominal * factor)));
}

} // namespace quay
