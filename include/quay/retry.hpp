/*
 * quay - Leased Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <mutex>
#include <random>

#include "quay/config.hpp"

namespace quay {

// Exponential backoff with jitter: min(base * 2^attempts, max), scaled by a
// uniform factor in [1 - jitter, 1 + jitter].
class RetryPolicy {
public:
    explicit RetryPolicy(const RetryConfig& config);

    [[nodiscard]] Millis delayFor(int attempts);
    // Un-jittered delay; the centre of the range delayFor() draws from.
    [[nodiscard]] Millis nominalDelay(int attempts) const noexcept;

    [[nodiscard]] const RetryConfig& config() const noexcept { return config_; }

private:
    RetryConfig config_;
    std::mutex rngMutex_;
    std::mt19937 rng_;
};

} // namespace quay
