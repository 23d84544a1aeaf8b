/*
 * quay - Leased Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "quay/types.hpp"

namespace quay {

struct QueueConfig {
    std::size_t maxPayloadBytes = 10'000'000; // 10MB
    int defaultMaxAttempts = 3;
};

struct CoordinatorConfig {
    Millis heartbeatInterval{1000};
    // A worker silent for heartbeatInterval * livenessFactor is Dead.
    int livenessFactor = 3;

    [[nodiscard]] Millis livenessWindow() const noexcept { return heartbeatInterval * livenessFactor; }
};

struct RetryConfig {
    Millis base{1000};
    Millis max{60000};
    double jitter = 0.2;
    // 0 seeds from std::random_device.
    std::uint32_t seed = 0;
};

struct SupervisorConfig {
    Millis leaseDuration{30000};
    Millis executionTimeout{25000};
    Millis cancelGrace{2000};
    int safetyFactor = 3;

    [[nodiscard]] Millis renewInterval() const noexcept { return leaseDuration / safetyFactor; }
};

struct PoolConfig {
    int slots = 4;
    Millis pollInterval{200};
    std::string workerPrefix = "slot";
};

struct Config {
    QueueConfig queue;
    CoordinatorConfig coordinator;
    RetryConfig retry;
    SupervisorConfig supervisor;
    PoolConfig pool;
    Millis reaperInterval{1000};

    // Defaults overridden by QUAY_* environment variables. Unparseable or
    // zero values keep the default.
    [[nodiscard]] static Config fromEnv();

    // Empty when the configuration is usable.
    [[nodiscard]] std::vector<std::string> validate() const;
};

} // namespace quay
