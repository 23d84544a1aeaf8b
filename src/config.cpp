/*
 * quay - Leased Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "quay/config.hpp"
#include "quay/logger.hpp"
#include <algorithm>
#include <cstdlib>
#include <stdexcept>

namespace quay {

namespace {
std::uint64_t env_u64(const char* name, std::uint64_t defv) {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    try {
        auto parsed = static_cast<std::uint64_t>(std::stoull(val));
        return parsed == 0 ? defv : parsed;
    } catch (const std::exception&) {
        LOG_WARN(std::string("Ignoring invalid ") + name + "=" + val);
        return defv;
    }
}

Millis env_ms(const char* name, Millis defv) {
    return Millis(static_cast<Millis::rep>(env_u64(name, static_cast<std::uint64_t>(defv.count()))));
}
}

Config Config::fromEnv() {
    Config config;
    config.queue.maxPayloadBytes = static_cast<std::size_t>(
        env_u64("QUAY_MAX_PAYLOAD", config.queue.maxPayloadBytes));
    config.queue.defaultMaxAttempts = static_cast<int>(
        env_u64("QUAY_MAX_ATTEMPTS", static_cast<std::uint64_t>(config.queue.defaultMaxAttempts)));

    config.coordinator.heartbeatInterval = env_ms("QUAY_HEARTBEAT_MS", config.coordinator.heartbeatInterval);

    config.retry.base = env_ms("QUAY_BACKOFF_BASE_MS", config.retry.base);
    config.retry.max = env_ms("QUAY_BACKOFF_MAX_MS", config.retry.max);

    config.supervisor.leaseDuration = env_ms("QUAY_LEASE_MS", config.supervisor.leaseDuration);
    config.supervisor.executionTimeout = env_ms("QUAY_TIMEOUT_MS", config.supervisor.executionTimeout);
    config.supervisor.cancelGrace = env_ms("QUAY_GRACE_MS", config.supervisor.cancelGrace);

    config.reaperInterval = env_ms("QUAY_REAPER_MS", config.reaperInterval);
    return config;
}

std::vector<std::string> Config::validate() const {
    std::vector<std::string> problems;

    if (queue.maxPayloadBytes == 0) {
        problems.push_back("maximum payload size must be positive");
    }
    if (queue.defaultMaxAttempts < 1) {
        problems.push_back("default max attempts must be at least 1");
    }
    if (supervisor.safetyFactor < 3) {
        problems.push_back("safety factor must be at least 3");
    }
    if (supervisor.leaseDuration.count() <= 0) {
        problems.push_back("lease duration must be positive");
        return problems;
    }

    const auto cadenceLimit = supervisor.leaseDuration / std::max(supervisor.safetyFactor, 1);
    if (coordinator.heartbeatInterval.count() <= 0 || coordinator.heartbeatInterval >= cadenceLimit) {
        problems.push_back("heartbeat interval must be positive and below lease/" +
                           std::to_string(supervisor.safetyFactor) + " (" +
                           std::to_string(cadenceLimit.count()) + "ms)");
    }
    if (reaperInterval.count() <= 0 || reaperInterval >= cadenceLimit) {
        problems.push_back("reaper interval must be positive and below lease/" +
                           std::to_string(supervisor.safetyFactor) + " (" +
                           std::to_string(cadenceLimit.count()) + "ms)");
    }
    if (coordinator.livenessFactor < 1) {
        problems.push_back("liveness factor must be at least 1");
    }
    if (supervisor.executionTimeout.count() <= 0) {
        problems.push_back("execution timeout must be positive");
    }
    const auto leaseSlack = supervisor.leaseDuration - cadenceLimit;
    if (supervisor.cancelGrace.count() < 0) {
        problems.push_back("cancel grace must not be negative");
    } else if (supervisor.cancelGrace >= leaseSlack) {
        problems.push_back("cancel grace must be below lease - lease/" +
                           std::to_string(supervisor.safetyFactor) + " (" +
                           std::to_string(leaseSlack.count()) + "ms)");
    }
    if (retry.base.count() <= 0 || retry.max < retry.base) {
        problems.push_back("backoff base must be positive and not above the backoff cap");
    }
    if (retry.jitter < 0.0 || retry.jitter >= 1.0) {
        problems.push_back("backoff jitter must be in [0, 1)");
    }
    if (pool.slots < 1) {
        problems.push_back("at least one worker slot is required");
    }
    if (pool.pollInterval.count() <= 0) {
        problems.push_back("poll interval must be positive");
    }
    return problems;
}

} // namespace quay
