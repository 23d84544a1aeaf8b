/*
 * quay - Leased Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <optional>
#include <string>

#include "quay/types.hpp"

namespace quay {

// Time-bounded exclusive claim on a job by one worker.
struct Lease {
    JobId jobId;
    WorkerId workerId;
    TimePoint acquiredAt{};
    TimePoint expiresAt{};

    [[nodiscard]] bool expired(TimePoint now) const noexcept { return now >= expiresAt; }
};

struct Job {
    JobId id;
    std::string payload;
    JobState state = JobState::Waiting;
    int attempts = 0;
    int maxAttempts = 1;
    TimePoint enqueuedAt{};
    // Earliest instant a Delayed job may become Waiting.
    TimePoint availableAt{};
    std::optional<Lease> lease;
    std::string lastError;
    std::string result;

    // Number of the attempt currently in flight (or the next one).
    [[nodiscard]] int currentAttempt() const noexcept { return attempts + 1; }
};

struct Worker {
    WorkerId id;
    WorkerStatus status = WorkerStatus::Idle;
    TimePoint registeredAt{};
    TimePoint lastHeartbeatAt{};
    std::optional<JobId> currentJob;
};

// Immutable audit entry, one per (jobId, attempt).
struct ExecutionRecord {
    JobId jobId;
    int attempt = 0;
    WorkerId workerId;
    TimePoint startedAt{};
    TimePoint finishedAt{};
    Outcome outcome = Outcome::Failure;
    std::string resultOrError;
};

struct JobFilter {
    std::optional<JobState> state;
    std::optional<TimePoint> since;   // enqueuedAt >= since
    std::optional<TimePoint> until;   // enqueuedAt < until
    std::size_t limit = 0;            // 0 = unlimited
};

struct RecordFilter {
    std::optional<JobId> jobId;
    std::optional<TimePoint> since;   // finishedAt >= since
    std::optional<TimePoint> until;   // finishedAt < until
    std::size_t limit = 0;
};

} // namespace quay
