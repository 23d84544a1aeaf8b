/*
 * quay - Leased Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace quay {

// Job lifecycle states. Completed and Failed are terminal.
enum class JobState : std::uint8_t { Waiting, Active, Completed, Failed, Delayed };

enum class Outcome : std::uint8_t { Success, Failure, Timeout };

enum class WorkerStatus : std::uint8_t { Idle, Busy, Dead };

enum class ErrorKind : std::uint8_t {
    None = 0,
    TransientError,
    LeaseExpired,
    NotOwner,
    ExecutionFailure,
    ExecutionTimeout,
    TerminalFailure,
    UnknownJob,
    UnknownWorker,
    InvalidRequest,
    Draining
};

using JobId = std::string;
using WorkerId = std::string;

using TimePoint = std::chrono::system_clock::time_point;
using Millis = std::chrono::milliseconds;

[[nodiscard]] const char* toString(JobState state) noexcept;
[[nodiscard]] const char* toString(Outcome outcome) noexcept;
[[nodiscard]] const char* toString(WorkerStatus status) noexcept;
[[nodiscard]] const char* toString(ErrorKind error) noexcept;

[[nodiscard]] std::optional<JobState> parseJobState(const std::string& text) noexcept;
[[nodiscard]] std::optional<Outcome> parseOutcome(const std::string& text) noexcept;
[[nodiscard]] std::optional<WorkerStatus> parseWorkerStatus(const std::string& text) noexcept;

[[nodiscard]] inline bool isTerminal(JobState state) noexcept {
    return state == JobState::Completed || state == JobState::Failed;
}

// Milliseconds since the Unix epoch; the persisted form of every timestamp.
[[nodiscard]] std::int64_t toEpochMillis(TimePoint tp) noexcept;
[[nodiscard]] TimePoint fromEpochMillis(std::int64_t ms) noexcept;

} // namespace quay
