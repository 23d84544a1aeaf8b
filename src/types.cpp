/*
 * quay - Leased Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "quay/types.hpp"

namespace quay {

const char* toString(JobState state) noexcept {
    switch (state) {
        case JobState::Waiting: return "waiting";
        case JobState::Active: return "active";
        case JobState::Completed: return "completed";
        case JobState::Failed: return "failed";
        case JobState::Delayed: return "delayed";
        default: return "unknown";
    }
}

const char* toString(Outcome outcome) noexcept {
    switch (outcome) {
        case Outcome::Success: return "success";
        case Outcome::Failure: return "failure";
        case Outcome::Timeout: return "timeout";
        default: return "unknown";
    }
}

const char* toString(WorkerStatus status) noexcept {
    switch (status) {
        case WorkerStatus::Idle: return "idle";
        case WorkerStatus::Busy: return "busy";
        case WorkerStatus::Dead: return "dead";
        default: return "unknown";
    }
}

const char* toString(ErrorKind error) noexcept {
    switch (error) {
        case ErrorKind::None: return "none";
        case ErrorKind::TransientError: return "transient error";
        case ErrorKind::LeaseExpired: return "lease expired";
        case ErrorKind::NotOwner: return "not owner";
        case ErrorKind::ExecutionFailure: return "execution failure";
        case ErrorKind::ExecutionTimeout: return "execution timeout";
        case ErrorKind::TerminalFailure: return "terminal failure";
        case ErrorKind::UnknownJob: return "unknown job";
        case ErrorKind::UnknownWorker: return "unknown worker";
        case ErrorKind::InvalidRequest: return "invalid request";
        case ErrorKind::Draining: return "draining";
        default: return "unknown";
    }
}

std::optional<JobState> parseJobState(const std::string& text) noexcept {
    if (text == "waiting") return JobState::Waiting;
    if (text == "active") return JobState::Active;
    if (text == "completed") return JobState::Completed;
    if (text == "failed") return JobState::Failed;
    if (text == "delayed") return JobState::Delayed;
    return std::nullopt;
}

std::optional<Outcome> parseOutcome(const std::string& text) noexcept {
    if (text == "success") return Outcome::Success;
    if (text == "failure") return Outcome::Failure;
    if (text == "timeout") return Outcome::Timeout;
    return std::nullopt;
}

std::optional<WorkerStatus> parseWorkerStatus(const std::string& text) noexcept {
    if (text == "idle") return WorkerStatus::Idle;
    if (text == "busy") return WorkerStatus::Busy;
    if (text == "dead") return WorkerStatus::Dead;
    return std::nullopt;
}

std::int64_t toEpochMillis(TimePoint tp) noexcept {
    return std::chrono::duration_cast<Millis>(tp.time_since_epoch()).count();
}

TimePoint fromEpochMillis(std::int64_t ms) noexcept {
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(Millis(ms)));
}

} // namespace quay
