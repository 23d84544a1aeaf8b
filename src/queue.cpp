/*
 * quay - Leased Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "quay/queue.hpp"
#include "quay/logger.hpp"
#include <atomic>
#include <cctype>
#include <sstream>
#include <vector>
#include <unistd.h>

namespace quay {

JobId generateJobId() {
    static std::atomic<uint64_t> counter{0};

    auto now = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    uint64_t unique_counter = counter.fetch_add(1);

    std::ostringstream ss;
    ss << now << "_" << getpid() << "_" << unique_counter;
    return ss.str();
}

bool isValidJobId(const std::string& id) noexcept {
    if (id.empty() || id.size() > 128 || id.front() == '.') {
        return false;
    }
    for (unsigned char c : id) {
        if (!std::isalnum(c) && c != '_' && c != '-' && c != '.') {
            return false;
        }
    }
    return true;
}

Queue::Queue(Store& store, const Clock& clock, QueueConfig config)
    : store_(store), clock_(clock), config_(config) {
}

TimePoint Queue::now() const {
    // Persisted timestamps are millisecond precision; keep memory identical.
    return std::chrono::time_point_cast<Millis>(clock_.now());
}

bool Queue::recover() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!store_.reachable()) {
        LOG_ERROR("Cannot recover queue: store unreachable");
        return false;
    }

    jobs_.clear();
    waiting_.clear();
    delayed_.clear();
    active_.clear();
    completed_ = 0;
    failed_ = 0;

    const TimePoint t = now();
    std::vector<JobId> expired;
    for (auto& job : store_.listJobs()) {
        switch (job.state) {
            case JobState::Completed:
                ++completed_;
                continue;
            case JobState::Failed:
                ++failed_;
                continue;
            case JobState::Waiting:
                waiting_.push_back(job.id);
                break;
            case JobState::Delayed:
                delayed_.emplace(job.availableAt, job.id);
                break;
            case JobState::Active:
                active_.insert(job.id);
                if (!job.lease || job.lease->expired(t)) {
                    expired.push_back(job.id);
                }
                break;
        }
        JobId id = job.id;
        jobs_.emplace(std::move(id), std::move(job));
    }

    for (const auto& id : expired) {
        LOG_WARN("Recovering orphaned job: " + id);
        (void)reclaimLocked(id, t, "lease expired before restart");
    }

    LOG_INFO("Queue recovered: " + std::to_string(waiting_.size()) + " waiting, " +
             std::to_string(delayed_.size()) + " delayed, " + std::to_string(active_.size()) + " active, " +
             std::to_string(expired.size()) + " reclaimed");
    if (!waiting_.empty()) {
        workAvailable_.notify_all();
    }
    return true;
}

EnqueueResult Queue::enqueue(std::string payload, const EnqueueOptions& options) {
    std::lock_guard<std::mutex> lock(mutex_);
    return enqueueLocked(std::move(payload), options, now());
}

EnqueueResult Queue::enqueueLocked(std::string payload, const EnqueueOptions& options, TimePoint t) {
    if (draining_) {
        LOG_DEBUG("Enqueue refused while draining");
        return {false, "", ErrorKind::Draining, "Queue is draining"};
    }
    if (payload.empty()) {
        return {false, "", ErrorKind::InvalidRequest, "Payload is empty"};
    }
    if (payload.size() > config_.maxPayloadBytes) {
        LOG_DEBUG("Payload exceeds size limit: " + std::to_string(payload.size()) + " > " +
                  std::to_string(config_.maxPayloadBytes));
        return {false, "", ErrorKind::InvalidRequest,
                "Payload exceeds maximum size limit (" + std::to_string(config_.maxPayloadBytes) + " bytes)"};
    }
    const int maxAttempts = options.maxAttempts.value_or(config_.defaultMaxAttempts);
    if (maxAttempts < 1) {
        return {false, "", ErrorKind::InvalidRequest, "max_attempts must be at least 1"};
    }
    if (options.delay.count() < 0) {
        return {false, "", ErrorKind::InvalidRequest, "delay must not be negative"};
    }

    JobId id = options.id.value_or(generateJobId());
    if (!isValidJobId(id)) {
        return {false, "", ErrorKind::InvalidRequest, "Invalid job id: " + id};
    }
    if (jobs_.count(id) > 0 || store_.loadJob(id)) {
        return {false, id, ErrorKind::InvalidRequest, "Job already exists: " + id};
    }

    Job job;
    job.id = id;
    job.payload = std::move(payload);
    job.maxAttempts = maxAttempts;
    job.enqueuedAt = t;
    job.availableAt = t + options.delay;
    job.state = options.delay.count() > 0 ? JobState::Delayed : JobState::Waiting;

    if (!store_.persist(job)) {
        LOG_ERROR("Failed to persist new job: " + id);
        return {false, "", ErrorKind::TransientError, "Failed to persist job"};
    }

    if (job.state == JobState::Delayed) {
        delayed_.emplace(job.availableAt, id);
    } else {
        waiting_.push_back(id);
    }
    jobs_.emplace(id, std::move(job));
    workAvailable_.notify_one();

    LOG_INFO("Job enqueued: " + id + (options.delay.count() > 0
             ? " (delayed " + std::to_string(options.delay.count()) + "ms)" : std::string()));
    return {true, id, ErrorKind::None, ""};
}

ClaimResult Queue::claim(const WorkerId& workerId, Millis leaseDuration) {
    if (workerId.empty() || leaseDuration.count() <= 0) {
        LOG_WARN("Rejected claim with empty worker id or non-positive lease");
        return {std::nullopt, ErrorKind::InvalidRequest};
    }

    std::lock_guard<std::mutex> lock(mutex_);
    const TimePoint t = now();
    promoteDueLocked(t);

    while (!waiting_.empty()) {
        JobId id = waiting_.front();
        waiting_.pop_front();

        auto it = jobs_.find(id);
        if (it == jobs_.end() || it->second.state != JobState::Waiting) {
            continue;
        }

        Job next = it->second;
        next.state = JobState::Active;
        next.lease = Lease{id, workerId, t, t + leaseDuration};

        if (!store_.persist(next)) {
            // Put it back where it was for the next claim.
            waiting_.push_front(id);
            LOG_ERROR("Transient store error while claiming " + id);
            return {std::nullopt, ErrorKind::TransientError};
        }

        it->second = next;
        active_.insert(id);
        LOG_DEBUG(workerId + " leased job " + id + " (attempt " + std::to_string(next.currentAttempt()) +
                  "/" + std::to_string(next.maxAttempts) + ")");
        return {std::move(next), ErrorKind::None};
    }
    return {};
}

ErrorKind Queue::checkLease(const JobId& jobId, const WorkerId& workerId, TimePoint t) const {
    auto it = jobs_.find(jobId);
    if (it == jobs_.end()) {
        return store_.loadJob(jobId) ? ErrorKind::NotOwner : ErrorKind::UnknownJob;
    }
    const Job& job = it->second;
    if (job.state != JobState::Active || !job.lease || job.lease->workerId != workerId) {
        return ErrorKind::NotOwner;
    }
    if (job.lease->expired(t)) {
        return ErrorKind::LeaseExpired;
    }
    return ErrorKind::None;
}

Settlement Queue::ack(const JobId& jobId, const WorkerId& workerId, const std::string& result) {
    std::lock_guard<std::mutex> lock(mutex_);
    const TimePoint t = now();

    Settlement settlement;
    settlement.error = checkLease(jobId, workerId, t);
    if (settlement.error != ErrorKind::None) {
        LOG_WARN("Ignoring ack for " + jobId + " from " + workerId + ": " + toString(settlement.error));
        return settlement;
    }

    Job next = jobs_.at(jobId);
    const Lease lease = *next.lease;
    next.state = JobState::Completed;
    next.attempts += 1;
    next.result = result;
    next.lease.reset();

    if (!store_.persist(next)) {
        settlement.error = ErrorKind::TransientError;
        LOG_ERROR("Transient store error while completing " + jobId);
        return settlement;
    }

    ExecutionRecord record{jobId, next.attempts, workerId, lease.acquiredAt, t, Outcome::Success, result};
    appendRecord(record);
    retire(jobId, JobState::Completed);

    settlement.decision = Decision::Completed;
    settlement.record = std::move(record);
    LOG_INFO("Job completed: " + jobId + " by " + workerId);
    return settlement;
}

Settlement Queue::nack(const JobId& jobId, const WorkerId& workerId, const std::string& error,
                       Outcome outcome, Millis retryDelay) {
    std::lock_guard<std::mutex> lock(mutex_);
    const TimePoint t = now();

    Settlement settlement;
    if (outcome == Outcome::Success) {
        settlement.error = ErrorKind::InvalidRequest;
        return settlement;
    }
    settlement.error = checkLease(jobId, workerId, t);
    if (settlement.error != ErrorKind::None) {
        LOG_WARN("Ignoring nack for " + jobId + " from " + workerId + ": " + toString(settlement.error));
        return settlement;
    }

    Job next = jobs_.at(jobId);
    const Lease lease = *next.lease;
    next.attempts += 1;
    next.lastError = error;
    next.lease.reset();

    const bool exhausted = next.attempts >= next.maxAttempts;
    if (exhausted) {
        next.state = JobState::Failed;
    } else if (retryDelay.count() > 0) {
        next.state = JobState::Delayed;
        next.availableAt = t + retryDelay;
    } else {
        next.state = JobState::Waiting;
        next.availableAt = t;
    }

    if (!store_.persist(next)) {
        settlement.error = ErrorKind::TransientError;
        LOG_ERROR("Transient store error while settling " + jobId);
        return settlement;
    }

    ExecutionRecord record{jobId, next.attempts, workerId, lease.acquiredAt, t, outcome, error};
    appendRecord(record);
    settlement.record = record;
    active_.erase(jobId);

    if (exhausted) {
        retire(jobId, JobState::Failed);
        settlement.decision = Decision::Failed;
        settlement.error = ErrorKind::TerminalFailure;
        LOG_ERROR("Job failed permanently after " + std::to_string(next.attempts) + " attempt(s): " +
                  jobId + " - " + error);
        return settlement;
    }

    settlement.decision = Decision::Rescheduled;
    settlement.error = outcome == Outcome::Timeout ? ErrorKind::ExecutionTimeout : ErrorKind::ExecutionFailure;
    settlement.nextEligibleAt = next.availableAt;
    if (next.state == JobState::Delayed) {
        delayed_.emplace(next.availableAt, jobId);
    } else {
        waiting_.push_back(jobId);
        workAvailable_.notify_one();
    }
    jobs_[jobId] = std::move(next);
    LOG_WARN("Job " + jobId + " attempt " + std::to_string(record.attempt) + " " + toString(outcome) +
             ", retry in " + std::to_string(retryDelay.count()) + "ms: " + error);
    return settlement;
}

ErrorKind Queue::extendLease(const JobId& jobId, const WorkerId& workerId, Millis duration) {
    if (duration.count() <= 0) {
        return ErrorKind::InvalidRequest;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    const TimePoint t = now();

    ErrorKind error = checkLease(jobId, workerId, t);
    if (error != ErrorKind::None) {
        LOG_DEBUG("Lease extension refused for " + jobId + " (" + workerId + "): " + toString(error));
        return error;
    }

    Job next = jobs_.at(jobId);
    next.lease->expiresAt = t + duration;
    if (!store_.persist(next)) {
        return ErrorKind::TransientError;
    }
    jobs_[jobId] = std::move(next);
    LOG_TRACE("Lease extended: " + jobId + " +" + std::to_string(duration.count()) + "ms");
    return ErrorKind::None;
}

std::size_t Queue::promoteDelayed() {
    std::lock_guard<std::mutex> lock(mutex_);
    return promoteDueLocked(now());
}

std::size_t Queue::promoteDueLocked(TimePoint t) {
    std::size_t promoted = 0;
    while (!delayed_.empty() && delayed_.begin()->first <= t) {
        JobId id = delayed_.begin()->second;
        auto it = jobs_.find(id);
        if (it == jobs_.end() || it->second.state != JobState::Delayed) {
            delayed_.erase(delayed_.begin());
            continue;
        }

        Job next = it->second;
        next.state = JobState::Waiting;
        if (!store_.persist(next)) {
            LOG_ERROR("Transient store error while promoting " + id);
            break; // retried on the next sweep
        }
        delayed_.erase(delayed_.begin());
        it->second = std::move(next);
        waiting_.push_back(id);
        ++promoted;
    }
    if (promoted > 0) {
        LOG_DEBUG("Promoted " + std::to_string(promoted) + " delayed job(s)");
        workAvailable_.notify_all();
    }
    return promoted;
}

std::size_t Queue::reap() {
    std::lock_guard<std::mutex> lock(mutex_);
    const TimePoint t = now();

    std::vector<JobId> expired;
    for (const auto& id : active_) {
        const Job& job = jobs_.at(id);
        if (!job.lease || job.lease->expired(t)) {
            expired.push_back(id);
        }
    }

    std::size_t reclaimed = 0;
    for (const auto& id : expired) {
        if (reclaimLocked(id, t, "lease expired")) {
            ++reclaimed;
        }
    }
    if (reclaimed > 0) {
        LOG_WARN("Reaper reclaimed " + std::to_string(reclaimed) + " expired lease(s)");
    }
    return reclaimed;
}

std::size_t Queue::revokeWorker(const WorkerId& workerId) {
    std::lock_guard<std::mutex> lock(mutex_);
    const TimePoint t = now();

    std::vector<JobId> held;
    for (const auto& id : active_) {
        const Job& job = jobs_.at(id);
        if (job.lease && job.lease->workerId == workerId) {
            held.push_back(id);
        }
    }

    std::size_t revoked = 0;
    for (const auto& id : held) {
        if (reclaimLocked(id, t, "lease revoked: worker " + workerId + " is dead")) {
            ++revoked;
        }
    }
    if (revoked > 0) {
        LOG_WARN("Revoked " + std::to_string(revoked) + " lease(s) held by " + workerId);
    }
    return revoked;
}

bool Queue::reclaimLocked(const JobId& jobId, TimePoint t, const std::string& reason) {
    Job next = jobs_.at(jobId);
    const std::optional<Lease> lease = next.lease;
    next.attempts += 1;
    next.lastError = reason;
    next.lease.reset();

    const bool exhausted = next.attempts >= next.maxAttempts;
    next.state = exhausted ? JobState::Failed : JobState::Waiting;
    next.availableAt = t;

    if (!store_.persist(next)) {
        LOG_ERROR("Transient store error while reclaiming " + jobId + "; will retry");
        return false;
    }
    active_.erase(jobId);

    // The lost attempt keeps its place in the record chain.
    ExecutionRecord record{jobId, next.attempts, lease ? lease->workerId : WorkerId(),
                           lease ? lease->acquiredAt : t, t, Outcome::Timeout, reason};
    appendRecord(record);

    if (exhausted) {
        retire(jobId, JobState::Failed);
        LOG_ERROR("Job failed permanently after " + std::to_string(next.attempts) + " attempt(s): " +
                  jobId + " - " + reason);
        return true;
    }

    jobs_[jobId] = std::move(next);
    waiting_.push_back(jobId);
    workAvailable_.notify_one();
    LOG_DEBUG("Reclaimed job " + jobId + ": " + reason);
    return true;
}

void Queue::appendRecord(const ExecutionRecord& record) {
    if (!store_.persist(record)) {
        LOG_ERROR("Execution record lost for " + record.jobId + "#" + std::to_string(record.attempt) +
                  " (" + toString(record.outcome) + ")");
    }
}

void Queue::retire(const JobId& jobId, JobState terminal) {
    jobs_.erase(jobId);
    active_.erase(jobId);
    if (terminal == JobState::Completed) {
        ++completed_;
    } else {
        ++failed_;
    }
}

EnqueueResult Queue::requeue(const JobId& failedJobId) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (jobs_.count(failedJobId) > 0) {
        return {false, "", ErrorKind::InvalidRequest, "Job is not in a terminal state: " + failedJobId};
    }
    auto job = store_.loadJob(failedJobId);
    if (!job) {
        return {false, "", ErrorKind::UnknownJob, "Job not found: " + failedJobId};
    }
    if (job->state != JobState::Failed) {
        return {false, "", ErrorKind::InvalidRequest, "Only failed jobs can be re-enqueued: " + failedJobId};
    }

    EnqueueOptions options;
    options.maxAttempts = job->maxAttempts;
    auto result = enqueueLocked(std::move(job->payload), options, now());
    if (result) {
        LOG_INFO("Failed job " + failedJobId + " re-enqueued as " + result.id);
    }
    return result;
}

std::optional<Job> Queue::get(const JobId& id) const {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = jobs_.find(id);
        if (it != jobs_.end()) {
            return it->second;
        }
    }
    return store_.loadJob(id);
}

QueueCounts Queue::counts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    QueueCounts counts;
    for (const auto& [id, job] : jobs_) {
        switch (job.state) {
            case JobState::Waiting: ++counts.waiting; break;
            case JobState::Delayed: ++counts.delayed; break;
            case JobState::Active: ++counts.active; break;
            default: break;
        }
    }
    counts.completed = completed_;
    counts.failed = failed_;
    return counts;
}

void Queue::setDraining(bool draining) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (draining_ != draining) {
        LOG_INFO(draining ? "Queue draining: new jobs refused" : "Queue accepting new jobs");
    }
    draining_ = draining;
}

bool Queue::isDraining() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return draining_;
}

bool Queue::reachable() const noexcept {
    return store_.reachable();
}

bool Queue::waitForWork(Millis timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return workAvailable_.wait_for(lock, timeout, [this] {
        return !waiting_.empty() || (!delayed_.empty() && delayed_.begin()->first <= now());
    });
}

} // namespace quay
