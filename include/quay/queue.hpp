/*
 * quay - Leased Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>

#include "quay/clock.hpp"
#include "quay/config.hpp"
#include "quay/job.hpp"
#include "quay/store.hpp"

namespace quay {

struct EnqueueOptions {
    std::optional<int> maxAttempts;   // QueueConfig::defaultMaxAttempts when unset
    Millis delay{0};
    std::optional<JobId> id;          // generated when unset
};

struct EnqueueResult {
    bool ok = false;
    JobId id;
    ErrorKind error = ErrorKind::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

// No job with error None means nothing was claimable.
struct ClaimResult {
    std::optional<Job> job;
    ErrorKind error = ErrorKind::None;
    explicit operator bool() const noexcept { return job.has_value(); }
};

enum class Decision : std::uint8_t {
    Completed,    // ack accepted
    Rescheduled,  // nack accepted, job Waiting or Delayed again
    Failed,       // nack accepted, attempts exhausted
    Rejected      // caller no longer holds the lease, nothing changed
};

// Outcome of ack/nack, returned as a value.
struct Settlement {
    Decision decision = Decision::Rejected;
    ErrorKind error = ErrorKind::None;
    std::optional<ExecutionRecord> record;
    TimePoint nextEligibleAt{};
    explicit operator bool() const noexcept { return decision != Decision::Rejected; }
};

struct QueueCounts {
    std::size_t waiting = 0;
    std::size_t delayed = 0;
    std::size_t active = 0;
    std::size_t completed = 0;
    std::size_t failed = 0;

    [[nodiscard]] std::size_t total() const noexcept { return waiting + delayed + active + completed + failed; }
};

[[nodiscard]] JobId generateJobId();
[[nodiscard]] bool isValidJobId(const std::string& id) noexcept;

// Leased job queue. Every transition runs inside one critical section and is
// written through to the Store before it becomes visible, so a claim is a
// single pop-and-mark: no two callers can receive the same Waiting job.
// Terminal jobs are evicted from memory and served from the Store.
class Queue {
public:
    Queue(Store& store, const Clock& clock, QueueConfig config = {});

    Queue(const Queue&) = delete;
    Queue& operator=(const Queue&) = delete;

    // Rebuilds the index from the Store. Active jobs whose lease has already
    // expired are reclaimed as crash leftovers.
    [[nodiscard]] bool recover();

    [[nodiscard]] EnqueueResult enqueue(std::string payload, const EnqueueOptions& options = {});
    [[nodiscard]] ClaimResult claim(const WorkerId& workerId, Millis leaseDuration);

    [[nodiscard]] Settlement ack(const JobId& jobId, const WorkerId& workerId, const std::string& result = {});
    [[nodiscard]] Settlement nack(const JobId& jobId, const WorkerId& workerId, const std::string& error,
                                  Outcome outcome = Outcome::Failure, Millis retryDelay = Millis(0));
    [[nodiscard]] ErrorKind extendLease(const JobId& jobId, const WorkerId& workerId, Millis duration);

    // Periodic sweeps; each returns the number of jobs moved.
    std::size_t promoteDelayed();
    std::size_t reap();
    std::size_t revokeWorker(const WorkerId& workerId);

    // New job carrying a Failed job's payload and attempt budget.
    [[nodiscard]] EnqueueResult requeue(const JobId& failedJobId);

    [[nodiscard]] std::optional<Job> get(const JobId& id) const;
    [[nodiscard]] QueueCounts counts() const;

    void setDraining(bool draining);
    [[nodiscard]] bool isDraining() const;
    [[nodiscard]] bool reachable() const noexcept;

    // Blocks until a job is claimable or the timeout passes.
    bool waitForWork(Millis timeout);

private:
    Store& store_;
    const Clock& clock_;
    QueueConfig config_;

    mutable std::mutex mutex_;
    std::condition_variable workAvailable_;
    bool draining_ = false;

    std::unordered_map<JobId, Job> jobs_;      // non-terminal jobs
    std::deque<JobId> waiting_;
    std::multimap<TimePoint, JobId> delayed_;
    std::unordered_set<JobId> active_;
    std::size_t completed_ = 0;
    std::size_t failed_ = 0;

    [[nodiscard]] TimePoint now() const;
    [[nodiscard]] EnqueueResult enqueueLocked(std::string payload, const EnqueueOptions& options, TimePoint now);
    [[nodiscard]] ErrorKind checkLease(const JobId& jobId, const WorkerId& workerId, TimePoint now) const;
    std::size_t promoteDueLocked(TimePoint now);
    bool reclaimLocked(const JobId& jobId, TimePoint now, const std::string& reason);
    void appendRecord(const ExecutionRecord& record);
    void retire(const JobId& jobId, JobState terminal);
};

} // namespace quay
