/*
 * quay - Leased Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "quay/supervisor.hpp"
#include "quay/logger.hpp"
#include <algorithm>
#include <thread>

namespace quay {

namespace {
using SteadyClock = std::chrono::steady_clock;

// Shared between the supervisor and the execution thread, which may outlive
// the attempt when it is abandoned.
struct Execution {
    std::mutex mutex;
    std::condition_variable cv;
    bool done = false;
    HandlerResult result;
};
}

CancelToken::CancelToken() : state_(std::make_shared<State>()) {}

void CancelToken::cancel() noexcept {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->cancelled = true;
    }
    state_->cv.notify_all();
}

bool CancelToken::cancelled() const noexcept {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

bool CancelToken::waitFor(Millis timeout) const {
    std::unique_lock<std::mutex> lock(state_->mutex);
    return state_->cv.wait_for(lock, timeout, [this] { return state_->cancelled; });
}

const char* toString(AttemptPhase phase) noexcept {
    switch (phase) {
        case AttemptPhase::Start: return "start";
        case AttemptPhase::Running: return "running";
        case AttemptPhase::Succeeded: return "succeeded";
        case AttemptPhase::Failed: return "failed";
        case AttemptPhase::TimedOut: return "timed out";
        default: return "unknown";
    }
}

Supervisor::Supervisor(Queue& queue, const Clock& clock, Handler handler,
                       SupervisorConfig config, RetryConfig retry)
    : queue_(queue), clock_(clock), handler_(std::move(handler)), config_(config), retry_(retry) {
}

ExecutionRecord Supervisor::run(const Job& job, const WorkerId& workerId) {
    AttemptPhase phase = AttemptPhase::Start;
    const int attempt = job.currentAttempt();
    const std::string label = job.id + "#" + std::to_string(attempt);

    ExecutionRecord local;
    local.jobId = job.id;
    local.attempt = attempt;
    local.workerId = workerId;
    local.startedAt = job.lease ? job.lease->acquiredAt : clock_.now();

    if (!handler_) {
        local.finishedAt = clock_.now();
        local.outcome = Outcome::Failure;
        local.resultOrError = "no handler configured";
        LOG_ERROR("No handler configured, failing attempt " + label);
        auto settlement = queue_.nack(job.id, workerId, local.resultOrError, Outcome::Failure,
                                      retry_.delayFor(job.attempts));
        return settlement.record ? *settlement.record : local;
    }

    auto execution = std::make_shared<Execution>();
    CancelToken token;
    std::thread thread([execution, token, handler = handler_, job, workerId]() {
        setThreadName(workerId + "-exec");
        HandlerResult result;
        try {
            result = handler(job, token);
        } catch (const std::exception& e) {
            result = {false, "", std::string("handler threw: ") + e.what()};
        } catch (...) {
            result = {false, "", "handler threw an unknown exception"};
        }
        {
            std::lock_guard<std::mutex> lock(execution->mutex);
            execution->result = std::move(result);
            execution->done = true;
        }
        execution->cv.notify_all();
        clearThreadName();
    });
    phase = AttemptPhase::Running;
    LOG_DEBUG("Attempt " + label + " running on " + workerId);

    const auto renewEvery = std::max(config_.renewInterval(), Millis(1));
    auto nextRenew = SteadyClock::now() + renewEvery;
    ErrorKind leaseError = ErrorKind::None;
    bool timedOut = false;

    // Waits for the handler until `until`, renewing the lease on the way.
    // Returns false when the lease was lost.
    auto waitRenewing = [&](std::unique_lock<std::mutex>& lock, SteadyClock::time_point until) {
        while (!execution->done) {
            execution->cv.wait_until(lock, std::min(until, nextRenew), [&] { return execution->done; });
            if (execution->done) {
                return true;
            }
            const auto now = SteadyClock::now();
            if (now >= nextRenew) {
                lock.unlock();
                ErrorKind error = queue_.extendLease(job.id, workerId, config_.leaseDuration);
                lock.lock();
                if (error == ErrorKind::TransientError) {
                    LOG_WARN("Lease renewal for " + label + " hit a transient store error");
                } else if (error != ErrorKind::None) {
                    leaseError = error;
                    return false;
                }
                nextRenew = now + renewEvery;
            }
            if (now >= until) {
                return true;
            }
        }
        return true;
    };

    std::unique_lock<std::mutex> lock(execution->mutex);
    if (waitRenewing(lock, SteadyClock::now() + config_.executionTimeout) && !execution->done) {
        timedOut = true;
    }

    bool finished = execution->done;
    if (!finished) {
        token.cancel();
        // The lease stays ours through the grace so the timeout can be settled.
        if (leaseError == ErrorKind::None) {
            waitRenewing(lock, SteadyClock::now() + config_.cancelGrace);
        } else {
            execution->cv.wait_for(lock, config_.cancelGrace, [&] { return execution->done; });
        }
        finished = execution->done;
    }
    HandlerResult result = execution->result;
    lock.unlock();

    if (finished) {
        thread.join();
    } else {
        // Stop crediting it; the lease is settled below and the job becomes
        // claimable even though the handler may still be running.
        LOG_WARN("Abandoning execution of " + label + " after " +
                 std::to_string(config_.cancelGrace.count()) + "ms cancel grace");
        thread.detach();
    }

    local.finishedAt = clock_.now();

    if (leaseError != ErrorKind::None) {
        phase = AttemptPhase::Failed;
        local.outcome = Outcome::Failure;
        local.resultOrError = std::string("lease lost: ") + toString(leaseError);
        LOG_WARN("Attempt " + label + " lost its lease (" + toString(leaseError) + "), not settling");
        return local;
    }

    Settlement settlement;
    if (finished && result.ok && !timedOut) {
        phase = AttemptPhase::Succeeded;
        local.outcome = Outcome::Success;
        local.resultOrError = result.output;
        settlement = queue_.ack(job.id, workerId, result.output);
    } else if (finished && !result.ok && !timedOut) {
        phase = AttemptPhase::Failed;
        local.outcome = Outcome::Failure;
        local.resultOrError = result.error.empty() ? "execution failed" : result.error;
        settlement = queue_.nack(job.id, workerId, local.resultOrError, Outcome::Failure,
                                 retry_.delayFor(job.attempts));
    } else {
        phase = AttemptPhase::TimedOut;
        local.outcome = Outcome::Timeout;
        local.resultOrError = "execution exceeded " + std::to_string(config_.executionTimeout.count()) + "ms";
        settlement = queue_.nack(job.id, workerId, local.resultOrError, Outcome::Timeout,
                                 retry_.delayFor(job.attempts));
    }

    if (!settlement) {
        LOG_WARN("Attempt " + label + " " + toString(phase) + " but settlement was rejected: " +
                 toString(settlement.error));
        return local;
    }
    LOG_INFO("Attempt " + label + " " + toString(phase) + " on " + workerId);
    return settlement.record ? *settlement.record : local;
}

} // namespace quay
