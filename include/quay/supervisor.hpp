/*
 * quay - Leased Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include "quay/clock.hpp"
#include "quay/config.hpp"
#include "quay/job.hpp"
#include "quay/queue.hpp"
#include "quay/retry.hpp"

namespace quay {

// Advisory cancellation signal shared between the supervisor and a handler.
// Copies observe the same flag.
class CancelToken {
public:
    CancelToken();

    void cancel() noexcept;
    [[nodiscard]] bool cancelled() const noexcept;
    // Sleeps up to `timeout`; returns true as soon as the token is cancelled.
    bool waitFor(Millis timeout) const;

private:
    struct State {
        std::mutex mutex;
        std::condition_variable cv;
        bool cancelled = false;
    };
    std::shared_ptr<State> state_;
};

struct HandlerResult {
    bool ok = false;
    std::string output;
    std::string error;
};

// Executes a job's payload. Should return promptly once the token is
// cancelled; a handler that does not is abandoned after the grace period.
using Handler = std::function<HandlerResult(const Job&, const CancelToken&)>;

enum class AttemptPhase : std::uint8_t { Start, Running, Succeeded, Failed, TimedOut };

[[nodiscard]] const char* toString(AttemptPhase phase) noexcept;

// Runs one attempt of a leased job: enforces the execution deadline, renews
// the lease while the handler runs, settles the attempt with ack/nack and
// schedules retries with exponential backoff.
class Supervisor {
public:
    Supervisor(Queue& queue, const Clock& clock, Handler handler,
               SupervisorConfig config = {}, RetryConfig retry = {});

    Supervisor(const Supervisor&) = delete;
    Supervisor& operator=(const Supervisor&) = delete;

    // The returned record is the persisted one when the settlement was
    // accepted, otherwise the supervisor's own account of the attempt.
    [[nodiscard]] ExecutionRecord run(const Job& job, const WorkerId& workerId);

    [[nodiscard]] const SupervisorConfig& config() const noexcept { return config_; }
    [[nodiscard]] RetryPolicy& retryPolicy() noexcept { return retry_; }

private:
    Queue& queue_;
    const Clock& clock_;
    Handler handler_;
    SupervisorConfig config_;
    RetryPolicy retry_;
};

} // namespace quay
