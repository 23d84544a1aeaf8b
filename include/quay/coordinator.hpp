/*
 * quay - Leased Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <vector>

#include "quay/clock.hpp"
#include "quay/config.hpp"
#include "quay/job.hpp"
#include "quay/queue.hpp"

namespace quay {

// Tracks worker liveness and gates claims so each worker slot holds at most
// one lease. A worker whose last heartbeat is older than the liveness window
// is marked Dead by sweep(), and its leases are revoked immediately rather
// than waiting for them to expire.
class Coordinator {
public:
    Coordinator(Queue& queue, const Clock& clock, CoordinatorConfig config = {});

    Coordinator(const Coordinator&) = delete;
    Coordinator& operator=(const Coordinator&) = delete;

    // Registering a Dead worker revives it as Idle.
    [[nodiscard]] ErrorKind registerWorker(const WorkerId& workerId);
    // UnknownWorker for unknown and Dead workers; they must register again.
    [[nodiscard]] ErrorKind heartbeat(const WorkerId& workerId);
    // Graceful exit of a slot; any lease it still holds is revoked.
    void deregister(const WorkerId& workerId);

    // Refuses unknown and Dead workers with UnknownWorker, Busy ones with
    // InvalidRequest.
    [[nodiscard]] ClaimResult claim(const WorkerId& workerId, Millis leaseDuration);
    void release(const WorkerId& workerId);

    // Marks silent workers Dead and revokes their leases. Returns the number
    // of workers that died in this sweep.
    std::size_t sweep();

    [[nodiscard]] std::set<WorkerId> listLiveWorkers() const;
    [[nodiscard]] std::vector<Worker> workers() const;
    [[nodiscard]] std::optional<Worker> worker(const WorkerId& workerId) const;

    [[nodiscard]] const CoordinatorConfig& config() const noexcept { return config_; }

private:
    Queue& queue_;
    const Clock& clock_;
    CoordinatorConfig config_;

    mutable std::mutex mutex_;
    std::map<WorkerId, Worker> workers_;
};

} // namespace quay
