/*
 * quay - Leased Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "quay/coordinator.hpp"
#include "quay/logger.hpp"

namespace quay {

namespace {
bool isValidWorkerId(const WorkerId& id) {
    return !id.empty() && id.find('\n') == std::string::npos;
}
}

Coordinator::Coordinator(Queue& queue, const Clock& clock, CoordinatorConfig config)
    : queue_(queue), clock_(clock), config_(config) {
    LOG_DEBUG("Coordinator created: heartbeat " + std::to_string(config_.heartbeatInterval.count()) +
              "ms, liveness window " + std::to_string(config_.livenessWindow().count()) + "ms");
}

ErrorKind Coordinator::registerWorker(const WorkerId& workerId) {
    if (!isValidWorkerId(workerId)) {
        return ErrorKind::InvalidRequest;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    const TimePoint t = clock_.now();

    auto it = workers_.find(workerId);
    if (it != workers_.end() && it->second.status != WorkerStatus::Dead) {
        it->second.lastHeartbeatAt = t;
        return ErrorKind::None;
    }

    Worker worker;
    worker.id = workerId;
    worker.registeredAt = t;
    worker.lastHeartbeatAt = t;
    workers_[workerId] = worker;
    LOG_INFO(std::string(it == workers_.end() ? "Worker registered: " : "Worker re-registered: ") + workerId);
    return ErrorKind::None;
}

ErrorKind Coordinator::heartbeat(const WorkerId& workerId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = workers_.find(workerId);
    if (it == workers_.end() || it->second.status == WorkerStatus::Dead) {
        LOG_DEBUG("Heartbeat from unknown or dead worker: " + workerId);
        return ErrorKind::UnknownWorker;
    }
    it->second.lastHeartbeatAt = clock_.now();
    return ErrorKind::None;
}

void Coordinator::deregister(const WorkerId& workerId) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (workers_.erase(workerId) == 0) {
            return;
        }
    }
    (void)queue_.revokeWorker(workerId);
    LOG_DEBUG("Worker deregistered: " + workerId);
}

ClaimResult Coordinator::claim(const WorkerId& workerId, Millis leaseDuration) {
    // The slot is marked Busy before the queue is touched so a second claim
    // from the same worker cannot slip in between.
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = workers_.find(workerId);
        if (it == workers_.end() || it->second.status == WorkerStatus::Dead) {
            return {std::nullopt, ErrorKind::UnknownWorker};
        }
        if (it->second.status != WorkerStatus::Idle) {
            return {std::nullopt, ErrorKind::InvalidRequest};
        }
        it->second.status = WorkerStatus::Busy;
    }

    ClaimResult claimed = queue_.claim(workerId, leaseDuration);
    const std::optional<Job>& job = claimed.job;

    bool orphaned = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = workers_.find(workerId);
        if (it == workers_.end() || it->second.status == WorkerStatus::Dead) {
            orphaned = true;
        } else if (job) {
            it->second.currentJob = job->id;
        } else {
            it->second.status = WorkerStatus::Idle;
        }
    }
    if (orphaned) {
        // Declared dead (or deregistered) mid-claim; the sweep's revocation
        // may have run before this lease existed.
        if (job) {
            (void)queue_.revokeWorker(workerId);
        }
        return {std::nullopt, ErrorKind::UnknownWorker};
    }
    return claimed;
}

void Coordinator::release(const WorkerId& workerId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = workers_.find(workerId);
    if (it == workers_.end() || it->second.status == WorkerStatus::Dead) {
        return;
    }
    it->second.status = WorkerStatus::Idle;
    it->second.currentJob.reset();
}

std::size_t Coordinator::sweep() {
    std::vector<WorkerId> died;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const TimePoint t = clock_.now();
        const auto window = config_.livenessWindow();
        for (auto& [id, worker] : workers_) {
            if (worker.status == WorkerStatus::Dead) {
                continue;
            }
            if (t - worker.lastHeartbeatAt > window) {
                worker.status = WorkerStatus::Dead;
                worker.currentJob.reset();
                died.push_back(id);
            }
        }
    }

    for (const auto& id : died) {
        LOG_WARN("Worker " + id + " missed heartbeats for more than " +
                 std::to_string(config_.livenessWindow().count()) + "ms, marked dead");
        (void)queue_.revokeWorker(id);
    }
    return died.size();
}

std::set<WorkerId> Coordinator::listLiveWorkers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::set<WorkerId> live;
    for (const auto& [id, worker] : workers_) {
        if (worker.status != WorkerStatus::Dead) {
            live.insert(id);
        }
    }
    return live;
}

std::vector<Worker> Coordinator::workers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Worker> snapshot;
    snapshot.reserve(workers_.size());
    for (const auto& [id, worker] : workers_) {
        snapshot.push_back(worker);
    }
    return snapshot;
}

std::optional<Worker> Coordinator::worker(const WorkerId& workerId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = workers_.find(workerId);
    if (it == workers_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace quay
