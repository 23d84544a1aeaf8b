/*
 * quay - Leased Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "quay/pool.hpp"
#include "quay/logger.hpp"
#include <chrono>

namespace quay {

Pool::Pool(Coordinator& coordinator, Queue& queue, Supervisor& supervisor, PoolConfig config) noexcept
    : coordinator_(coordinator), queue_(queue), supervisor_(supervisor), config_(std::move(config)) {
    LOG_DEBUG("Pool created with " + std::to_string(config_.slots) + " slots");
}

Pool::~Pool() {
    stop();
}

bool Pool::start() {
    if (running_.load()) {
        LOG_WARN("Pool already running");
        return false;
    }
    if (config_.slots < 1) {
        LOG_ERROR("Pool needs at least one slot");
        return false;
    }

    // Slots are registered before any thread starts so the first heartbeat
    // and the first claim never race a missing registration.
    for (int i = 0; i < config_.slots; ++i) {
        if (coordinator_.registerWorker(slotId(i)) != ErrorKind::None) {
            LOG_ERROR("Failed to register slot " + slotId(i));
            return false;
        }
    }

    running_.store(true);
    shutdown_.store(false);
    heartbeatStop_ = false;

    try {
        workerThreads_.reserve(static_cast<std::size_t>(config_.slots));
        for (int i = 0; i < config_.slots; ++i) {
            workerThreads_.emplace_back(&Pool::workerLoop, this, i);
        }
        heartbeatThread_ = std::thread(&Pool::heartbeatLoop, this);

        LOG_INFO("Pool started with " + std::to_string(config_.slots) + " worker slots");
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start pool: " + std::string(e.what()));
        stop();
        return false;
    }
}

void Pool::stop() noexcept {
    if (!running_.load()) {
        return;
    }

    LOG_DEBUG("Stopping pool...");
    shutdown_.store(true);
    running_.store(false);

    // Slots finish the attempt they are running; the heartbeat thread keeps
    // them alive until then.
    for (auto& thread : workerThreads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    workerThreads_.clear();

    {
        std::lock_guard<std::mutex> lock(heartbeatMutex_);
        heartbeatStop_ = true;
    }
    heartbeatWake_.notify_all();
    if (heartbeatThread_.joinable()) {
        heartbeatThread_.join();
    }

    for (int i = 0; i < config_.slots; ++i) {
        coordinator_.deregister(slotId(i));
    }

    LOG_INFO("Pool stopped");
}

std::vector<WorkerId> Pool::slotIds() const {
    std::vector<WorkerId> ids;
    ids.reserve(static_cast<std::size_t>(config_.slots));
    for (int i = 0; i < config_.slots; ++i) {
        ids.push_back(slotId(i));
    }
    return ids;
}

WorkerId Pool::slotId(int slot) const {
    return config_.workerPrefix + "-" + std::to_string(slot);
}

void Pool::workerLoop(int slot) {
    const WorkerId id = slotId(slot);
    setThreadName(id);
    LOG_DEBUG(id + " thread started");

    const Millis lease = supervisor_.config().leaseDuration;

    try {
        while (!shutdown_.load()) {
            ClaimResult claimed = coordinator_.claim(id, lease);
            if (!claimed) {
                if (claimed.error == ErrorKind::TransientError) {
                    LOG_WARN(id + " claim hit a transient store error");
                }
                auto self = coordinator_.worker(id);
                if (!self || self->status == WorkerStatus::Dead) {
                    // Declared dead while stalled; come back as a fresh worker.
                    if (coordinator_.registerWorker(id) == ErrorKind::None) {
                        LOG_WARN(id + " re-registered after being marked dead");
                    }
                }
                (void)queue_.waitForWork(config_.pollInterval);
                continue;
            }

            const Job& job = *claimed.job;
            LOG_INFO(id + " claimed job: " + job.id + " (attempt " + std::to_string(job.currentAttempt()) +
                     "/" + std::to_string(job.maxAttempts) + ")");
            inFlight_.fetch_add(1);
            try {
                ExecutionRecord record = supervisor_.run(job, id);
                LOG_DEBUG(id + " finished job " + job.id + ": " + toString(record.outcome));
            } catch (const std::exception& e) {
                LOG_ERROR(id + " job processing error: " + std::string(e.what()) + " (job: " + job.id + ")");
            }
            inFlight_.fetch_sub(1);
            coordinator_.release(id);
        }
    } catch (const std::exception& e) {
        LOG_ERROR(id + " fatal error: " + std::string(e.what()));
    }

    LOG_DEBUG(id + " stopped");
    clearThreadName();
}

void Pool::heartbeatLoop() {
    setThreadName("Heartbeat");
    const Millis interval = coordinator_.config().heartbeatInterval;

    std::unique_lock<std::mutex> lock(heartbeatMutex_);
    while (!heartbeatStop_) {
        lock.unlock();
        for (int i = 0; i < config_.slots; ++i) {
            const WorkerId id = slotId(i);
            if (coordinator_.heartbeat(id) == ErrorKind::UnknownWorker) {
                LOG_DEBUG("Heartbeat refused for " + id);
            }
        }
        lock.lock();
        heartbeatWake_.wait_for(lock, interval, [this] { return heartbeatStop_; });
    }
    lock.unlock();
    LOG_DEBUG("Heartbeat loop stopped");
    clearThreadName();
}

} // namespace quay
