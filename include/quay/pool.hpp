/*
 * quay - Leased Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

#include "quay/config.hpp"
#include "quay/coordinator.hpp"
#include "quay/queue.hpp"
#include "quay/supervisor.hpp"

namespace quay {

// Worker slots. Each slot is a thread that registers with the Coordinator
// as its own worker and runs at most one attempt at a time. A separate
// thread heartbeats every slot.
class Pool {
public:
    Pool(Coordinator& coordinator, Queue& queue, Supervisor& supervisor, PoolConfig config = {}) noexcept;
    ~Pool();

    Pool(const Pool&) = delete;
    Pool& operator=(const Pool&) = delete;
    Pool(Pool&&) = delete;
    Pool& operator=(Pool&&) = delete;

    [[nodiscard]] bool start();
    // Stops claiming, waits for in-flight attempts and deregisters the slots.
    void stop() noexcept;

    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }
    [[nodiscard]] int slotCount() const noexcept { return config_.slots; }
    [[nodiscard]] int inFlight() const noexcept { return inFlight_.load(); }
    [[nodiscard]] std::vector<WorkerId> slotIds() const;

private:
    void workerLoop(int slot);
    void heartbeatLoop();
    [[nodiscard]] WorkerId slotId(int slot) const;

    Coordinator& coordinator_;
    Queue& queue_;
    Supervisor& supervisor_;
    PoolConfig config_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};
    std::atomic<int> inFlight_{0};

    std::mutex heartbeatMutex_;
    std::condition_variable heartbeatWake_;
    bool heartbeatStop_ = false;

    std::vector<std::thread> workerThreads_;
    std::thread heartbeatThread_;
};

} // namespace quay
