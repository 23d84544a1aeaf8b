/*
 * quay - Leased Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <condition_variable>
#include <filesystem>
#include <memory>
#include <mutex>
#include <thread>

#include "quay/clock.hpp"
#include "quay/config.hpp"
#include "quay/supervisor.hpp"

namespace quay {

class FileStore;
class Queue;
class Coordinator;
class Pool;
class Inbox;
struct Health;

// Daemon core: owns the store, queue, coordinator, supervisor, worker pool
// and inbox of one workspace, and runs the maintenance loop (inbox intake,
// delayed promotion, lease reaping, liveness sweep, status snapshot).
class Server final {
public:
    Server(const std::filesystem::path& workspace, Config config, Handler handler);
    Server(const std::filesystem::path& workspace, Config config, Handler handler, const Clock& clock);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;
    Server(Server&&) = delete;
    Server& operator=(Server&&) = delete;

    [[nodiscard]] bool start();
    // Refuses new work from now on; in-flight attempts keep running.
    void drain() noexcept;
    // Drains, waits for in-flight attempts, then stops every thread.
    void shutdown() noexcept;

    // One maintenance pass, as the loop runs it every reaper interval.
    void runMaintenance();

    [[nodiscard]] Health health() const;
    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }
    [[nodiscard]] bool isDraining() const noexcept { return draining_.load(); }

    [[nodiscard]] const std::filesystem::path& workspace() const noexcept { return workspace_; }
    [[nodiscard]] const Config& config() const noexcept { return config_; }

    // Valid after a successful start().
    [[nodiscard]] Queue& queue() noexcept { return *queue_; }
    [[nodiscard]] Coordinator& coordinator() noexcept { return *coordinator_; }
    [[nodiscard]] Inbox& inbox() noexcept { return *inbox_; }
    [[nodiscard]] FileStore& store() noexcept { return *store_; }

private:
    void maintenanceLoop();
    void writeStatus() noexcept;

    std::filesystem::path workspace_;
    Config config_;
    Handler handler_;
    SystemClock systemClock_;
    const Clock& clock_;

    std::atomic<bool> running_{false};
    std::atomic<bool> draining_{false};

    std::unique_ptr<FileStore> store_;
    std::unique_ptr<Queue> queue_;
    std::unique_ptr<Coordinator> coordinator_;
    std::unique_ptr<Supervisor> supervisor_;
    std::unique_ptr<Pool> pool_;
    std::unique_ptr<Inbox> inbox_;

    std::mutex maintenanceMutex_;
    std::condition_variable maintenanceWake_;
    bool maintenanceStop_ = false;
    std::thread maintenanceThread_;
};

} // namespace quay
