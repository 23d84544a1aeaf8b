/*
 * quay - Leased Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "quay/clock.hpp"
#include "quay/inbox.hpp"
#include "quay/job.hpp"
#include "quay/queue.hpp"
#include "quay/store.hpp"

namespace quay {

// What the daemon publishes under <workspace>/status every maintenance
// cycle. Tools read it back instead of talking to the daemon.
struct StatusSnapshot {
    TimePoint updatedAt{};
    bool queueReachable = false;
    bool coordinatorReachable = false;
    bool draining = false;
    Millis reaperInterval{1000};
    std::vector<Worker> workers;
};

[[nodiscard]] bool writeStatusSnapshot(const std::filesystem::path& workspace, const StatusSnapshot& snapshot) noexcept;
[[nodiscard]] std::optional<StatusSnapshot> readStatusSnapshot(const std::filesystem::path& workspace) noexcept;

struct Health {
    bool live = false;       // daemon snapshot fresh, queue and coordinator reachable
    bool ready = false;      // live and accepting new jobs
    bool stale = true;       // no snapshot, or older than the staleness window
    bool queueReachable = false;
    bool coordinatorReachable = false;
    std::string readiness = "unknown";   // accepting | draining | unknown
    std::optional<TimePoint> updatedAt;
};

// Read-only view over a workspace: queue depth, workers, execution history
// and health. Never mutates the jobs or records it reports on.
class Monitor final {
public:
    Monitor(const std::filesystem::path& workspace, const Clock& clock) noexcept;

    Monitor(const Monitor&) = delete;
    Monitor& operator=(const Monitor&) = delete;

    [[nodiscard]] QueueCounts depth() const noexcept;
    // Submissions published to the inbox and not yet taken in.
    [[nodiscard]] std::size_t pendingCount() const noexcept;

    // Both are empty/zero when the daemon's snapshot is stale.
    [[nodiscard]] std::size_t liveWorkerCount() const noexcept;
    [[nodiscard]] std::vector<Worker> workers() const noexcept;

    // Newest `limit` executions; none for a limit of 0.
    [[nodiscard]] std::vector<ExecutionRecord> recentRecords(std::size_t limit = 10) const noexcept;
    [[nodiscard]] std::vector<ExecutionRecord> recordsFor(const JobId& id) const noexcept;
    [[nodiscard]] std::vector<ExecutionRecord> recordsBetween(TimePoint since, TimePoint until) const noexcept;
    [[nodiscard]] std::vector<Job> jobs(const JobFilter& filter = {}) const noexcept;

    // A job still in the inbox is reported as Waiting with no attempts.
    [[nodiscard]] std::optional<Job> job(const JobId& id) const noexcept;

    // Staleness window defaults to three reaper intervals from the snapshot.
    [[nodiscard]] Health health(std::optional<Millis> staleAfter = std::nullopt) const noexcept;

    [[nodiscard]] const std::filesystem::path& workspace() const noexcept { return workspace_; }

private:
    std::filesystem::path workspace_;
    const Clock& clock_;
    FileStore store_;
    Inbox inbox_;

    [[nodiscard]] bool fresh(const StatusSnapshot& snapshot, Millis staleAfter) const noexcept;
};

} // namespace quay
