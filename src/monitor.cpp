/*
 * quay - Leased Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "quay/monitor.hpp"
#include "quay/logger.hpp"
#include <fstream>
#include <sstream>

namespace quay {

namespace {
namespace fs = std::filesystem;

bool publish(const fs::path& path, const std::string& content) {
    fs::path tmp = path;
    tmp += ".tmp";
    {
        std::ofstream file(tmp, std::ios::binary | std::ios::trunc);
        if (!file) return false;
        file << content;
        file.flush();
        if (!file) return false;
    }
    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        fs::remove(tmp, ec);
        return false;
    }
    return true;
}

std::int64_t parseInt(const std::string& text, std::int64_t fallback) {
    try {
        return std::stoll(text);
    } catch (const std::exception&) {
        return fallback;
    }
}
}

// status/health      key=value lines
// status/workers     id \t status \t registered_at \t last_heartbeat_at \t current_job|-
bool writeStatusSnapshot(const std::filesystem::path& workspace, const StatusSnapshot& snapshot) noexcept {
    try {
        auto dir = workspace / "status";
        fs::create_directories(dir);

        std::ostringstream workers;
        for (const auto& w : snapshot.workers) {
            workers << w.id << '\t' << toString(w.status) << '\t' << toEpochMillis(w.registeredAt) << '\t'
                    << toEpochMillis(w.lastHeartbeatAt) << '\t' << w.currentJob.value_or("-") << '\n';
        }

        std::ostringstream health;
        health << "updated_at=" << toEpochMillis(snapshot.updatedAt) << "\n"
               << "queue=" << (snapshot.queueReachable ? "ok" : "unreachable") << "\n"
               << "coordinator=" << (snapshot.coordinatorReachable ? "ok" : "unreachable") << "\n"
               << "readiness=" << (snapshot.draining ? "draining" : "accepting") << "\n"
               << "reaper_ms=" << snapshot.reaperInterval.count() << "\n";

        // Workers first so a reader that sees a fresh health file also sees
        // the worker list from the same cycle or a later one.
        return publish(dir / "workers", workers.str()) && publish(dir / "health", health.str());
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to write status snapshot: " + std::string(e.what()));
        return false;
    }
}

std::optional<StatusSnapshot> readStatusSnapshot(const std::filesystem::path& workspace) noexcept {
    try {
        std::ifstream health(workspace / "status" / "health");
        if (!health) {
            return std::nullopt;
        }

        StatusSnapshot snapshot;
        bool haveTimestamp = false;
        std::string line;
        while (std::getline(health, line)) {
            auto eq = line.find('=');
            if (eq == std::string::npos) continue;
            const std::string key = line.substr(0, eq);
            const std::string value = line.substr(eq + 1);
            if (key == "updated_at") {
                snapshot.updatedAt = fromEpochMillis(parseInt(value, 0));
                haveTimestamp = true;
            } else if (key == "queue") {
                snapshot.queueReachable = value == "ok";
            } else if (key == "coordinator") {
                snapshot.coordinatorReachable = value == "ok";
            } else if (key == "readiness") {
                snapshot.draining = value == "draining";
            } else if (key == "reaper_ms") {
                snapshot.reaperInterval = Millis(parseInt(value, 1000));
            }
        }
        if (!haveTimestamp) {
            return std::nullopt;
        }

        std::ifstream workers(workspace / "status" / "workers");
        while (workers && std::getline(workers, line)) {
            std::istringstream fields(line);
            std::string id, status, registered, heartbeat, current;
            if (!std::getline(fields, id, '\t') || !std::getline(fields, status, '\t') ||
                !std::getline(fields, registered, '\t') || !std::getline(fields, heartbeat, '\t') ||
                !std::getline(fields, current, '\t')) {
                continue;
            }
            auto parsed = parseWorkerStatus(status);
            if (id.empty() || !parsed) {
                continue;
            }
            Worker w;
            w.id = id;
            w.status = *parsed;
            w.registeredAt = fromEpochMillis(parseInt(registered, 0));
            w.lastHeartbeatAt = fromEpochMillis(parseInt(heartbeat, 0));
            if (current != "-") {
                w.currentJob = current;
            }
            snapshot.workers.push_back(std::move(w));
        }
        return snapshot;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to read status snapshot: " + std::string(e.what()));
        return std::nullopt;
    }
}

Monitor::Monitor(const std::filesystem::path& workspace, const Clock& clock) noexcept
    : workspace_(workspace), clock_(clock), store_(workspace), inbox_(workspace, false) {
    LOG_DEBUG("Monitor created for workspace: " + workspace_.string());
}

QueueCounts Monitor::depth() const noexcept {
    QueueCounts counts;
    counts.waiting = store_.countJobs(JobState::Waiting);
    counts.delayed = store_.countJobs(JobState::Delayed);
    counts.active = store_.countJobs(JobState::Active);
    counts.completed = store_.countJobs(JobState::Completed);
    counts.failed = store_.countJobs(JobState::Failed);
    return counts;
}

std::size_t Monitor::pendingCount() const noexcept {
    return inbox_.scan().size();
}

std::size_t Monitor::liveWorkerCount() const noexcept {
    std::size_t live = 0;
    for (const auto& w : workers()) {
        if (w.status != WorkerStatus::Dead) {
            ++live;
        }
    }
    return live;
}

std::vector<Worker> Monitor::workers() const noexcept {
    auto snapshot = readStatusSnapshot(workspace_);
    if (!snapshot || !fresh(*snapshot, snapshot->reaperInterval * 3)) {
        return {};
    }
    return snapshot->workers;
}

std::vector<ExecutionRecord> Monitor::recentRecords(std::size_t limit) const noexcept {
    // RecordFilter treats 0 as unlimited.
    if (limit == 0) {
        return {};
    }
    RecordFilter filter;
    filter.limit = limit;
    return store_.listRecords(filter);
}

std::vector<ExecutionRecord> Monitor::recordsFor(const JobId& id) const noexcept {
    RecordFilter filter;
    filter.jobId = id;
    return store_.listRecords(filter);
}

std::vector<ExecutionRecord> Monitor::recordsBetween(TimePoint since, TimePoint until) const noexcept {
    RecordFilter filter;
    filter.since = since;
    filter.until = until;
    return store_.listRecords(filter);
}

std::vector<Job> Monitor::jobs(const JobFilter& filter) const noexcept {
    return store_.listJobs(filter);
}

std::optional<Job> Monitor::job(const JobId& id) const noexcept {
    if (!isValidJobId(id)) {
        return std::nullopt;
    }
    if (auto job = store_.loadJob(id)) {
        return job;
    }

    auto pending = inbox_.load(id);
    if (!pending) {
        return std::nullopt;
    }
    Job job;
    job.id = pending->id;
    job.payload = std::move(pending->payload);
    job.state = JobState::Waiting;
    job.maxAttempts = pending->options.maxAttempts.value_or(QueueConfig{}.defaultMaxAttempts);
    return job;
}

Health Monitor::health(std::optional<Millis> staleAfter) const noexcept {
    Health health;
    auto snapshot = readStatusSnapshot(workspace_);
    if (!snapshot) {
        return health;
    }

    health.updatedAt = snapshot->updatedAt;
    health.queueReachable = snapshot->queueReachable;
    health.coordinatorReachable = snapshot->coordinatorReachable;
    health.readiness = snapshot->draining ? "draining" : "accepting";
    health.stale = !fresh(*snapshot, staleAfter.value_or(snapshot->reaperInterval * 3));
    health.live = !health.stale && health.queueReachable && health.coordinatorReachable;
    health.ready = health.live && !snapshot->draining;
    return health;
}

bool Monitor::fresh(const StatusSnapshot& snapshot, Millis staleAfter) const noexcept {
    return clock_.now() - snapshot.updatedAt <= staleAfter;
}

} // namespace quay
