/*
 * quay - Leased Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "quay/store.hpp"
#include "quay/logger.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#include <sstream>
#include <unordered_map>
#include <unistd.h>

namespace quay {

namespace {
namespace fs = std::filesystem;

constexpr JobState kStates[] = {
    JobState::Waiting, JobState::Delayed, JobState::Active, JobState::Completed, JobState::Failed
};

constexpr int kLocatePasses = 4;

using Fields = std::unordered_map<std::string, std::string>;

std::optional<std::string> readFile(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

bool writeFile(const fs::path& path, const std::string& content) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) return false;
    file << content;
    file.flush();
    file.close();
    return !file.fail();
}

// Write to a sibling temp file, then rename over the target.
bool writeFileAtomic(const fs::path& path, const std::string& content) {
    fs::path tmp = path;
    tmp += ".tmp";
    if (!writeFile(tmp, content)) {
        std::error_code ec;
        fs::remove(tmp, ec);
        return false;
    }
    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        LOG_ERROR("Failed to publish " + path.string() + ": " + ec.message());
        fs::remove(tmp, ec);
        return false;
    }
    return true;
}

Fields parseFields(std::istream& in) {
    Fields fields;
    std::string line;
    while (std::getline(in, line)) {
        if (line.empty()) {
            break; // header/body separator
        }
        auto eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        fields[line.substr(0, eq)] = line.substr(eq + 1);
    }
    return fields;
}

std::optional<std::int64_t> fieldInt(const Fields& fields, const std::string& key) {
    auto it = fields.find(key);
    if (it == fields.end()) {
        return std::nullopt;
    }
    try {
        return std::stoll(it->second);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string fieldStr(const Fields& fields, const std::string& key) {
    auto it = fields.find(key);
    return it == fields.end() ? std::string() : it->second;
}

std::string encodeMeta(const Job& job) {
    std::ostringstream out;
    out << "id=" << job.id << "\n"
        << "state=" << toString(job.state) << "\n"
        << "attempts=" << job.attempts << "\n"
        << "max_attempts=" << job.maxAttempts << "\n"
        << "enqueued_at=" << toEpochMillis(job.enqueuedAt) << "\n"
        << "available_at=" << toEpochMillis(job.availableAt) << "\n";
    if (job.lease) {
        out << "lease_worker=" << job.lease->workerId << "\n"
            << "lease_acquired_at=" << toEpochMillis(job.lease->acquiredAt) << "\n"
            << "lease_expires_at=" << toEpochMillis(job.lease->expiresAt) << "\n";
    }
    return out.str();
}

std::string encodeRecord(const ExecutionRecord& record) {
    std::ostringstream out;
    out << "job_id=" << record.jobId << "\n"
        << "attempt=" << record.attempt << "\n"
        << "worker_id=" << record.workerId << "\n"
        << "started_at=" << toEpochMillis(record.startedAt) << "\n"
        << "finished_at=" << toEpochMillis(record.finishedAt) << "\n"
        << "outcome=" << toString(record.outcome) << "\n"
        << "\n"
        << record.resultOrError;
    return out.str();
}

bool inWindow(TimePoint tp, const std::optional<TimePoint>& since, const std::optional<TimePoint>& until) {
    if (since && tp < *since) return false;
    if (until && tp >= *until) return false;
    return true;
}
}

FileStore::FileStore(const std::filesystem::path& workspace) noexcept
    : workspace_(workspace), jobsRoot_(workspace / "jobs"), recordsRoot_(workspace / "records") {
}

bool FileStore::open() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        for (JobState state : kStates) {
            fs::create_directories(stateDir(state));
        }
        fs::create_directories(jobsRoot_ / ".staging");
        fs::create_directories(recordsRoot_);

        // Staged jobs were never acknowledged to their submitter.
        for (const auto& entry : fs::directory_iterator(jobsRoot_ / ".staging")) {
            LOG_WARN("Discarding unpublished job: " + entry.path().filename().string());
            std::error_code ec;
            fs::remove_all(entry.path(), ec);
        }

        int repaired = 0;
        for (JobState dirState : kStates) {
            for (const auto& entry : fs::directory_iterator(stateDir(dirState))) {
                if (!entry.is_directory()) {
                    continue;
                }
                auto job = readJobDir(entry.path());
                if (!job) {
                    LOG_ERROR("Unreadable job directory left in place: " + entry.path().string());
                    continue;
                }
                if (job->state == dirState) {
                    continue;
                }
                std::error_code ec;
                fs::rename(entry.path(), stateDir(job->state) / job->id, ec);
                if (ec) {
                    LOG_ERROR("Failed to repair job " + job->id + ": " + ec.message());
                    return false;
                }
                ++repaired;
            }
        }
        if (repaired > 0) {
            LOG_WARN("Repaired " + std::to_string(repaired) + " interrupted job move(s)");
        }

        LOG_DEBUG("Store opened: " + workspace_.string());
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to open store: " + std::string(e.what()));
        return false;
    }
}

bool FileStore::persist(const Job& job) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        auto target = stateDir(job.state) / job.id;
        auto current = locate(job.id);

        if (!current) {
            auto staging = jobsRoot_ / ".staging" / job.id;
            fs::create_directories(staging);
            if (!writeFile(staging / "payload.bin", job.payload) || !writeJobFiles(staging, job)) {
                LOG_ERROR("Failed to stage job: " + job.id);
                std::error_code ec;
                fs::remove_all(staging, ec);
                return false;
            }
            fs::rename(staging, target);
            LOG_TRACE("Job published: " + job.id + " (" + toString(job.state) + ")");
            return true;
        }

        if (!writeJobFiles(*current, job)) {
            LOG_ERROR("Failed to write job files: " + job.id);
            return false;
        }
        if (*current != target) {
            fs::rename(*current, target);
        }
        LOG_TRACE("Job persisted: " + job.id + " (" + toString(job.state) + ")");
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to persist job " + job.id + ": " + std::string(e.what()));
        return false;
    }
}

bool FileStore::persist(const ExecutionRecord& record) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        auto dir = recordsRoot_ / record.jobId;
        fs::create_directories(dir);

        const auto name = std::to_string(record.attempt) + ".rec";
        auto finalPath = dir / name;
        auto tmpPath = dir / ("." + name + ".tmp");
        if (!writeFile(tmpPath, encodeRecord(record))) {
            LOG_ERROR("Failed to write record " + record.jobId + "#" + std::to_string(record.attempt));
            std::error_code ec;
            fs::remove(tmpPath, ec);
            return false;
        }

        // link() refuses an existing target, which keeps records append-only.
        int rc = ::link(tmpPath.c_str(), finalPath.c_str());
        int err = errno;
        std::error_code ec;
        fs::remove(tmpPath, ec);
        if (rc != 0) {
            if (err == EEXIST) {
                LOG_WARN("Execution record already exists: " + record.jobId + "#" + std::to_string(record.attempt));
            } else {
                LOG_ERROR("Failed to publish record " + record.jobId + "#" +
                          std::to_string(record.attempt) + ": " + std::strerror(err));
            }
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to persist record for " + record.jobId + ": " + std::string(e.what()));
        return false;
    }
}

std::optional<Job> FileStore::loadJob(const JobId& id) const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        // Another process may move the directory between state checks or
        // while it is being read, so a miss is retried a few times.
        for (int pass = 0; pass < kLocatePasses; ++pass) {
            auto dir = locate(id);
            if (!dir) {
                continue;
            }
            auto job = readJobDir(*dir);
            if (job) {
                return job;
            }
            std::error_code ec;
            if (fs::is_directory(*dir, ec)) {
                return std::nullopt;
            }
        }
        return std::nullopt;
    } catch (const std::exception& e) {
        LOG_ERROR("Error loading job " + id + ": " + e.what());
        return std::nullopt;
    }
}

std::vector<Job> FileStore::listJobs(const JobFilter& filter) const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Job> jobs;
    try {
        // The meta decides the state, so every state directory is scanned.
        for (JobState dirState : kStates) {
            auto dir = stateDir(dirState);
            if (!fs::exists(dir)) {
                continue;
            }
            for (const auto& entry : fs::directory_iterator(dir)) {
                if (!entry.is_directory()) {
                    continue;
                }
                auto job = readJobDir(entry.path());
                if (!job) {
                    continue;
                }
                if (filter.state && job->state != *filter.state) {
                    continue;
                }
                if (!inWindow(job->enqueuedAt, filter.since, filter.until)) {
                    continue;
                }
                jobs.push_back(std::move(*job));
            }
        }

        std::sort(jobs.begin(), jobs.end(), [](const Job& a, const Job& b) {
            if (a.enqueuedAt != b.enqueuedAt) return a.enqueuedAt < b.enqueuedAt;
            return a.id < b.id;
        });
        if (filter.limit > 0 && jobs.size() > filter.limit) {
            jobs.resize(filter.limit);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Error listing jobs: " + std::string(e.what()));
    }
    return jobs;
}

std::vector<ExecutionRecord> FileStore::listRecords(const RecordFilter& filter) const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ExecutionRecord> records;
    try {
        std::vector<fs::path> dirs;
        if (filter.jobId) {
            dirs.push_back(recordsRoot_ / *filter.jobId);
        } else if (fs::exists(recordsRoot_)) {
            for (const auto& entry : fs::directory_iterator(recordsRoot_)) {
                if (entry.is_directory()) {
                    dirs.push_back(entry.path());
                }
            }
        }

        for (const auto& dir : dirs) {
            if (!fs::exists(dir)) {
                continue;
            }
            for (const auto& entry : fs::directory_iterator(dir)) {
                if (!entry.is_regular_file() || entry.path().extension() != ".rec") {
                    continue;
                }
                auto record = readRecordFile(entry.path());
                if (!record || !inWindow(record->finishedAt, filter.since, filter.until)) {
                    continue;
                }
                records.push_back(std::move(*record));
            }
        }

        std::sort(records.begin(), records.end(), [](const ExecutionRecord& a, const ExecutionRecord& b) {
            if (a.finishedAt != b.finishedAt) return a.finishedAt < b.finishedAt;
            if (a.jobId != b.jobId) return a.jobId < b.jobId;
            return a.attempt < b.attempt;
        });
        if (filter.limit > 0 && records.size() > filter.limit) {
            records.erase(records.begin(), records.end() - static_cast<std::ptrdiff_t>(filter.limit));
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Error listing execution records: " + std::string(e.what()));
    }
    return records;
}

bool FileStore::reachable() const noexcept {
    std::error_code ec;
    return fs::is_directory(jobsRoot_, ec) && fs::is_directory(recordsRoot_, ec);
}

std::size_t FileStore::countJobs(JobState state) const noexcept {
    std::size_t count = 0;
    try {
        auto dir = stateDir(state);
        if (!fs::exists(dir)) {
            return 0;
        }
        for (const auto& entry : fs::directory_iterator(dir)) {
            if (entry.is_directory()) {
                ++count;
            }
        }
    } catch (const std::exception& e) {
        LOG_WARN("Partial count for " + std::string(toString(state)) + " jobs: " + e.what());
    }
    return count;
}

std::filesystem::path FileStore::stateDir(JobState state) const {
    return jobsRoot_ / toString(state);
}

std::optional<std::filesystem::path> FileStore::locate(const JobId& id) const {
    for (JobState state : kStates) {
        auto dir = stateDir(state) / id;
        std::error_code ec;
        if (fs::is_directory(dir, ec)) {
            return dir;
        }
    }
    return std::nullopt;
}

std::optional<Job> FileStore::readJobDir(const std::filesystem::path& dir) const {
    std::ifstream meta(dir / "job.meta");
    if (!meta) {
        return std::nullopt;
    }
    Fields fields = parseFields(meta);

    auto state = parseJobState(fieldStr(fields, "state"));
    auto attempts = fieldInt(fields, "attempts");
    auto maxAttempts = fieldInt(fields, "max_attempts");
    auto enqueuedAt = fieldInt(fields, "enqueued_at");
    if (!state || !attempts || !maxAttempts || !enqueuedAt || fieldStr(fields, "id").empty()) {
        LOG_WARN("Malformed job.meta in " + dir.string());
        return std::nullopt;
    }

    Job job;
    job.id = fieldStr(fields, "id");
    job.state = *state;
    job.attempts = static_cast<int>(*attempts);
    job.maxAttempts = static_cast<int>(*maxAttempts);
    job.enqueuedAt = fromEpochMillis(*enqueuedAt);
    job.availableAt = fromEpochMillis(fieldInt(fields, "available_at").value_or(*enqueuedAt));

    auto leaseWorker = fieldStr(fields, "lease_worker");
    auto leaseAcquired = fieldInt(fields, "lease_acquired_at");
    auto leaseExpires = fieldInt(fields, "lease_expires_at");
    if (!leaseWorker.empty() && leaseAcquired && leaseExpires) {
        job.lease = Lease{job.id, leaseWorker, fromEpochMillis(*leaseAcquired), fromEpochMillis(*leaseExpires)};
    }

    auto payload = readFile(dir / "payload.bin");
    if (!payload) {
        return std::nullopt;
    }
    job.payload = std::move(*payload);
    job.lastError = readFile(dir / "error.txt").value_or("");
    job.result = readFile(dir / "result.txt").value_or("");

    // Moved away mid-read: some of the files above were missed.
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return std::nullopt;
    }
    return job;
}

bool FileStore::writeJobFiles(const std::filesystem::path& dir, const Job& job) const {
    // Meta last: it is the commit point for the other files.
    return writeFileAtomic(dir / "error.txt", job.lastError) &&
           writeFileAtomic(dir / "result.txt", job.result) &&
           writeFileAtomic(dir / "job.meta", encodeMeta(job));
}

std::optional<ExecutionRecord> FileStore::readRecordFile(const std::filesystem::path& file) const {
    std::ifstream in(file, std::ios::binary);
    if (!in) {
        return std::nullopt;
    }
    Fields fields = parseFields(in);
    std::string body((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    auto attempt = fieldInt(fields, "attempt");
    auto startedAt = fieldInt(fields, "started_at");
    auto finishedAt = fieldInt(fields, "finished_at");
    auto outcome = parseOutcome(fieldStr(fields, "outcome"));
    if (!attempt || !startedAt || !finishedAt || !outcome) {
        LOG_WARN("Malformed execution record: " + file.string());
        return std::nullopt;
    }

    ExecutionRecord record;
    record.jobId = fieldStr(fields, "job_id");
    record.attempt = static_cast<int>(*attempt);
    record.workerId = fieldStr(fields, "worker_id");
    record.startedAt = fromEpochMillis(*startedAt);
    record.finishedAt = fromEpochMillis(*finishedAt);
    record.outcome = *outcome;
    record.resultOrError = std::move(body);
    return record;
}

} // namespace quay
