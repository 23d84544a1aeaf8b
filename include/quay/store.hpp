/*
 * quay - Leased Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <mutex>
#include <optional>
#include <vector>

#include "quay/job.hpp"

namespace quay {

// Durable record of jobs and execution history. The latest persisted Job is
// the source of truth after a restart.
class Store {
public:
    virtual ~Store() = default;

    [[nodiscard]] virtual bool persist(const Job& job) noexcept = 0;
    // Fails if a record for (jobId, attempt) already exists.
    [[nodiscard]] virtual bool persist(const ExecutionRecord& record) noexcept = 0;

    [[nodiscard]] virtual std::optional<Job> loadJob(const JobId& id) const noexcept = 0;
    // Ordered by enqueue time; limit keeps the oldest matches.
    [[nodiscard]] virtual std::vector<Job> listJobs(const JobFilter& filter = {}) const noexcept = 0;
    // Ordered by finish time, then attempt; limit keeps the newest matches.
    [[nodiscard]] virtual std::vector<ExecutionRecord> listRecords(const RecordFilter& filter = {}) const noexcept = 0;

    [[nodiscard]] virtual bool reachable() const noexcept = 0;
};

// Store laid out as a workspace directory:
//
//   jobs/<state>/<id>/{job.meta,payload.bin,error.txt,result.txt}
//   jobs/.staging/<id>/       new jobs are assembled here, then renamed in
//   records/<id>/<attempt>.rec
//
// job.meta is replaced by rename and written before the job directory moves,
// so a crash between the two leaves the meta ahead of the directory. open()
// moves such directories to where their meta says they belong.
class FileStore final : public Store {
public:
    explicit FileStore(const std::filesystem::path& workspace) noexcept;

    FileStore(const FileStore&) = delete;
    FileStore& operator=(const FileStore&) = delete;

    // Creates the layout and repairs interrupted moves. Read-only users
    // (status tools) may skip it.
    [[nodiscard]] bool open() noexcept;

    [[nodiscard]] bool persist(const Job& job) noexcept override;
    [[nodiscard]] bool persist(const ExecutionRecord& record) noexcept override;

    [[nodiscard]] std::optional<Job> loadJob(const JobId& id) const noexcept override;
    [[nodiscard]] std::vector<Job> listJobs(const JobFilter& filter = {}) const noexcept override;
    [[nodiscard]] std::vector<ExecutionRecord> listRecords(const RecordFilter& filter = {}) const noexcept override;

    [[nodiscard]] bool reachable() const noexcept override;

    // Directory count for one state, without reading any meta. May lag the
    // meta by one in-flight move.
    [[nodiscard]] std::size_t countJobs(JobState state) const noexcept;

    [[nodiscard]] const std::filesystem::path& workspace() const noexcept { return workspace_; }

private:
    std::filesystem::path workspace_;
    std::filesystem::path jobsRoot_;
    std::filesystem::path recordsRoot_;
    mutable std::mutex mutex_;

    [[nodiscard]] std::filesystem::path stateDir(JobState state) const;
    [[nodiscard]] std::optional<std::filesystem::path> locate(const JobId& id) const;
    [[nodiscard]] std::optional<Job> readJobDir(const std::filesystem::path& dir) const;
    [[nodiscard]] bool writeJobFiles(const std::filesystem::path& dir, const Job& job) const;
    [[nodiscard]] std::optional<ExecutionRecord> readRecordFile(const std::filesystem::path& file) const;
};

} // namespace quay
