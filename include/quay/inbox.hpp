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

#include "quay/queue.hpp"

namespace quay {

enum class SubmissionError : uint8_t {
    None = 0,
    IoError,
    InvalidSize,
    InvalidContent,
    InvalidOptions,
    Duplicate,
    WorkspaceError
};

[[nodiscard]] const char* toString(SubmissionError error) noexcept;

struct SubmitResult {
    bool ok = false;
    JobId id;
    SubmissionError error = SubmissionError::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

// A submission that has been published but not yet taken in by the daemon.
struct PendingSubmission {
    JobId id;
    std::string payload;
    EnqueueOptions options;
};

// Cross-process drop-box in front of the Queue:
//
//   inbox/writing/<id>/{payload.bin,options.meta}   being written
//   inbox/ready/<id>/                              published by rename
//
// Producers only ever see their submission appear in ready/ complete. The
// daemon takes ready entries into the Queue under the same id.
class Inbox final {
public:
    explicit Inbox(const std::filesystem::path& workspace, bool createIfMissing = true);

    Inbox(const Inbox&) = delete;
    Inbox& operator=(const Inbox&) = delete;
    Inbox(Inbox&&) noexcept = default;
    Inbox& operator=(Inbox&&) noexcept = default;

    // options.id makes the submission idempotent: an id already in the inbox
    // or in the workspace's job store is refused with Duplicate.
    [[nodiscard]] SubmitResult submit(const std::string& payload, const EnqueueOptions& options = {});

    // Ready ids, oldest first.
    [[nodiscard]] std::vector<JobId> scan() const noexcept;
    [[nodiscard]] std::optional<PendingSubmission> load(const JobId& id) const noexcept;
    [[nodiscard]] bool contains(const JobId& id) const noexcept;

    // Enqueues every ready submission and removes it from the inbox.
    // Stops early while the queue is draining. Returns the number accepted.
    std::size_t accept(Queue& queue);

    void setMaxSize(std::size_t maxBytes) noexcept { maxBytes_ = maxBytes; }
    [[nodiscard]] std::size_t maxSize() const noexcept { return maxBytes_; }
    [[nodiscard]] bool ready() const noexcept { return ready_; }

private:
    std::filesystem::path workspace_;
    std::filesystem::path writingPath_;
    std::filesystem::path readyPath_;
    std::size_t maxBytes_ = 10'000'000; // 10MB
    bool ready_ = false;

    [[nodiscard]] bool createWorkspace(bool createIfMissing) noexcept;
    [[nodiscard]] bool writeFiles(const std::filesystem::path& dir, const std::string& payload,
                                  const EnqueueOptions& options) const noexcept;
    [[nodiscard]] bool atomicPublish(const JobId& jobId) const noexcept;
    void remove(const JobId& jobId) const noexcept;
    void cleanupFailedJob(const JobId& jobId) const noexcept;
};

} // namespace quay
