/*
 * quay - Leased Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "quay/inbox.hpp"
#include "quay/logger.hpp"
#include "quay/store.hpp"
#include <algorithm>
#include <fstream>
#include <iterator>
#include <sstream>

namespace quay {

namespace {
constexpr const char* kPayloadFile = "payload.bin";
constexpr const char* kOptionsFile = "options.meta";

bool writeFile(const std::filesystem::path& path, const std::string& content) noexcept {
    try {
        std::ofstream file(path, std::ios::binary);
        if (!file) return false;

        file << content;
        file.flush();
        file.close();

        return file.good();
    } catch (const std::exception&) {
        return false;
    }
}

std::optional<std::string> readFile(const std::filesystem::path& path) noexcept {
    try {
        std::ifstream file(path, std::ios::binary);
        if (!file) return std::nullopt;
        return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    } catch (const std::exception&) {
        return std::nullopt;
    }
}
}

const char* toString(SubmissionError error) noexcept {
    switch (error) {
        case SubmissionError::None: return "none";
        case SubmissionError::IoError: return "io error";
        case SubmissionError::InvalidSize: return "invalid size";
        case SubmissionError::InvalidContent: return "invalid content";
        case SubmissionError::InvalidOptions: return "invalid options";
        case SubmissionError::Duplicate: return "duplicate";
        case SubmissionError::WorkspaceError: return "workspace error";
        default: return "unknown";
    }
}

Inbox::Inbox(const std::filesystem::path& workspace, bool createIfMissing)
    : workspace_(workspace),
      writingPath_(workspace / "inbox" / "writing"),
      readyPath_(workspace / "inbox" / "ready") {
    ready_ = createWorkspace(createIfMissing);
    if (!ready_ && createIfMissing) {
        LOG_ERROR("Failed to initialize inbox: " + workspace_.string());
    }
}

SubmitResult Inbox::submit(const std::string& payload, const EnqueueOptions& options) {
    if (!ready_) {
        return {false, "", SubmissionError::WorkspaceError, "Workspace not initialized: " + workspace_.string()};
    }
    if (payload.empty()) {
        LOG_DEBUG("Invalid payload: empty");
        return {false, "", SubmissionError::InvalidContent, "Payload is empty"};
    }
    if (payload.size() > maxBytes_) {
        LOG_DEBUG("Payload exceeds size limit: " + std::to_string(payload.size()) + " > " + std::to_string(maxBytes_));
        return {false, "", SubmissionError::InvalidSize,
                "Payload exceeds maximum size limit (" + std::to_string(maxBytes_) + " bytes)"};
    }
    if (options.maxAttempts && *options.maxAttempts < 1) {
        return {false, "", SubmissionError::InvalidOptions, "max attempts must be at least 1"};
    }
    if (options.delay.count() < 0) {
        return {false, "", SubmissionError::InvalidOptions, "delay must not be negative"};
    }

    JobId jobId = options.id ? *options.id : generateJobId();
    if (!isValidJobId(jobId)) {
        return {false, "", SubmissionError::InvalidOptions, "Invalid job id: " + jobId};
    }
    if (contains(jobId)) {
        return {false, jobId, SubmissionError::Duplicate, "Job already submitted: " + jobId};
    }
    if (options.id && FileStore(workspace_).loadJob(jobId)) {
        return {false, jobId, SubmissionError::Duplicate, "Job already in the queue: " + jobId};
    }
    LOG_DEBUG("Submitting job ID: " + jobId);

    std::error_code ec;
    auto dir = writingPath_ / jobId;
    if (!std::filesystem::create_directory(dir, ec) || ec) {
        // An existing writing/ entry means a concurrent submit of the same id.
        if (!ec) {
            return {false, jobId, SubmissionError::Duplicate, "Job already being submitted: " + jobId};
        }
        LOG_ERROR("Failed to create job directory for: " + jobId);
        return {false, "", SubmissionError::IoError, "Failed to create job directory"};
    }

    if (!writeFiles(dir, payload, options)) {
        LOG_ERROR("Failed to write submission files for: " + jobId);
        cleanupFailedJob(jobId);
        return {false, "", SubmissionError::IoError, "Failed to write submission files"};
    }

    if (!atomicPublish(jobId)) {
        cleanupFailedJob(jobId);
        if (contains(jobId)) {
            return {false, jobId, SubmissionError::Duplicate, "Job already submitted: " + jobId};
        }
        LOG_ERROR("Failed to publish job: " + jobId);
        return {false, "", SubmissionError::IoError, "Failed to publish job"};
    }

    LOG_INFO("Job submitted: " + jobId);
    return {true, jobId, SubmissionError::None, ""};
}

std::vector<JobId> Inbox::scan() const noexcept {
    std::vector<JobId> jobs;
    try {
        if (!std::filesystem::exists(readyPath_)) {
            LOG_DEBUG("Ready directory does not exist: " + readyPath_.string());
            return jobs;
        }
        for (const auto& entry : std::filesystem::directory_iterator(readyPath_)) {
            if (entry.is_directory() && std::filesystem::is_regular_file(entry.path() / kPayloadFile)) {
                jobs.push_back(entry.path().filename().string());
            }
        }
        // Generated ids start with a timestamp, so this is submission order.
        std::sort(jobs.begin(), jobs.end());
    } catch (const std::exception& e) {
        LOG_ERROR("Inbox scan error: " + std::string(e.what()));
    }
    return jobs;
}

std::optional<PendingSubmission> Inbox::load(const JobId& id) const noexcept {
    try {
        auto dir = readyPath_ / id;
        auto payload = readFile(dir / kPayloadFile);
        if (!payload) {
            return std::nullopt;
        }

        PendingSubmission pending;
        pending.id = id;
        pending.payload = std::move(*payload);
        pending.options.id = id;

        std::istringstream meta(readFile(dir / kOptionsFile).value_or(""));
        std::string line;
        while (std::getline(meta, line)) {
            auto eq = line.find('=');
            if (eq == std::string::npos) continue;
            const std::string key = line.substr(0, eq);
            const std::string value = line.substr(eq + 1);
            if (key == "max_attempts" && !value.empty()) {
                pending.options.maxAttempts = std::stoi(value);
            } else if (key == "delay_ms") {
                pending.options.delay = Millis(std::stoll(value));
            }
        }
        return pending;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to load submission " + id + ": " + e.what());
        return std::nullopt;
    }
}

bool Inbox::contains(const JobId& id) const noexcept {
    std::error_code ec;
    return std::filesystem::exists(readyPath_ / id, ec);
}

std::size_t Inbox::accept(Queue& queue) {
    std::size_t accepted = 0;
    for (const auto& id : scan()) {
        if (queue.isDraining()) {
            break;
        }
        if (queue.get(id)) {
            // Already enqueued; the daemon stopped before removing the entry,
            // or the same id raced past submit().
            LOG_WARN("Dropping inbox entry for job already in the queue: " + id);
            remove(id);
            continue;
        }

        auto pending = load(id);
        if (!pending) {
            LOG_WARN("Unreadable inbox entry left in place: " + id);
            continue;
        }

        auto result = queue.enqueue(std::move(pending->payload), pending->options);
        if (!result) {
            if (result.error == ErrorKind::Draining) {
                break;
            }
            if (result.error == ErrorKind::TransientError) {
                LOG_WARN("Inbox entry " + id + " not accepted yet: " + result.message);
                continue;
            }
            LOG_ERROR("Inbox entry " + id + " rejected: " + result.message);
            remove(id);
            continue;
        }
        remove(id);
        ++accepted;
    }
    if (accepted > 0) {
        LOG_DEBUG("Accepted " + std::to_string(accepted) + " submissions from inbox");
    }
    return accepted;
}

bool Inbox::createWorkspace(bool createIfMissing) noexcept {
    try {
        if (!std::filesystem::exists(workspace_)) {
            if (!createIfMissing) {
                return false;
            }
            std::filesystem::create_directories(workspace_);
        }

        std::filesystem::create_directories(writingPath_);
        std::filesystem::create_directories(readyPath_);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to create inbox: " + std::string(e.what()));
        return false;
    }
}

bool Inbox::writeFiles(const std::filesystem::path& dir, const std::string& payload,
                       const EnqueueOptions& options) const noexcept {
    try {
        std::ostringstream meta;
        if (options.maxAttempts) {
            meta << "max_attempts=" << *options.maxAttempts << "\n";
        }
        meta << "delay_ms=" << options.delay.count() << "\n";
        return writeFile(dir / kPayloadFile, payload) && writeFile(dir / kOptionsFile, meta.str());
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Failed to stage submission: ") + e.what());
        return false;
    }
}

bool Inbox::atomicPublish(const JobId& jobId) const noexcept {
    try {
        auto writingPath = writingPath_ / jobId;
        auto readyPath = readyPath_ / jobId;

        // rename(2) would replace an empty directory; a published entry never is one.
        std::filesystem::rename(writingPath, readyPath);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Failed to publish submission: ") + e.what());
        return false;
    }
}

void Inbox::remove(const JobId& jobId) const noexcept {
    std::error_code ec;
    std::filesystem::remove_all(readyPath_ / jobId, ec);
    if (ec) {
        LOG_WARN("Failed to remove inbox entry " + jobId + ": " + ec.message());
    }
}

void Inbox::cleanupFailedJob(const JobId& jobId) const noexcept {
    std::error_code ec;
    std::filesystem::remove_all(writingPath_ / jobId, ec);
}

} // namespace quay
