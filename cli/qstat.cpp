/*
 * quay - Job status tool (qstat)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "quay/clock.hpp"
#include "quay/logger.hpp"
#include "quay/monitor.hpp"
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <thread>
#include <unistd.h>

using namespace quay;

void printUsage(const char* progName) {
    std::cout << "quay Job Status Tool\n\n";
    std::cout << "Usage: " << progName << " <workspace> <job_id> [--wait] [--history]\n\n";
    std::cout << "Arguments:\n";
    std::cout << "  workspace     Directory shared with quayd\n";
    std::cout << "  job_id        Job to inspect (read from stdin when piped)\n\n";
    std::cout << "Options:\n";
    std::cout << "  -w, --wait    Block until the job completes or fails\n";
    std::cout << "  --history     Print every execution attempt\n\n";
    std::cout << "Exit status:\n";
    std::cout << "  0 completed (result on stdout), 1 failed or missing, 2 not finished\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  QUAY_LOG_LEVEL    Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progName << " ./workspace 1731808123456_12345_0\n";
    std::cout << "  qsub ./workspace echo hi | " << progName << " ./workspace --wait\n";
}

int main(int argc, char* argv[]) {
    if (std::getenv("QUAY_LOG_LEVEL")) {
        Logger::initFromEnv();
    } else {
        Logger::setLevel(LogLevel::WARN);
    }

    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    std::string workspace = argv[1];
    std::string jobId;
    bool wait = false;
    bool history = false;

    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "-w" || arg == "--wait") {
            wait = true;
        } else if (arg == "--history") {
            history = true;
        } else if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else {
            jobId = arg;
        }
    }

    // Check piped input for JobID if not provided
    if (jobId.empty() && !isatty(fileno(stdin))) {
        std::cin >> jobId;
    }
    if (jobId.empty()) {
        printUsage(argv[0]);
        return 1;
    }

    try {
        SystemClock clock;
        Monitor monitor(workspace, clock);

        auto job = monitor.job(jobId);
        while (wait && (!job || !isTerminal(job->state))) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            job = monitor.job(jobId);
        }

        if (!job) {
            std::cerr << "Job not found: " << jobId << std::endl;
            return 1;
        }

        if (history) {
            for (const auto& record : monitor.recordsFor(jobId)) {
                std::cerr << "attempt " << record.attempt << "  " << toString(record.outcome)
                          << "  " << record.workerId << "  "
                          << std::chrono::duration_cast<Millis>(record.finishedAt - record.startedAt).count()
                          << "ms\n";
            }
        }

        if (job->state == JobState::Completed) {
            std::cout << job->result;
            if (!job->result.empty() && job->result.back() != '\n') {
                std::cout << std::endl;
            }
            return 0;
        }
        if (job->state == JobState::Failed) {
            std::cerr << "Job failed: " << jobId << " after " << job->attempts << " attempt(s)" << std::endl;
            if (!job->lastError.empty()) {
                std::cerr << "Error: " << job->lastError << std::endl;
            }
            return 1;
        }

        std::cerr << "Job not ready: " << jobId << " (state: " << toString(job->state)
                  << ", attempts: " << job->attempts << "/" << job->maxAttempts << ")";
        if (!job->lastError.empty()) {
            std::cerr << " last error: " << job->lastError;
        }
        std::cerr << std::endl;
        return 2;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
