/*
 * quay - Queue and worker monitor (qmon)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "quay/clock.hpp"
#include "quay/logger.hpp"
#include "quay/monitor.hpp"
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

using namespace quay;

void printUsage(const char* progName) {
    std::cout << "quay Monitor\n\n";
    std::cout << "Usage: " << progName << " <workspace> [--health | --ready] [-n <count>]\n\n";
    std::cout << "Without options prints queue depth per state, live workers and the most\n";
    std::cout << "recent executions.\n\n";
    std::cout << "Options:\n";
    std::cout << "  --health      Exit 0 if the daemon is live, 1 otherwise\n";
    std::cout << "  --ready       Exit 0 if the daemon is live and accepting jobs, 1 otherwise\n";
    std::cout << "  -n <count>    Recent executions to list (default 10)\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  QUAY_LOG_LEVEL    Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n";
}

std::string formatTime(TimePoint tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
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
    bool probeHealth = false;
    bool probeReady = false;
    std::size_t recent = 10;

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--health") {
            probeHealth = true;
        } else if (arg == "--ready") {
            probeReady = true;
        } else if (arg == "-n" && i + 1 < argc) {
            const std::string count = argv[++i];
            try {
                recent = count.empty() || count[0] == '-' ? 0 : static_cast<std::size_t>(std::stoul(count));
            } catch (const std::exception&) {
                recent = 0;
            }
            if (recent == 0) {
                std::cerr << "Error: Invalid count (must be a positive number)\n";
                return 1;
            }
        } else if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else {
            std::cerr << "Error: Unknown option: " << arg << "\n";
            return 1;
        }
    }

    try {
        SystemClock clock;
        Monitor monitor(workspace, clock);
        Health health = monitor.health();

        if (probeHealth || probeReady) {
            bool ok = probeReady ? health.ready : health.live;
            std::cout << (ok ? "ok" : "unavailable") << " (" << health.readiness
                      << (health.stale ? ", stale" : "") << ")\n";
            return ok ? 0 : 1;
        }

        std::cout << "quay Worker Distribution Monitor\n";
        std::cout << "================================\n\n";

        std::cout << "Daemon: " << (health.live ? "live" : "down") << ", " << health.readiness;
        if (health.updatedAt) {
            std::cout << " (updated " << formatTime(*health.updatedAt) << ")";
        }
        std::cout << "\n\n";

        QueueCounts depth = monitor.depth();
        std::cout << "Queue:\n";
        std::cout << "  pending    " << monitor.pendingCount() << "\n";
        std::cout << "  waiting    " << depth.waiting << "\n";
        std::cout << "  delayed    " << depth.delayed << "\n";
        std::cout << "  active     " << depth.active << "\n";
        std::cout << "  completed  " << depth.completed << "\n";
        std::cout << "  failed     " << depth.failed << "\n\n";

        auto workers = monitor.workers();
        std::cout << "Workers (" << monitor.liveWorkerCount() << " live):\n";
        for (const auto& w : workers) {
            std::cout << "  " << std::left << std::setw(12) << w.id << std::setw(6) << toString(w.status)
                      << " " << (w.currentJob ? *w.currentJob : "-") << "\n";
        }
        std::cout << "\n";

        auto records = monitor.recentRecords(recent);
        std::cout << "Recent executions (last " << recent << "):\n";
        for (auto it = records.rbegin(); it != records.rend(); ++it) {
            std::cout << "  " << formatTime(it->startedAt) << "  " << std::left << std::setw(8)
                      << toString(it->outcome) << it->jobId << "#" << it->attempt << "  " << it->workerId << "\n";
        }
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
