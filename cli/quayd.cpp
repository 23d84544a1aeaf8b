/*
 * quay - Server daemon (quayd)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "quay/command.hpp"
#include "quay/config.hpp"
#include "quay/logger.hpp"
#include "quay/server.hpp"
#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <unistd.h>

using namespace quay;

constexpr const char* VERSION = "0.1.0";

// Async-signal-safe: only set flag, no complex operations
static volatile sig_atomic_t g_shutdown_requested = 0;

void signalHandler(int signal) {
    (void)signal;
    g_shutdown_requested = 1;
}

void printUsage(const char* progName) {
    std::cout << "quay daemon v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " <workspace> [options]\n\n";
    std::cout << "Arguments:\n";
    std::cout << "  workspace          Directory for queue storage (created if missing)\n\n";
    std::cout << "Options:\n";
    std::cout << "  -w, --workers <n>  Worker slots (default 4)\n";
    std::cout << "  --lease <s>        Lease duration in seconds (default 30)\n";
    std::cout << "  --timeout <s>      Execution timeout in seconds (default 25)\n";
    std::cout << "  -h, --help         Show this help message\n";
    std::cout << "  -v, --version      Show version\n\n";
    std::cout << "Each job payload is run with /bin/sh -c. SIGINT or SIGTERM drains the\n";
    std::cout << "queue, waits for running jobs, then exits.\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  QUAY_LOG_LEVEL        Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n";
    std::cout << "  QUAY_LEASE_MS         Lease duration\n";
    std::cout << "  QUAY_TIMEOUT_MS       Execution timeout\n";
    std::cout << "  QUAY_GRACE_MS         Cancel grace before an attempt is abandoned\n";
    std::cout << "  QUAY_HEARTBEAT_MS     Worker heartbeat interval\n";
    std::cout << "  QUAY_REAPER_MS        Maintenance (reaper) interval\n";
    std::cout << "  QUAY_BACKOFF_BASE_MS  First retry delay\n";
    std::cout << "  QUAY_BACKOFF_MAX_MS   Retry delay cap\n";
    std::cout << "  QUAY_MAX_ATTEMPTS     Default attempts per job\n";
    std::cout << "  QUAY_MAX_PAYLOAD      Maximum payload size in bytes\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progName << " ./workspace\n";
    std::cout << "  " << progName << " ./workspace -w 8 --lease 60 --timeout 50\n";
}

std::optional<long> parseSeconds(const std::string& text) {
    try {
        std::size_t pos = 0;
        long value = std::stol(text, &pos);
        if (pos != text.size() || value <= 0) {
            return std::nullopt;
        }
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

int main(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "-v" || arg == "--version") {
            std::cout << VERSION << "\n";
            return 0;
        }
    }

    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    Logger::initFromEnv();

    std::string workspace = argv[1];
    Config config = Config::fromEnv();
    bool leaseGiven = false;

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-w" || arg == "--workers") && i + 1 < argc) {
            try {
                config.pool.slots = std::stoi(argv[++i]);
            } catch (...) {
                std::cerr << "Error: Invalid worker count\n";
                return 1;
            }
        } else if (arg == "--lease" && i + 1 < argc) {
            auto secs = parseSeconds(argv[++i]);
            if (!secs) {
                std::cerr << "Error: Invalid lease duration\n";
                return 1;
            }
            config.supervisor.leaseDuration = std::chrono::seconds(*secs);
            leaseGiven = true;
        } else if (arg == "--timeout" && i + 1 < argc) {
            auto secs = parseSeconds(argv[++i]);
            if (!secs) {
                std::cerr << "Error: Invalid timeout\n";
                return 1;
            }
            config.supervisor.executionTimeout = std::chrono::seconds(*secs);
        } else {
            std::cerr << "Error: Unknown option: " << arg << "\n";
            return 1;
        }
    }

    // A short --lease pulls the heartbeat and reaper cadence and the cancel
    // grace down with it.
    if (leaseGiven) {
        const auto limit = config.supervisor.renewInterval() / 2;
        config.coordinator.heartbeatInterval = std::min(config.coordinator.heartbeatInterval, limit);
        config.reaperInterval = std::min(config.reaperInterval, limit);
        const auto slack = config.supervisor.leaseDuration - config.supervisor.renewInterval();
        config.supervisor.cancelGrace = std::min(config.supervisor.cancelGrace, slack / 2);
    }

    auto problems = config.validate();
    if (!problems.empty()) {
        for (const auto& problem : problems) {
            std::cerr << "Error: " << problem << "\n";
        }
        return 1;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    try {
        CommandConfig commandConfig;
        commandConfig.termGrace = std::max(config.supervisor.cancelGrace / 2, Millis(100));
        Server server(workspace, config, CommandHandler(commandConfig));

        if (!server.start()) {
            std::cerr << "Failed to start\n";
            return 1;
        }

        std::filesystem::path pidPath = std::filesystem::path(workspace) / ".quayd.pid";
        {
            std::ofstream pf(pidPath);
            if (pf) {
                pf << getpid();
            }
        }

        std::cout << "quayd " << VERSION << " running\n";
        std::cout << "  Workspace  " << workspace << "\n";
        std::cout << "  Workers    " << config.pool.slots << "\n";
        std::cout << "  Lease      " << config.supervisor.leaseDuration.count() << "ms\n";
        std::cout << "  Timeout    " << config.supervisor.executionTimeout.count() << "ms\n";
        std::cout << "  Submit:  qsub " << workspace << " <command...>\n";
        std::cout << "  Status:  qstat " << workspace << " <job-id>\n";
        std::cout << "  Monitor: qmon " << workspace << "\n" << std::flush;

        while (!g_shutdown_requested && server.isRunning()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        if (g_shutdown_requested) {
            std::cout << "\nShutdown requested, draining..." << std::endl;
        }
        LOG_DEBUG("Shutdown requested, stopping server...");
        server.shutdown();
        {
            std::error_code ec;
            std::filesystem::remove(pidPath, ec);
        }

    } catch (const std::exception& e) {
        LOG_ERROR("Server error: " + std::string(e.what()));
        return 1;
    }

    LOG_DEBUG("quay daemon stopped");
    return 0;
}
