/*
 * quay - Job submission tool (qsub)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "quay/config.hpp"
#include "quay/inbox.hpp"
#include "quay/logger.hpp"
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <iterator>
#include <sstream>
#include <unistd.h>

using namespace quay;

constexpr const char* VERSION = "0.1.0";

void printUsage(const char* progName) {
    std::cout << "quay Job Submission Tool v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " <workspace> <command...> [options]\n";
    std::cout << "       " << progName << " <workspace> -     (read command from stdin)\n";
    std::cout << "       " << progName << " --help | --version\n\n";
    std::cout << "Arguments:\n";
    std::cout << "  workspace     Directory shared with quayd\n";
    std::cout << "  command       Shell command to run (can be multiple words)\n";
    std::cout << "  -             Read command from stdin\n\n";
    std::cout << "Options:\n";
    std::cout << "  --max-attempts <n>  Attempts before the job fails (default QUAY_MAX_ATTEMPTS or 3)\n";
    std::cout << "  --delay <s>         Seconds before the job becomes claimable\n";
    std::cout << "  --id <id>           Explicit job id; resubmitting the same id is refused\n";
    std::cout << "  -h, --help          Show this help message\n";
    std::cout << "  -v, --version       Show version\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  QUAY_LOG_LEVEL    Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progName << " ./workspace echo hello\n";
    std::cout << "  " << progName << " ./workspace \"curl -fsS https://example.com\" --max-attempts 5\n";
    std::cout << "  echo \"make -C build\" | " << progName << " ./workspace -\n";
}

int main(int argc, char* argv[]) {
    // Default to WARN for clean piping; QUAY_LOG_LEVEL overrides
    if (std::getenv("QUAY_LOG_LEVEL")) {
        Logger::initFromEnv();
    } else {
        Logger::setLevel(LogLevel::WARN);
    }

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

    std::string workspace = argv[1];
    EnqueueOptions options;
    bool readStdin = argc == 2 && !isatty(fileno(stdin));
    std::ostringstream commandStream;
    bool first = true;

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--max-attempts" && i + 1 < argc) {
            try {
                options.maxAttempts = std::stoi(argv[++i]);
            } catch (...) {
                std::cerr << "Error: Invalid attempt count\n";
                return 1;
            }
        } else if (arg == "--delay" && i + 1 < argc) {
            try {
                options.delay = std::chrono::seconds(std::stol(argv[++i]));
            } catch (...) {
                std::cerr << "Error: Invalid delay\n";
                return 1;
            }
        } else if (arg == "--id" && i + 1 < argc) {
            options.id = std::string(argv[++i]);
        } else if (arg == "-" && first) {
            readStdin = true;
        } else {
            if (!first) commandStream << " ";
            commandStream << arg;
            first = false;
        }
    }

    std::string command;
    if (readStdin) {
        command.assign((std::istreambuf_iterator<char>(std::cin)),
                       std::istreambuf_iterator<char>());
        if (!command.empty() && command.back() == '\n') {
            command.pop_back();
        }
    } else {
        command = commandStream.str();
    }

    if (command.empty()) {
        std::cerr << "Error: Empty command provided\n";
        return 1;
    }

    try {
        Inbox inbox(workspace, true);
        inbox.setMaxSize(Config::fromEnv().queue.maxPayloadBytes);

        auto result = inbox.submit(command, options);
        if (result.ok) {
            // Just the job ID - clean for piping, no noise
            std::cout << result.id << std::endl;
            return 0;
        }
        std::cerr << "Error: " << result.message << std::endl;
        return 1;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
