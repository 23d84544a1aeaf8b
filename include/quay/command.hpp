/*
 * quay - Leased Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <string>

#include "quay/supervisor.hpp"

namespace quay {

struct CommandConfig {
    std::string shell = "/bin/sh";
    std::size_t maxOutputBytes = 1 << 20;
    // Time between SIGTERM and SIGKILL once the attempt is cancelled.
    Millis termGrace{1000};
};

// Handler that runs the payload as `shell -c <payload>` in its own process
// group. stdout becomes the result; a non-zero exit fails the attempt with
// the tail of stderr. QUAY_JOB_ID and QUAY_ATTEMPT are exported to the child.
class CommandHandler {
public:
    explicit CommandHandler(CommandConfig config = {});

    HandlerResult operator()(const Job& job, const CancelToken& token) const;

private:
    CommandConfig config_;
};

} // namespace quay
