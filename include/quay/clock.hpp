/*
 * quay - Leased Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <mutex>

#include "quay/types.hpp"

namespace quay {

// Wall-clock source for leases, delays and heartbeats.
class Clock {
public:
    virtual ~Clock() = default;
    [[nodiscard]] virtual TimePoint now() const = 0;
};

class SystemClock final : public Clock {
public:
    [[nodiscard]] TimePoint now() const override;
};

// Clock that only moves when told to. Used to drive expiry deterministically.
class ManualClock final : public Clock {
public:
    explicit ManualClock(TimePoint start = TimePoint(std::chrono::hours(24 * 365 * 50))) noexcept;

    [[nodiscard]] TimePoint now() const override;
    void advance(Millis delta);
    void set(TimePoint tp);

private:
    mutable std::mutex mutex_;
    TimePoint now_;
};

} // namespace quay
