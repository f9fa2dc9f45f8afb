/*
 * mtget - Bounded-concurrency transfer scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>

#include "mtget/types.hpp"

namespace mtget {

struct Report {
    std::size_t completed = 0;
    std::size_t failed = 0;
    std::size_t skipped = 0;
    std::size_t notDispatched = 0;
    std::size_t total = 0;
    std::size_t peakActive = 0;
    bool interrupted = false;
    bool overallSuccess = true;
};

// Tallies terminal results. Counts only ever grow.
class Aggregator {
public:
    explicit Aggregator(std::size_t total) noexcept : total_(total) {}

    void record(const TaskResult& result) noexcept;
    void markNotDispatched(std::size_t count) noexcept { notDispatched_ += count; }
    void markInterrupted() noexcept { interrupted_ = true; }
    void setPeakActive(std::size_t peak) noexcept { peakActive_ = peak; }

    [[nodiscard]] Report report() const noexcept;

private:
    std::size_t total_;
    std::size_t completed_ = 0;
    std::size_t failed_ = 0;
    std::size_t skipped_ = 0;
    std::size_t notDispatched_ = 0;
    std::size_t peakActive_ = 0;
    bool interrupted_ = false;
};

[[nodiscard]] ExitCode exitCodeFor(const Report& report) noexcept;

}
