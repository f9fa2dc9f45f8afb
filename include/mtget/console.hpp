/*
 * mtget - Bounded-concurrency transfer scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <mutex>
#include <ostream>
#include <string>

#include "mtget/types.hpp"

namespace mtget {

struct Report;

// Per-task status lines and the final summary. Safe to call from workers.
class Console {
public:
    explicit Console(std::ostream& out, bool color);

    void running(const Task& task, int attempt);
    void retry(const Task& task, int attempt, const std::string& reason, std::chrono::milliseconds wait);
    void done(const Task& task, double seconds);
    void failed(const Task& task, int attempts, const std::string& reason);
    void skipped(const Task& task);

    void summary(const Report& report, double seconds);

private:
    void line(const char* color, const Task& task, const char* word, const std::string& detail);
    const char* paint(const char* code) const noexcept { return color_ ? code : ""; }

    std::ostream& out_;
    bool color_;
    std::mutex mutex_;
};

[[nodiscard]] std::string timestamp();

}
