/*
 * mtget - Bounded-concurrency transfer scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <filesystem>
#include <string>

namespace mtget {

// Submission index; also the FIFO dispatch order.
using TaskId = std::uint32_t;

// Per-task lifecycle. Completed, Failed and Skipped are terminal.
enum class TaskState : std::uint8_t { Pending, Dispatched, Retrying, Completed, Failed, Skipped };

enum class Outcome : std::uint8_t { Completed, Failed, Skipped };

struct Task {
    TaskId id = 0;
    std::string source;
    std::filesystem::path destination;
};

struct TaskResult {
    TaskId id = 0;
    Outcome outcome = Outcome::Failed;
    int attempts = 0;
    bool interrupted = false;
    std::string error;
};

enum ExitCode : int {
    Success = 0,
    Failure = 1,
    Interrupted = 130
};

// Completed, Failed and Skipped accept no further transitions.
[[nodiscard]] bool isTerminal(TaskState state) noexcept;
[[nodiscard]] bool canTransition(TaskState from, TaskState to) noexcept;

[[nodiscard]] const char* toString(TaskState state) noexcept;
[[nodiscard]] const char* toString(Outcome outcome) noexcept;

} // namespace mtget
