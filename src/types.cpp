/*
 * mtget - Bounded-concurrency transfer scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "mtget/types.hpp"

namespace mtget {

bool isTerminal(TaskState state) noexcept {
    return state == TaskState::Completed || state == TaskState::Failed || state == TaskState::Skipped;
}

bool canTransition(TaskState from, TaskState to) noexcept {
    switch (from) {
        case TaskState::Pending:
            return to == TaskState::Dispatched || to == TaskState::Skipped;
        case TaskState::Dispatched:
        case TaskState::Retrying:
            return to == TaskState::Retrying || to == TaskState::Completed || to == TaskState::Failed;
        case TaskState::Completed:
        case TaskState::Failed:
        case TaskState::Skipped:
            return false;
    }
    return false;
}

const char* toString(TaskState state) noexcept {
    switch (state) {
        case TaskState::Pending:    return "pending";
        case TaskState::Dispatched: return "dispatched";
        case TaskState::Retrying:   return "retrying";
        case TaskState::Completed:  return "completed";
        case TaskState::Failed:     return "failed";
        case TaskState::Skipped:    return "skipped";
    }
    return "unknown";
}

const char* toString(Outcome outcome) noexcept {
    switch (outcome) {
        case Outcome::Completed: return "completed";
        case Outcome::Failed:    return "failed";
        case Outcome::Skipped:   return "skipped";
    }
    return "unknown";
}

}
