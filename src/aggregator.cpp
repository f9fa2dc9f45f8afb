/*
 * mtget - Bounded-concurrency transfer scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "mtget/aggregator.hpp"

namespace mtget {

void Aggregator::record(const TaskResult& result) noexcept {
    switch (result.outcome) {
        case Outcome::Completed: ++completed_; break;
        case Outcome::Failed:    ++failed_;    break;
        case Outcome::Skipped:   ++skipped_;   break;
    }
}

Report Aggregator::report() const noexcept {
    Report report;
    report.completed = completed_;
    report.failed = failed_;
    report.skipped = skipped_;
    report.notDispatched = notDispatched_;
    report.total = total_;
    report.peakActive = peakActive_;
    report.interrupted = interrupted_;
    report.overallSuccess = failed_ == 0;
    return report;
}

ExitCode exitCodeFor(const Report& report) noexcept {
    if (report.interrupted) {
        return ExitCode::Interrupted;
    }
    return report.failed == 0 ? ExitCode::Success : ExitCode::Failure;
}

}
