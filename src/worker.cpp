/*
 * mtget - Bounded-concurrency transfer scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "mtget/worker.hpp"
#include "mtget/console.hpp"
#include "mtget/logger.hpp"
#include "mtget/transfer.hpp"
#include <algorithm>
#include <thread>

namespace mtget {

namespace {
constexpr auto kSleepSlice = std::chrono::milliseconds(50);

std::string taskLabel(const Task& task) {
    return "task " + std::to_string(task.id) + " (" + task.source + ")";
}
}

bool interruptibleSleep(std::chrono::milliseconds delay, const std::atomic<bool>& stop) {
    auto sleepEnd = std::chrono::steady_clock::now() + delay;
    while (!stop.load()) {
        auto now = std::chrono::steady_clock::now();
        if (now >= sleepEnd) {
            return true;
        }
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(sleepEnd - now);
        std::this_thread::sleep_for(std::min(left, std::chrono::milliseconds(kSleepSlice)));
    }
    return false;
}

Worker::Worker(TransferExecutor& executor, const RetryPolicy& policy, const TransferOptions& options,
               const std::atomic<bool>& stop, Console* console, BackoffSleeper sleeper)
    : executor_(executor), policy_(policy), options_(options), stop_(stop), console_(console),
      sleeper_(std::move(sleeper)) {
    if (!sleeper_) {
        sleeper_ = [this](std::chrono::milliseconds delay) { return interruptibleSleep(delay, stop_); };
    }
}

TaskResult Worker::run(const Task& task) noexcept {
    TaskResult result;
    result.id = task.id;
    result.outcome = Outcome::Failed;

    auto interrupted = [&]() {
        result.interrupted = true;
        result.error = "interrupted";
        LOG_INFO("Interrupted " + taskLabel(task) + " after " + std::to_string(result.attempts) + " attempt(s)");
        return result;
    };

    try {
        const int limit = policy_.attemptLimit();
        auto startTime = std::chrono::steady_clock::now();

        for (int attempt = 1; attempt <= limit; ++attempt) {
            if (stop_.load()) {
                return interrupted();
            }

            result.attempts = attempt;
            if (console_) console_->running(task, attempt);

            TransferOutcome outcome;
            try {
                outcome = executor_.transfer(task, options_, stop_);
            } catch (const std::exception& e) {
                outcome = TransferOutcome{};
                outcome.message = std::string("executor error: ") + e.what();
                LOG_ERROR("Executor threw for " + taskLabel(task) + ": " + e.what());
            }

            if (outcome.ok) {
                result.outcome = Outcome::Completed;
                result.error.clear();
                auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - startTime).count();
                if (console_) console_->done(task, elapsed);
                LOG_INFO("TASK COMPLETED: " + taskLabel(task) + " -> " + task.destination.string() +
                         " in " + std::to_string(attempt) + " attempt(s)");
                return result;
            }

            if (outcome.cancelled || stop_.load()) {
                return interrupted();
            }

            result.error = outcome.message.empty() ? "transfer failed" : outcome.message;

            if (attempt < limit) {
                auto wait = policy_.backoffAfter(attempt);
                LOG_WARN("Attempt " + std::to_string(attempt) + "/" + std::to_string(limit) + " failed for " +
                         taskLabel(task) + ": " + result.error + "; retrying in " +
                         std::to_string(wait.count()) + "ms");
                if (console_) console_->retry(task, attempt, result.error, wait);
                if (onRetry_) onRetry_(attempt);
                if (!sleeper_(wait)) {
                    return interrupted();
                }
            } else {
                LOG_WARN("Attempt " + std::to_string(attempt) + "/" + std::to_string(limit) + " failed for " +
                         taskLabel(task) + ": " + result.error);
            }
        }

        if (console_) console_->failed(task, result.attempts, result.error);
        LOG_ERROR("TASK FAILED: " + taskLabel(task) + " after " + std::to_string(result.attempts) + " attempt(s)");
        return result;

    } catch (const std::exception& e) {
        LOG_ERROR("Worker error for " + taskLabel(task) + ": " + std::string(e.what()));
        result.outcome = Outcome::Failed;
        result.error = std::string("internal error: ") + e.what();
        return result;
    } catch (...) {
        LOG_ERROR("Unknown worker error for " + taskLabel(task));
        result.outcome = Outcome::Failed;
        result.error = "unknown internal error";
        return result;
    }
}

}
