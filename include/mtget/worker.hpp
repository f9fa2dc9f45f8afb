/*
 * mtget - Bounded-concurrency transfer scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <functional>

#include "mtget/config.hpp"
#include "mtget/types.hpp"

namespace mtget {

class TransferExecutor;
class Console;

// Sleeps for the given backoff; returns false if interrupted by a stop request.
using BackoffSleeper = std::function<bool(std::chrono::milliseconds)>;

// Called from the worker thread after a failed attempt that will be retried.
using RetryListener = std::function<void(int failedAttempt)>;

[[nodiscard]] bool interruptibleSleep(std::chrono::milliseconds delay, const std::atomic<bool>& stop);

// Owns one task's attempt/retry lifecycle. Never touches scheduler state;
// its only product is the returned TaskResult.
class Worker {
public:
    Worker(TransferExecutor& executor, const RetryPolicy& policy, const TransferOptions& options,
           const std::atomic<bool>& stop, Console* console = nullptr, BackoffSleeper sleeper = {});

    Worker(const Worker&) = delete;
    Worker& operator=(const Worker&) = delete;

    void setRetryListener(RetryListener listener) { onRetry_ = std::move(listener); }

    [[nodiscard]] TaskResult run(const Task& task) noexcept;

private:
    TransferExecutor& executor_;
    const RetryPolicy& policy_;
    const TransferOptions& options_;
    const std::atomic<bool>& stop_;
    Console* console_;
    BackoffSleeper sleeper_;
    RetryListener onRetry_;
};

}
