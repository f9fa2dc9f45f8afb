/*
 * mtget - Bounded-concurrency transfer scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <unordered_map>
#include <vector>

#include "mtget/aggregator.hpp"
#include "mtget/config.hpp"
#include "mtget/types.hpp"
#include "mtget/worker.hpp"

namespace mtget {

class TransferExecutor;
class Console;

// Hooks called from the dispatch loop thread only.
class SchedulerObserver {
public:
    virtual ~SchedulerObserver() = default;
    virtual void onDispatch(const Task& task, std::size_t active) { (void)task; (void)active; }
    virtual void onResult(const TaskResult& result) { (void)result; }
    virtual void onStateChange(TaskId id, TaskState state, int attempts) { (void)id; (void)state; (void)attempts; }
};

// Bounded-concurrency dispatcher. One thread per in-flight task, never more
// than config.concurrency at once. The active set and the tallies are only
// touched from the thread calling run(); workers hand back their result
// through the completion channel.
class Scheduler final {
public:
    Scheduler(const RunConfig& config, TransferExecutor& executor, Console* console = nullptr);
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;
    Scheduler(Scheduler&&) = delete;
    Scheduler& operator=(Scheduler&&) = delete;

    [[nodiscard]] Report run(const std::vector<Task>& tasks);

    // Safe from any thread. Stops dispatch and cancels in-flight workers.
    void requestStop() noexcept;
    [[nodiscard]] bool stopRequested() const noexcept { return stop_.load(); }

    // Polled from the dispatch loop; used to bridge a signal flag.
    void setStopPredicate(std::function<bool()> predicate) { stopPredicate_ = std::move(predicate); }
    void setObserver(SchedulerObserver* observer) noexcept { observer_ = observer; }
    void setBackoffSleeper(BackoffSleeper sleeper) { sleeper_ = std::move(sleeper); }

    [[nodiscard]] std::size_t activeCount() const noexcept { return active_.size(); }

private:
    struct WorkerHandle {
        Task task;
        TaskState state = TaskState::Pending;
        int attempts = 0;
        std::thread thread;
    };

    // What a worker hands back: a Retrying notice or its terminal result.
    struct WorkerEvent {
        TaskState state = TaskState::Failed;
        TaskResult result;
    };

    [[nodiscard]] bool shouldSkip(const Task& task) const noexcept;
    void spawn(const Task& task);
    void workerMain(Task task) noexcept;
    void publish(WorkerEvent event) noexcept;
    void advance(WorkerHandle& handle, TaskState next, int attempts);
    bool reapOne(std::chrono::milliseconds wait);
    void drain();
    void pollExternalStop();
    void record(const TaskResult& result);
    void joinAll() noexcept;

    RunConfig config_;
    TransferExecutor& executor_;
    Console* console_;
    SchedulerObserver* observer_ = nullptr;
    std::function<bool()> stopPredicate_;
    BackoffSleeper sleeper_;

    std::atomic<bool> stop_{false};

    std::unordered_map<TaskId, WorkerHandle> active_;
    std::size_t peakActive_ = 0;
    Aggregator* aggregator_ = nullptr;

    std::mutex eventsMutex_;
    std::condition_variable eventReady_;
    std::queue<WorkerEvent> events_;
};

}
