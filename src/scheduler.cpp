/*
 * mtget - Bounded-concurrency transfer scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "mtget/scheduler.hpp"
#include "mtget/console.hpp"
#include "mtget/logger.hpp"
#include "mtget/transfer.hpp"
#include <algorithm>
#include <filesystem>
#include <system_error>

namespace mtget {

Scheduler::Scheduler(const RunConfig& config, TransferExecutor& executor, Console* console)
    : config_(config), executor_(executor), console_(console) {
    LOG_DEBUG("Scheduler created - concurrency: " + std::to_string(config_.concurrency) +
              ", attempts: " + std::to_string(config_.retry.attemptLimit()) +
              ", resume: " + (config_.transfer.resume ? "yes" : "no"));
}

Scheduler::~Scheduler() {
    if (!active_.empty()) {
        LOG_WARN("Scheduler destroyed with " + std::to_string(active_.size()) + " active workers");
        requestStop();
        joinAll();
    }
}

void Scheduler::requestStop() noexcept {
    stop_.store(true);
    eventReady_.notify_all();
}

Report Scheduler::run(const std::vector<Task>& tasks) {
    Aggregator aggregator(tasks.size());
    aggregator_ = &aggregator;
    peakActive_ = 0;

    const auto cap = static_cast<std::size_t>(std::max(config_.concurrency, 1));
    LOG_INFO("Dispatching " + std::to_string(tasks.size()) + " task(s), up to " +
             std::to_string(cap) + " at a time");

    std::size_t next = 0;
    for (; next < tasks.size(); ++next) {
        pollExternalStop();
        if (stop_.load()) {
            break;
        }

        const Task& task = tasks[next];
        if (shouldSkip(task)) {
            TaskResult skipped;
            skipped.id = task.id;
            skipped.outcome = Outcome::Skipped;
            if (console_) console_->skipped(task);
            LOG_INFO("Skipping task " + std::to_string(task.id) + ": " + task.destination.string() + " exists");
            if (observer_) observer_->onStateChange(task.id, TaskState::Skipped, 0);
            record(skipped);
            continue;
        }

        // At capacity: wait for a completion to free a slot
        while (active_.size() >= cap && !stop_.load()) {
            reapOne(config_.pollInterval);
            pollExternalStop();
        }
        if (stop_.load()) {
            break;
        }

        spawn(task);
    }

    if (next < tasks.size()) {
        aggregator.markNotDispatched(tasks.size() - next);
        LOG_WARN("Stopped before dispatching " + std::to_string(tasks.size() - next) + " task(s)");
    }

    drain();

    if (stop_.load()) {
        aggregator.markInterrupted();
    }
    aggregator.setPeakActive(peakActive_);
    aggregator_ = nullptr;

    Report report = aggregator.report();
    LOG_INFO("Run finished - completed: " + std::to_string(report.completed) +
             ", failed: " + std::to_string(report.failed) +
             ", skipped: " + std::to_string(report.skipped) +
             ", total: " + std::to_string(report.total));
    return report;
}

bool Scheduler::shouldSkip(const Task& task) const noexcept {
    if (config_.transfer.resume) {
        return false;
    }
    std::error_code ec;
    return std::filesystem::exists(task.destination, ec);
}

void Scheduler::spawn(const Task& task) {
    WorkerHandle handle;
    handle.task = task;

    try {
        handle.thread = std::thread(&Scheduler::workerMain, this, task);
    } catch (const std::system_error& e) {
        LOG_ERROR("Failed to start worker for task " + std::to_string(task.id) + ": " + e.what());
        TaskResult failed;
        failed.id = task.id;
        failed.outcome = Outcome::Failed;
        failed.error = std::string("cannot start worker: ") + e.what();
        if (console_) console_->failed(task, 0, failed.error);
        record(failed);
        return;
    }

    auto& slot = active_.emplace(task.id, std::move(handle)).first->second;
    peakActive_ = std::max(peakActive_, active_.size());
    LOG_DEBUG("Dispatched task " + std::to_string(task.id) + " (" + std::to_string(active_.size()) + " active)");
    if (observer_) observer_->onDispatch(task, active_.size());
    advance(slot, TaskState::Dispatched, 0);
}

void Scheduler::workerMain(Task task) noexcept {
    TaskResult result;
    result.id = task.id;
    try {
        setThreadName(workerThreadName(task.id));
        Worker worker(executor_, config_.retry, config_.transfer, stop_, console_, sleeper_);
        worker.setRetryListener([this, id = task.id](int failedAttempt) {
            WorkerEvent retrying;
            retrying.state = TaskState::Retrying;
            retrying.result.id = id;
            retrying.result.attempts = failedAttempt;
            publish(std::move(retrying));
        });
        result = worker.run(task);
    } catch (const std::exception& e) {
        LOG_ERROR("Worker " + std::to_string(task.id) + " fatal error: " + std::string(e.what()));
        result.outcome = Outcome::Failed;
        result.error = e.what();
    } catch (...) {
        LOG_ERROR("Worker " + std::to_string(task.id) + " unknown fatal error");
        result.outcome = Outcome::Failed;
        result.error = "unknown worker error";
    }

    WorkerEvent done;
    done.state = result.outcome == Outcome::Completed ? TaskState::Completed : TaskState::Failed;
    done.result = std::move(result);
    publish(std::move(done));
    clearThreadName();
}

void Scheduler::publish(WorkerEvent event) noexcept {
    const TaskId id = event.result.id;
    try {
        {
            std::lock_guard<std::mutex> lock(eventsMutex_);
            events_.push(std::move(event));
        }
        eventReady_.notify_one();
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to publish event for task " + std::to_string(id) + ": " + e.what());
    }
}

void Scheduler::advance(WorkerHandle& handle, TaskState next, int attempts) {
    if (!canTransition(handle.state, next)) {
        LOG_ERROR("Task " + std::to_string(handle.task.id) + " cannot move from " +
                  toString(handle.state) + " to " + toString(next));
        return;
    }
    handle.state = next;
    handle.attempts = attempts;
    LOG_TRACE("Task " + std::to_string(handle.task.id) + " is " + toString(next) +
              " (" + std::to_string(attempts) + " attempt(s))");
    if (observer_) observer_->onStateChange(handle.task.id, next, attempts);
}

bool Scheduler::reapOne(std::chrono::milliseconds wait) {
    WorkerEvent event;
    {
        std::unique_lock<std::mutex> lock(eventsMutex_);
        eventReady_.wait_for(lock, wait, [this] { return !events_.empty(); });
        if (events_.empty()) {
            return false;
        }
        event = std::move(events_.front());
        events_.pop();
    }

    auto it = active_.find(event.result.id);
    if (it == active_.end()) {
        LOG_ERROR("Event for unknown task " + std::to_string(event.result.id));
        return false;
    }

    // A retry notice keeps the slot; only a terminal result frees it
    if (!isTerminal(event.state)) {
        advance(it->second, event.state, event.result.attempts);
        return false;
    }

    // The worker published as its last action; this join is immediate
    if (it->second.thread.joinable()) {
        it->second.thread.join();
    }
    advance(it->second, event.state, event.result.attempts);
    active_.erase(it);

    record(event.result);
    return true;
}

void Scheduler::drain() {
    if (!active_.empty()) {
        LOG_DEBUG("Draining " + std::to_string(active_.size()) + " active worker(s)");
    }
    while (!active_.empty()) {
        pollExternalStop();
        reapOne(config_.pollInterval);
    }
}

void Scheduler::pollExternalStop() {
    if (!stop_.load() && stopPredicate_ && stopPredicate_()) {
        LOG_WARN("Interrupt received, cancelling " + std::to_string(active_.size()) + " active worker(s)");
        requestStop();
    }
}

void Scheduler::record(const TaskResult& result) {
    if (aggregator_) {
        aggregator_->record(result);
    }
    if (observer_) {
        observer_->onResult(result);
    }
}

void Scheduler::joinAll() noexcept {
    for (auto& entry : active_) {
        if (entry.second.thread.joinable()) {
            entry.second.thread.join();
        }
    }
    active_.clear();
    std::lock_guard<std::mutex> lock(eventsMutex_);
    while (!events_.empty()) {
        events_.pop();
    }
}

}
