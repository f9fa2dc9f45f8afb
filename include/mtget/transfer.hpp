/*
 * mtget - Bounded-concurrency transfer scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <functional>
#include <string>
#include <vector>

#include "mtget/config.hpp"
#include "mtget/types.hpp"

namespace mtget {

struct TransferOutcome {
    bool ok = false;
    int exitStatus = -1;
    bool timedOut = false;
    bool cancelled = false;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

// Performs one attempt of one task. Implementations must return promptly
// once `stop` is set and must not leave anything running behind them.
class TransferExecutor {
public:
    virtual ~TransferExecutor() = default;

    [[nodiscard]] virtual TransferOutcome transfer(const Task& task, const TransferOptions& options,
                                                   const std::atomic<bool>& stop) = 0;
};

using ArgvBuilder = std::function<std::vector<std::string>(const Task&, const TransferOptions&)>;

// curl --fail --location ... --output <dest> [--continue-at -] [--limit-rate r] [--max-time t] <source>
[[nodiscard]] ArgvBuilder curlArgv(const std::string& program);

// Runs each attempt as a child process in its own process group.
class CommandExecutor final : public TransferExecutor {
public:
    explicit CommandExecutor(ArgvBuilder argv,
                             std::chrono::milliseconds killGrace = std::chrono::milliseconds(2000),
                             std::chrono::milliseconds pollInterval = std::chrono::milliseconds(50));

    CommandExecutor(const CommandExecutor&) = delete;
    CommandExecutor& operator=(const CommandExecutor&) = delete;

    [[nodiscard]] TransferOutcome transfer(const Task& task, const TransferOptions& options,
                                           const std::atomic<bool>& stop) override;

private:
    void terminateGroup(int pid, int& status) noexcept;
    void reap(int pid, int& status) noexcept;

    ArgvBuilder argv_;
    std::chrono::milliseconds killGrace_;
    std::chrono::milliseconds pollInterval_;
};

}
