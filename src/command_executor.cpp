/*
 * mtget - Bounded-concurrency transfer scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "mtget/transfer.hpp"
#include "mtget/logger.hpp"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <thread>
#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace mtget {

namespace {

std::string describeStatus(int status) {
    if (WIFEXITED(status)) {
        int code = WEXITSTATUS(status);
        if (code == 127) {
            return "command not found (exit 127)";
        }
        return "exit status " + std::to_string(code);
    }
    if (WIFSIGNALED(status)) {
        return "killed by signal " + std::to_string(WTERMSIG(status));
    }
    return "abnormal termination";
}

}

ArgvBuilder curlArgv(const std::string& program) {
    return [program](const Task& task, const TransferOptions& options) {
        std::vector<std::string> args{
            program,
            "--fail",
            "--location",
            "--silent",
            "--show-error",
            "--output",
            task.destination.string(),
        };
        if (options.resume) {
            args.emplace_back("--continue-at");
            args.emplace_back("-");
        }
        if (!options.rateLimit.empty()) {
            args.emplace_back("--limit-rate");
            args.push_back(options.rateLimit);
        }
        if (options.timeout.count() > 0) {
            args.emplace_back("--max-time");
            args.push_back(std::to_string(options.timeout.count()));
        }
        args.push_back(task.source);
        return args;
    };
}

CommandExecutor::CommandExecutor(ArgvBuilder argv, std::chrono::milliseconds killGrace,
                                 std::chrono::milliseconds pollInterval)
    : argv_(std::move(argv)), killGrace_(killGrace), pollInterval_(pollInterval) {
}

TransferOutcome CommandExecutor::transfer(const Task& task, const TransferOptions& options,
                                          const std::atomic<bool>& stop) {
    TransferOutcome outcome;

    std::vector<std::string> args = argv_(task, options);
    if (args.empty()) {
        outcome.message = "empty command line";
        return outcome;
    }

    // Built before fork: the child only calls async-signal-safe functions
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& s : args) {
        argv.push_back(s.data());
    }
    argv.push_back(nullptr);

    if (stop.load()) {
        outcome.cancelled = true;
        outcome.message = "cancelled before start";
        return outcome;
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        outcome.message = std::string("fork failed: ") + std::strerror(errno);
        LOG_ERROR(outcome.message);
        return outcome;
    }
    if (pid == 0) {
        ::setpgid(0, 0);
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            if (devnull > STDERR_FILENO) ::close(devnull);
        }
        ::execvp(argv[0], argv.data());
        ::_exit(127);
    }
    // Also set from the parent so kill(-pid) is valid before the child runs
    ::setpgid(pid, pid);

    LOG_DEBUG("Started " + args[0] + " (pid " + std::to_string(pid) + ") for task " + std::to_string(task.id));

    const auto deadline = std::chrono::steady_clock::now() + options.timeout;
    int status = 0;

    while (true) {
        pid_t rc = ::waitpid(pid, &status, WNOHANG);
        if (rc == pid) {
            break;
        }
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            outcome.message = std::string("waitpid failed: ") + std::strerror(errno);
            LOG_ERROR(outcome.message);
            ::kill(-pid, SIGKILL);
            reap(pid, status);
            return outcome;
        }

        if (stop.load()) {
            LOG_DEBUG("Stopping pid " + std::to_string(pid) + " for task " + std::to_string(task.id));
            terminateGroup(pid, status);
            outcome.cancelled = true;
            outcome.message = "cancelled";
            return outcome;
        }
        if (options.timeout.count() > 0 && std::chrono::steady_clock::now() >= deadline) {
            terminateGroup(pid, status);
            outcome.timedOut = true;
            outcome.message = "timed out after " + std::to_string(options.timeout.count()) + "s";
            return outcome;
        }

        std::this_thread::sleep_for(pollInterval_);
    }

    outcome.exitStatus = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    outcome.ok = WIFEXITED(status) && WEXITSTATUS(status) == 0;
    if (!outcome.ok) {
        outcome.message = describeStatus(status);
    }
    return outcome;
}

void CommandExecutor::terminateGroup(int pid, int& status) noexcept {
    ::kill(-pid, SIGTERM);

    bool leaderExited = false;
    const auto graceEnd = std::chrono::steady_clock::now() + killGrace_;
    while (std::chrono::steady_clock::now() < graceEnd) {
        // WNOWAIT leaves the leader a zombie so its pid, and the group id, stay reserved
        siginfo_t info{};
        int rc = ::waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOHANG | WNOWAIT);
        if (rc == 0 && info.si_pid == pid) {
            leaderExited = true;
            break;
        }
        if (rc < 0 && errno != EINTR) {
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    if (!leaderExited) {
        LOG_WARN("pid " + std::to_string(pid) + " ignored SIGTERM, sending SIGKILL");
    }
    // Sweep anything left in the group before the leader is reaped
    ::kill(-pid, SIGKILL);
    reap(pid, status);
}

void CommandExecutor::reap(int pid, int& status) noexcept {
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
}

}
