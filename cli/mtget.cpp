/*
 * mtget - Parallel downloader (mtget)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "mtget/config.hpp"
#include "mtget/console.hpp"
#include "mtget/logger.hpp"
#include "mtget/scheduler.hpp"
#include "mtget/task_list.hpp"
#include "mtget/transfer.hpp"
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>
#include <unistd.h>

using namespace mtget;

constexpr const char* VERSION = "0.1.0";

// Async-signal-safe: only set flag; the dispatch loop polls it
static volatile sig_atomic_t g_shutdown_requested = 0;

void signalHandler(int signal) {
    (void)signal;
    g_shutdown_requested = 1;
}

void printUsage(const char* progName) {
    std::cout << "mtget Parallel Downloader v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " [options] <url>...\n";
    std::cout << "       " << progName << " [options] -i <file>\n";
    std::cout << "       " << progName << " --help | --version\n\n";
    std::cout << "Options:\n";
    std::cout << "  -j, --jobs <n>         Concurrent transfers, 1-50 (default 4)\n";
    std::cout << "  -r, --retries <n>      Attempts per file, 0-10 (default 3; 0 = single attempt)\n";
    std::cout << "      --retry-delay <s>  Base backoff; attempt k waits k * delay (default 2)\n";
    std::cout << "  -t, --timeout <s>      Per-attempt timeout in seconds (default 300)\n";
    std::cout << "  -c, --continue         Resume partial files instead of skipping existing ones\n";
    std::cout << "      --limit-rate <r>   Passed to the transfer tool (e.g. 500k, 2M)\n";
    std::cout << "  -d, --dir <path>       Destination directory, created if missing (default .)\n";
    std::cout << "  -i, --input <file>     Read 'url [destination]' lines from file ('-' for stdin)\n";
    std::cout << "      --curl <path>      Transfer program (default curl)\n";
    std::cout << "  -h, --help             Show this help message\n";
    std::cout << "  -v, --version          Show version\n\n";
    std::cout << "Input file format:\n";
    std::cout << "  One entry per line; blank lines and lines starting with '#' are ignored.\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  MTGET_JOBS, MTGET_RETRIES, MTGET_RETRY_DELAY, MTGET_TIMEOUT, MTGET_CURL\n";
    std::cout << "  MTGET_LOG_LEVEL    Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n\n";
    std::cout << "Exit status:\n";
    std::cout << "  0 all transfers completed, 1 a transfer failed or bad arguments, 130 interrupted\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progName << " -j 8 -d ./downloads https://example.com/a.iso https://example.com/b.iso\n";
    std::cout << "  " << progName << " -c --limit-rate 1M -i urls.txt\n";
}

std::optional<int> parseInt(const std::string& value) {
    try {
        std::size_t used = 0;
        int parsed = std::stoi(value, &used);
        if (used != value.size()) {
            return std::nullopt;
        }
        return parsed;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

int main(int argc, char* argv[]) {
    // Default to WARN so status lines stay readable; MTGET_LOG_LEVEL overrides
    if (!std::getenv("MTGET_LOG_LEVEL"))
        Logger::setLevel(LogLevel::WARN);
    setThreadName("Main");

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return ExitCode::Success;
        }
        if (arg == "-v" || arg == "--version") {
            std::cout << VERSION << "\n";
            return ExitCode::Success;
        }
    }

    RunConfig config = configFromEnv();
    std::vector<std::string> sources;
    std::string inputFile;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto needValue = [&](const char* name) -> std::optional<std::string> {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << name << " requires a value\n";
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };
        auto needInt = [&](const char* name) -> std::optional<int> {
            auto value = needValue(name);
            if (!value) {
                return std::nullopt;
            }
            auto parsed = parseInt(*value);
            if (!parsed) {
                std::cerr << "Error: Invalid value for " << name << ": " << *value << "\n";
            }
            return parsed;
        };

        if (arg == "-j" || arg == "--jobs") {
            auto n = needInt("--jobs");
            if (!n) return ExitCode::Failure;
            config.concurrency = *n;
        } else if (arg == "-r" || arg == "--retries") {
            auto n = needInt("--retries");
            if (!n) return ExitCode::Failure;
            config.retry.maxAttempts = *n;
        } else if (arg == "--retry-delay") {
            auto n = needInt("--retry-delay");
            if (!n) return ExitCode::Failure;
            config.retry.baseDelay = std::chrono::seconds(*n);
        } else if (arg == "-t" || arg == "--timeout") {
            auto n = needInt("--timeout");
            if (!n) return ExitCode::Failure;
            config.transfer.timeout = std::chrono::seconds(*n);
        } else if (arg == "-c" || arg == "--continue") {
            config.transfer.resume = true;
        } else if (arg == "--limit-rate") {
            auto v = needValue("--limit-rate");
            if (!v) return ExitCode::Failure;
            config.transfer.rateLimit = *v;
        } else if (arg == "-d" || arg == "--dir") {
            auto v = needValue("--dir");
            if (!v) return ExitCode::Failure;
            config.destinationDir = *v;
        } else if (arg == "-i" || arg == "--input") {
            auto v = needValue("--input");
            if (!v) return ExitCode::Failure;
            inputFile = *v;
        } else if (arg == "--curl") {
            auto v = needValue("--curl");
            if (!v) return ExitCode::Failure;
            config.program = *v;
        } else if (arg.size() > 1 && arg[0] == '-') {
            std::cerr << "Error: Unknown option: " << arg << "\n";
            return ExitCode::Failure;
        } else {
            sources.push_back(arg);
        }
    }

    if (sources.empty() && inputFile.empty()) {
        printUsage(argv[0]);
        return ExitCode::Failure;
    }
    if (!sources.empty() && !inputFile.empty()) {
        std::cerr << "Error: Give URLs either as arguments or with --input, not both\n";
        return ExitCode::Failure;
    }

    // Configuration errors are fatal before anything is dispatched
    if (auto checked = validate(config); !checked) {
        std::cerr << "Error: " << checked.message << "\n";
        return ExitCode::Failure;
    }
    if (auto prepared = prepareDestination(config.destinationDir); !prepared) {
        std::cerr << "Error: " << prepared.message << "\n";
        return ExitCode::Failure;
    }

    TaskList list;
    if (!inputFile.empty()) {
        if (inputFile == "-") {
            list = parseTaskLines(std::cin, config.destinationDir);
        } else {
            std::ifstream in(inputFile);
            if (!in) {
                std::cerr << "Error: Cannot read input file: " << inputFile << "\n";
                return ExitCode::Failure;
            }
            list = parseTaskLines(in, config.destinationDir);
        }
    } else {
        list = parseTaskArgs(sources, config.destinationDir);
    }

    for (const auto& rejected : list.rejected) {
        std::cerr << "Warning: ignoring " << rejected.entry;
        if (rejected.line > 0) std::cerr << " (line " << rejected.line << ")";
        std::cerr << ": " << rejected.message << "\n";
    }
    if (list.tasks.empty()) {
        std::cerr << "Error: No valid entries to download\n";
        return ExitCode::Failure;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    LOG_DEBUG("Program: " + config.program);
    LOG_DEBUG("Destination: " + config.destinationDir.string());
    LOG_DEBUG("mtget Log Level: " + std::string(getenv("MTGET_LOG_LEVEL") ? getenv("MTGET_LOG_LEVEL") : "WARN"));

    Console console(std::cout, isatty(STDOUT_FILENO) != 0);
    std::cout << "\n  Downloading " << list.tasks.size() << " file(s) to " << config.destinationDir.string()
              << " with " << config.concurrency << " worker(s)\n\n" << std::flush;

    try {
        CommandExecutor executor(curlArgv(config.program), config.killGrace);
        Scheduler scheduler(config, executor, &console);
        scheduler.setStopPredicate([] { return g_shutdown_requested != 0; });

        auto startTime = std::chrono::steady_clock::now();
        Report report = scheduler.run(list.tasks);
        auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - startTime).count();

        console.summary(report, elapsed);
        if (!list.rejected.empty()) {
            std::cout << "    Ignored " << list.rejected.size() << " invalid entr"
                      << (list.rejected.size() == 1 ? "y" : "ies") << "\n\n" << std::flush;
        }
        return exitCodeFor(report);

    } catch (const std::exception& e) {
        LOG_ERROR("Run error: " + std::string(e.what()));
        std::cerr << "Error: " << e.what() << "\n";
        return g_shutdown_requested ? ExitCode::Interrupted : ExitCode::Failure;
    }
}
