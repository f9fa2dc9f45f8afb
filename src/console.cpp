/*
 * mtget - Bounded-concurrency transfer scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "mtget/console.hpp"
#include "mtget/aggregator.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace mtget {

namespace {
constexpr const char* kGray = "\033[90m";
constexpr const char* kRed = "\033[31m";
constexpr const char* kGreen = "\033[32m";
constexpr const char* kYellow = "\033[33m";
constexpr const char* kBold = "\033[1m";
constexpr const char* kReset = "\033[0m";
}

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&time, &local);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%H:%M:%S", &local);
    return buf;
}

Console::Console(std::ostream& out, bool color) : out_(out), color_(color) {
}

void Console::line(const char* color, const Task& task, const char* word, const std::string& detail) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << "    " << paint(kGray) << timestamp() << paint(kReset) << "  "
         << task.destination.filename().string() << "  "
         << paint(color) << word << paint(kReset);
    if (!detail.empty()) {
        out_ << "  " << detail;
    }
    out_ << "\n" << std::flush;
}

void Console::running(const Task& task, int attempt) {
    line(kYellow, task, "running", attempt > 1 ? "attempt " + std::to_string(attempt) : std::string());
}

void Console::retry(const Task& task, int attempt, const std::string& reason, std::chrono::milliseconds wait) {
    std::ostringstream detail;
    detail << "attempt " << attempt << " " << reason << ", next in " << std::fixed << std::setprecision(1)
           << std::chrono::duration<double>(wait).count() << "s";
    line(kYellow, task, "retry", detail.str());
}

void Console::done(const Task& task, double seconds) {
    std::ostringstream detail;
    detail << std::fixed << std::setprecision(1) << seconds << "s";
    line(kGreen, task, "done", detail.str());
}

void Console::failed(const Task& task, int attempts, const std::string& reason) {
    line(kRed, task, "failed", reason + " (" + std::to_string(attempts) + " attempt" + (attempts == 1 ? ")" : "s)"));
}

void Console::skipped(const Task& task) {
    line(kGray, task, "skipped", "exists");
}

void Console::summary(const Report& report, double seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << "\n";
    out_ << "  " << paint(kBold) << (report.interrupted ? "INTERRUPTED" : "SUMMARY") << paint(kReset) << "\n\n";
    out_ << "    Completed  " << paint(kGreen) << report.completed << paint(kReset) << "\n";
    out_ << "    Failed     " << (report.failed > 0 ? paint(kRed) : "") << report.failed << paint(kReset) << "\n";
    out_ << "    Skipped    " << report.skipped << "\n";
    if (report.notDispatched > 0) {
        out_ << "    Not run    " << report.notDispatched << "\n";
    }
    out_ << "    Total      " << report.total << "\n";
    out_ << "    Elapsed    " << std::fixed << std::setprecision(1) << seconds << "s\n";
    out_ << "\n" << std::flush;
}

}
