/*
 * mtget - Bounded-concurrency transfer scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace mtget {

constexpr int kMinConcurrency = 1;
constexpr int kMaxConcurrency = 50;
constexpr int kMinAttempts = 0;
constexpr int kMaxAttempts = 10;
constexpr std::chrono::seconds kMaxTimeout{86400};
constexpr std::chrono::seconds kMaxBaseDelay{600};

// Retry budget shared read-only by all workers.
// maxAttempts counts total attempts; 0 still performs one.
struct RetryPolicy {
    int maxAttempts = 3;
    std::chrono::milliseconds baseDelay{2000};

    [[nodiscard]] int attemptLimit() const noexcept { return maxAttempts < 1 ? 1 : maxAttempts; }

    // Linear backoff: failed attempt k waits k * baseDelay before attempt k+1.
    [[nodiscard]] std::chrono::milliseconds backoffAfter(int failedAttempt) const noexcept {
        return baseDelay * failedAttempt;
    }
};

struct TransferOptions {
    bool resume = false;
    std::string rateLimit;
    std::chrono::seconds timeout{300};
};

struct RunConfig {
    int concurrency = 4;
    RetryPolicy retry;
    TransferOptions transfer;
    std::filesystem::path destinationDir = ".";
    std::chrono::milliseconds pollInterval{100};
    std::chrono::milliseconds killGrace{2000};
    std::string program = "curl";
};

enum class ConfigError : uint8_t {
    None = 0,
    InvalidConcurrency,
    InvalidAttempts,
    InvalidTimeout,
    InvalidDelay,
    DestinationError
};

struct ConfigResult {
    bool ok = false;
    ConfigError error = ConfigError::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

// Defaults from MTGET_JOBS, MTGET_RETRIES, MTGET_RETRY_DELAY, MTGET_TIMEOUT, MTGET_CURL.
[[nodiscard]] RunConfig configFromEnv();

[[nodiscard]] ConfigResult validate(const RunConfig& config);

// Creates the destination directory if it is missing.
[[nodiscard]] ConfigResult prepareDestination(const std::filesystem::path& dir);

}
