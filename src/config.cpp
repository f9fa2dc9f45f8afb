/*
 * mtget - Bounded-concurrency transfer scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "mtget/config.hpp"
#include "mtget/logger.hpp"
#include <cstdlib>
#include <limits>
#include <system_error>

namespace mtget {

namespace {
long env_long(const char* name, long defv) {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    try {
        std::size_t used = 0;
        long parsed = std::stol(val, &used);
        if (used != std::string(val).size()) {
            LOG_WARN(std::string("Ignoring non-numeric ") + name + "=" + val);
            return defv;
        }
        return parsed;
    } catch (const std::exception&) {
        LOG_WARN(std::string("Ignoring invalid ") + name + "=" + val);
        return defv;
    }
}

int env_int(const char* name, int defv) {
    long value = env_long(name, defv);
    if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
        LOG_WARN(std::string("Ignoring out-of-range ") + name + "=" + std::getenv(name));
        return defv;
    }
    return static_cast<int>(value);
}

ConfigResult fail(ConfigError error, std::string message) {
    ConfigResult result;
    result.error = error;
    result.message = std::move(message);
    return result;
}
}

RunConfig configFromEnv() {
    RunConfig config;
    config.concurrency = env_int("MTGET_JOBS", config.concurrency);
    config.retry.maxAttempts = env_int("MTGET_RETRIES", config.retry.maxAttempts);
    config.retry.baseDelay = std::chrono::seconds(env_int("MTGET_RETRY_DELAY", 2));
    config.transfer.timeout = std::chrono::seconds(
        env_int("MTGET_TIMEOUT", static_cast<int>(config.transfer.timeout.count())));
    if (const char* curl = std::getenv("MTGET_CURL"); curl && *curl) {
        config.program = curl;
    }
    return config;
}

ConfigResult validate(const RunConfig& config) {
    if (config.concurrency < kMinConcurrency || config.concurrency > kMaxConcurrency) {
        return fail(ConfigError::InvalidConcurrency,
                    "Concurrency must be between " + std::to_string(kMinConcurrency) + " and " +
                    std::to_string(kMaxConcurrency) + " (got " + std::to_string(config.concurrency) + ")");
    }
    if (config.retry.maxAttempts < kMinAttempts || config.retry.maxAttempts > kMaxAttempts) {
        return fail(ConfigError::InvalidAttempts,
                    "Retries must be between " + std::to_string(kMinAttempts) + " and " +
                    std::to_string(kMaxAttempts) + " (got " + std::to_string(config.retry.maxAttempts) + ")");
    }
    if (config.transfer.timeout.count() < 1 || config.transfer.timeout > kMaxTimeout) {
        return fail(ConfigError::InvalidTimeout,
                    "Timeout must be between 1 and " + std::to_string(kMaxTimeout.count()) +
                    " seconds (got " + std::to_string(config.transfer.timeout.count()) + ")");
    }
    if (config.retry.baseDelay.count() < 0 || config.retry.baseDelay > kMaxBaseDelay) {
        return fail(ConfigError::InvalidDelay,
                    "Retry delay must be between 0 and " + std::to_string(kMaxBaseDelay.count()) + " seconds");
    }

    ConfigResult result;
    result.ok = true;
    return result;
}

ConfigResult prepareDestination(const std::filesystem::path& dir) {
    if (dir.empty()) {
        return fail(ConfigError::DestinationError, "Destination directory is empty");
    }

    std::error_code ec;
    if (std::filesystem::exists(dir, ec)) {
        if (!std::filesystem::is_directory(dir, ec)) {
            return fail(ConfigError::DestinationError, "Destination is not a directory: " + dir.string());
        }
    } else {
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            return fail(ConfigError::DestinationError,
                        "Cannot create destination " + dir.string() + ": " + ec.message());
        }
        LOG_INFO("Created destination directory: " + dir.string());
    }

    ConfigResult result;
    result.ok = true;
    return result;
}

}
