/*
 * mtget - Bounded-concurrency transfer scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <vector>

#include "mtget/types.hpp"

namespace mtget {

enum class ValidationError : uint8_t {
    None = 0,
    MissingSource,
    UnsupportedScheme,
    NoFilename,
    DuplicateDestination,
    TooManyFields,
    OutsideDestination
};

struct Rejected {
    std::size_t line = 0;
    std::string entry;
    ValidationError error = ValidationError::None;
    std::string message;
};

struct TaskList {
    std::vector<Task> tasks;
    std::vector<Rejected> rejected;
};

// One entry per line: "source [destination]". Blank lines and '#' comments are ignored.
[[nodiscard]] TaskList parseTaskLines(std::istream& in, const std::filesystem::path& destDir);

// Positional arguments: each is a bare source.
[[nodiscard]] TaskList parseTaskArgs(const std::vector<std::string>& args, const std::filesystem::path& destDir);

[[nodiscard]] std::optional<std::string> filenameFromSource(const std::string& source);
[[nodiscard]] bool hasSupportedScheme(const std::string& source);

std::string trim(std::string value);

}
