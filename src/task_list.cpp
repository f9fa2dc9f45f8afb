/*
 * mtget - Bounded-concurrency transfer scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "mtget/task_list.hpp"
#include "mtget/logger.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <sstream>
#include <unordered_set>

namespace mtget {

namespace {

constexpr std::array<const char*, 5> kSchemes = {"http", "https", "ftp", "ftps", "file"};

std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

class Builder {
public:
    explicit Builder(const std::filesystem::path& destDir) : destDir_(destDir) {}

    void add(std::size_t line, const std::string& entry, const std::string& source,
             const std::string& destination) {
        if (source.empty()) {
            reject(line, entry, ValidationError::MissingSource, "missing source");
            return;
        }
        if (!hasSupportedScheme(source)) {
            reject(line, entry, ValidationError::UnsupportedScheme, "unsupported or missing URL scheme");
            return;
        }

        std::filesystem::path target;
        if (destination.empty()) {
            auto name = filenameFromSource(source);
            if (!name) {
                reject(line, entry, ValidationError::NoFilename, "cannot derive a filename from source");
                return;
            }
            target = (destDir_ / *name).lexically_normal();
        } else {
            std::filesystem::path given(destination);
            if (given.is_absolute()) {
                target = given.lexically_normal();
            } else {
                target = (destDir_ / given).lexically_normal();
                if (!insideDestDir(target)) {
                    reject(line, entry, ValidationError::OutsideDestination,
                           "relative destination leaves " + destDir_.string() + ": " + destination);
                    return;
                }
            }
        }

        if (!seen_.insert(target.string()).second) {
            reject(line, entry, ValidationError::DuplicateDestination,
                   "destination already used by an earlier entry: " + target.string());
            return;
        }

        Task task;
        task.id = static_cast<TaskId>(list_.tasks.size());
        task.source = source;
        task.destination = std::move(target);
        LOG_TRACE("Accepted task " + std::to_string(task.id) + ": " + task.source);
        list_.tasks.push_back(std::move(task));
    }

    void reject(std::size_t line, const std::string& entry, ValidationError error, const std::string& message) {
        LOG_WARN("Skipping invalid entry" + (line > 0 ? " on line " + std::to_string(line) : std::string()) +
                 ": " + entry + " (" + message + ")");
        list_.rejected.push_back(Rejected{line, entry, error, message});
    }

    TaskList take() { return std::move(list_); }

private:
    // A relative destination must name a file below the destination directory
    bool insideDestDir(const std::filesystem::path& target) const {
        auto base = destDir_.lexically_normal();
        if (!base.has_filename() && base.has_relative_path()) {
            base = base.parent_path();
        }
        auto rel = target.lexically_relative(base);
        if (rel.empty() || rel == ".") {
            return false;
        }
        return *rel.begin() != "..";
    }

    std::filesystem::path destDir_;
    std::unordered_set<std::string> seen_;
    TaskList list_;
};

}

std::string trim(std::string value) {
    auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), notSpace));
    value.erase(std::find_if(value.rbegin(), value.rend(), notSpace).base(), value.end());
    return value;
}

bool hasSupportedScheme(const std::string& source) {
    auto pos = source.find("://");
    if (pos == std::string::npos || pos == 0 || pos + 3 >= source.size()) {
        return false;
    }
    std::string scheme = toLowerCopy(source.substr(0, pos));
    return std::find(kSchemes.begin(), kSchemes.end(), scheme) != kSchemes.end();
}

std::optional<std::string> filenameFromSource(const std::string& source) {
    auto schemeEnd = source.find("://");
    std::string rest = schemeEnd == std::string::npos ? source : source.substr(schemeEnd + 3);

    auto cut = rest.find_first_of("?#");
    if (cut != std::string::npos) {
        rest.erase(cut);
    }

    // "host" alone has no path component to name a file after
    auto slash = rest.rfind('/');
    if (slash == std::string::npos) {
        return std::nullopt;
    }

    std::string name = rest.substr(slash + 1);
    if (name.empty() || name == "." || name == "..") {
        return std::nullopt;
    }
    return name;
}

TaskList parseTaskLines(std::istream& in, const std::filesystem::path& destDir) {
    Builder builder(destDir);
    std::string raw;
    std::size_t lineNo = 0;

    while (std::getline(in, raw)) {
        ++lineNo;
        std::string line = trim(raw);
        if (line.empty() || line[0] == '#') {
            continue;
        }

        std::istringstream fields(line);
        std::string source;
        std::string destination;
        std::string extra;
        fields >> source >> destination >> extra;
        if (!extra.empty()) {
            builder.reject(lineNo, line, ValidationError::TooManyFields, "expected 'source [destination]'");
            continue;
        }
        builder.add(lineNo, line, source, destination);
    }

    TaskList list = builder.take();
    LOG_DEBUG("Parsed " + std::to_string(lineNo) + " lines: " + std::to_string(list.tasks.size()) +
              " tasks, " + std::to_string(list.rejected.size()) + " rejected");
    return list;
}

TaskList parseTaskArgs(const std::vector<std::string>& args, const std::filesystem::path& destDir) {
    Builder builder(destDir);
    for (const auto& arg : args) {
        std::string source = trim(arg);
        builder.add(0, arg, source, "");
    }
    return builder.take();
}

}
