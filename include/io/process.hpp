#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

#include "core/context.hpp"

namespace rehost::io {

struct ProcessResult {
    int code = -1;
    std::string commandLine;
    long long processId = -1;
    bool timedOut = false;
    double durationSeconds = 0.0;
};

struct ProcessLimits {
    // Zero means no limit.
    std::chrono::milliseconds timeout{0};
    std::chrono::milliseconds killGrace{2000};
    // When set, stdout and stderr of the child are appended to this file.
    std::filesystem::path logFile;
};

std::string shellQuote(const std::string &value);

ProcessResult runCommand(
    const std::string &command,
    const std::vector<std::string> &args,
    const std::filesystem::path &cwd,
    const rehost::Context &ctx
);

// Runs the child in its own process group. On timeout the whole group receives
// SIGTERM, then SIGKILL once killGrace has elapsed.
ProcessResult runBoundedCommand(
    const std::string &command,
    const std::vector<std::string> &args,
    const std::filesystem::path &cwd,
    const ProcessLimits &limits,
    const rehost::Context &ctx
);

bool isCommandAvailable(const std::string &command);

} // namespace rehost::io
