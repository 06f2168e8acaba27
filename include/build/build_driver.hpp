#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

#include "core/context.hpp"
#include "model/specs.hpp"

namespace rehost::build {

enum class BuildStatus {
    Success,
    Failure
};

struct BuildResult {
    BuildStatus status = BuildStatus::Failure;
    double durationSeconds = 0.0;
    std::filesystem::path logRef;
    // "timeout", "exit code N" or a start failure; empty on success.
    std::string reason;
    int exitCode = -1;
    std::string commandLine;
};

struct BuildRequest {
    std::string lunchTarget;
    // One `m` invocation per entry.
    std::vector<std::string> goals;
    // Shell command run instead of envsetup/lunch/m when set.
    std::string commandOverride;
    std::chrono::seconds timeout{0};
    std::filesystem::path logDir;
    // Log file name: <logName>.log under logDir.
    std::string logName = "build";
};

std::string toString(BuildStatus status);

// "source build/envsetup.sh && lunch <target> && m <goals> [&& m <goals>...]"
std::string composeBuildScript(const std::string &lunchTarget, const std::vector<std::string> &goals);

// Runs the build as a child process group of the tree. Never retries.
BuildResult runBuild(const model::TreeHandle &tree, const BuildRequest &request, const rehost::Context &ctx);

} // namespace rehost::build
