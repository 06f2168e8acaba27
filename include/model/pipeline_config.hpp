#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace rehost::model {

struct TreeSettings {
    std::filesystem::path root;
    std::string checkoutId;
    // Relative to the tree root.
    std::string injectDir = "packages/modules/rehost";
    // Tree directories scanned for libraries the build already provides.
    std::vector<std::string> presenceDirs;
    // Library names treated as present without scanning.
    std::vector<std::string> providedLibs;
    // Product makefile that receives the inherit-product hook, relative to the tree root.
    std::string productMakefile;
    // BoardConfig.mk whose partition sizes follow the injected payload, relative to the tree root.
    std::string boardConfig;
};

// Upper bound for build.timeout_seconds (30 days).
constexpr long long kMaxBuildTimeoutSeconds = 30LL * 24 * 60 * 60;

struct BuildSettings {
    // Overrides the envsetup/lunch/m invocation when set.
    std::string command;
    std::chrono::seconds timeout{0};
    // One `m` invocation per entry, chained with &&. Empty entry means plain `m`.
    std::vector<std::string> goals;
    std::vector<std::string> packageGoals;
    std::string packageCommand;
    bool skipPackage = false;
};

struct ApexSettings {
    std::filesystem::path key;
    std::filesystem::path cert;
    std::string signTool;
    std::vector<std::string> signArgs;
    std::string archiveUnpack;
    std::string archivePack;
    std::string imageUnpack;
    std::string imagePack;
};

struct PipelineConfig {
    std::filesystem::path configFile;
    std::string firmwareId;
    int androidVersion = 0;
    std::string arch = "x86_64";
    std::string lunchTarget;
    TreeSettings tree;
    std::filesystem::path firmwareRoot;
    std::filesystem::path strategy;
    // Optional; empty means no dependency data.
    std::filesystem::path dependencies;
    std::filesystem::path buildOutput;
    BuildSettings build;
    ApexSettings apex;
    std::size_t workers = 0;
    std::filesystem::path logDir;
    std::filesystem::path runLog;
};

// Throws ConfigError. Relative paths resolve against the directory of the file.
PipelineConfig loadPipelineConfig(const std::filesystem::path &configFile);
PipelineConfig parsePipelineConfig(const nlohmann::json &data, const std::filesystem::path &baseDir);

std::string defaultLunchTarget(const std::string &arch, int androidVersion);
std::string productDeviceFor(const std::string &lunchTarget);
std::vector<std::string> defaultBuildGoals(int androidVersion);
std::vector<std::string> defaultPackageGoals(int androidVersion);

} // namespace rehost::model
