#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "core/context.hpp"
#include "graph/dependency_graph.hpp"
#include "model/specs.hpp"

namespace rehost::inject {

constexpr const char *kRunMarker = ".rehost-run";

struct PreBuildOptions {
    std::string injectDir = "packages/modules/rehost";
    std::vector<std::string> presenceDirs;
    std::vector<std::string> providedLibs;
    std::string productMakefile;
    // BoardConfig.mk whose partition sizes are fitted to the injected payload, relative to the tree root.
    std::string boardConfig;
    std::string runId;
};

struct PreBuildResult {
    std::vector<model::BuildModule> modules;
    std::vector<std::string> warnings;
    std::vector<std::string> unresolved;
    std::size_t skippedModules = 0;
    std::filesystem::path packagesFragment;
    // Dynamic partition group size written to the board config, 0 when none is configured.
    std::uintmax_t partitionBytes = 0;
};

// Plans every pre-build module first and writes nothing unless the whole plan
// is valid. Throws InjectionError.
PreBuildResult injectPreBuild(
    const model::InjectionStrategy &strategy,
    const std::vector<model::FirmwareArtifact> &artifacts,
    const graph::DependencyGraph &graph,
    const model::TreeHandle &tree,
    const PreBuildOptions &options,
    const rehost::Context &ctx
);

// Written by the first run that injects into a tree and left in place, so a
// tree is injected by one run only.
std::filesystem::path runMarkerPath(const model::TreeHandle &tree, const std::string &injectDir);

} // namespace rehost::inject
