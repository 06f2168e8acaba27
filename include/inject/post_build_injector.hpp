#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "core/context.hpp"
#include "model/specs.hpp"

namespace rehost::inject {

struct PostBuildResult {
    std::size_t injected = 0;
    std::size_t skipped = 0;
    std::vector<std::string> warnings;
};

// Copies post_build artifacts (apex_payload excluded) into the build output on
// a bounded worker pool. Failed items are collected and thrown together as one
// InjectionError once every item has finished.
PostBuildResult injectPostBuild(
    const model::InjectionStrategy &strategy,
    const std::vector<model::FirmwareArtifact> &artifacts,
    const std::filesystem::path &buildOutputRoot,
    std::size_t workers,
    const rehost::Context &ctx
);

} // namespace rehost::inject
