#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "apex/apex_container.hpp"
#include "core/context.hpp"
#include "model/specs.hpp"

namespace rehost::apex {

struct ApexJob {
    std::filesystem::path container;
    // Set when the build output only holds <apex_name>.capex. The container is
    // decompressed beside it and the .capex is retired once the APEX is replaced.
    std::filesystem::path compressed;
    std::vector<PayloadOverlay> overlays;
};

struct ApexOutcome {
    std::filesystem::path container;
    // Last state reached: "intact" (untouched), "replaced", or the state where it failed.
    std::string finalState;
    std::string error;
    bool ok = false;
};

struct ApexReport {
    std::vector<ApexOutcome> outcomes;
    std::vector<std::string> invalidArtifacts;
    std::size_t replaced = 0;
    std::size_t untouched = 0;
    std::size_t failed = 0;
};

// Groups apex_payload artifacts by container. Artifacts are addressed as
// <partition>/apex/<apex_name>/<payload path> and map to <out>/<partition>/apex/<apex_name>.apex,
// or to <apex_name>.capex when only the compressed container exists.
std::vector<ApexJob> planApexJobs(
    const model::InjectionStrategy &strategy,
    const std::vector<model::FirmwareArtifact> &artifacts,
    const std::filesystem::path &buildOutputRoot,
    std::vector<std::string> &invalidArtifacts
);

// Drives one container through the state machine. Failures are reported in the outcome.
ApexOutcome repackageContainer(
    const ApexJob &job,
    const ApexTools &tools,
    const SigningConfig &signing,
    const rehost::Context &ctx
);

ApexReport repackageAll(
    const std::vector<ApexJob> &jobs,
    const ApexTools &tools,
    const SigningConfig &signing,
    std::size_t workers,
    const rehost::Context &ctx
);

} // namespace rehost::apex
