#pragma once

#include <cstddef>
#include <vector>

#include "core/context.hpp"
#include "model/firmware.hpp"
#include "model/pipeline_config.hpp"
#include "pipeline/run_record.hpp"

namespace rehost::pipeline {

// Stage names in execution order.
extern const std::vector<const char *> kStageNames;

// Runs every stage for one firmware against one tree and appends the record
// to the run log whatever the outcome. Failures up to and including build
// abort the run; post_build and apex failures degrade it to partial_success.
PipelineRun runPipeline(
    const model::PipelineConfig &config,
    model::FirmwareSource &source,
    const rehost::Context &ctx
);

// Same, reading firmware from config.firmwareRoot.
PipelineRun runPipeline(const model::PipelineConfig &config, const rehost::Context &ctx);

// Independent runs, each with its own tree, on a bounded worker pool.
// Results keep the order of configs.
std::vector<PipelineRun> runBatch(
    const std::vector<model::PipelineConfig> &configs,
    std::size_t jobs,
    const rehost::Context &ctx
);

// 2 when the run failed or its record could not be written, 0 otherwise.
int exitCodeFor(const PipelineRun &run);

} // namespace rehost::pipeline
