#pragma once

#include <chrono>
#include <filesystem>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "core/context.hpp"
#include "nlohmann/json.hpp"

namespace rehost::pipeline {

enum class StageStatus {
    Success,
    Failure,
    Skipped
};

enum class FinalStatus {
    Success,
    PartialSuccess,
    Failure
};

struct StageRecord {
    std::string name;
    StageStatus status = StageStatus::Skipped;
    double durationSeconds = 0.0;
    std::string detail;
};

// Append-only record of one pipeline run.
struct PipelineRun {
    std::string runId;
    std::string firmwareId;
    int androidVersion = 0;
    std::string checkoutId;
    std::string startedAt;
    std::vector<StageRecord> stages;
    FinalStatus finalStatus = FinalStatus::Failure;
    std::vector<std::string> warnings;
    // Set once the record reached the run log; not serialised.
    bool recorded = false;
};

std::string toString(StageStatus status);
std::string toString(FinalStatus status);

nlohmann::json toJson(const PipelineRun &run);

std::string makeRunId();
std::string isoTimestamp(std::chrono::system_clock::time_point when);

// JSON array file shared by concurrent runs. Appends are serialised by an
// in-process mutex plus flock on <file>.lock and land through an atomic rename.
class RunLog {
public:
    explicit RunLog(std::filesystem::path file) : file_(std::move(file)) {}

    bool append(const PipelineRun &run, const rehost::Context &ctx) const;
    std::vector<nlohmann::json> readAll() const;

    const std::filesystem::path &file() const { return file_; }

private:
    std::filesystem::path file_;
};

} // namespace rehost::pipeline
