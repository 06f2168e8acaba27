#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "core/context.hpp"
#include "model/specs.hpp"

namespace rehost::model {

class FirmwareSource {
public:
    virtual ~FirmwareSource() = default;

    // Artifacts sorted by relative path. Throws std::runtime_error when the
    // firmware cannot be retrieved.
    virtual std::vector<FirmwareArtifact> fetch(const std::string &firmwareId) = 0;
};

// Extracted firmware on disk: <root>/<firmware_id>/<partition>/... or <root>/<partition>/...
class DirectoryFirmwareSource : public FirmwareSource {
public:
    DirectoryFirmwareSource(std::filesystem::path root, const rehost::Context &ctx);

    std::vector<FirmwareArtifact> fetch(const std::string &firmwareId) override;

private:
    std::filesystem::path root_;
    const rehost::Context &ctx_;
};

} // namespace rehost::model
