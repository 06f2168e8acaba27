#include "model/firmware.hpp"

#include <stdexcept>
#include <system_error>
#include <utility>

#include "io/fs_utils.hpp"

namespace fs = std::filesystem;

namespace rehost::model
{

    DirectoryFirmwareSource::DirectoryFirmwareSource(fs::path root, const rehost::Context &ctx)
        : root_(std::move(root)), ctx_(ctx)
    {
    }

    std::vector<FirmwareArtifact> DirectoryFirmwareSource::fetch(const std::string &firmwareId)
    {
        std::error_code ec;
        fs::path base = root_ / firmwareId;
        if (firmwareId.empty() || !fs::is_directory(base, ec))
        {
            base = root_;
        }
        if (!fs::is_directory(base, ec))
        {
            throw std::runtime_error("Firmware directory not found: " + base.string());
        }

        std::vector<FirmwareArtifact> out;
        for (const auto &relative : io::listFilesRecursive(base))
        {
            FirmwareArtifact artifact;
            artifact.relativePath = relative.generic_string();
            artifact.sourcePath = base / relative;
            artifact.originPartition = relative.begin()->string();
            const auto size = fs::file_size(artifact.sourcePath, ec);
            artifact.size = ec ? 0 : size;

            const auto digest = io::sha256File(artifact.sourcePath);
            if (!digest.has_value())
            {
                throw std::runtime_error("Could not hash firmware file: " + artifact.sourcePath.string());
            }
            artifact.sha256 = digest.value();
            out.push_back(std::move(artifact));
        }

        if (out.empty())
        {
            ctx_.warn("Firmware ", firmwareId, " has no files under ", base.string());
        }
        else
        {
            ctx_.log("Fetched ", out.size(), " firmware files for ", firmwareId, " from ", base.string());
        }
        return out;
    }

} // namespace rehost::model
