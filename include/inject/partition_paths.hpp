#pragma once

#include <string>

namespace rehost::inject {

// Maps a firmware-relative path onto the build output layout:
// super/ -> system/, system/system/ -> system/, system/{vendor,product,system_ext}/ -> {vendor,product,system_ext}/.
std::string normalizeOutputPath(const std::string &relativePath);

// First component of the normalized path.
std::string partitionOf(const std::string &relativePath);

// Soong property that places a module on the partition, empty for system.
std::string partitionProperty(const std::string &partition);

} // namespace rehost::inject
