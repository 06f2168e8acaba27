#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace rehost::inject {

constexpr std::uintmax_t kGiB = 1024ULL * 1024 * 1024;
constexpr std::uintmax_t kSuperMetadataBytes = 8ULL * 1024 * 1024;

// Dynamic partition group size able to hold payloadBytes: 4 GiB grown in
// 64 GiB steps until 10 GiB of headroom remain.
std::uintmax_t minimalPartitionSize(std::uintmax_t payloadBytes);

// Rewrites BOARD_SUPER_PARTITION_SIZE (groupBytes plus metadata) and every
// BOARD_*_DYNAMIC_PARTITIONS_SIZE (groupBytes). Throws InjectionError when the
// makefile has no BOARD_SUPER_PARTITION_SIZE assignment.
std::string resizedBoardConfig(const std::string &content, std::uintmax_t groupBytes);

// Bytes of regular files below root, ignoring entries whose name starts with '.'.
std::uintmax_t injectedPayloadBytes(const std::filesystem::path &root);

} // namespace rehost::inject
