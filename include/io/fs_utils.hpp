#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "core/context.hpp"

namespace rehost::io {

enum class ElfClass {
    None,
    Elf32,
    Elf64
};

bool ensureDir(const std::filesystem::path &path);

// Regular files below root, sorted, as paths relative to root.
std::vector<std::filesystem::path> listFilesRecursive(const std::filesystem::path &root);

std::optional<std::string> sha256File(const std::filesystem::path &path);
ElfClass readElfClass(const std::filesystem::path &path);

std::optional<std::string> readTextFile(const std::filesystem::path &path);

// Writes to a sibling temp file and renames it over the target.
bool writeFileAtomic(const std::filesystem::path &path, const std::string &content);
bool copyFileAtomic(const std::filesystem::path &from, const std::filesystem::path &to);

std::filesystem::path makeScratchDir(const std::string &tag);

} // namespace rehost::io
