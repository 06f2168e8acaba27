#pragma once

#include <string>
#include <vector>

#include "model/specs.hpp"

namespace rehost::inject {

constexpr const char *kModuleSuffix = "_rehost";
constexpr const char *kPackagesFragment = "rehost_packages.mk";

struct BlueprintEntry {
    std::string name;
    // Installed file name without the module suffix.
    std::string stem;
    std::string src;
    model::ModuleType type = model::ModuleType::Misc;
    std::string partition = "system";
    // Directory below lib/, bin/ or etc/ on the device, may be empty.
    std::string installSubdir;
    std::vector<std::string> sharedLibs;
    bool is64Bit = true;
};

std::string blueprintModuleType(model::ModuleType type);

// Soong-safe module name derived from a file name.
std::string sanitizeModuleName(const std::string &value);

// Subdirectory below the lib, bin or etc directory of a device path.
std::string installSubdirOf(const std::string &normalizedPath);

std::string renderBlueprintEntry(const BlueprintEntry &entry);
std::string renderBlueprint(const std::vector<BlueprintEntry> &entries);

std::string renderPackagesFragment(const std::vector<std::string> &moduleNames);
std::string inheritProductLine(const std::string &fragmentPath);

} // namespace rehost::inject
