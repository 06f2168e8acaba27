#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace rehost::model {

enum class ModuleType {
    SharedLib,
    Executable,
    App,
    JavaLib,
    Etc,
    Apex,
    ApexPayload,
    Misc,
    Auto
};

enum class Phase {
    PreBuild,
    PostBuild
};

enum class OverwritePolicy {
    Fail,
    Skip,
    Replace
};

struct InjectionRule {
    std::string pattern;
    ModuleType moduleType = ModuleType::Auto;
    Phase phase = Phase::PreBuild;
    OverwritePolicy overwritePolicy = OverwritePolicy::Fail;
    // Pattern text before the first wildcard; drives longest-prefix resolution.
    std::string literalPrefix;
    std::size_t declarationIndex = 0;
};

// Artifacts dropped before rule matching.
struct ExcludeFilter {
    std::vector<std::string> keywords;
    std::vector<std::string> extensions;
    std::vector<std::string> files;
};

struct InjectionStrategy {
    // Declaration order.
    std::vector<InjectionRule> rules;
    // Indices into rules: longest literal prefix first, then declaration order.
    std::vector<std::size_t> resolutionOrder;
    ExcludeFilter exclude;
    std::filesystem::path sourceFile;
};

struct FirmwareArtifact {
    std::string relativePath;
    std::filesystem::path sourcePath;
    std::string originPartition;
    std::string sha256;
    std::uintmax_t size = 0;
};

// Explicit handle on the AOSP checkout a run is allowed to touch.
struct TreeHandle {
    std::filesystem::path root;
    std::string checkoutId;
};

struct BuildModule {
    std::string moduleName;
    ModuleType moduleType = ModuleType::Misc;
    std::vector<FirmwareArtifact> injectedFiles;
    std::vector<std::string> sharedLibs;
    std::string descriptorText;
    std::filesystem::path directory;
};

struct RuleMatch {
    const InjectionRule *rule = nullptr;
    // Concrete module type after classifying Auto rules.
    ModuleType moduleType = ModuleType::Misc;
};

std::string toString(ModuleType type);
std::string toString(Phase phase);
std::string toString(OverwritePolicy policy);

std::optional<ModuleType> parseModuleType(const std::string &value);
std::optional<Phase> parsePhase(const std::string &value);
std::optional<OverwritePolicy> parseOverwritePolicy(const std::string &value);

} // namespace rehost::model
