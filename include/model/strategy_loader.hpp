#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "core/context.hpp"
#include "model/specs.hpp"
#include "nlohmann/json.hpp"

namespace rehost::model {

// Throws ConfigError on malformed or ambiguous rules.
InjectionStrategy loadStrategy(const std::filesystem::path &strategyFile, const rehost::Context &ctx);
InjectionStrategy parseStrategy(const nlohmann::json &data, const std::filesystem::path &sourceFile);

std::string literalPrefixOf(const std::string &pattern);

// `*` and `?` stay within one path segment, `**` spans segments.
bool globMatch(const std::string &pattern, const std::string &path);
bool globsIntersect(const std::string &left, const std::string &right);

bool isExcluded(const InjectionStrategy &strategy, const std::string &relativePath);

const InjectionRule *resolveRule(const InjectionStrategy &strategy, const std::string &relativePath);
std::optional<RuleMatch> matchArtifact(const InjectionStrategy &strategy, const FirmwareArtifact &artifact);

ModuleType classifyArtifact(const FirmwareArtifact &artifact);

} // namespace rehost::model
