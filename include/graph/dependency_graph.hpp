#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "core/context.hpp"
#include "model/specs.hpp"
#include "nlohmann/json.hpp"

namespace rehost::graph {

struct DependencyNode {
    std::string libraryName;
    std::optional<std::filesystem::path> resolvedPath;
    // Consumers of this library, as node indices.
    std::vector<std::size_t> requiredBy;
    // Edges in insertion order.
    std::vector<std::size_t> dependencies;
};

struct ClosureReport {
    std::string root;
    std::vector<std::string> members;
    // Members other than the root without a resolved path.
    std::vector<std::string> unresolved;
    std::vector<std::vector<std::string>> cycles;
};

class DependencyGraph {
public:
    std::size_t addLibrary(const std::string &name);
    void addEdge(const std::string &consumer, const std::string &dependency);
    void resolve(const std::string &library, const std::filesystem::path &path);

    bool contains(const std::string &name) const;
    std::optional<std::size_t> indexOf(const std::string &name) const;
    const DependencyNode &node(std::size_t index) const { return nodes_[index]; }
    std::size_t size() const { return nodes_.size(); }

    // Breadth-first, root first, every library exactly once.
    std::vector<std::string> closure(const std::string &root) const;
    ClosureReport closureReport(const std::string &root) const;

    // Cycles reachable from root, or from every node when root is empty.
    std::vector<std::vector<std::string>> findCycles(const std::string &root = "") const;

    // Orders names so that each one follows the libraries it depends on.
    // Unrelated names keep their input order; cycles are cut at the first visit.
    std::vector<std::string> dependencyFirstOrder(const std::vector<std::string> &names) const;

private:
    std::vector<DependencyNode> nodes_;
    std::unordered_map<std::string, std::size_t> index_;
};

DependencyGraph parseDependencyPairs(const std::string &text);
DependencyGraph parseDependencyJson(const nlohmann::json &data);
DependencyGraph parseLddtree(const std::string &text);

// Picks the parser from the file: .json, lddtree text (contains "=>"), or pairs.
// Throws ConfigError when the file cannot be read or parsed.
DependencyGraph loadDependencyGraph(const std::filesystem::path &path, const rehost::Context &ctx);

// Resolves graph libraries to firmware artifacts by file name.
void resolveFromArtifacts(
    DependencyGraph &graph,
    const std::vector<model::FirmwareArtifact> &artifacts,
    const rehost::Context &ctx
);

} // namespace rehost::graph
