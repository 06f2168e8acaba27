#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <vector>

#include <gtest/gtest.h>

#include "core/context.hpp"
#include "core/errors.hpp"
#include "graph/dependency_graph.hpp"
#include "nlohmann/json.hpp"

namespace fs = std::filesystem;

namespace
{

    fs::path makeTempRoot(const std::string &name)
    {
        const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
        return fs::temp_directory_path() / ("rehost_graph_test_" + name + "_" + std::to_string(now));
    }

    void cleanupTemp(const fs::path &root)
    {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    std::size_t positionOf(const std::vector<std::string> &items, const std::string &name)
    {
        return static_cast<std::size_t>(std::find(items.begin(), items.end(), name) - items.begin());
    }

} // namespace

TEST(DependencyClosure, RootFirstAndEachLibraryOnce)
{
    rehost::graph::DependencyGraph graph;
    graph.addEdge("app_process64", "libandroid_runtime.so");
    graph.addEdge("app_process64", "libutils.so");
    graph.addEdge("libandroid_runtime.so", "libutils.so");
    graph.addEdge("libutils.so", "libc.so");

    const auto members = graph.closure("app_process64");
    ASSERT_EQ(members.size(), 4u);
    EXPECT_EQ(members.front(), "app_process64");
    EXPECT_EQ(std::count(members.begin(), members.end(), "libutils.so"), 1);
    EXPECT_EQ(graph.closure("app_process64"), members);
}

TEST(DependencyClosure, CycleTerminates)
{
    rehost::graph::DependencyGraph graph;
    graph.addEdge("libA.so", "libB.so");
    graph.addEdge("libB.so", "libA.so");

    const auto members = graph.closure("libA.so");
    EXPECT_EQ(members, (std::vector<std::string>{"libA.so", "libB.so"}));

    const auto cycles = graph.findCycles();
    ASSERT_EQ(cycles.size(), 1u);
    EXPECT_EQ(cycles[0], (std::vector<std::string>{"libA.so", "libB.so", "libA.so"}));
}

TEST(DependencyClosure, UnknownRootIsItsOwnClosure)
{
    rehost::graph::DependencyGraph graph;
    graph.addEdge("libA.so", "libB.so");
    EXPECT_EQ(graph.closure("libmissing.so"), (std::vector<std::string>{"libmissing.so"}));
}

TEST(DependencyClosure, ReportListsUnresolvedMembers)
{
    rehost::graph::DependencyGraph graph;
    graph.addEdge("libfoo.so", "libbar.so");
    graph.addEdge("libfoo.so", "libbaz.so");
    graph.resolve("libbar.so", "/vendor/lib64/libbar.so");

    const auto report = graph.closureReport("libfoo.so");
    EXPECT_EQ(report.members.size(), 3u);
    EXPECT_EQ(report.unresolved, (std::vector<std::string>{"libbaz.so"}));
    EXPECT_TRUE(report.cycles.empty());
}

TEST(DependencyClosure, EdgesAreDeduplicated)
{
    rehost::graph::DependencyGraph graph;
    graph.addEdge("libfoo.so", "libbar.so");
    graph.addEdge("libfoo.so", "libbar.so");

    const auto index = graph.indexOf("libfoo.so");
    ASSERT_TRUE(index.has_value());
    EXPECT_EQ(graph.node(index.value()).dependencies.size(), 1u);
    EXPECT_EQ(graph.node(graph.indexOf("libbar.so").value()).requiredBy.size(), 1u);
}

TEST(DependencyOrder, DependenciesComeFirst)
{
    rehost::graph::DependencyGraph graph;
    graph.addEdge("libfoo.so", "libbar.so");
    graph.addEdge("libbar.so", "libbaz.so");

    const auto order = graph.dependencyFirstOrder({"libfoo.so", "libbar.so", "libbaz.so", "libother.so"});
    ASSERT_EQ(order.size(), 4u);
    EXPECT_LT(positionOf(order, "libbaz.so"), positionOf(order, "libbar.so"));
    EXPECT_LT(positionOf(order, "libbar.so"), positionOf(order, "libfoo.so"));
    EXPECT_EQ(order.back(), "libother.so");
}

TEST(DependencyParse, Lddtree)
{
    const std::string text =
        "app_process64 (interpreter => /system/bin/linker64)\n"
        "    libandroid_runtime.so => /system/lib64/libandroid_runtime.so\n"
        "        libutils.so => /system/lib64/libutils.so\n"
        "    libvendorx.so => not found\n";

    const auto graph = rehost::graph::parseLddtree(text);
    EXPECT_EQ(graph.size(), 4u);
    EXPECT_EQ(graph.closure("app_process64").size(), 4u);
    EXPECT_EQ(graph.closure("libandroid_runtime.so"),
              (std::vector<std::string>{"libandroid_runtime.so", "libutils.so"}));

    const auto report = graph.closureReport("app_process64");
    EXPECT_EQ(report.unresolved, (std::vector<std::string>{"libvendorx.so"}));
    const auto runtime = graph.indexOf("libandroid_runtime.so");
    ASSERT_TRUE(runtime.has_value());
    ASSERT_TRUE(graph.node(runtime.value()).resolvedPath.has_value());
    EXPECT_EQ(graph.node(runtime.value()).resolvedPath->generic_string(), "/system/lib64/libandroid_runtime.so");
}

TEST(DependencyParse, PairsAndJson)
{
    const auto pairs = rehost::graph::parseDependencyPairs("# consumer dependency\nlibfoo.so libbar.so\n\nlibbar.so libc.so\n");
    EXPECT_EQ(pairs.closure("libfoo.so").size(), 3u);
    EXPECT_THROW(rehost::graph::parseDependencyPairs("libfoo.so\n"), rehost::ConfigError);
    EXPECT_THROW(rehost::graph::parseDependencyPairs("a b c\n"), rehost::ConfigError);

    const auto fromJson = rehost::graph::parseDependencyJson(
        nlohmann::json::parse(R"({"libfoo.so": ["libbar.so"], "libbar.so": []})"));
    EXPECT_EQ(fromJson.closure("libfoo.so"), (std::vector<std::string>{"libfoo.so", "libbar.so"}));
    EXPECT_THROW(rehost::graph::parseDependencyJson(nlohmann::json::parse("[1, 2]")), rehost::ConfigError);
    EXPECT_THROW(rehost::graph::parseDependencyJson(nlohmann::json::parse(R"({"a": "b"})")), rehost::ConfigError);
}

TEST(DependencyParse, LoadPicksFormatFromFile)
{
    const fs::path root = makeTempRoot("load");
    cleanupTemp(root);
    fs::create_directories(root);
    rehost::Context ctx(false);

    {
        std::ofstream out(root / "deps.txt");
        out << "libA.so libB.so\nlibB.so libA.so\n";
    }
    {
        std::ofstream out(root / "tree.txt");
        out << "libfoo.so => /vendor/lib64/libfoo.so\n    libbar.so => not found\n";
    }
    {
        std::ofstream out(root / "deps.json");
        out << R"({"libfoo.so": ["libbar.so"]})";
    }

    EXPECT_EQ(rehost::graph::loadDependencyGraph(root / "deps.txt", ctx).findCycles().size(), 1u);
    EXPECT_EQ(rehost::graph::loadDependencyGraph(root / "tree.txt", ctx).closure("libfoo.so").size(), 2u);
    EXPECT_EQ(rehost::graph::loadDependencyGraph(root / "deps.json", ctx).size(), 2u);
    EXPECT_THROW(rehost::graph::loadDependencyGraph(root / "missing.txt", ctx), rehost::ConfigError);

    cleanupTemp(root);
}

TEST(DependencyParse, ResolveFromArtifactsByFileName)
{
    rehost::graph::DependencyGraph graph;
    graph.addEdge("libfoo.so", "libbar.so");

    rehost::model::FirmwareArtifact artifact;
    artifact.relativePath = "vendor/lib64/libbar.so";
    artifact.sourcePath = "/firmware/vendor/lib64/libbar.so";

    rehost::Context ctx(false);
    rehost::graph::resolveFromArtifacts(graph, {artifact}, ctx);

    EXPECT_TRUE(graph.closureReport("libfoo.so").unresolved.empty());
}
