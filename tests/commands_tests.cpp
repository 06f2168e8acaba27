#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <vector>

#include <gtest/gtest.h>

#include "commands/apex_command.hpp"
#include "commands/closure_command.hpp"
#include "commands/run_command.hpp"
#include "commands/validate_command.hpp"
#include "core/context.hpp"
#include "nlohmann/json.hpp"
#include "pipeline/run_record.hpp"

namespace fs = std::filesystem;
using nlohmann::json;

namespace
{

    fs::path makeTempRoot(const std::string &name)
    {
        const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
        return fs::temp_directory_path() / ("rehost_commands_test_" + name + "_" + std::to_string(now));
    }

    void cleanupTemp(const fs::path &root)
    {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    void writeTextFile(const fs::path &file, const std::string &content)
    {
        fs::create_directories(file.parent_path());
        std::ofstream out(file, std::ios::binary);
        out << content;
    }

    const char *kStrategy = R"([
        {"pattern": "vendor/lib64/*.so", "module_type": "shared_lib", "phase": "pre_build", "overwrite_policy": "replace"},
        {"pattern": "vendor/etc/*", "module_type": "etc", "phase": "post_build", "overwrite_policy": "replace"}
    ])";

    // Firmware <root>/firmware/<firmwareId>/vendor/... and a pipeline config for tree <root>/<treeName>.
    fs::path writePipeline(const fs::path &root, const std::string &firmwareId, const std::string &treeName,
                           const std::string &buildCommand = "true")
    {
        writeTextFile(root / "firmware" / firmwareId / "vendor" / "lib64" / ("lib" + firmwareId + ".so"), firmwareId);
        writeTextFile(root / "firmware" / firmwareId / "vendor" / "etc" / (firmwareId + ".conf"), "conf");
        writeTextFile(root / "strategy.json", kStrategy);

        const json config = {
            {"firmware_id", firmwareId},
            {"android_version", 12},
            {"tree", {{"root", treeName}, {"provided_libs", json::array({"libc"})}}},
            {"firmware_root", "firmware"},
            {"strategy", "strategy.json"},
            {"build", {{"command", buildCommand}, {"package_command", "true"}}},
            {"workers", 2},
        };
        const fs::path file = root / (firmwareId + ".json");
        writeTextFile(file, config.dump(2));
        fs::create_directories(root / treeName / "out" / "target" / "product" / "emulator_x86_64");
        return file;
    }

} // namespace

TEST(BatchCommand, DisjointTreesRunConcurrently)
{
    const fs::path root = makeTempRoot("batch");
    cleanupTemp(root);
    rehost::Context ctx(false);

    const fs::path first = writePipeline(root, "1001", "aosp-a");
    const fs::path second = writePipeline(root, "1002", "aosp-b");

    EXPECT_EQ(rehost::commands::runBatchCommand(ctx, {"--config", first.string(), second.string(), "--jobs", "2"}), 0);

    EXPECT_TRUE(fs::exists(root / "aosp-a" / "packages/modules/rehost" / "lib1001_rehost" / "lib1001.so"));
    EXPECT_TRUE(fs::exists(root / "aosp-b" / "packages/modules/rehost" / "lib1002_rehost" / "lib1002.so"));
    EXPECT_FALSE(fs::exists(root / "aosp-a" / "packages/modules/rehost" / "lib1002_rehost"));
    EXPECT_TRUE(fs::exists(root / "aosp-b" / "out/target/product/emulator_x86_64/vendor/etc/1002.conf"));

    const auto records = rehost::pipeline::RunLog(root / "runs.json").readAll();
    ASSERT_EQ(records.size(), 2u);
    EXPECT_NE(records[0]["run_id"], records[1]["run_id"]);
    for (const auto &record : records)
    {
        EXPECT_EQ(record["final_status"], "success");
    }

    cleanupTemp(root);
}

TEST(BatchCommand, SharedTreeIsRejectedBeforeAnyRun)
{
    const fs::path root = makeTempRoot("shared");
    cleanupTemp(root);
    rehost::Context ctx(false);

    const fs::path first = writePipeline(root, "1001", "aosp");
    const fs::path second = writePipeline(root, "1002", "aosp");

    EXPECT_EQ(rehost::commands::runBatchCommand(ctx, {first.string(), second.string()}), 1);
    EXPECT_FALSE(fs::exists(root / "aosp" / "packages/modules/rehost"));
    EXPECT_FALSE(fs::exists(root / "runs.json"));

    cleanupTemp(root);
}

TEST(BatchCommand, FailedRunSetsExitCode)
{
    const fs::path root = makeTempRoot("batch_fail");
    cleanupTemp(root);
    rehost::Context ctx(false);

    const fs::path good = writePipeline(root, "1001", "aosp-a");
    const fs::path bad = writePipeline(root, "1002", "aosp-b", "false");

    EXPECT_EQ(rehost::commands::runBatchCommand(ctx, {good.string(), bad.string()}), 2);
    EXPECT_EQ(rehost::pipeline::RunLog(root / "runs.json").readAll().size(), 2u);

    cleanupTemp(root);
}

TEST(RunCommand, ExitCodes)
{
    const fs::path root = makeTempRoot("run");
    cleanupTemp(root);
    rehost::Context ctx(false);

    const fs::path config = writePipeline(root, "1001", "aosp");
    EXPECT_EQ(rehost::commands::runRunCommand(ctx, {}), 1);
    EXPECT_EQ(rehost::commands::runRunCommand(ctx, {"--config"}), 1);
    EXPECT_EQ(rehost::commands::runRunCommand(ctx, {"--jobs", "2", config.string()}), 1);
    EXPECT_EQ(rehost::commands::runRunCommand(ctx, {config.string(), config.string()}), 1);
    EXPECT_EQ(rehost::commands::runRunCommand(ctx, {(root / "missing.json").string()}), 1);
    EXPECT_EQ(rehost::pipeline::RunLog(root / "runs.json").readAll().size(), 0u);

    EXPECT_EQ(rehost::commands::runRunCommand(ctx, {"--config", config.string()}), 0);
    EXPECT_EQ(rehost::pipeline::RunLog(root / "runs.json").readAll().size(), 1u);

    cleanupTemp(root);
}

TEST(ValidateCommand, ReportsStrategyAndMatches)
{
    const fs::path root = makeTempRoot("validate");
    cleanupTemp(root);
    rehost::Context ctx(false);

    writePipeline(root, "1001", "aosp");
    const std::string strategy = (root / "strategy.json").string();
    EXPECT_EQ(rehost::commands::runValidateCommand(ctx, {strategy}), 0);
    EXPECT_EQ(rehost::commands::runValidateCommand(ctx, {strategy, "--firmware", (root / "firmware").string()}), 0);
    EXPECT_EQ(rehost::commands::runValidateCommand(ctx, {strategy, "--firmware", (root / "absent").string()}), 1);
    EXPECT_EQ(rehost::commands::runValidateCommand(ctx, {}), 1);
    EXPECT_EQ(rehost::commands::runValidateCommand(ctx, {strategy, "extra.json"}), 1);

    writeTextFile(root / "ambiguous.json", R"([
        {"pattern": "vendor/lib64/*.so", "module_type": "shared_lib", "phase": "pre_build", "overwrite_policy": "replace"},
        {"pattern": "vendor/lib64/lib*", "module_type": "shared_lib", "phase": "pre_build", "overwrite_policy": "replace"}
    ])");
    EXPECT_EQ(rehost::commands::runValidateCommand(ctx, {(root / "ambiguous.json").string()}), 1);

    cleanupTemp(root);
}

TEST(ClosureCommand, LoadsGraphAndReportsClosure)
{
    const fs::path root = makeTempRoot("closure");
    cleanupTemp(root);
    rehost::Context ctx(false);

    writeTextFile(root / "deps.txt", "libfoo.so libbar.so\nlibbar.so libfoo.so\n");
    const std::string deps = (root / "deps.txt").string();
    EXPECT_EQ(rehost::commands::runClosureCommand(ctx, {deps, "libfoo.so"}), 0);
    EXPECT_EQ(rehost::commands::runClosureCommand(ctx, {deps, "libmissing.so"}), 0);
    EXPECT_EQ(rehost::commands::runClosureCommand(ctx, {deps}), 1);
    EXPECT_EQ(rehost::commands::runClosureCommand(ctx, {(root / "absent.txt").string(), "libfoo.so"}), 1);

    cleanupTemp(root);
}

TEST(ApexCommand, RejectsIncompleteInvocation)
{
    const fs::path root = makeTempRoot("apex");
    cleanupTemp(root);
    rehost::Context ctx(false);
    writeTextFile(root / "keys" / "key.pem", "key");
    writeTextFile(root / "keys" / "cert.pem", "cert");
    const std::string key = (root / "keys" / "key.pem").string();
    const std::string cert = (root / "keys" / "cert.pem").string();
    const std::string container = (root / "com.foo.apex").string();

    EXPECT_EQ(rehost::commands::runApexCommand(ctx, {container, (root / "overlay").string()}), 1);
    EXPECT_EQ(rehost::commands::runApexCommand(ctx, {container, "--key", key, "--cert", cert}), 1);
    EXPECT_EQ(rehost::commands::runApexCommand(
                  ctx, {container, (root / "overlay").string(), "--key", key, "--cert", cert, "--policy", "merge"}),
              1);
    EXPECT_EQ(rehost::commands::runApexCommand(ctx, {container, (root / "overlay").string(), "--key", key, "--cert", cert}),
              1);

    // A container that does not exist fails as a run, not as a usage error.
    writeTextFile(root / "overlay" / "bin" / "tool", "patched");
    EXPECT_EQ(rehost::commands::runApexCommand(ctx, {container, (root / "overlay").string(), "--key", key, "--cert", cert}),
              2);

    cleanupTemp(root);
}
