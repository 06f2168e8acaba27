#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

#include <gtest/gtest.h>

#include "core/context.hpp"
#include "core/errors.hpp"
#include "inject/partition_paths.hpp"
#include "inject/post_build_injector.hpp"
#include "io/fs_utils.hpp"
#include "model/strategy_loader.hpp"
#include "nlohmann/json.hpp"

namespace fs = std::filesystem;

namespace
{

    fs::path makeTempRoot(const std::string &name)
    {
        const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
        return fs::temp_directory_path() / ("rehost_postbuild_test_" + name + "_" + std::to_string(now));
    }

    void cleanupTemp(const fs::path &root)
    {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    std::string loadTextFile(const fs::path &file)
    {
        std::ifstream in(file, std::ios::binary);
        std::ostringstream out;
        out << in.rdbuf();
        return out.str();
    }

    void writeTextFile(const fs::path &file, const std::string &content)
    {
        fs::create_directories(file.parent_path());
        std::ofstream out(file, std::ios::binary);
        out << content;
    }

    rehost::model::FirmwareArtifact makeArtifact(const fs::path &firmwareRoot, const std::string &relativePath,
                                                 const std::string &content)
    {
        rehost::model::FirmwareArtifact artifact;
        artifact.relativePath = relativePath;
        artifact.sourcePath = firmwareRoot / relativePath;
        writeTextFile(artifact.sourcePath, content);
        artifact.sha256 = rehost::io::sha256File(artifact.sourcePath).value_or("");
        return artifact;
    }

    rehost::model::InjectionStrategy postBuildStrategy()
    {
        return rehost::model::parseStrategy(nlohmann::json::parse(R"([
            {"pattern": "vendor/bin/*", "module_type": "executable", "phase": "post_build", "overwrite_policy": "replace"},
            {"pattern": "vendor/etc/*", "module_type": "etc", "phase": "post_build", "overwrite_policy": "skip"},
            {"pattern": "system/etc/*", "module_type": "etc", "phase": "post_build", "overwrite_policy": "fail"},
            {"pattern": "vendor/lib64/*.so", "module_type": "shared_lib", "phase": "pre_build"},
            {"pattern": "system/apex/**", "module_type": "apex_payload", "phase": "post_build"}
        ])"),
                                            "strategy.json");
    }

} // namespace

TEST(PartitionPaths, NormalizesNestedPartitions)
{
    EXPECT_EQ(rehost::inject::normalizeOutputPath("system/system/bin/foo"), "system/bin/foo");
    EXPECT_EQ(rehost::inject::normalizeOutputPath("system/vendor/lib64/libfoo.so"), "vendor/lib64/libfoo.so");
    EXPECT_EQ(rehost::inject::normalizeOutputPath("./super/etc/init.rc"), "system/etc/init.rc");
    EXPECT_EQ(rehost::inject::partitionOf("system/system_ext/etc/foo.xml"), "system_ext");
    EXPECT_EQ(rehost::inject::partitionProperty("odm"), "device_specific: true");
    EXPECT_EQ(rehost::inject::partitionProperty("system"), "");
}

TEST(PostBuildInjection, CopiesPostBuildArtifactsOnly)
{
    const fs::path root = makeTempRoot("copy");
    cleanupTemp(root);
    const fs::path firmware = root / "firmware";
    const fs::path out = root / "out";
    fs::create_directories(out);
    rehost::Context ctx(false);

    const std::vector<rehost::model::FirmwareArtifact> artifacts = {
        makeArtifact(firmware, "vendor/bin/hald", "hal daemon"),
        makeArtifact(firmware, "vendor/etc/hald.conf", "config"),
        makeArtifact(firmware, "vendor/lib64/libfoo.so", "pre-build only"),
        makeArtifact(firmware, "system/apex/com.foo.apex", "container"),
    };

    const auto result = rehost::inject::injectPostBuild(postBuildStrategy(), artifacts, out, 2, ctx);

    EXPECT_EQ(result.injected, 2u);
    EXPECT_EQ(loadTextFile(out / "vendor/bin/hald"), "hal daemon");
    EXPECT_EQ(loadTextFile(out / "vendor/etc/hald.conf"), "config");
    EXPECT_FALSE(fs::exists(out / "vendor/lib64/libfoo.so"));
    EXPECT_FALSE(fs::exists(out / "system/apex/com.foo.apex"));

    const auto perms = fs::status(out / "vendor/bin/hald").permissions();
    EXPECT_NE(perms & fs::perms::owner_exec, fs::perms::none);
    EXPECT_NE(perms & fs::perms::others_exec, fs::perms::none);

    cleanupTemp(root);
}

TEST(PostBuildInjection, PoliciesDecideExistingTargets)
{
    const fs::path root = makeTempRoot("policy");
    cleanupTemp(root);
    const fs::path firmware = root / "firmware";
    const fs::path out = root / "out";
    rehost::Context ctx(false);

    writeTextFile(out / "vendor/bin/hald", "old daemon");
    writeTextFile(out / "vendor/etc/hald.conf", "old config");

    const std::vector<rehost::model::FirmwareArtifact> artifacts = {
        makeArtifact(firmware, "vendor/bin/hald", "new daemon"),
        makeArtifact(firmware, "vendor/etc/hald.conf", "new config"),
    };

    const auto result = rehost::inject::injectPostBuild(postBuildStrategy(), artifacts, out, 1, ctx);

    EXPECT_EQ(result.injected, 1u);
    EXPECT_EQ(result.skipped, 1u);
    EXPECT_EQ(result.warnings.size(), 2u);
    EXPECT_EQ(loadTextFile(out / "vendor/bin/hald"), "new daemon");
    EXPECT_EQ(loadTextFile(out / "vendor/etc/hald.conf"), "old config");

    cleanupTemp(root);
}

TEST(PostBuildInjection, FailuresAreAggregatedAfterAllItems)
{
    const fs::path root = makeTempRoot("fail");
    cleanupTemp(root);
    const fs::path firmware = root / "firmware";
    const fs::path out = root / "out";
    rehost::Context ctx(false);

    writeTextFile(out / "system/etc/a.xml", "existing a");
    writeTextFile(out / "system/etc/b.xml", "existing b");

    const std::vector<rehost::model::FirmwareArtifact> artifacts = {
        makeArtifact(firmware, "system/etc/a.xml", "firmware a"),
        makeArtifact(firmware, "system/etc/b.xml", "firmware b"),
        makeArtifact(firmware, "vendor/bin/hald", "hal daemon"),
    };

    try
    {
        rehost::inject::injectPostBuild(postBuildStrategy(), artifacts, out, 3, ctx);
        FAIL() << "expected InjectionError";
    }
    catch (const rehost::InjectionError &e)
    {
        const std::string message = e.what();
        EXPECT_NE(message.find("2 of 3"), std::string::npos) << message;
        EXPECT_NE(message.find("system/etc/a.xml"), std::string::npos);
        EXPECT_NE(message.find("system/etc/b.xml"), std::string::npos);
    }

    EXPECT_EQ(loadTextFile(out / "vendor/bin/hald"), "hal daemon");
    EXPECT_EQ(loadTextFile(out / "system/etc/a.xml"), "existing a");

    cleanupTemp(root);
}

TEST(PostBuildInjection, MissingBuildOutputThrows)
{
    rehost::Context ctx(false);
    EXPECT_THROW(rehost::inject::injectPostBuild(postBuildStrategy(), {}, "/rehost/no/such/out", 1, ctx),
                 rehost::InjectionError);
}

TEST(PostBuildInjection, TargetsClaimedTwiceAreRejectedBeforeCopying)
{
    const fs::path root = makeTempRoot("duplicate");
    cleanupTemp(root);
    const fs::path firmware = root / "firmware";
    const fs::path out = root / "out";
    fs::create_directories(out);
    rehost::Context ctx(false);

    const auto strategy = rehost::model::parseStrategy(nlohmann::json::parse(R"([
        {"pattern": "super/etc/*", "module_type": "etc", "phase": "post_build", "overwrite_policy": "fail"},
        {"pattern": "system/system/etc/*", "module_type": "etc", "phase": "post_build", "overwrite_policy": "fail"},
        {"pattern": "vendor/etc/*", "module_type": "etc", "phase": "post_build", "overwrite_policy": "fail"}
    ])"),
                                                       "strategy.json");
    const std::vector<rehost::model::FirmwareArtifact> artifacts = {
        makeArtifact(firmware, "super/etc/init.rc", "from super"),
        makeArtifact(firmware, "system/system/etc/init.rc", "from system"),
        makeArtifact(firmware, "vendor/etc/hald.conf", "config"),
    };

    try
    {
        rehost::inject::injectPostBuild(strategy, artifacts, out, 4, ctx);
        FAIL() << "expected InjectionError";
    }
    catch (const rehost::InjectionError &e)
    {
        const std::string message = e.what();
        EXPECT_NE(message.find("super/etc/init.rc"), std::string::npos);
        EXPECT_NE(message.find("system/system/etc/init.rc"), std::string::npos);
    }
    EXPECT_FALSE(fs::exists(out / "system/etc/init.rc"));
    EXPECT_FALSE(fs::exists(out / "vendor/etc/hald.conf"));

    cleanupTemp(root);
}
