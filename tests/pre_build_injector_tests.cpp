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
#include "graph/dependency_graph.hpp"
#include "inject/blueprint.hpp"
#include "inject/board_config.hpp"
#include "inject/pre_build_injector.hpp"
#include "io/fs_utils.hpp"
#include "model/strategy_loader.hpp"
#include "nlohmann/json.hpp"

namespace fs = std::filesystem;

namespace
{

    fs::path makeTempRoot(const std::string &name)
    {
        const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
        return fs::temp_directory_path() / ("rehost_prebuild_test_" + name + "_" + std::to_string(now));
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
        artifact.size = content.size();
        return artifact;
    }

    rehost::model::InjectionStrategy strategyWithPolicy(const std::string &policy)
    {
        return rehost::model::parseStrategy(nlohmann::json::parse(
                                                R"([{"pattern": "vendor/lib64/*.so", "module_type": "shared_lib", "phase": "pre_build", "overwrite_policy": ")" +
                                                policy + R"("}])"),
                                            "strategy.json");
    }

    struct Fixture
    {
        fs::path root;
        fs::path firmware;
        rehost::model::TreeHandle tree;
        rehost::inject::PreBuildOptions options;

        explicit Fixture(const std::string &name)
        {
            root = makeTempRoot(name);
            cleanupTemp(root);
            firmware = root / "firmware";
            tree.root = root / "aosp";
            tree.checkoutId = "checkout-1";
            fs::create_directories(tree.root);
            fs::create_directories(firmware);
            options.runId = "run-1";
        }

        ~Fixture() { cleanupTemp(root); }

        fs::path injectRoot() const { return tree.root / options.injectDir; }
    };

} // namespace

TEST(PreBuildInjection, PresentDependencyIsReferencedNotBundled)
{
    Fixture fx("present");
    rehost::Context ctx(false);

    // libbar is already part of the tree.
    writeTextFile(fx.tree.root / "out/target/product/emu64x/vendor/lib64/libbar.so", "tree libbar");
    fx.options.presenceDirs = {"out/target/product/emu64x"};

    const auto foo = makeArtifact(fx.firmware, "vendor/lib64/libfoo.so", "firmware libfoo");
    const auto bar = makeArtifact(fx.firmware, "vendor/etc/libbar.so", "firmware libbar");

    rehost::graph::DependencyGraph graph;
    graph.addEdge("libfoo.so", "libbar.so");

    const auto result = rehost::inject::injectPreBuild(strategyWithPolicy("skip"), {foo, bar}, graph, fx.tree, fx.options, ctx);

    ASSERT_EQ(result.modules.size(), 1u);
    EXPECT_TRUE(result.unresolved.empty());
    const auto &module = result.modules[0];
    EXPECT_EQ(module.moduleName, "libfoo_rehost");
    ASSERT_EQ(module.injectedFiles.size(), 1u);
    EXPECT_EQ(module.injectedFiles[0].relativePath, "vendor/lib64/libfoo.so");
    EXPECT_EQ(module.sharedLibs, (std::vector<std::string>{"libbar"}));

    const fs::path moduleDir = fx.injectRoot() / "libfoo_rehost";
    EXPECT_TRUE(fs::exists(moduleDir / "libfoo.so"));
    EXPECT_FALSE(fs::exists(moduleDir / "libbar.so"));

    const std::string blueprint = loadTextFile(moduleDir / "Android.bp");
    EXPECT_NE(blueprint.find("cc_prebuilt_library_shared {"), std::string::npos);
    EXPECT_NE(blueprint.find("name: \"libfoo_rehost\""), std::string::npos);
    EXPECT_NE(blueprint.find("stem: \"libfoo\""), std::string::npos);
    EXPECT_NE(blueprint.find("\"libbar\""), std::string::npos);
    EXPECT_NE(blueprint.find("vendor: true"), std::string::npos);

    const std::string fragment = loadTextFile(result.packagesFragment);
    EXPECT_NE(fragment.find("PRODUCT_PACKAGES"), std::string::npos);
    EXPECT_NE(fragment.find("libfoo_rehost"), std::string::npos);

    EXPECT_EQ(loadTextFile(rehost::inject::runMarkerPath(fx.tree, fx.options.injectDir)), "run-1");
}

TEST(PreBuildInjection, ProvidedLibsCountAsPresent)
{
    Fixture fx("provided");
    rehost::Context ctx(false);
    fx.options.providedLibs = {"libbar"};

    const auto foo = makeArtifact(fx.firmware, "vendor/lib64/libfoo.so", "firmware libfoo");

    rehost::graph::DependencyGraph graph;
    graph.addEdge("libfoo.so", "libbar.so");

    const auto result = rehost::inject::injectPreBuild(strategyWithPolicy("skip"), {foo}, graph, fx.tree, fx.options, ctx);
    ASSERT_EQ(result.modules.size(), 1u);
    EXPECT_TRUE(result.unresolved.empty());
    EXPECT_EQ(result.modules[0].sharedLibs, (std::vector<std::string>{"libbar"}));
}

TEST(PreBuildInjection, MissingDependencyIsBundledFromFirmware)
{
    Fixture fx("bundle");
    rehost::Context ctx(false);

    const auto foo = makeArtifact(fx.firmware, "vendor/lib64/libfoo.so", "firmware libfoo");
    const auto helper = makeArtifact(fx.firmware, "vendor/lib64/hw/libhelper.so", "firmware helper");

    rehost::graph::DependencyGraph graph;
    graph.addEdge("libfoo.so", "libhelper.so");
    graph.addEdge("libfoo.so", "libghost.so");

    const auto result = rehost::inject::injectPreBuild(strategyWithPolicy("fail"), {foo, helper}, graph, fx.tree, fx.options, ctx);

    ASSERT_EQ(result.modules.size(), 1u);
    EXPECT_EQ(result.modules[0].injectedFiles.size(), 2u);
    EXPECT_EQ(result.unresolved, (std::vector<std::string>{"libghost.so"}));
    EXPECT_FALSE(result.warnings.empty());

    const fs::path moduleDir = fx.injectRoot() / "libfoo_rehost";
    EXPECT_TRUE(fs::exists(moduleDir / "libhelper.so"));
    const std::string blueprint = loadTextFile(moduleDir / "Android.bp");
    EXPECT_NE(blueprint.find("name: \"libhelper_rehost\""), std::string::npos);
    EXPECT_NE(blueprint.find("relative_install_path: \"hw\""), std::string::npos);
}

TEST(PreBuildInjection, BundledDependencyMatchesRootElfClass)
{
    Fixture fx("elfclass");
    rehost::Context ctx(false);

    const std::string elf32("\x7f" "ELF" "\x01", 5);
    const std::string elf64("\x7f" "ELF" "\x02", 5);
    const auto foo = makeArtifact(fx.firmware, "vendor/lib64/libfoo.so", elf64 + "libfoo");
    const auto bar32 = makeArtifact(fx.firmware, "vendor/lib/libbar.so", elf32 + "libbar");
    const auto bar64 = makeArtifact(fx.firmware, "vendor/lib64/hw/libbar.so", elf64 + "libbar");
    const auto baz32 = makeArtifact(fx.firmware, "vendor/lib/libbaz.so", elf32 + "libbaz");

    rehost::graph::DependencyGraph graph;
    graph.addEdge("libfoo.so", "libbar.so");
    graph.addEdge("libfoo.so", "libbaz.so");

    const auto result =
        rehost::inject::injectPreBuild(strategyWithPolicy("fail"), {foo, bar32, bar64, baz32}, graph, fx.tree, fx.options, ctx);

    ASSERT_EQ(result.modules.size(), 1u);
    ASSERT_EQ(result.modules[0].injectedFiles.size(), 2u);
    EXPECT_EQ(result.modules[0].injectedFiles[1].relativePath, "vendor/lib64/hw/libbar.so");
    EXPECT_EQ(result.unresolved, (std::vector<std::string>{"libbaz.so"}));
}

TEST(PreBuildInjection, DependencyInjectedFirstIsReferenced)
{
    Fixture fx("order");
    rehost::Context ctx(false);

    const auto foo = makeArtifact(fx.firmware, "vendor/lib64/libfoo.so", "firmware libfoo");
    const auto zed = makeArtifact(fx.firmware, "vendor/lib64/libzed.so", "firmware libzed");

    rehost::graph::DependencyGraph graph;
    graph.addEdge("libfoo.so", "libzed.so");

    const auto result = rehost::inject::injectPreBuild(strategyWithPolicy("fail"), {foo, zed}, graph, fx.tree, fx.options, ctx);

    ASSERT_EQ(result.modules.size(), 2u);
    EXPECT_EQ(result.modules[0].moduleName, "libzed_rehost");
    EXPECT_EQ(result.modules[1].moduleName, "libfoo_rehost");
    EXPECT_EQ(result.modules[1].sharedLibs, (std::vector<std::string>{"libzed_rehost"}));
}

TEST(PreBuildInjection, FailPolicyLeavesTreeUntouched)
{
    Fixture fx("fail");
    rehost::Context ctx(false);

    const auto foo = makeArtifact(fx.firmware, "vendor/lib64/libfoo.so", "firmware libfoo");
    const auto baz = makeArtifact(fx.firmware, "vendor/lib64/libbaz.so", "firmware libbaz");
    writeTextFile(fx.injectRoot() / "libfoo_rehost" / "libfoo.so", "older libfoo");

    rehost::graph::DependencyGraph graph;
    EXPECT_THROW(rehost::inject::injectPreBuild(strategyWithPolicy("fail"), {foo, baz}, graph, fx.tree, fx.options, ctx),
                 rehost::InjectionError);

    EXPECT_FALSE(fs::exists(rehost::inject::runMarkerPath(fx.tree, fx.options.injectDir)));
    EXPECT_FALSE(fs::exists(fx.injectRoot() / "libbaz_rehost"));
    EXPECT_FALSE(fs::exists(fx.injectRoot() / rehost::inject::kPackagesFragment));
    EXPECT_EQ(loadTextFile(fx.injectRoot() / "libfoo_rehost" / "libfoo.so"), "older libfoo");
}

TEST(PreBuildInjection, ReplacePolicyOverwritesAndWarnsOnCollision)
{
    Fixture fx("replace");
    rehost::Context ctx(false);

    const auto foo = makeArtifact(fx.firmware, "vendor/lib64/libfoo.so", "firmware libfoo");
    writeTextFile(fx.injectRoot() / "libfoo_rehost" / "libfoo.so", "older libfoo");

    rehost::graph::DependencyGraph graph;
    const auto result = rehost::inject::injectPreBuild(strategyWithPolicy("replace"), {foo}, graph, fx.tree, fx.options, ctx);

    ASSERT_EQ(result.modules.size(), 1u);
    EXPECT_EQ(result.skippedModules, 0u);
    EXPECT_EQ(loadTextFile(fx.injectRoot() / "libfoo_rehost" / "libfoo.so"), "firmware libfoo");
    ASSERT_FALSE(result.warnings.empty());
    EXPECT_NE(result.warnings[0].find("Version collision"), std::string::npos);
    EXPECT_FALSE(fs::exists(fx.injectRoot() / ".backup-run-1"));
    EXPECT_FALSE(fs::exists(fx.injectRoot() / ".staging-run-1"));
}

TEST(PreBuildInjection, SkipPolicyKeepsExistingModule)
{
    Fixture fx("skip");
    rehost::Context ctx(false);

    const auto foo = makeArtifact(fx.firmware, "vendor/lib64/libfoo.so", "firmware libfoo");
    writeTextFile(fx.injectRoot() / "libfoo_rehost" / "libfoo.so", "older libfoo");

    rehost::graph::DependencyGraph graph;
    const auto result = rehost::inject::injectPreBuild(strategyWithPolicy("skip"), {foo}, graph, fx.tree, fx.options, ctx);

    EXPECT_EQ(result.skippedModules, 1u);
    EXPECT_EQ(loadTextFile(fx.injectRoot() / "libfoo_rehost" / "libfoo.so"), "older libfoo");
}

TEST(PreBuildInjection, TreeClaimedByAnotherRunIsRejected)
{
    Fixture fx("claimed");
    rehost::Context ctx(false);
    writeTextFile(rehost::inject::runMarkerPath(fx.tree, fx.options.injectDir), "run-0");

    const auto foo = makeArtifact(fx.firmware, "vendor/lib64/libfoo.so", "firmware libfoo");
    rehost::graph::DependencyGraph graph;
    EXPECT_THROW(rehost::inject::injectPreBuild(strategyWithPolicy("skip"), {foo}, graph, fx.tree, fx.options, ctx),
                 rehost::InjectionError);
    EXPECT_FALSE(fs::exists(fx.injectRoot() / "libfoo_rehost"));
    EXPECT_EQ(loadTextFile(rehost::inject::runMarkerPath(fx.tree, fx.options.injectDir)), "run-0");
}

TEST(PreBuildInjection, ProductMakefileInheritsFragmentOnce)
{
    Fixture fx("product");
    rehost::Context ctx(false);
    fx.options.productMakefile = "device/generic/goldfish/rehost.mk";
    writeTextFile(fx.tree.root / fx.options.productMakefile, "PRODUCT_NAME := sdk_phone64\n");

    const auto foo = makeArtifact(fx.firmware, "vendor/lib64/libfoo.so", "firmware libfoo");
    rehost::graph::DependencyGraph graph;
    rehost::inject::injectPreBuild(strategyWithPolicy("replace"), {foo}, graph, fx.tree, fx.options, ctx);
    rehost::inject::injectPreBuild(strategyWithPolicy("replace"), {foo}, graph, fx.tree, fx.options, ctx);

    const std::string makefile = loadTextFile(fx.tree.root / fx.options.productMakefile);
    const std::string line = rehost::inject::inheritProductLine("packages/modules/rehost/rehost_packages.mk");
    const auto first = makefile.find(line);
    ASSERT_NE(first, std::string::npos);
    EXPECT_EQ(makefile.find(line, first + 1), std::string::npos);
    EXPECT_EQ(makefile.rfind("PRODUCT_NAME := sdk_phone64", 0), 0u);
}

TEST(PreBuildInjection, BoardConfigIsFittedToPayload)
{
    Fixture fx("board");
    rehost::Context ctx(false);
    fx.options.boardConfig = "build/make/target/board/BoardConfigEmuCommon.mk";
    writeTextFile(fx.tree.root / fx.options.boardConfig,
                  "  BOARD_SUPER_PARTITION_SIZE := 3229614080\n  BOARD_EMULATOR_DYNAMIC_PARTITIONS_SIZE := 3221225472\n");

    const auto foo = makeArtifact(fx.firmware, "vendor/lib64/libfoo.so", "firmware libfoo");
    rehost::graph::DependencyGraph graph;
    const auto result = rehost::inject::injectPreBuild(strategyWithPolicy("skip"), {foo}, graph, fx.tree, fx.options, ctx);

    EXPECT_EQ(result.partitionBytes, rehost::inject::minimalPartitionSize(0));
    const std::string board = loadTextFile(fx.tree.root / fx.options.boardConfig);
    EXPECT_NE(board.find("  BOARD_EMULATOR_DYNAMIC_PARTITIONS_SIZE := " + std::to_string(result.partitionBytes)),
              std::string::npos);
    EXPECT_NE(board.find("  BOARD_SUPER_PARTITION_SIZE := " +
                         std::to_string(result.partitionBytes + rehost::inject::kSuperMetadataBytes)),
              std::string::npos);
}

TEST(PreBuildInjection, BoardConfigWithoutSuperSizeRollsBack)
{
    Fixture fx("board_broken");
    rehost::Context ctx(false);
    fx.options.boardConfig = "build/make/target/board/BoardConfigEmuCommon.mk";
    writeTextFile(fx.tree.root / fx.options.boardConfig, "TARGET_ARCH := x86_64\n");

    const auto foo = makeArtifact(fx.firmware, "vendor/lib64/libfoo.so", "firmware libfoo");
    rehost::graph::DependencyGraph graph;
    EXPECT_THROW(rehost::inject::injectPreBuild(strategyWithPolicy("skip"), {foo}, graph, fx.tree, fx.options, ctx),
                 rehost::InjectionError);

    EXPECT_FALSE(fs::exists(fx.injectRoot() / "libfoo_rehost"));
    EXPECT_FALSE(fs::exists(rehost::inject::runMarkerPath(fx.tree, fx.options.injectDir)));
    EXPECT_EQ(loadTextFile(fx.tree.root / fx.options.boardConfig), "TARGET_ARCH := x86_64\n");
}

TEST(Blueprint, ModuleNamesAndPartitions)
{
    EXPECT_EQ(rehost::inject::sanitizeModuleName("android.hardware.foo@1.0-impl"), "android.hardware.foo@1.0-impl");
    EXPECT_EQ(rehost::inject::sanitizeModuleName("lib foo(1)"), "lib_foo_1_");
    EXPECT_EQ(rehost::inject::installSubdirOf("vendor/lib64/hw/libfoo.so"), "hw");
    EXPECT_EQ(rehost::inject::installSubdirOf("vendor/lib64/libfoo.so"), "");

    rehost::inject::BlueprintEntry entry;
    entry.name = "init.foo.rc_rehost";
    entry.src = "init.foo.rc";
    entry.type = rehost::model::ModuleType::Etc;
    entry.partition = "product";
    entry.installSubdir = "init";
    const std::string text = rehost::inject::renderBlueprintEntry(entry);
    EXPECT_NE(text.find("prebuilt_etc {"), std::string::npos);
    EXPECT_NE(text.find("sub_dir: \"init\""), std::string::npos);
    EXPECT_NE(text.find("product_specific: true"), std::string::npos);
}
