#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>

#include <gtest/gtest.h>

#include "build/build_driver.hpp"
#include "core/context.hpp"

namespace fs = std::filesystem;

namespace
{

    fs::path makeTempRoot(const std::string &name)
    {
        const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
        return fs::temp_directory_path() / ("rehost_build_test_" + name + "_" + std::to_string(now));
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

} // namespace

TEST(BuildScript, ChainsOneMakePerGoal)
{
    EXPECT_EQ(rehost::build::composeBuildScript("sdk_phone_x86_64-userdebug", {"", "sdk"}),
              "source build/envsetup.sh && lunch sdk_phone_x86_64-userdebug && m && m sdk");
    EXPECT_EQ(rehost::build::composeBuildScript("sdk_phone64_x86_64-userdebug", {}),
              "source build/envsetup.sh && lunch sdk_phone64_x86_64-userdebug && m");
}

TEST(BuildDriver, SuccessWritesLog)
{
    const fs::path root = makeTempRoot("ok");
    cleanupTemp(root);
    fs::create_directories(root / "tree");
    rehost::Context ctx(false);

    rehost::build::BuildRequest request;
    request.commandOverride = "echo building in $(pwd)";
    request.logDir = root / "logs";
    request.logName = "run_build";

    const auto result = rehost::build::runBuild({root / "tree", "tree"}, request, ctx);
    EXPECT_EQ(result.status, rehost::build::BuildStatus::Success);
    EXPECT_TRUE(result.reason.empty());
    EXPECT_EQ(result.logRef, root / "logs" / "run_build.log");
    EXPECT_NE(loadTextFile(result.logRef).find("building in"), std::string::npos);

    cleanupTemp(root);
}

TEST(BuildDriver, NonZeroExitIsFailure)
{
    const fs::path root = makeTempRoot("exit");
    cleanupTemp(root);
    fs::create_directories(root);
    rehost::Context ctx(false);

    rehost::build::BuildRequest request;
    request.commandOverride = "exit 7";

    const auto result = rehost::build::runBuild({root, "tree"}, request, ctx);
    EXPECT_EQ(result.status, rehost::build::BuildStatus::Failure);
    EXPECT_EQ(result.exitCode, 7);
    EXPECT_EQ(result.reason, "exit code 7");

    cleanupTemp(root);
}

TEST(BuildDriver, TimeoutIsFailureWithReason)
{
    const fs::path root = makeTempRoot("timeout");
    cleanupTemp(root);
    fs::create_directories(root);
    rehost::Context ctx(false);

    rehost::build::BuildRequest request;
    request.commandOverride = "sleep 5";
    request.timeout = std::chrono::seconds(1);

    const auto start = std::chrono::steady_clock::now();
    const auto result = rehost::build::runBuild({root, "tree"}, request, ctx);
    const double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

    EXPECT_EQ(result.status, rehost::build::BuildStatus::Failure);
    EXPECT_EQ(result.reason, "timeout");
    EXPECT_LT(elapsed, 4.5);

    cleanupTemp(root);
}
