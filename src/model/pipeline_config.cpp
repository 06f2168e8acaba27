#include "model/pipeline_config.hpp"

#include "core/errors.hpp"
#include "io/json_reader.hpp"

namespace fs = std::filesystem;
using nlohmann::json;

namespace rehost::model
{
    namespace
    {

        constexpr int kMinAndroidVersion = 11;
        constexpr int kMaxAndroidVersion = 14;

        std::string readString(const json &node, const char *key, const std::string &fallback = "")
        {
            if (!node.contains(key) || node[key].is_null())
            {
                return fallback;
            }
            if (!node[key].is_string())
            {
                throw ConfigError(std::string("'") + key + "' must be a string");
            }
            return node[key].get<std::string>();
        }

        std::vector<std::string> readStringList(const json &node, const char *key)
        {
            std::vector<std::string> out;
            if (!node.contains(key))
            {
                return out;
            }
            if (!node[key].is_array())
            {
                throw ConfigError(std::string("'") + key + "' must be an array of strings");
            }
            for (const auto &item : node[key])
            {
                if (!item.is_string())
                {
                    throw ConfigError(std::string("'") + key + "' must be an array of strings");
                }
                out.push_back(item.get<std::string>());
            }
            return out;
        }

        fs::path resolvePath(const fs::path &baseDir, const std::string &value)
        {
            if (value.empty())
            {
                return {};
            }
            fs::path raw(value);
            if (raw.is_absolute())
            {
                return raw.lexically_normal();
            }
            return (baseDir / raw).lexically_normal();
        }

        const json &objectOrEmpty(const json &data, const char *key)
        {
            static const json empty = json::object();
            if (!data.contains(key))
            {
                return empty;
            }
            if (!data[key].is_object())
            {
                throw ConfigError(std::string("'") + key + "' must be an object");
            }
            return data[key];
        }

    } // namespace

    std::string defaultLunchTarget(const std::string &arch, int androidVersion)
    {
        if (arch == "arm64")
        {
            if (androidVersion <= 12)
            {
                return "sdk_phone_arm64-userdebug";
            }
            if (androidVersion == 13)
            {
                return "sdk_phone64_arm64-userdebug";
            }
            return "sdk_phone64_arm64-ap2a-userdebug";
        }
        return "sdk_phone_x86_64-userdebug";
    }

    std::string productDeviceFor(const std::string &lunchTarget)
    {
        const std::string product = lunchTarget.substr(0, lunchTarget.find('-'));
        const bool releaseConfig = lunchTarget.find("-ap") != std::string::npos;

        if (product == "sdk_phone64_arm64")
        {
            return releaseConfig ? "emu64a" : "emulator64_arm64";
        }
        if (product == "sdk_phone_arm64")
        {
            return "emulator_arm64";
        }
        if (product == "sdk_phone64_x86_64")
        {
            return releaseConfig ? "emu64x" : "emulator64_x86_64";
        }
        if (product == "sdk_phone_x86_64")
        {
            return "emulator_x86_64";
        }
        return "generic";
    }

    std::vector<std::string> defaultBuildGoals(int androidVersion)
    {
        if (androidVersion <= 12)
        {
            return {"", "sdk"};
        }
        return {""};
    }

    std::vector<std::string> defaultPackageGoals(int androidVersion)
    {
        if (androidVersion <= 11)
        {
            return {"sdk_repo", "dist"};
        }
        if (androidVersion == 12)
        {
            return {"sdk_repo", "emu_img_zip"};
        }
        return {"emu_img_zip"};
    }

    PipelineConfig parsePipelineConfig(const json &data, const fs::path &baseDir)
    {
        if (!data.is_object())
        {
            throw ConfigError("pipeline config root must be an object");
        }

        PipelineConfig config;
        config.firmwareId = readString(data, "firmware_id");
        if (config.firmwareId.empty())
        {
            throw ConfigError("'firmware_id' is required");
        }

        if (!data.contains("android_version") || !data["android_version"].is_number_integer())
        {
            throw ConfigError("'android_version' must be an integer");
        }
        config.androidVersion = data["android_version"].get<int>();
        if (config.androidVersion < kMinAndroidVersion || config.androidVersion > kMaxAndroidVersion)
        {
            throw ConfigError("unsupported android_version " + std::to_string(config.androidVersion) +
                              " (supported " + std::to_string(kMinAndroidVersion) + "-" +
                              std::to_string(kMaxAndroidVersion) + ")");
        }

        config.arch = readString(data, "arch", "x86_64");
        if (config.arch != "x86_64" && config.arch != "arm64")
        {
            throw ConfigError("unsupported arch '" + config.arch + "' (use x86_64|arm64)");
        }
        config.lunchTarget = readString(data, "lunch_target", defaultLunchTarget(config.arch, config.androidVersion));

        const json &tree = objectOrEmpty(data, "tree");
        config.tree.root = resolvePath(baseDir, readString(tree, "root"));
        if (config.tree.root.empty())
        {
            throw ConfigError("'tree.root' is required");
        }
        config.tree.checkoutId = readString(tree, "checkout_id", config.tree.root.filename().string());
        config.tree.injectDir = readString(tree, "inject_dir", config.tree.injectDir);
        config.tree.presenceDirs = readStringList(tree, "presence_dirs");
        config.tree.providedLibs = readStringList(tree, "provided_libs");
        config.tree.productMakefile = readString(tree, "product_makefile");
        config.tree.boardConfig = readString(tree, "board_config");

        config.firmwareRoot = resolvePath(baseDir, readString(data, "firmware_root"));
        if (config.firmwareRoot.empty())
        {
            throw ConfigError("'firmware_root' is required");
        }
        config.strategy = resolvePath(baseDir, readString(data, "strategy"));
        if (config.strategy.empty())
        {
            throw ConfigError("'strategy' is required");
        }
        config.dependencies = resolvePath(baseDir, readString(data, "dependencies"));

        const std::string buildOutput = readString(data, "build_output");
        config.buildOutput = buildOutput.empty()
                                 ? config.tree.root / "out" / "target" / "product" / productDeviceFor(config.lunchTarget)
                                 : resolvePath(baseDir, buildOutput);
        if (!data.contains("tree") || !tree.contains("presence_dirs"))
        {
            config.tree.presenceDirs.push_back(config.buildOutput.lexically_relative(config.tree.root).generic_string());
        }

        const json &build = objectOrEmpty(data, "build");
        config.build.command = readString(build, "command");
        config.build.packageCommand = readString(build, "package_command");
        if (build.contains("timeout_seconds"))
        {
            const json &timeout = build["timeout_seconds"];
            const bool inRange = timeout.is_number_unsigned()
                                     ? timeout.get<unsigned long long>() <= static_cast<unsigned long long>(kMaxBuildTimeoutSeconds)
                                     : timeout.is_number_integer() && timeout.get<long long>() >= 0 &&
                                           timeout.get<long long>() <= kMaxBuildTimeoutSeconds;
            if (!inRange)
            {
                throw ConfigError("'build.timeout_seconds' must be an integer between 0 and " +
                                  std::to_string(kMaxBuildTimeoutSeconds));
            }
            config.build.timeout = std::chrono::seconds(timeout.get<long long>());
        }
        config.build.goals = build.contains("goals") ? readStringList(build, "goals") : defaultBuildGoals(config.androidVersion);
        config.build.packageGoals = build.contains("package_goals") ? readStringList(build, "package_goals")
                                                                     : defaultPackageGoals(config.androidVersion);
        if (build.contains("skip_package"))
        {
            if (!build["skip_package"].is_boolean())
            {
                throw ConfigError("'build.skip_package' must be a boolean");
            }
            config.build.skipPackage = build["skip_package"].get<bool>();
        }

        const json &apex = objectOrEmpty(data, "apex");
        config.apex.key = resolvePath(baseDir, readString(apex, "key"));
        config.apex.cert = resolvePath(baseDir, readString(apex, "cert"));
        config.apex.signTool = readString(apex, "sign_tool");
        config.apex.signArgs = readStringList(apex, "sign_args");
        config.apex.archiveUnpack = readString(apex, "archive_unpack");
        config.apex.archivePack = readString(apex, "archive_pack");
        config.apex.imageUnpack = readString(apex, "image_unpack");
        config.apex.imagePack = readString(apex, "image_pack");

        if (data.contains("workers"))
        {
            if (!data["workers"].is_number_unsigned())
            {
                throw ConfigError("'workers' must be a non-negative integer");
            }
            config.workers = data["workers"].get<std::size_t>();
        }

        config.logDir = resolvePath(baseDir, readString(data, "log_dir", "logs"));
        config.runLog = resolvePath(baseDir, readString(data, "run_log", "runs.json"));
        return config;
    }

    PipelineConfig loadPipelineConfig(const fs::path &configFile)
    {
        json data;
        try
        {
            data = io::loadJsonFile(configFile);
        }
        catch (const std::exception &e)
        {
            throw ConfigError(e.what());
        }

        const fs::path absolute = fs::absolute(configFile);
        PipelineConfig config = parsePipelineConfig(data, absolute.parent_path());
        config.configFile = absolute;
        return config;
    }

} // namespace rehost::model
