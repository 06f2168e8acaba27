#include "model/specs.hpp"

#include <algorithm>
#include <cctype>

namespace rehost::model
{
    namespace
    {

        std::string lower(std::string value)
        {
            std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return value;
        }

    } // namespace

    std::string toString(ModuleType type)
    {
        switch (type)
        {
        case ModuleType::SharedLib:
            return "shared_lib";
        case ModuleType::Executable:
            return "executable";
        case ModuleType::App:
            return "app";
        case ModuleType::JavaLib:
            return "java_lib";
        case ModuleType::Etc:
            return "etc";
        case ModuleType::Apex:
            return "apex";
        case ModuleType::ApexPayload:
            return "apex_payload";
        case ModuleType::Misc:
            return "misc";
        case ModuleType::Auto:
            return "auto";
        }
        return "misc";
    }

    std::string toString(Phase phase)
    {
        return phase == Phase::PreBuild ? "pre_build" : "post_build";
    }

    std::string toString(OverwritePolicy policy)
    {
        switch (policy)
        {
        case OverwritePolicy::Fail:
            return "fail";
        case OverwritePolicy::Skip:
            return "skip";
        case OverwritePolicy::Replace:
            return "replace";
        }
        return "fail";
    }

    std::optional<ModuleType> parseModuleType(const std::string &value)
    {
        const std::string key = lower(value);
        if (key == "shared_lib" || key == "shared_libraries")
        {
            return ModuleType::SharedLib;
        }
        if (key == "executable" || key == "executables")
        {
            return ModuleType::Executable;
        }
        if (key == "app" || key == "apps")
        {
            return ModuleType::App;
        }
        if (key == "java_lib" || key == "java_libraries")
        {
            return ModuleType::JavaLib;
        }
        if (key == "etc")
        {
            return ModuleType::Etc;
        }
        if (key == "apex")
        {
            return ModuleType::Apex;
        }
        if (key == "apex_payload")
        {
            return ModuleType::ApexPayload;
        }
        if (key == "misc")
        {
            return ModuleType::Misc;
        }
        if (key == "auto")
        {
            return ModuleType::Auto;
        }
        return std::nullopt;
    }

    std::optional<Phase> parsePhase(const std::string &value)
    {
        const std::string key = lower(value);
        if (key == "pre_build" || key == "prebuild")
        {
            return Phase::PreBuild;
        }
        if (key == "post_build" || key == "postbuild")
        {
            return Phase::PostBuild;
        }
        return std::nullopt;
    }

    std::optional<OverwritePolicy> parseOverwritePolicy(const std::string &value)
    {
        const std::string key = lower(value);
        if (key == "fail")
        {
            return OverwritePolicy::Fail;
        }
        if (key == "skip")
        {
            return OverwritePolicy::Skip;
        }
        if (key == "replace")
        {
            return OverwritePolicy::Replace;
        }
        return std::nullopt;
    }

} // namespace rehost::model
