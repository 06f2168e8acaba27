#include "inject/partition_paths.hpp"

#include <array>

namespace rehost::inject
{
    namespace
    {

        bool startsWith(const std::string &value, const std::string &prefix)
        {
            return value.compare(0, prefix.size(), prefix) == 0;
        }

    } // namespace

    std::string normalizeOutputPath(const std::string &relativePath)
    {
        std::string path = relativePath;
        while (startsWith(path, "./"))
        {
            path.erase(0, 2);
        }
        while (startsWith(path, "/"))
        {
            path.erase(0, 1);
        }

        if (startsWith(path, "super/"))
        {
            path = "system/" + path.substr(6);
        }
        while (startsWith(path, "system/system/"))
        {
            path.erase(0, 7);
        }

        static const std::array<const char *, 3> kNested = {"vendor/", "product/", "system_ext/"};
        for (const char *nested : kNested)
        {
            const std::string prefix = std::string("system/") + nested;
            if (startsWith(path, prefix))
            {
                path.erase(0, 7);
                break;
            }
        }
        return path;
    }

    std::string partitionOf(const std::string &relativePath)
    {
        const std::string path = normalizeOutputPath(relativePath);
        return path.substr(0, path.find('/'));
    }

    std::string partitionProperty(const std::string &partition)
    {
        if (partition == "vendor")
        {
            return "vendor: true";
        }
        if (partition == "product")
        {
            return "product_specific: true";
        }
        if (partition == "system_ext")
        {
            return "system_ext_specific: true";
        }
        if (partition == "odm")
        {
            return "device_specific: true";
        }
        return "";
    }

} // namespace rehost::inject
