#include "inject/blueprint.hpp"

#include <cctype>
#include <filesystem>
#include <sstream>

#include "inject/partition_paths.hpp"

namespace fs = std::filesystem;

namespace rehost::inject
{
    namespace
    {

        void writeList(std::ostringstream &out, const char *key, const std::vector<std::string> &values)
        {
            if (values.empty())
            {
                return;
            }
            out << "    " << key << ": [\n";
            for (const auto &value : values)
            {
                out << "        \"" << value << "\",\n";
            }
            out << "    ],\n";
        }

        void writeString(std::ostringstream &out, const char *key, const std::string &value)
        {
            if (!value.empty())
            {
                out << "    " << key << ": \"" << value << "\",\n";
            }
        }

    } // namespace

    std::string blueprintModuleType(model::ModuleType type)
    {
        switch (type)
        {
        case model::ModuleType::SharedLib:
            return "cc_prebuilt_library_shared";
        case model::ModuleType::Executable:
            return "cc_prebuilt_binary";
        case model::ModuleType::App:
            return "android_app_import";
        case model::ModuleType::JavaLib:
            return "java_import";
        case model::ModuleType::Apex:
            return "prebuilt_apex";
        case model::ModuleType::Etc:
        case model::ModuleType::Misc:
        case model::ModuleType::ApexPayload:
        case model::ModuleType::Auto:
            return "prebuilt_etc";
        }
        return "prebuilt_etc";
    }

    std::string sanitizeModuleName(const std::string &value)
    {
        std::string out;
        out.reserve(value.size());
        for (unsigned char c : value)
        {
            if (std::isalnum(c) || c == '_' || c == '-' || c == '.' || c == '+' || c == '@')
            {
                out.push_back(static_cast<char>(c));
            }
            else
            {
                out.push_back('_');
            }
        }
        if (out.empty())
        {
            out = "module";
        }
        return out;
    }

    std::string installSubdirOf(const std::string &normalizedPath)
    {
        const fs::path parent = fs::path(normalizedPath).parent_path();
        std::vector<std::string> parts;
        for (const auto &part : parent)
        {
            parts.push_back(part.string());
        }

        for (std::size_t i = 0; i < parts.size(); ++i)
        {
            const std::string &part = parts[i];
            if (part == "lib" || part == "lib64" || part == "bin" || part == "etc")
            {
                fs::path rest;
                for (std::size_t j = i + 1; j < parts.size(); ++j)
                {
                    rest /= parts[j];
                }
                return rest.generic_string();
            }
        }
        return "";
    }

    std::string renderBlueprintEntry(const BlueprintEntry &entry)
    {
        std::ostringstream out;
        out << blueprintModuleType(entry.type) << " {\n";
        writeString(out, "name", entry.name);

        switch (entry.type)
        {
        case model::ModuleType::SharedLib:
        case model::ModuleType::Executable:
            writeString(out, "stem", entry.stem);
            writeList(out, "srcs", {entry.src});
            writeString(out, "relative_install_path", entry.installSubdir);
            out << "    compile_multilib: \"" << (entry.is64Bit ? "64" : "32") << "\",\n";
            writeList(out, "shared_libs", entry.sharedLibs);
            out << "    check_elf_files: false,\n";
            out << "    strip: {\n        none: true,\n    },\n";
            break;
        case model::ModuleType::App:
            writeString(out, "apk", entry.src);
            out << "    presigned: true,\n";
            out << "    dex_preopt: {\n        enabled: false,\n    },\n";
            break;
        case model::ModuleType::JavaLib:
            writeList(out, "jars", {entry.src});
            out << "    installable: true,\n";
            break;
        case model::ModuleType::Apex:
            writeString(out, "src", entry.src);
            writeString(out, "filename", entry.src);
            break;
        default:
            writeString(out, "src", entry.src);
            writeString(out, "filename", entry.src);
            writeString(out, "sub_dir", entry.installSubdir);
            break;
        }

        const std::string partition = partitionProperty(entry.partition);
        if (!partition.empty())
        {
            out << "    " << partition << ",\n";
        }
        out << "}\n";
        return out.str();
    }

    std::string renderBlueprint(const std::vector<BlueprintEntry> &entries)
    {
        std::ostringstream out;
        out << "// Generated by rehost. Do not edit.\n";
        for (const auto &entry : entries)
        {
            out << '\n'
                << renderBlueprintEntry(entry);
        }
        return out.str();
    }

    std::string renderPackagesFragment(const std::vector<std::string> &moduleNames)
    {
        std::ostringstream out;
        out << "# Generated by rehost. Do not edit.\n";
        if (moduleNames.empty())
        {
            return out.str();
        }
        out << "PRODUCT_PACKAGES += \\\n";
        for (std::size_t i = 0; i < moduleNames.size(); ++i)
        {
            out << "    " << moduleNames[i] << (i + 1 < moduleNames.size() ? " \\\n" : "\n");
        }
        return out.str();
    }

    std::string inheritProductLine(const std::string &fragmentPath)
    {
        return "$(call inherit-product, " + fragmentPath + ")";
    }

} // namespace rehost::inject
