#include "inject/board_config.hpp"

#include <sstream>
#include <system_error>

#include "core/errors.hpp"
#include "io/fs_utils.hpp"

namespace fs = std::filesystem;

namespace rehost::inject
{
    namespace
    {

        constexpr const char *kSuperSize = "BOARD_SUPER_PARTITION_SIZE";
        constexpr const char *kDynamicSuffix = "_DYNAMIC_PARTITIONS_SIZE";

        // Variable assigned on the line, empty for comments and other lines.
        std::string assignedVariable(const std::string &line)
        {
            const std::size_t start = line.find_first_not_of(" \t");
            if (start == std::string::npos || line[start] == '#')
            {
                return {};
            }
            const std::size_t end = line.find_first_of(" \t:?+=", start);
            if (end == std::string::npos || line.find('=', end) == std::string::npos)
            {
                return {};
            }
            return line.substr(start, end - start);
        }

        bool endsWith(const std::string &value, const std::string &suffix)
        {
            return value.size() >= suffix.size() && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
        }

    } // namespace

    std::uintmax_t minimalPartitionSize(std::uintmax_t payloadBytes)
    {
        std::uintmax_t size = 4 * kGiB;
        while (size < payloadBytes + 10 * kGiB)
        {
            size += 64 * kGiB;
        }
        return size;
    }

    std::string resizedBoardConfig(const std::string &content, std::uintmax_t groupBytes)
    {
        std::istringstream in(content);
        std::ostringstream out;
        std::string line;
        bool sawSuper = false;
        bool first = true;
        while (std::getline(in, line))
        {
            if (!first)
            {
                out << '\n';
            }
            first = false;

            const std::string variable = assignedVariable(line);
            const std::string indent = line.substr(0, line.find_first_not_of(" \t"));
            if (variable == kSuperSize)
            {
                sawSuper = true;
                out << indent << variable << " := " << groupBytes + kSuperMetadataBytes;
            }
            else if (variable.rfind("BOARD_", 0) == 0 && endsWith(variable, kDynamicSuffix))
            {
                out << indent << variable << " := " << groupBytes;
            }
            else
            {
                out << line;
            }
        }
        if (!content.empty() && content.back() == '\n')
        {
            out << '\n';
        }

        if (!sawSuper)
        {
            throw InjectionError(std::string("Board config has no ") + kSuperSize + " assignment");
        }
        return out.str();
    }

    std::uintmax_t injectedPayloadBytes(const fs::path &root)
    {
        std::uintmax_t total = 0;
        for (const auto &relative : io::listFilesRecursive(root))
        {
            bool hidden = false;
            for (const auto &part : relative)
            {
                if (part.string().rfind('.', 0) == 0)
                {
                    hidden = true;
                    break;
                }
            }
            if (hidden)
            {
                continue;
            }
            std::error_code ec;
            const std::uintmax_t size = fs::file_size(root / relative, ec);
            if (ec)
            {
                throw InjectionError("Could not size " + (root / relative).string() + ": " + ec.message());
            }
            total += size;
        }
        return total;
    }

} // namespace rehost::inject
