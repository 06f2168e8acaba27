#include "io/fs_utils.hpp"

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <system_error>

#include <openssl/evp.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace rehost::io
{
    namespace
    {

        constexpr std::size_t kReadChunk = 64 * 1024;

        std::string uniqueSuffix()
        {
            static std::atomic<unsigned long> counter{0};
            const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
            std::ostringstream out;
            out << getpid() << '_' << now << '_' << counter.fetch_add(1);
            return out.str();
        }

        fs::path siblingTemp(const fs::path &target)
        {
            return target.parent_path() / ("." + target.filename().string() + ".tmp-" + uniqueSuffix());
        }

    } // namespace

    bool ensureDir(const fs::path &path)
    {
        std::error_code ec;
        if (fs::exists(path, ec))
        {
            return fs::is_directory(path, ec);
        }
        return fs::create_directories(path, ec) && !ec;
    }

    std::vector<fs::path> listFilesRecursive(const fs::path &root)
    {
        std::vector<fs::path> out;
        std::error_code ec;
        if (!fs::is_directory(root, ec))
        {
            return out;
        }

        for (auto it = fs::recursive_directory_iterator(root, ec); !ec && it != fs::recursive_directory_iterator(); it.increment(ec))
        {
            if (!it->is_regular_file(ec))
            {
                continue;
            }
            out.push_back(it->path().lexically_relative(root));
        }

        std::sort(out.begin(), out.end());
        return out;
    }

    std::optional<std::string> sha256File(const fs::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        if (!in.is_open())
        {
            return std::nullopt;
        }

        std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> md(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
        if (!md || EVP_DigestInit_ex(md.get(), EVP_sha256(), nullptr) != 1)
        {
            return std::nullopt;
        }

        std::vector<char> buffer(kReadChunk);
        while (in)
        {
            in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            const std::streamsize got = in.gcount();
            if (got > 0 && EVP_DigestUpdate(md.get(), buffer.data(), static_cast<std::size_t>(got)) != 1)
            {
                return std::nullopt;
            }
        }
        if (in.bad())
        {
            return std::nullopt;
        }

        std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
        unsigned int length = 0;
        if (EVP_DigestFinal_ex(md.get(), digest.data(), &length) != 1)
        {
            return std::nullopt;
        }

        std::ostringstream hex;
        hex << std::hex << std::setfill('0');
        for (unsigned int i = 0; i < length; ++i)
        {
            hex << std::setw(2) << static_cast<int>(digest[i]);
        }
        return hex.str();
    }

    ElfClass readElfClass(const fs::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        std::array<char, 5> header{};
        if (!in.read(header.data(), static_cast<std::streamsize>(header.size())))
        {
            return ElfClass::None;
        }
        if (header[0] != 0x7f || header[1] != 'E' || header[2] != 'L' || header[3] != 'F')
        {
            return ElfClass::None;
        }
        if (header[4] == 1)
        {
            return ElfClass::Elf32;
        }
        if (header[4] == 2)
        {
            return ElfClass::Elf64;
        }
        return ElfClass::None;
    }

    std::optional<std::string> readTextFile(const fs::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        if (!in.is_open())
        {
            return std::nullopt;
        }
        std::ostringstream out;
        out << in.rdbuf();
        return out.str();
    }

    bool writeFileAtomic(const fs::path &path, const std::string &content)
    {
        if (!path.parent_path().empty() && !ensureDir(path.parent_path()))
        {
            return false;
        }

        const fs::path temp = siblingTemp(path);
        {
            std::ofstream out(temp, std::ios::binary | std::ios::trunc);
            if (!out.is_open())
            {
                return false;
            }
            out << content;
            out.flush();
            if (!out)
            {
                std::error_code ec;
                fs::remove(temp, ec);
                return false;
            }
        }

        std::error_code ec;
        fs::rename(temp, path, ec);
        if (ec)
        {
            fs::remove(temp, ec);
            return false;
        }
        return true;
    }

    bool copyFileAtomic(const fs::path &from, const fs::path &to)
    {
        if (!to.parent_path().empty() && !ensureDir(to.parent_path()))
        {
            return false;
        }

        const fs::path temp = siblingTemp(to);
        std::error_code ec;
        fs::copy_file(from, temp, fs::copy_options::overwrite_existing, ec);
        if (ec)
        {
            fs::remove(temp, ec);
            return false;
        }
        fs::permissions(temp, fs::status(from, ec).permissions(), ec);
        fs::rename(temp, to, ec);
        if (ec)
        {
            fs::remove(temp, ec);
            return false;
        }
        return true;
    }

    fs::path makeScratchDir(const std::string &tag)
    {
        const fs::path dir = fs::temp_directory_path() / ("rehost_" + tag + "_" + uniqueSuffix());
        ensureDir(dir);
        return dir;
    }

} // namespace rehost::io
