#include "io/json_reader.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

#include "io/fs_utils.hpp"

namespace rehost::io
{

    nlohmann::json loadJsonDocument(const std::filesystem::path &path)
    {
        std::ifstream in(path);
        if (!in.is_open())
        {
            throw std::runtime_error("Could not open JSON file: " + path.string());
        }

        nlohmann::json data;
        try
        {
            in >> data;
        }
        catch (const nlohmann::json::parse_error &e)
        {
            throw std::runtime_error("Invalid JSON in " + path.string() + ": " + e.what());
        }
        return data;
    }

    nlohmann::json loadJsonFile(const std::filesystem::path &path)
    {
        nlohmann::json data = loadJsonDocument(path);
        if (!data.is_object())
        {
            throw std::runtime_error("JSON root is not object: " + path.string());
        }
        return data;
    }

    bool writeJsonFile(const std::filesystem::path &path, const nlohmann::json &data)
    {
        return writeFileAtomic(path, data.dump(4) + "\n");
    }

    std::vector<std::string> splitFlags(const std::string &text)
    {
        std::vector<std::string> out;
        std::istringstream input(text);
        std::string token;
        while (input >> token)
        {
            if (!token.empty())
            {
                out.push_back(token);
            }
        }
        return out;
    }

} // namespace rehost::io
