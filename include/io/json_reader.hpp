#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace rehost::io {

nlohmann::json loadJsonFile(const std::filesystem::path &path);
nlohmann::json loadJsonDocument(const std::filesystem::path &path);
bool writeJsonFile(const std::filesystem::path &path, const nlohmann::json &data);
std::vector<std::string> splitFlags(const std::string &text);

} // namespace rehost::io
