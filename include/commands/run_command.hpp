#pragma once

#include <string>
#include <vector>

#include "core/context.hpp"

namespace rehost::commands {

int runRunCommand(const rehost::Context &ctx, const std::vector<std::string> &args);
int runBatchCommand(const rehost::Context &ctx, const std::vector<std::string> &args);

} // namespace rehost::commands
