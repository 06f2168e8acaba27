#include "commands/validate_command.hpp"

#include <filesystem>
#include <map>
#include <string>

#include "core/errors.hpp"
#include "model/firmware.hpp"
#include "model/strategy_loader.hpp"

namespace fs = std::filesystem;

namespace rehost::commands
{

    int runValidateCommand(const rehost::Context &ctx, const std::vector<std::string> &args)
    {
        std::string strategyFile;
        std::string firmwareDir;
        for (size_t i = 0; i < args.size(); ++i)
        {
            const std::string &arg = args[i];
            if (arg == "--firmware")
            {
                if (i + 1 >= args.size())
                {
                    ctx.error("--firmware requires value");
                    return 1;
                }
                firmwareDir = args[++i];
                continue;
            }
            if (arg.rfind("--", 0) == 0)
            {
                ctx.error("Unknown option: ", arg);
                return 1;
            }
            if (!strategyFile.empty())
            {
                ctx.error("Unexpected argument: ", arg);
                return 1;
            }
            strategyFile = arg;
        }
        if (strategyFile.empty())
        {
            ctx.error("Usage: validate <strategy.json> [--firmware <dir>]");
            return 1;
        }

        model::InjectionStrategy strategy;
        try
        {
            strategy = model::loadStrategy(strategyFile, ctx);
        }
        catch (const ConfigError &e)
        {
            ctx.error("Invalid strategy: ", e.what());
            return 1;
        }

        ctx.log("Resolution order:");
        for (std::size_t index : strategy.resolutionOrder)
        {
            const auto &rule = strategy.rules[index];
            ctx.log("  #", rule.declarationIndex, "  ", rule.pattern, "  -> ", model::toString(rule.moduleType), " [",
                    model::toString(rule.phase), ", ", model::toString(rule.overwritePolicy), "]");
        }

        if (firmwareDir.empty())
        {
            return 0;
        }

        std::vector<model::FirmwareArtifact> artifacts;
        try
        {
            model::DirectoryFirmwareSource source(firmwareDir, ctx);
            artifacts = source.fetch("");
        }
        catch (const std::exception &e)
        {
            ctx.error(e.what());
            return 1;
        }

        std::map<std::string, std::size_t> perType;
        std::size_t unmatched = 0;
        for (const auto &artifact : artifacts)
        {
            const auto match = model::matchArtifact(strategy, artifact);
            if (!match.has_value())
            {
                ++unmatched;
                ctx.debug("  ", artifact.relativePath, "  -> <none>");
                continue;
            }
            ++perType[model::toString(match->rule->phase) + "/" + model::toString(match->moduleType)];
            ctx.log("  ", artifact.relativePath, "  -> ", model::toString(match->moduleType), " (", match->rule->pattern,
                    ")");
        }

        ctx.log("Matched ", artifacts.size() - unmatched, " of ", artifacts.size(), " artifacts");
        for (const auto &[key, count] : perType)
        {
            ctx.log("  ", key, ": ", count);
        }
        return 0;
    }

} // namespace rehost::commands
