#include "commands/apex_command.hpp"

#include <filesystem>
#include <string>

#include "apex/apex_repackager.hpp"
#include "io/fs_utils.hpp"

namespace fs = std::filesystem;

namespace rehost::commands
{
    namespace
    {

        struct ApexOptions
        {
            fs::path container;
            fs::path overlay;
            apex::SigningConfig signing;
            model::OverwritePolicy policy = model::OverwritePolicy::Replace;
        };

        bool parseOptions(const std::vector<std::string> &args, ApexOptions &opt, const rehost::Context &ctx)
        {
            std::vector<std::string> positionals;
            for (size_t i = 0; i < args.size(); ++i)
            {
                const std::string &arg = args[i];
                const bool takesValue = arg == "--key" || arg == "--cert" || arg == "--sign-tool" || arg == "--policy";
                if (takesValue && i + 1 >= args.size())
                {
                    ctx.error(arg, " requires value");
                    return false;
                }
                if (arg == "--key")
                {
                    opt.signing.key = args[++i];
                    continue;
                }
                if (arg == "--cert")
                {
                    opt.signing.cert = args[++i];
                    continue;
                }
                if (arg == "--sign-tool")
                {
                    opt.signing.signTool = args[++i];
                    opt.signing.signArgs = {"{key}", "{cert}", "{input}", "{output}"};
                    continue;
                }
                if (arg == "--policy")
                {
                    const auto policy = model::parseOverwritePolicy(args[++i]);
                    if (!policy.has_value())
                    {
                        ctx.error("Invalid --policy: ", args[i], " (use fail|skip|replace)");
                        return false;
                    }
                    opt.policy = policy.value();
                    continue;
                }
                if (arg.rfind("--", 0) == 0)
                {
                    ctx.error("Unknown option: ", arg);
                    return false;
                }
                positionals.push_back(arg);
            }

            if (positionals.size() != 2 || opt.signing.key.empty() || opt.signing.cert.empty())
            {
                ctx.error("Usage: apex <container.apex|container.capex> <overlay_dir> --key <key> --cert <cert> [--sign-tool T] [--policy P]");
                return false;
            }
            opt.container = fs::absolute(positionals[0]);
            opt.overlay = fs::absolute(positionals[1]);
            return true;
        }

    } // namespace

    int runApexCommand(const rehost::Context &ctx, const std::vector<std::string> &args)
    {
        ApexOptions opt;
        if (!parseOptions(args, opt, ctx))
        {
            return 1;
        }

        std::error_code ec;
        if (!fs::is_directory(opt.overlay, ec))
        {
            ctx.error("Overlay directory not found: ", opt.overlay.string());
            return 1;
        }

        apex::ApexJob job;
        job.container = opt.container;
        if (opt.container.extension() == ".capex")
        {
            job.compressed = opt.container;
            job.container = fs::path(opt.container).replace_extension(".apex");
        }
        for (const auto &relative : io::listFilesRecursive(opt.overlay))
        {
            apex::PayloadOverlay overlay;
            overlay.payloadPath = relative.generic_string();
            overlay.source = opt.overlay / relative;
            overlay.sha256 = io::sha256File(overlay.source).value_or("");
            overlay.policy = opt.policy;
            job.overlays.push_back(std::move(overlay));
        }

        const apex::ApexOutcome outcome = apex::repackageContainer(job, apex::ApexTools{}, opt.signing, ctx);
        if (!outcome.ok)
        {
            return 2;
        }
        ctx.log(opt.container.filename().string(), ": ", outcome.finalState);
        return 0;
    }

} // namespace rehost::commands
