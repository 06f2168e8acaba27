#include "commands/run_command.hpp"

#include <filesystem>
#include <string>
#include <vector>

#include "core/errors.hpp"
#include "model/pipeline_config.hpp"
#include "pipeline/orchestrator.hpp"

namespace fs = std::filesystem;

namespace rehost::commands
{
    namespace
    {

        struct RunOptions
        {
            std::vector<fs::path> configs;
            std::size_t jobs = 0;
        };

        bool parseOptions(const std::vector<std::string> &args, RunOptions &opt, bool allowJobs, const rehost::Context &ctx)
        {
            for (size_t i = 0; i < args.size(); ++i)
            {
                const std::string &arg = args[i];
                if (arg == "--config")
                {
                    if (i + 1 >= args.size())
                    {
                        ctx.error("--config requires value");
                        return false;
                    }
                    opt.configs.emplace_back(args[++i]);
                    continue;
                }
                if (arg == "--jobs" && allowJobs)
                {
                    if (i + 1 >= args.size())
                    {
                        ctx.error("--jobs requires value");
                        return false;
                    }
                    try
                    {
                        const int value = std::stoi(args[++i]);
                        if (value <= 0)
                        {
                            ctx.error("Invalid --jobs: ", args[i]);
                            return false;
                        }
                        opt.jobs = static_cast<std::size_t>(value);
                    }
                    catch (const std::exception &)
                    {
                        ctx.error("Invalid --jobs: ", args[i]);
                        return false;
                    }
                    continue;
                }
                if (arg.rfind("--", 0) == 0)
                {
                    ctx.error("Unknown option: ", arg);
                    return false;
                }
                opt.configs.emplace_back(arg);
            }

            if (opt.configs.empty())
            {
                ctx.error("Missing --config <pipeline.json>");
                return false;
            }
            return true;
        }

        bool loadConfigs(const std::vector<fs::path> &files, std::vector<model::PipelineConfig> &out, const rehost::Context &ctx)
        {
            bool ok = true;
            for (const auto &file : files)
            {
                try
                {
                    out.push_back(model::loadPipelineConfig(file));
                }
                catch (const ConfigError &e)
                {
                    ctx.error("Invalid config ", file.string(), ": ", e.what());
                    ok = false;
                }
            }
            return ok;
        }

        void printSummary(const pipeline::PipelineRun &run, const rehost::Context &ctx)
        {
            ctx.log("Run ", run.runId, " [", run.firmwareId, "] ", pipeline::toString(run.finalStatus));
            for (const auto &stage : run.stages)
            {
                ctx.log("  ", stage.name, ": ", pipeline::toString(stage.status), " (", stage.durationSeconds, "s) ",
                        stage.detail);
            }
            if (!run.warnings.empty())
            {
                ctx.log("  warnings: ", run.warnings.size());
            }
        }

    } // namespace

    int runRunCommand(const rehost::Context &ctx, const std::vector<std::string> &args)
    {
        RunOptions opt;
        if (!parseOptions(args, opt, false, ctx))
        {
            return 1;
        }
        if (opt.configs.size() != 1)
        {
            ctx.error("run takes exactly one config (use batch for several)");
            return 1;
        }

        std::vector<model::PipelineConfig> configs;
        if (!loadConfigs(opt.configs, configs, ctx))
        {
            return 1;
        }

        const pipeline::PipelineRun run = pipeline::runPipeline(configs.front(), ctx);
        printSummary(run, ctx);
        return pipeline::exitCodeFor(run);
    }

    int runBatchCommand(const rehost::Context &ctx, const std::vector<std::string> &args)
    {
        RunOptions opt;
        if (!parseOptions(args, opt, true, ctx))
        {
            return 1;
        }

        std::vector<model::PipelineConfig> configs;
        if (!loadConfigs(opt.configs, configs, ctx))
        {
            return 1;
        }

        for (std::size_t i = 0; i < configs.size(); ++i)
        {
            for (std::size_t j = i + 1; j < configs.size(); ++j)
            {
                if (configs[i].tree.root == configs[j].tree.root)
                {
                    ctx.error("Batch runs must use disjoint trees: ", configs[i].configFile.string(), " and ",
                              configs[j].configFile.string(), " share ", configs[i].tree.root.string());
                    return 1;
                }
            }
        }

        const auto runs = pipeline::runBatch(configs, opt.jobs, ctx);
        int code = 0;
        for (const auto &run : runs)
        {
            printSummary(run, ctx);
            if (pipeline::exitCodeFor(run) != 0)
            {
                code = pipeline::exitCodeFor(run);
            }
        }
        return code;
    }

} // namespace rehost::commands
