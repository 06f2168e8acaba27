#include "pipeline/orchestrator.hpp"

#include <chrono>
#include <exception>
#include <optional>
#include <sstream>
#include <utility>

#include "apex/apex_repackager.hpp"
#include "build/build_driver.hpp"
#include "core/errors.hpp"
#include "core/worker_pool.hpp"
#include "graph/dependency_graph.hpp"
#include "inject/post_build_injector.hpp"
#include "inject/pre_build_injector.hpp"
#include "io/fs_utils.hpp"
#include "model/strategy_loader.hpp"

namespace fs = std::filesystem;

namespace rehost::pipeline
{

    const std::vector<const char *> kStageNames = {
        "load_strategy", "fetch_firmware", "dependency_graph", "pre_build", "build", "post_build", "apex", "package"};

    namespace
    {

        using Clock = std::chrono::steady_clock;

        class StageRunner
        {
        public:
            StageRunner(PipelineRun &run, const rehost::Context &ctx) : run_(run), ctx_(ctx) {}

            // Runs body unless an earlier fatal stage failed. body returns the stage detail.
            template <typename Body>
            bool run(const char *name, bool fatal, Body body)
            {
                StageRecord record;
                record.name = name;
                if (aborted_)
                {
                    record.status = StageStatus::Skipped;
                    record.detail = "not attempted";
                    run_.stages.push_back(record);
                    return false;
                }

                ctx_.log("== ", name);
                const auto start = Clock::now();
                try
                {
                    record.detail = body();
                    record.status = StageStatus::Success;
                }
                catch (const std::exception &e)
                {
                    record.status = StageStatus::Failure;
                    record.detail = e.what();
                    ctx_.error("Stage ", name, " failed: ", e.what());
                    if (fatal)
                    {
                        aborted_ = true;
                    }
                    else
                    {
                        degraded_ = true;
                    }
                }
                record.durationSeconds = std::chrono::duration<double>(Clock::now() - start).count();
                run_.stages.push_back(record);
                return record.status == StageStatus::Success;
            }

            void skip(const char *name, const std::string &detail)
            {
                StageRecord record;
                record.name = name;
                record.status = StageStatus::Skipped;
                record.detail = aborted_ ? "not attempted" : detail;
                run_.stages.push_back(record);
            }

            FinalStatus finalStatus() const
            {
                if (aborted_)
                {
                    return FinalStatus::Failure;
                }
                return degraded_ ? FinalStatus::PartialSuccess : FinalStatus::Success;
            }

        private:
            PipelineRun &run_;
            const rehost::Context &ctx_;
            bool aborted_ = false;
            bool degraded_ = false;
        };

        apex::ApexTools toolsFrom(const model::ApexSettings &settings)
        {
            apex::ApexTools tools;
            if (!settings.archiveUnpack.empty())
            {
                tools.archiveUnpack = settings.archiveUnpack;
            }
            if (!settings.archivePack.empty())
            {
                tools.archivePack = settings.archivePack;
            }
            if (!settings.imageUnpack.empty())
            {
                tools.imageUnpack = settings.imageUnpack;
            }
            if (!settings.imagePack.empty())
            {
                tools.imagePack = settings.imagePack;
            }
            return tools;
        }

        apex::SigningConfig signingFrom(const model::ApexSettings &settings)
        {
            apex::SigningConfig signing;
            signing.key = settings.key;
            signing.cert = settings.cert;
            if (!settings.signTool.empty())
            {
                signing.signTool = settings.signTool;
                signing.signArgs = settings.signArgs;
            }
            return signing;
        }

        build::BuildResult runBuildStep(
            const model::PipelineConfig &config,
            const model::TreeHandle &tree,
            const std::string &runId,
            const std::vector<std::string> &goals,
            const std::string &commandOverride,
            const std::string &label,
            const rehost::Context &ctx)
        {
            build::BuildRequest request;
            request.lunchTarget = config.lunchTarget;
            request.goals = goals;
            request.commandOverride = commandOverride;
            request.timeout = config.build.timeout;
            request.logDir = config.logDir;
            request.logName = runId + "_" + label;

            build::BuildResult result = build::runBuild(tree, request, ctx);
            if (result.status != build::BuildStatus::Success)
            {
                std::string message = label + " failed: " + result.reason;
                if (!result.logRef.empty())
                {
                    message += " (log " + result.logRef.string() + ")";
                }
                throw BuildFailure(message);
            }
            return result;
        }

        void appendWarnings(PipelineRun &run, const std::vector<std::string> &warnings)
        {
            run.warnings.insert(run.warnings.end(), warnings.begin(), warnings.end());
        }

    } // namespace

    PipelineRun runPipeline(const model::PipelineConfig &config, model::FirmwareSource &source, const rehost::Context &baseCtx)
    {
        PipelineRun run;
        run.runId = makeRunId();
        run.firmwareId = config.firmwareId;
        run.androidVersion = config.androidVersion;
        run.checkoutId = config.tree.checkoutId;
        run.startedAt = isoTimestamp(std::chrono::system_clock::now());

        const model::TreeHandle tree{config.tree.root, config.tree.checkoutId};

        rehost::Context ctx = baseCtx.withPrefix(config.firmwareId);
        if (!config.logDir.empty() && io::ensureDir(config.logDir))
        {
            ctx = ctx.withLogFile((config.logDir / (run.runId + "_" + config.firmwareId + "_process.log")).string());
        }
        ctx.log("Run ", run.runId, " for firmware ", config.firmwareId, " (Android ", config.androidVersion, ", ",
                config.lunchTarget, ") on ", tree.root.string());

        StageRunner stages(run, ctx);
        model::InjectionStrategy strategy;
        std::vector<model::FirmwareArtifact> artifacts;
        graph::DependencyGraph graph;

        stages.run("load_strategy", true, [&]()
                   {
            strategy = model::loadStrategy(config.strategy, ctx);
            return std::to_string(strategy.rules.size()) + " rules"; });

        stages.run("fetch_firmware", true, [&]()
                   {
            artifacts = source.fetch(config.firmwareId);
            return std::to_string(artifacts.size()) + " artifacts"; });

        stages.run("dependency_graph", true, [&]()
                   {
            if (!config.dependencies.empty())
            {
                graph = graph::loadDependencyGraph(config.dependencies, ctx);
            }
            graph::resolveFromArtifacts(graph, artifacts, ctx);
            const auto cycles = graph.findCycles();
            for (const auto &cycle : cycles)
            {
                std::ostringstream chain;
                for (std::size_t i = 0; i < cycle.size(); ++i)
                {
                    chain << (i == 0 ? "" : " -> ") << cycle[i];
                }
                run.warnings.push_back("Dependency cycle: " + chain.str());
            }
            return std::to_string(graph.size()) + " libraries, " + std::to_string(cycles.size()) + " cycles"; });

        stages.run("pre_build", true, [&]()
                   {
            inject::PreBuildOptions options;
            options.injectDir = config.tree.injectDir;
            options.presenceDirs = config.tree.presenceDirs;
            options.providedLibs = config.tree.providedLibs;
            options.productMakefile = config.tree.productMakefile;
            options.boardConfig = config.tree.boardConfig;
            options.runId = run.runId;

            const inject::PreBuildResult result = inject::injectPreBuild(strategy, artifacts, graph, tree, options, ctx);
            appendWarnings(run, result.warnings);
            return std::to_string(result.modules.size()) + " modules (" + std::to_string(result.skippedModules) +
                   " kept), " + std::to_string(result.unresolved.size()) + " unresolved"; });

        stages.run("build", true, [&]()
                   {
            const build::BuildResult result =
                runBuildStep(config, tree, run.runId, config.build.goals, config.build.command, "build", ctx);
            std::ostringstream detail;
            detail << "ok in " << result.durationSeconds << "s";
            if (!result.logRef.empty())
            {
                detail << ", log " << result.logRef.string();
            }
            return detail.str(); });

        stages.run("post_build", false, [&]()
                   {
            const inject::PostBuildResult result =
                inject::injectPostBuild(strategy, artifacts, config.buildOutput, config.workers, ctx);
            appendWarnings(run, result.warnings);
            return std::to_string(result.injected) + " injected, " + std::to_string(result.skipped) + " kept"; });

        stages.run("apex", false, [&]()
                   {
            std::vector<std::string> invalid;
            const auto jobs = apex::planApexJobs(strategy, artifacts, config.buildOutput, invalid);
            for (const auto &path : invalid)
            {
                run.warnings.push_back("apex_payload artifact outside <partition>/apex/<name>/: " + path);
            }
            const apex::ApexReport report =
                apex::repackageAll(jobs, toolsFrom(config.apex), signingFrom(config.apex), config.workers, ctx);

            std::ostringstream detail;
            detail << report.replaced << " replaced, " << report.untouched << " untouched, " << report.failed << " failed";
            if (report.failed > 0 || !invalid.empty())
            {
                for (const auto &outcome : report.outcomes)
                {
                    if (!outcome.ok)
                    {
                        detail << "; " << outcome.container.filename().string() << " (" << outcome.finalState
                               << "): " << outcome.error;
                    }
                }
                if (!invalid.empty())
                {
                    detail << "; " << invalid.size() << " artifacts with invalid apex paths";
                }
                throw InjectionError(detail.str());
            }
            return detail.str(); });

        if (config.build.skipPackage)
        {
            stages.skip("package", "disabled by configuration");
        }
        else
        {
            stages.run("package", true, [&]()
                       {
                runBuildStep(config, tree, run.runId, config.build.packageGoals, config.build.packageCommand, "package", ctx);
                return "image directory " + config.buildOutput.string(); });
        }

        // The run marker stays in an injected tree so later runs refuse it.
        run.finalStatus = stages.finalStatus();

        for (const auto &warning : run.warnings)
        {
            ctx.debug("warning: ", warning);
        }
        ctx.log("Run ", run.runId, " finished: ", toString(run.finalStatus));

        if (!config.runLog.empty())
        {
            RunLog log(config.runLog);
            run.recorded = log.append(run, ctx);
            if (!run.recorded)
            {
                ctx.error("Run record for ", run.runId, " could not be persisted to ", config.runLog.string());
            }
        }
        else
        {
            run.recorded = true;
        }
        return run;
    }

    PipelineRun runPipeline(const model::PipelineConfig &config, const rehost::Context &ctx)
    {
        model::DirectoryFirmwareSource source(config.firmwareRoot, ctx);
        return runPipeline(config, source, ctx);
    }

    std::vector<PipelineRun> runBatch(
        const std::vector<model::PipelineConfig> &configs,
        std::size_t jobs,
        const rehost::Context &ctx)
    {
        std::vector<PipelineRun> runs(configs.size());
        {
            WorkerPool pool(computeWorkerCount(jobs));
            for (std::size_t i = 0; i < configs.size(); ++i)
            {
                pool.enqueue([&, i]()
                             { runs[i] = runPipeline(configs[i], ctx); });
            }
            pool.wait();
        }

        std::size_t ok = 0;
        for (const auto &run : runs)
        {
            if (run.finalStatus != FinalStatus::Failure)
            {
                ++ok;
            }
        }
        ctx.log("Batch finished: ", ok, " of ", runs.size(), " runs succeeded");
        return runs;
    }

    int exitCodeFor(const PipelineRun &run)
    {
        return run.finalStatus == FinalStatus::Failure || !run.recorded ? 2 : 0;
    }

} // namespace rehost::pipeline
