#include "apex/apex_repackager.hpp"

#include <map>
#include <mutex>
#include <system_error>

#include "core/worker_pool.hpp"
#include "inject/partition_paths.hpp"
#include "model/strategy_loader.hpp"

namespace fs = std::filesystem;

namespace rehost::apex
{
    namespace
    {

        // A replaced APEX retires its .capex; otherwise the decompressed copy goes away.
        void settleCompressed(const ApexJob &job, ApexOutcome &outcome, const rehost::Context &ctx)
        {
            std::error_code ec;
            if (outcome.ok && outcome.finalState == "replaced")
            {
                const fs::path retired = job.compressed.string() + kRetiredCapexSuffix;
                fs::rename(job.compressed, retired, ec);
                if (ec)
                {
                    outcome.ok = false;
                    outcome.error = "Could not retire " + job.compressed.string() + ": " + ec.message();
                    ctx.error(outcome.error);
                }
                return;
            }

            fs::remove(job.container, ec);
            if (ec)
            {
                ctx.error("Could not remove decompressed ", job.container.string(), ": ", ec.message());
            }
        }

    } // namespace


    std::vector<ApexJob> planApexJobs(
        const model::InjectionStrategy &strategy,
        const std::vector<model::FirmwareArtifact> &artifacts,
        const fs::path &buildOutputRoot,
        std::vector<std::string> &invalidArtifacts)
    {
        std::map<fs::path, ApexJob> jobs;
        for (const auto &artifact : artifacts)
        {
            const auto match = model::matchArtifact(strategy, artifact);
            if (!match.has_value() || match->moduleType != model::ModuleType::ApexPayload)
            {
                continue;
            }

            std::vector<std::string> parts;
            for (const auto &part : fs::path(inject::normalizeOutputPath(artifact.relativePath)))
            {
                parts.push_back(part.string());
            }
            if (parts.size() < 4 || parts[1] != "apex")
            {
                invalidArtifacts.push_back(artifact.relativePath);
                continue;
            }

            fs::path payloadPath;
            for (std::size_t i = 3; i < parts.size(); ++i)
            {
                payloadPath /= parts[i];
            }

            const fs::path apexDir = buildOutputRoot / parts[0] / "apex";
            const fs::path container = apexDir / (parts[2] + ".apex");
            ApexJob &job = jobs[container];
            job.container = container;
            std::error_code ec;
            const fs::path compressed = apexDir / (parts[2] + ".capex");
            if (!fs::exists(container, ec) && fs::is_regular_file(compressed, ec))
            {
                job.compressed = compressed;
            }
            job.overlays.push_back({payloadPath.generic_string(), artifact.sourcePath, artifact.sha256,
                                    match->rule->overwritePolicy});
        }

        std::vector<ApexJob> out;
        for (auto &[path, job] : jobs)
        {
            out.push_back(std::move(job));
        }
        return out;
    }

    ApexOutcome repackageContainer(
        const ApexJob &job,
        const ApexTools &tools,
        const SigningConfig &signing,
        const rehost::Context &ctx)
    {
        ApexOutcome outcome;
        outcome.container = job.container;

        ApexState state = Intact{job.container};
        bool decompressed = false;
        try
        {
            if (!job.compressed.empty())
            {
                decompressCapex(job.compressed, job.container, tools, ctx);
                decompressed = true;
            }
            state = unpack(std::get<Intact>(state), tools, ctx);
            auto modified = modifyPayload(std::get<Unpacked>(std::move(state)), job.overlays, ctx);
            if (std::holds_alternative<Intact>(modified))
            {
                state = std::get<Intact>(std::move(modified));
            }
            else
            {
                state = std::get<PayloadModified>(std::move(modified));
                state = repack(std::get<PayloadModified>(std::move(state)), tools, ctx);
                state = sign(std::get<Repacked>(std::move(state)), signing, tools, ctx);
                state = replace(std::get<Signed>(std::move(state)), ctx);
            }
            outcome.ok = true;
        }
        catch (const std::exception &e)
        {
            outcome.error = e.what();
            ctx.error("APEX ", job.container.filename().string(), " failed in state ", stateName(state), ": ", e.what());
        }

        outcome.finalState = stateName(state);
        if (decompressed)
        {
            settleCompressed(job, outcome, ctx);
        }
        return outcome;
    }

    ApexReport repackageAll(
        const std::vector<ApexJob> &jobs,
        const ApexTools &tools,
        const SigningConfig &signing,
        std::size_t workers,
        const rehost::Context &ctx)
    {
        ApexReport report;
        report.outcomes.resize(jobs.size());
        if (!jobs.empty())
        {
            WorkerPool pool(computeWorkerCount(workers));
            for (std::size_t i = 0; i < jobs.size(); ++i)
            {
                pool.enqueue([&, i]()
                             { report.outcomes[i] = repackageContainer(jobs[i], tools, signing, ctx); });
            }
            pool.wait();
        }

        for (const auto &outcome : report.outcomes)
        {
            if (!outcome.ok)
            {
                ++report.failed;
            }
            else if (outcome.finalState == "replaced")
            {
                ++report.replaced;
            }
            else
            {
                ++report.untouched;
            }
        }
        ctx.log("APEX repackaging: ", report.replaced, " replaced, ", report.untouched, " untouched, ", report.failed,
                " failed");
        return report;
    }

} // namespace rehost::apex
