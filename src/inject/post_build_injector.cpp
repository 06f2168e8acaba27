#include "inject/post_build_injector.hpp"

#include <map>
#include <mutex>
#include <sstream>
#include <system_error>

#include "core/errors.hpp"
#include "core/worker_pool.hpp"
#include "inject/partition_paths.hpp"
#include "io/fs_utils.hpp"
#include "model/strategy_loader.hpp"

namespace fs = std::filesystem;

namespace rehost::inject
{
    namespace
    {

        struct WorkItem
        {
            const model::FirmwareArtifact *artifact = nullptr;
            const model::InjectionRule *rule = nullptr;
            model::ModuleType moduleType = model::ModuleType::Misc;
            fs::path target;
        };

        enum class ItemOutcome
        {
            Injected,
            Skipped
        };

        bool needsExecBit(const WorkItem &item)
        {
            return item.moduleType == model::ModuleType::Executable ||
                   item.target.extension() == ".so";
        }

        ItemOutcome injectItem(const WorkItem &item, std::vector<std::string> &warnings, const rehost::Context &ctx)
        {
            std::error_code ec;
            if (!fs::is_regular_file(item.artifact->sourcePath, ec))
            {
                throw InjectionError("Missing source artifact " + item.artifact->sourcePath.string());
            }

            if (fs::exists(item.target, ec))
            {
                const auto digest = io::sha256File(item.target);
                if (digest.has_value() && digest.value() != item.artifact->sha256)
                {
                    warnings.push_back("Version collision at " + item.target.string() + ": build " + digest.value() +
                                       ", firmware " + item.artifact->sha256);
                }

                switch (item.rule->overwritePolicy)
                {
                case model::OverwritePolicy::Fail:
                    throw InjectionError("Target already exists: " + item.target.string() +
                                         " (rule '" + item.rule->pattern + "' uses overwrite_policy fail)");
                case model::OverwritePolicy::Skip:
                    ctx.debug("Keeping ", item.target.string());
                    return ItemOutcome::Skipped;
                case model::OverwritePolicy::Replace:
                    ctx.debug("Replacing ", item.target.string());
                    break;
                }
            }

            if (!io::copyFileAtomic(item.artifact->sourcePath, item.target))
            {
                throw InjectionError("Could not copy " + item.artifact->sourcePath.string() + " to " + item.target.string());
            }

            if (needsExecBit(item))
            {
                fs::permissions(item.target,
                                fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
                                    fs::perms::others_read | fs::perms::others_exec,
                                fs::perm_options::replace, ec);
                if (ec)
                {
                    throw InjectionError("Could not set mode 0755 on " + item.target.string() + ": " + ec.message());
                }
            }
            return ItemOutcome::Injected;
        }

    } // namespace

    PostBuildResult injectPostBuild(
        const model::InjectionStrategy &strategy,
        const std::vector<model::FirmwareArtifact> &artifacts,
        const fs::path &buildOutputRoot,
        std::size_t workers,
        const rehost::Context &ctx)
    {
        std::error_code ec;
        if (!fs::is_directory(buildOutputRoot, ec))
        {
            throw InjectionError("Build output does not exist: " + buildOutputRoot.string());
        }

        std::vector<WorkItem> items;
        for (const auto &artifact : artifacts)
        {
            const auto match = model::matchArtifact(strategy, artifact);
            if (!match.has_value() || match->rule->phase != model::Phase::PostBuild ||
                match->moduleType == model::ModuleType::ApexPayload)
            {
                continue;
            }
            items.push_back({&artifact, match->rule, match->moduleType, buildOutputRoot / normalizeOutputPath(artifact.relativePath)});
        }

        // Distinct firmware paths can normalise onto one target; the copy order on the pool is not defined.
        std::map<fs::path, const model::FirmwareArtifact *> claimed;
        std::vector<std::string> conflicts;
        for (const auto &item : items)
        {
            const auto [it, inserted] = claimed.emplace(item.target, item.artifact);
            if (!inserted)
            {
                conflicts.push_back(it->second->relativePath + " and " + item.artifact->relativePath + " -> " +
                                    item.target.string());
            }
        }
        if (!conflicts.empty())
        {
            std::ostringstream message;
            message << conflicts.size() << " post-build targets are claimed by more than one artifact";
            for (const auto &conflict : conflicts)
            {
                message << "\n  " << conflict;
            }
            throw InjectionError(message.str());
        }

        PostBuildResult result;
        if (items.empty())
        {
            ctx.log("Post-build injection: nothing to inject");
            return result;
        }

        std::mutex mutex;
        std::vector<std::string> failures;
        {
            WorkerPool pool(computeWorkerCount(workers));
            for (const auto &item : items)
            {
                pool.enqueue([&, item]()
                             {
                    std::vector<std::string> warnings;
                    try
                    {
                        const ItemOutcome outcome = injectItem(item, warnings, ctx);
                        std::lock_guard<std::mutex> lock(mutex);
                        if (outcome == ItemOutcome::Injected)
                        {
                            ++result.injected;
                        }
                        else
                        {
                            ++result.skipped;
                        }
                        result.warnings.insert(result.warnings.end(), warnings.begin(), warnings.end());
                    }
                    catch (const std::exception &e)
                    {
                        std::lock_guard<std::mutex> lock(mutex);
                        failures.push_back(item.artifact->relativePath + ": " + e.what());
                        result.warnings.insert(result.warnings.end(), warnings.begin(), warnings.end());
                    } });
            }
            pool.wait();
        }

        for (const auto &warning : result.warnings)
        {
            ctx.warn(warning);
        }
        ctx.log("Post-build injection: ", result.injected, " injected, ", result.skipped, " kept, ", failures.size(),
                " failed");

        if (!failures.empty())
        {
            std::ostringstream message;
            message << failures.size() << " of " << items.size() << " post-build artifacts failed ("
                    << result.injected << " injected)";
            for (const auto &failure : failures)
            {
                message << "\n  " << failure;
            }
            throw InjectionError(message.str());
        }
        return result;
    }

} // namespace rehost::inject
