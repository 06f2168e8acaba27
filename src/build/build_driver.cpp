#include "build/build_driver.hpp"

#include <sstream>
#include <system_error>

#include "io/fs_utils.hpp"
#include "io/process.hpp"

namespace fs = std::filesystem;

namespace rehost::build
{

    std::string toString(BuildStatus status)
    {
        return status == BuildStatus::Success ? "success" : "failure";
    }

    std::string composeBuildScript(const std::string &lunchTarget, const std::vector<std::string> &goals)
    {
        std::ostringstream script;
        script << "source build/envsetup.sh && lunch " << lunchTarget;
        if (goals.empty())
        {
            script << " && m";
        }
        for (const auto &goal : goals)
        {
            script << " && m";
            if (!goal.empty())
            {
                script << ' ' << goal;
            }
        }
        return script.str();
    }

    BuildResult runBuild(const model::TreeHandle &tree, const BuildRequest &request, const rehost::Context &ctx)
    {
        BuildResult result;

        std::string shell = "bash";
        std::string script = composeBuildScript(request.lunchTarget, request.goals);
        if (!request.commandOverride.empty())
        {
            shell = "sh";
            script = request.commandOverride;
        }

        if (!request.logDir.empty())
        {
            if (!io::ensureDir(request.logDir))
            {
                result.reason = "could not create log directory " + request.logDir.string();
                ctx.error(result.reason);
                return result;
            }
            result.logRef = request.logDir / (request.logName + ".log");
        }

        if (!io::isCommandAvailable(shell))
        {
            result.reason = shell + " not found on PATH";
            ctx.error(result.reason);
            return result;
        }

        io::ProcessLimits limits;
        limits.timeout = request.timeout;
        limits.logFile = result.logRef;

        ctx.log("Build [", request.logName, "] in ", tree.root.string(), " (checkout ", tree.checkoutId, ")");
        const io::ProcessResult process = io::runBoundedCommand(shell, {"-c", script}, tree.root, limits, ctx);

        result.commandLine = process.commandLine;
        result.durationSeconds = process.durationSeconds;
        result.exitCode = process.code;

        if (process.timedOut)
        {
            result.reason = "timeout";
            ctx.error("Build [", request.logName, "] timed out after ", request.timeout.count(), "s");
            return result;
        }
        if (process.code != 0)
        {
            result.reason = "exit code " + std::to_string(process.code);
            ctx.error("Build [", request.logName, "] failed with ", result.reason,
                      result.logRef.empty() ? "" : ", see ", result.logRef.string());
            return result;
        }

        result.status = BuildStatus::Success;
        ctx.log("Build [", request.logName, "] finished in ", result.durationSeconds, "s");
        return result;
    }

} // namespace rehost::build
