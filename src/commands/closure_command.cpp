#include "commands/closure_command.hpp"

#include <string>

#include "core/errors.hpp"
#include "graph/dependency_graph.hpp"

namespace rehost::commands
{

    int runClosureCommand(const rehost::Context &ctx, const std::vector<std::string> &args)
    {
        if (args.size() != 2)
        {
            ctx.error("Usage: closure <dependencies> <library>");
            return 1;
        }

        graph::DependencyGraph graph;
        try
        {
            graph = graph::loadDependencyGraph(args[0], ctx);
        }
        catch (const ConfigError &e)
        {
            ctx.error("Invalid dependency file: ", e.what());
            return 1;
        }

        const std::string &root = args[1];
        if (!graph.contains(root))
        {
            ctx.warn("Library ", root, " is not in the graph");
        }

        const graph::ClosureReport report = graph.closureReport(root);
        ctx.log("Closure of ", root, " (", report.members.size(), " libraries):");
        for (const auto &member : report.members)
        {
            ctx.log("  ", member);
        }
        if (!report.unresolved.empty())
        {
            ctx.log("Unresolved:");
            for (const auto &member : report.unresolved)
            {
                ctx.log("  ", member);
            }
        }
        for (const auto &cycle : report.cycles)
        {
            std::string chain;
            for (const auto &name : cycle)
            {
                chain += chain.empty() ? name : " -> " + name;
            }
            ctx.warn("Cycle: ", chain);
        }
        return 0;
    }

} // namespace rehost::commands
