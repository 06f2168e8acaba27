#include <iostream>
#include <string>
#include <vector>

#include "commands/apex_command.hpp"
#include "commands/closure_command.hpp"
#include "commands/run_command.hpp"
#include "commands/validate_command.hpp"
#include "core/context.hpp"

namespace
{

    constexpr const char *kAppName = "rehost";
    constexpr const char *kVersionLine = "firmware build-injection and APEX repackaging pipeline";

    void printHelp()
    {
        std::cout << kAppName << " - " << kVersionLine << "\n"
                  << "\n"
                  << "Usage:\n"
                  << "  " << kAppName << " run --config <pipeline.json> [--quiet]\n"
                  << "  " << kAppName << " batch --config <a.json> --config <b.json> [--jobs N] [--quiet]\n"
                  << "  " << kAppName << " validate <strategy.json> [--firmware <dir>]\n"
                  << "  " << kAppName << " closure <dependencies> <library>\n"
                  << "  " << kAppName << " apex <container.apex|.capex> <overlay_dir> --key <key> --cert <cert> [--sign-tool T] [--policy fail|skip|replace]\n"
                  << "\n"
                  << "Exit codes: 0 success or partial success, 1 usage or config error, 2 run aborted.\n"
                  << "\n"
                  << "Examples:\n"
                  << "  " << kAppName << " validate strategies/default.json --firmware /data/firmware/1234\n"
                  << "  " << kAppName << " closure deps/lddtree.txt app_process64\n"
                  << "  " << kAppName << " run --config configs/1234.json\n"
                  << "  " << kAppName << " batch --config configs/1234.json --config configs/5678.json --jobs 2\n";
    }

    // Strips --quiet so subcommands never see it.
    std::vector<std::string> collectArgs(int argc, char **argv, int startIndex, bool &verbose)
    {
        std::vector<std::string> out;
        for (int i = startIndex; i < argc; ++i)
        {
            const std::string arg = argv[i];
            if (arg == "--quiet" || arg == "-q")
            {
                verbose = false;
                continue;
            }
            out.push_back(arg);
        }
        return out;
    }

} // namespace

int main(int argc, char **argv)
{
    if (argc < 2)
    {
        printHelp();
        return 1;
    }

    const std::string command = argv[1];
    if (command == "help" || command == "--help" || command == "-h")
    {
        printHelp();
        return 0;
    }
    if (command == "version" || command == "--version" || command == "-v")
    {
        std::cout << kAppName << " - " << kVersionLine << '\n';
        return 0;
    }

    bool verbose = true;
    const std::vector<std::string> args = collectArgs(argc, argv, 2, verbose);
    const rehost::Context ctx(verbose);

    if (command == "run")
    {
        return rehost::commands::runRunCommand(ctx, args);
    }
    if (command == "batch")
    {
        return rehost::commands::runBatchCommand(ctx, args);
    }
    if (command == "validate")
    {
        return rehost::commands::runValidateCommand(ctx, args);
    }
    if (command == "closure")
    {
        return rehost::commands::runClosureCommand(ctx, args);
    }
    if (command == "apex")
    {
        return rehost::commands::runApexCommand(ctx, args);
    }

    std::cerr << "Unknown command: " << command << '\n';
    printHelp();
    return 1;
}
