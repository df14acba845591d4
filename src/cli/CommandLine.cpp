#include "cli/CommandLine.h"

#include <sstream>
#include <string_view>

#include "migration/MigrationPipeline.h"

namespace level::cli
{

namespace
{

struct PathOption
{
    std::string_view flag;
    std::optional<std::filesystem::path> CommandLine::*target;
};

const PathOption kPathOptions[] = {
    {"--levels-dir", &CommandLine::levelsDir},
    {"--config", &CommandLine::configFile},
    {"--telemetry-dir", &CommandLine::telemetryDir},
};

} // namespace

bool isKnownCommand(const std::string &command)
{
    if (command == "all" || command == "validate" || command == "list-steps")
    {
        return true;
    }
    for (const std::string &step : migration::stepCommands())
    {
        if (step == command)
        {
            return true;
        }
    }
    return false;
}

CommandLineParseResult parseCommandLine(const std::vector<std::string> &args)
{
    CommandLineParseResult result;
    CommandLine &options = result.options;

    for (std::size_t i = 0; i < args.size(); ++i)
    {
        const std::string_view arg(args[i]);
        if (arg == "--help" || arg == "-h")
        {
            options.help = true;
            continue;
        }
        if (arg == "--dry-run")
        {
            options.dryRun = true;
            continue;
        }
        if (arg == "--verbose" || arg == "-v")
        {
            options.verbose = true;
            continue;
        }

        bool matched = false;
        for (const PathOption &option : kPathOptions)
        {
            if (arg == option.flag)
            {
                if (i + 1 >= args.size())
                {
                    result.error = std::string(option.flag) + " needs a value";
                    return result;
                }
                options.*option.target = std::filesystem::path(args[++i]);
                matched = true;
                break;
            }
            if (arg.size() > option.flag.size() && arg.substr(0, option.flag.size()) == option.flag &&
                arg[option.flag.size()] == '=')
            {
                options.*option.target = std::filesystem::path(std::string(arg.substr(option.flag.size() + 1)));
                matched = true;
                break;
            }
        }
        if (matched)
        {
            continue;
        }

        if (!arg.empty() && arg.front() == '-')
        {
            result.error = "unknown option " + std::string(arg);
            return result;
        }
        if (!options.command.empty())
        {
            result.error = "unexpected argument " + std::string(arg);
            return result;
        }
        options.command = std::string(arg);
    }

    if (options.help)
    {
        result.ok = true;
        return result;
    }
    if (options.command.empty())
    {
        result.error = "missing command";
        return result;
    }
    if (!isKnownCommand(options.command))
    {
        result.error = "unknown command " + options.command;
        return result;
    }
    result.ok = true;
    return result;
}

std::string usageText()
{
    std::ostringstream oss;
    oss << "usage: levelmigrate <command> [--levels-dir DIR] [--config FILE] [--telemetry-dir DIR]"
           " [--dry-run] [--verbose]\n\n"
        << "commands:\n";
    for (const std::string &step : migration::stepCommands())
    {
        const auto instance = migration::makeStep(step);
        oss << "  " << step << std::string(step.size() < 22 ? 22 - step.size() : 1, ' ') << instance->summary()
            << '\n';
    }
    oss << "  all                   run every migration step in order\n"
        << "  validate              check levels against the current schema\n"
        << "  list-steps            print the migration steps\n\n"
        << "\"appliedMigrations\": [\"fix-cycle-times\"] is stamped only on levels with a moving\n"
        << "sweeper whose cycle was converted to a round trip. Levels without moving sweepers never\n"
        << "carry the stamp, and validate does not require it.\n";
    return oss.str();
}

} // namespace level::cli
