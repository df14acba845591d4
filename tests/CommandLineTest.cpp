#include "TestSupport.h"

#include "cli/CommandLine.h"

#include <string>
#include <vector>

using testing_support::assertTrue;

int main()
{
    bool success = true;

    {
        const auto parsed = level::cli::parseCommandLine(
            {"rename-phase", "--levels-dir", "levels", "--dry-run", "--config=custom.json", "-v"});
        success &= assertTrue(parsed.ok, "valid command line accepted");
        success &= assertTrue(parsed.options.command == "rename-phase", "command read");
        success &= assertTrue(parsed.options.levelsDir && parsed.options.levelsDir->string() == "levels",
                              "separate value form");
        success &= assertTrue(parsed.options.configFile && parsed.options.configFile->string() == "custom.json",
                              "inline value form");
        success &= assertTrue(parsed.options.dryRun && parsed.options.verbose, "flags read");
        success &= assertTrue(!parsed.options.telemetryDir.has_value(), "unset option stays empty");
    }

    {
        const auto parsed = level::cli::parseCommandLine({"all", "--telemetry-dir", "out/logs"});
        success &= assertTrue(parsed.ok && parsed.options.telemetryDir &&
                                  parsed.options.telemetryDir->string() == "out/logs",
                              "telemetry directory read");
    }

    success &= assertTrue(level::cli::parseCommandLine({"--help"}).ok, "help needs no command");
    success &= assertTrue(level::cli::parseCommandLine({"validate"}).ok, "validate is a command");
    success &= assertTrue(level::cli::parseCommandLine({"list-steps"}).ok, "list-steps is a command");

    {
        const auto parsed = level::cli::parseCommandLine({});
        success &= assertTrue(!parsed.ok && parsed.error == "missing command", "missing command rejected");
    }
    {
        const auto parsed = level::cli::parseCommandLine({"frobnicate"});
        success &= assertTrue(!parsed.ok && parsed.error == "unknown command frobnicate", "unknown command rejected");
    }
    {
        const auto parsed = level::cli::parseCommandLine({"all", "--levels-dir"});
        success &= assertTrue(!parsed.ok && parsed.error == "--levels-dir needs a value", "missing value rejected");
    }
    {
        const auto parsed = level::cli::parseCommandLine({"all", "--force"});
        success &= assertTrue(!parsed.ok && parsed.error == "unknown option --force", "unknown option rejected");
    }
    {
        const auto parsed = level::cli::parseCommandLine({"all", "validate"});
        success &= assertTrue(!parsed.ok && parsed.error == "unexpected argument validate", "extra argument rejected");
    }

    const std::string usage = level::cli::usageText();
    success &= assertTrue(usage.find("migrate-buttons") != std::string::npos &&
                              usage.find("generalize-endpoints") != std::string::npos &&
                              usage.find("validate") != std::string::npos,
                          "usage lists every command");
    success &= assertTrue(usage.find("appliedMigrations") != std::string::npos &&
                              usage.find("Levels without moving sweepers never") != std::string::npos,
                          "usage explains when the cycle ledger is stamped");

    return success ? 0 : 1;
}
