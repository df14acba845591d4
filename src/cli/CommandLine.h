#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace level::cli
{

struct CommandLine
{
    std::string command;
    std::optional<std::filesystem::path> levelsDir;
    std::optional<std::filesystem::path> configFile;
    std::optional<std::filesystem::path> telemetryDir;
    bool dryRun = false;
    bool verbose = false;
    bool help = false;
};

struct CommandLineParseResult
{
    CommandLine options;
    bool ok = false;
    std::string error;
};

// Accepts "--flag value" and "--flag=value" for the path options.
CommandLineParseResult parseCommandLine(const std::vector<std::string> &args);

bool isKnownCommand(const std::string &command);

std::string usageText();

} // namespace level::cli
