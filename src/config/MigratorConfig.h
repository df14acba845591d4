#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

struct LevelsOptions
{
    std::string root{"app/Laserfingers/Levels"};
    std::string extension{".json"};
    // Finding no level files is a failure rather than an empty run.
    bool failWhenEmpty = true;
};

struct OutputOptions
{
    int indent = 2;
    bool ensureAscii = true;
    bool trailingNewline = true;
};

struct TelemetryOptions
{
    // Empty disables the JSON-lines log.
    std::string outputDirectory;
    std::uintmax_t rotationBytes = 4ull * 1024ull * 1024ull;
    std::size_t maxFiles = 16;
    bool console = false;
};

struct MigratorConfig
{
    LevelsOptions levels{};
    OutputOptions output{};
    TelemetryOptions telemetry{};
};
