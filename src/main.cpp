#include "cli/CommandLine.h"
#include "config/MigratorConfig.h"
#include "config/MigratorConfigLoader.h"
#include "migration/MigrationPipeline.h"
#include "runner/LevelDiscovery.h"
#include "runner/MigrationRunner.h"
#include "telemetry/ConsoleTelemetrySink.h"
#include "telemetry/FileTelemetrySink.h"
#include "telemetry/TelemetrySink.h"

#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace
{

constexpr int kExitUsage = 2;

std::shared_ptr<TelemetrySink> buildTelemetry(const TelemetryOptions &options, bool verbose)
{
    auto fanout = std::make_shared<FanoutTelemetrySink>();
    if (options.console || verbose)
    {
        fanout->addSink(std::make_shared<ConsoleTelemetrySink>());
    }
    if (!options.outputDirectory.empty())
    {
        auto file = std::make_shared<FileTelemetrySink>(std::make_shared<ConsoleTelemetrySink>());
        file->setOutputDirectory(options.outputDirectory);
        file->setRotationThresholdBytes(options.rotationBytes);
        file->setMaxRetentionFiles(options.maxFiles);
        fanout->addSink(std::move(file));
    }
    return fanout;
}

void printErrors(const std::vector<level::LevelError> &errors)
{
    for (const level::LevelError &error : errors)
    {
        std::cerr << "  - [" << level::levelErrorKindToString(error.kind) << "] " << error.describe() << '\n';
    }
}

int listSteps()
{
    for (const std::string &command : level::migration::stepCommands())
    {
        const auto step = level::migration::makeStep(command);
        std::cout << command << ": " << step->summary() << '\n';
    }
    return 0;
}

level::migration::MigrationPipeline buildPipeline(const std::string &command)
{
    if (command == "all")
    {
        return level::migration::buildFullPipeline();
    }
    level::migration::MigrationPipeline pipeline;
    pipeline.registerStep(level::migration::makeStep(command));
    return pipeline;
}

int runValidation(const level::runner::MigrationRunner &runner, const std::vector<std::filesystem::path> &files)
{
    std::cout << "Validating " << files.size() << " level files...\n";
    const level::runner::ValidationSummary summary = runner.validate(files);

    std::cout << "\nValidation complete:\n"
              << "  valid: " << summary.valid << '\n';
    if (summary.invalid > 0)
    {
        std::cout << "  invalid: " << summary.invalid << '\n';
    }
    return summary.exitCode();
}

int runMigration(const level::cli::CommandLine &cli, level::runner::MigrationRunner &runner,
                 const std::vector<std::filesystem::path> &files)
{
    const level::migration::MigrationPipeline pipeline = buildPipeline(cli.command);
    std::cout << "Found " << files.size() << " level files\n";

    const level::runner::RunSummary summary = runner.run(files, pipeline);

    std::cout << "\nMigrated: " << summary.migrated << ", already migrated: " << summary.skipped
              << ", failed: " << summary.failed << '\n';
    if (cli.dryRun)
    {
        std::cout << "Dry run: no files were written.\n";
    }
    return summary.exitCode();
}

} // namespace

int main(int argc, char **argv)
{
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i)
    {
        args.emplace_back(argv[i]);
    }

    const level::cli::CommandLineParseResult parsed = level::cli::parseCommandLine(args);
    if (!parsed.ok)
    {
        std::cerr << "levelmigrate: " << parsed.error << "\n\n" << level::cli::usageText();
        return kExitUsage;
    }
    const level::cli::CommandLine &cli = parsed.options;
    if (cli.help)
    {
        std::cout << level::cli::usageText();
        return 0;
    }
    if (cli.command == "list-steps")
    {
        return listSteps();
    }

    const MigratorConfigLoader loader(cli.configFile.value_or(std::filesystem::path{}));
    const MigratorConfigLoadResult configResult = loader.load(cli.configFile.has_value());
    if (!configResult.success)
    {
        std::cerr << "Error: could not load " << loader.configFile().string() << '\n';
        for (const MigratorConfigLoadError &error : configResult.errors)
        {
            std::cerr << "  - " << error.file << ": " << error.message << '\n';
        }
        return 1;
    }

    MigratorConfig config = configResult.config;
    if (cli.levelsDir)
    {
        config.levels.root = cli.levelsDir->string();
    }
    if (cli.telemetryDir)
    {
        config.telemetry.outputDirectory = cli.telemetryDir->string();
    }

    const std::filesystem::path root(config.levels.root);
    const level::runner::DiscoveryResult discovery = level::runner::discoverLevelFiles(root, config.levels.extension);
    if (!discovery.rootExists)
    {
        std::cerr << "Error: Levels directory not found at " << root.string() << '\n';
        return 1;
    }
    if (!discovery.errors.empty())
    {
        std::cerr << "Error: could not list " << root.string() << '\n';
        printErrors(discovery.errors);
        return 1;
    }
    if (discovery.files.empty())
    {
        std::cout << "No level files found\n";
        return config.levels.failWhenEmpty ? 1 : 0;
    }

    level::runner::RunOptions runOptions;
    runOptions.dryRun = cli.dryRun;
    runOptions.output.indent = config.output.indent;
    runOptions.output.ensureAscii = config.output.ensureAscii;
    runOptions.output.trailingNewline = config.output.trailingNewline;

    level::runner::MigrationRunner runner(runOptions, buildTelemetry(config.telemetry, cli.verbose));
    const bool verbose = cli.verbose;
    runner.setProgressCallback([verbose](const level::runner::FileReport &report) {
        const std::string file = report.file.string();
        for (const std::string &warning : report.warnings)
        {
            std::cerr << "warning: " << file << ": " << warning << '\n';
        }
        switch (report.status)
        {
        case level::runner::FileStatus::Migrated:
            std::cout << "Updated: " << file << '\n';
            break;
        case level::runner::FileStatus::Skipped:
            if (verbose)
            {
                std::cout << "Already migrated: " << file << '\n';
            }
            break;
        case level::runner::FileStatus::Failed:
            std::cerr << "Error converting " << file << ":\n";
            printErrors(report.errors);
            break;
        }
    });
    runner.setValidationCallback([](const level::runner::ValidationReport &report) {
        if (report.valid)
        {
            std::cout << "ok      " << report.file.string() << '\n';
            return;
        }
        std::cout << "INVALID " << report.file.string() << '\n';
        printErrors(report.errors);
    });

    if (cli.command == "validate")
    {
        return runValidation(runner, discovery.files);
    }
    return runMigration(cli, runner, discovery.files);
}
