#include "TestSupport.h"

#include "config/MigratorConfigLoader.h"

#include <filesystem>
#include <iostream>

using testing_support::assertTrue;

namespace
{

bool hasError(const MigratorConfigLoadResult &result, const std::string &needle)
{
    for (const auto &error : result.errors)
    {
        if (error.message.find(needle) != std::string::npos)
        {
            return true;
        }
    }
    return false;
}

} // namespace

int main()
{
    bool success = true;
    std::filesystem::path root = std::filesystem::path(PROJECT_SOURCE_DIR);

    {
        MigratorConfigLoader loader(root / "config" / "levelmigrate.json");
        auto result = loader.load(true);
        if (!result.success)
        {
            std::cerr << "Config schema validation failed:\n";
            for (const auto &error : result.errors)
            {
                std::cerr << "  " << error.file << ": " << error.message << '\n';
            }
            return 1;
        }
        const MigratorConfig &config = result.config;
        success &= assertTrue(!result.usedDefaults, "shipped config read from disk");
        success &= assertTrue(config.levels.root == "app/Laserfingers/Levels", "levels root");
        success &= assertTrue(config.levels.extension == ".json" && config.levels.failWhenEmpty, "levels options");
        success &= assertTrue(config.output.indent == 2 && config.output.ensureAscii && config.output.trailingNewline,
                              "output options");
        success &= assertTrue(config.telemetry.rotationBytes == 4ull * 1024ull * 1024ull &&
                                  config.telemetry.maxFiles == 16 && config.telemetry.outputDirectory.empty(),
                              "telemetry options");
    }

    const std::filesystem::path scratch = testing_support::makeScratchDirectory("config");

    {
        MigratorConfigLoader loader(scratch / "absent.json");
        auto optional = loader.load(false);
        success &= assertTrue(optional.success && optional.usedDefaults, "missing optional config uses defaults");
        auto required = loader.load(true);
        success &= assertTrue(!required.success && hasError(required, "Failed to open"),
                              "missing required config fails");
    }

    {
        const std::filesystem::path file = scratch / "custom.json";
        testing_support::writeText(file, R"({"schema_version": 1,
            "levels": {"root": "levels", "extension": "level", "fail_when_empty": false},
            "output": {"indent": 4, "ensure_ascii": false},
            "telemetry": {"output_dir": "logs", "rotation_mb": 0.5, "max_files": 3, "console": true}})");
        auto result = MigratorConfigLoader(file).load(true);
        success &= assertTrue(result.success, "custom config loads");
        success &= assertTrue(result.config.levels.extension == ".level", "extension gets a leading dot");
        success &= assertTrue(!result.config.levels.failWhenEmpty, "fail_when_empty read");
        success &= assertTrue(result.config.output.indent == 4 && !result.config.output.ensureAscii,
                              "output overrides read");
        success &= assertTrue(result.config.output.trailingNewline, "unset keys keep defaults");
        success &= assertTrue(result.config.telemetry.rotationBytes == 512ull * 1024ull &&
                                  result.config.telemetry.maxFiles == 3 && result.config.telemetry.console,
                              "telemetry overrides read");
    }

    {
        const std::filesystem::path file = scratch / "wrong_version.json";
        testing_support::writeText(file, R"({"schema_version": 2})");
        auto result = MigratorConfigLoader(file).load(true);
        success &= assertTrue(!result.success && hasError(result, "schema_version mismatch"), "schema version checked");
    }

    {
        const std::filesystem::path file = scratch / "bad_values.json";
        testing_support::writeText(file, R"({"schema_version": 1, "levels": {"root": ""}, "output": {"indent": 12}})");
        auto result = MigratorConfigLoader(file).load(true);
        success &= assertTrue(!result.success, "invalid values rejected");
        success &= assertTrue(hasError(result, "levels.root") && hasError(result, "output.indent"),
                              "every invalid value reported");
    }

    {
        const std::filesystem::path file = scratch / "broken.json";
        testing_support::writeText(file, "{\"schema_version\": 1,");
        auto result = MigratorConfigLoader(file).load(true);
        success &= assertTrue(!result.success && hasError(result, "Failed to parse JSON at offset"),
                              "parse failure reported with offset");
    }

    std::error_code ec;
    std::filesystem::remove_all(scratch, ec);
    return success ? 0 : 1;
}
