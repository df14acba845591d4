#include "TestSupport.h"

#include "migration/MigrationPipeline.h"
#include "runner/LevelDiscovery.h"
#include "runner/MigrationRunner.h"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

using testing_support::assertEqualText;
using testing_support::assertTrue;
using testing_support::MockTelemetrySink;
using testing_support::readText;
using testing_support::writeText;

namespace fs = std::filesystem;

namespace
{

const char *kLegacySegment =
    R"({"id": "x", "lasers": [{"id": "l1", "color": "red", "thickness": 2, "kind": {"type": "segment", )"
    R"("segment": {"start": {"x": 0, "y": 1}, "end": {"x": 1, "y": 1}}}}]})";

const char *kUnifiedSegment = R"({
  "id": "x",
  "lasers": [
    {
      "id": "l1",
      "color": "red",
      "thickness": 2,
      "enabled": true,
      "type": "segment",
      "startEndpoint": {
        "points": [
          {
            "x": 0,
            "y": 1
          }
        ],
        "cycleSeconds": null,
        "initialT": 0.0
      },
      "endEndpoint": {
        "points": [
          {
            "x": 1,
            "y": 1
          }
        ],
        "cycleSeconds": null,
        "initialT": 0.0
      }
    }
  ]
}
)";

const char *kUnknownKind =
    R"({"id": "y", "lasers": [{"id": "l1", "color": "red", "thickness": 2, "kind": {"type": "beam", "beam": {}}}]})";

level::migration::MigrationPipeline singleStep(const std::string &command)
{
    level::migration::MigrationPipeline pipeline;
    pipeline.registerStep(level::migration::makeStep(command));
    return pipeline;
}

bool noTemporaryFiles(const fs::path &dir)
{
    for (const auto &entry : fs::recursive_directory_iterator(dir))
    {
        if (entry.path().string().find(".levelmigrate.tmp") != std::string::npos)
        {
            return false;
        }
    }
    return true;
}

} // namespace

int main()
{
    bool success = true;
    const fs::path root = testing_support::makeScratchDirectory("runner");
    const fs::path legacy = root / "world1" / "legacy.json";
    const fs::path canonical = root / "world1" / "already.json";
    const fs::path unknown = root / "world2" / "unknown.json";
    const fs::path broken = root / "broken.json";
    writeText(legacy, kLegacySegment);
    writeText(canonical, kUnifiedSegment);
    writeText(unknown, kUnknownKind);
    writeText(broken, "{\"id\": ");
    writeText(root / "notes.txt", "not a level");

    {
        const level::runner::DiscoveryResult discovery = level::runner::discoverLevelFiles(root, ".json");
        success &= assertTrue(discovery.rootExists && discovery.errors.empty(), "levels directory listed");
        success &= assertTrue(discovery.files.size() == 4, "only .json files discovered");
        success &= assertTrue(discovery.files.size() == 4 && discovery.files.front() == broken,
                              "files sorted by path");

        const level::runner::DiscoveryResult missing = level::runner::discoverLevelFiles(root / "nope", ".json");
        success &= assertTrue(!missing.rootExists && !missing.errors.empty(), "missing directory reported");
    }

    const std::vector<fs::path> files{legacy, canonical, unknown, broken};
    const level::migration::MigrationPipeline pipeline = singleStep("unify-kinds");

    {
        level::runner::RunOptions options;
        options.dryRun = true;
        level::runner::MigrationRunner runner(options, nullptr);
        const level::runner::RunSummary summary = runner.run(files, pipeline);
        success &= assertTrue(summary.migrated == 1 && summary.skipped == 1 && summary.failed == 2,
                              "dry run classifies every file");
        success &= assertEqualText(readText(legacy), kLegacySegment, "dry run writes nothing");
    }

    {
        auto telemetry = std::make_shared<MockTelemetrySink>();
        level::runner::MigrationRunner runner(level::runner::RunOptions{}, telemetry);
        std::vector<std::string> progress;
        runner.setProgressCallback([&progress](const level::runner::FileReport &report) {
            progress.emplace_back(level::runner::fileStatusToString(report.status));
        });

        const level::runner::RunSummary summary = runner.run(files, pipeline);
        success &= assertTrue(summary.total() == 4 && summary.exitCode() == 1, "failures give a non-zero exit");
        success &= assertTrue(summary.migrated == 1 && summary.skipped == 1 && summary.failed == 2,
                              "one migrated, one skipped, two failed");
        success &= assertTrue(progress.size() == 4 && progress[0] == "migrated" && progress[1] == "skipped",
                              "progress reported per file in order");

        success &= assertEqualText(readText(legacy), kUnifiedSegment, "legacy segment rewritten");
        success &= assertEqualText(readText(canonical), kUnifiedSegment, "up-to-date file left alone");
        success &= assertEqualText(readText(unknown), kUnknownKind, "failed file left unchanged");
        success &= assertTrue(noTemporaryFiles(root), "no temporary files left behind");

        const level::runner::FileReport &unknownReport = summary.reports[2];
        success &= assertTrue(unknownReport.errors.size() == 1 &&
                                  unknownReport.errors.front().kind == level::LevelErrorKind::UnknownLegacyVariant,
                              "unknown kind carried in the file report");
        const level::runner::FileReport &brokenReport = summary.reports[3];
        success &= assertTrue(!brokenReport.errors.empty() &&
                                  brokenReport.errors.front().message.rfind("invalid JSON at offset", 0) == 0,
                              "parse failure reported with its offset");
        success &= assertTrue(summary.reports[0].changedSteps.size() == 1 &&
                                  summary.reports[0].changedSteps.front() == "unify-kinds",
                              "changed steps listed");

        success &= assertTrue(telemetry->count("migration.run.started") == 1, "run start recorded");
        success &= assertTrue(telemetry->count("migration.file.migrated") == 1, "migration recorded");
        success &= assertTrue(telemetry->count("migration.file.skipped") == 1, "skip recorded");
        success &= assertTrue(telemetry->count("migration.file.failed") == 2, "failures recorded");
        success &= assertTrue(!telemetry->events.empty() && telemetry->events.back() == "migration.run.finished",
                              "run finish recorded last");

        const level::runner::RunSummary again = runner.run({legacy}, pipeline);
        success &= assertTrue(again.skipped == 1 && again.exitCode() == 0, "second run skips the migrated file");
    }

    {
        level::runner::MigrationRunner runner(level::runner::RunOptions{}, nullptr);
        const level::runner::ValidationSummary summary = runner.validate({legacy, broken});
        success &= assertTrue(summary.invalid == 2 && summary.exitCode() == 1,
                              "unified but not canonical levels fail validation");
    }

    {
        std::string error;
        const fs::path target = root / "atomic.json";
        success &= assertTrue(level::runner::writeFileAtomically(target, "{}\n", error) && error.empty(),
                              "atomic write succeeds");
        success &= assertEqualText(readText(target), "{}\n", "atomic write content");
        success &= assertTrue(!level::runner::writeFileAtomically(root / "missing" / "x.json", "{}", error) &&
                                  !error.empty(),
                              "atomic write into a missing directory fails");
    }

    std::error_code ec;
    fs::remove_all(root, ec);
    return success ? 0 : 1;
}
