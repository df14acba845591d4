#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "json/JsonWriter.h"
#include "level/LevelError.h"
#include "migration/MigrationPipeline.h"
#include "telemetry/TelemetrySink.h"

namespace level::runner
{

enum class FileStatus
{
    Migrated,
    Skipped,
    Failed
};

inline const char *fileStatusToString(FileStatus status)
{
    switch (status)
    {
    case FileStatus::Migrated:
        return "migrated";
    case FileStatus::Skipped:
        return "skipped";
    case FileStatus::Failed:
        return "failed";
    }
    return "failed";
}

struct FileReport
{
    std::filesystem::path file;
    FileStatus status = FileStatus::Skipped;
    // Steps that changed the document.
    std::vector<std::string> changedSteps;
    std::vector<LevelError> errors;
    std::vector<std::string> warnings;
};

struct RunSummary
{
    std::size_t migrated = 0;
    std::size_t skipped = 0;
    std::size_t failed = 0;
    std::vector<FileReport> reports;

    void add(FileReport report);
    std::size_t total() const { return migrated + skipped + failed; }
    int exitCode() const { return failed == 0 ? 0 : 1; }
};

struct ValidationReport
{
    std::filesystem::path file;
    bool valid = false;
    std::vector<LevelError> errors;
};

struct ValidationSummary
{
    std::size_t valid = 0;
    std::size_t invalid = 0;
    std::vector<ValidationReport> reports;

    int exitCode() const { return invalid == 0 ? 0 : 1; }
};

struct RunOptions
{
    // Report what would change without writing anything.
    bool dryRun = false;
    json::JsonWriteOptions output{};
};

class MigrationRunner
{
  public:
    using ProgressCallback = std::function<void(const FileReport &)>;
    using ValidationCallback = std::function<void(const ValidationReport &)>;

    MigrationRunner(RunOptions options, std::shared_ptr<TelemetrySink> telemetry);

    void setProgressCallback(ProgressCallback callback) { m_progress = std::move(callback); }
    void setValidationCallback(ValidationCallback callback) { m_validationProgress = std::move(callback); }

    const RunOptions &options() const { return m_options; }

    // Reads, migrates and (when something changed) rewrites one file. The file
    // is only replaced after the whole document migrated successfully.
    FileReport migrateFile(const std::filesystem::path &file, const migration::MigrationPipeline &pipeline) const;

    // Processes every file; a failed file never stops the batch.
    RunSummary run(const std::vector<std::filesystem::path> &files,
                   const migration::MigrationPipeline &pipeline) const;

    ValidationReport validateFile(const std::filesystem::path &file) const;
    ValidationSummary validate(const std::vector<std::filesystem::path> &files) const;

  private:
    void recordReport(const FileReport &report) const;

    RunOptions m_options;
    std::shared_ptr<TelemetrySink> m_telemetry;
    ProgressCallback m_progress;
    ValidationCallback m_validationProgress;
};

// Writes content to a temporary sibling and renames it over path.
bool writeFileAtomically(const std::filesystem::path &path, const std::string &content, std::string &error);

} // namespace level::runner
