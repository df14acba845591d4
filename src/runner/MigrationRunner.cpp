#include "runner/MigrationRunner.h"

#include <fstream>
#include <optional>
#include <sstream>
#include <system_error>
#include <utility>

#include "json/JsonUtils.h"
#include "level/LevelValidator.h"

namespace fs = std::filesystem;

namespace level::runner
{

namespace
{

std::optional<std::string> readFileBytes(const fs::path &path, std::vector<LevelError> &errors)
{
    std::ifstream stream(path, std::ios::in | std::ios::binary);
    if (!stream.is_open())
    {
        errors.push_back({LevelErrorKind::IoFailure, "", "failed to open file for reading"});
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << stream.rdbuf();
    if (stream.bad())
    {
        errors.push_back({LevelErrorKind::IoFailure, "", "failed to read file"});
        return std::nullopt;
    }
    return buffer.str();
}

std::optional<json::JsonValue> parseDocument(const std::string &bytes, std::vector<LevelError> &errors)
{
    json::ParseFailure failure;
    auto document = json::parseJson(bytes, failure);
    if (!document)
    {
        errors.push_back({LevelErrorKind::MalformedDocument, "",
                          "invalid JSON at offset " + std::to_string(failure.offset) + ": " + failure.message});
    }
    return document;
}

std::string joinNames(const std::vector<std::string> &names)
{
    std::string joined;
    for (const std::string &name : names)
    {
        if (!joined.empty())
        {
            joined += ',';
        }
        joined += name;
    }
    return joined;
}

} // namespace

void RunSummary::add(FileReport report)
{
    switch (report.status)
    {
    case FileStatus::Migrated:
        ++migrated;
        break;
    case FileStatus::Skipped:
        ++skipped;
        break;
    case FileStatus::Failed:
        ++failed;
        break;
    }
    reports.push_back(std::move(report));
}

bool writeFileAtomically(const std::filesystem::path &path, const std::string &content, std::string &error)
{
    fs::path temp = path;
    temp += ".levelmigrate.tmp";
    {
        std::ofstream stream(temp, std::ios::out | std::ios::binary | std::ios::trunc);
        if (!stream.is_open())
        {
            error = "failed to open temporary file " + temp.string();
            return false;
        }
        stream.write(content.data(), static_cast<std::streamsize>(content.size()));
        stream.flush();
        if (!stream.good())
        {
            error = "failed to write temporary file " + temp.string();
            stream.close();
            std::error_code removeEc;
            fs::remove(temp, removeEc);
            return false;
        }
    }

    std::error_code ec;
    fs::rename(temp, path, ec);
    if (ec)
    {
        error = "failed to replace file: " + ec.message();
        std::error_code removeEc;
        fs::remove(temp, removeEc);
        return false;
    }
    return true;
}

MigrationRunner::MigrationRunner(RunOptions options, std::shared_ptr<TelemetrySink> telemetry)
    : m_options(std::move(options)), m_telemetry(std::move(telemetry))
{
    if (!m_telemetry)
    {
        m_telemetry = std::make_shared<NullTelemetrySink>();
    }
}

FileReport MigrationRunner::migrateFile(const std::filesystem::path &file,
                                        const migration::MigrationPipeline &pipeline) const
{
    FileReport report;
    report.file = file;
    report.status = FileStatus::Failed;

    const auto bytes = readFileBytes(file, report.errors);
    if (!bytes)
    {
        return report;
    }
    auto document = parseDocument(*bytes, report.errors);
    if (!document)
    {
        return report;
    }

    const migration::PipelineResult result = pipeline.apply(*document);
    report.warnings = result.warnings();
    if (result.failed)
    {
        report.errors = result.errors();
        return report;
    }
    for (const migration::StepReport &step : result.steps)
    {
        if (step.result.changed())
        {
            report.changedSteps.push_back(step.stepName);
        }
    }
    if (!result.changed)
    {
        report.status = FileStatus::Skipped;
        return report;
    }

    if (!m_options.dryRun)
    {
        std::string error;
        if (!writeFileAtomically(file, json::writeJson(*document, m_options.output), error))
        {
            report.errors.push_back({LevelErrorKind::IoFailure, "", error});
            return report;
        }
    }
    report.status = FileStatus::Migrated;
    return report;
}

RunSummary MigrationRunner::run(const std::vector<std::filesystem::path> &files,
                                const migration::MigrationPipeline &pipeline) const
{
    std::vector<std::string> stepNames;
    for (std::size_t i = 0; i < pipeline.size(); ++i)
    {
        stepNames.emplace_back(pipeline.step(i).name());
    }

    TelemetrySink::Payload started;
    started.emplace_back("files", std::to_string(files.size()));
    started.emplace_back("steps", joinNames(stepNames));
    started.emplace_back("dry_run", m_options.dryRun ? "true" : "false");
    m_telemetry->recordEvent("migration.run.started", started);

    RunSummary summary;
    for (const fs::path &file : files)
    {
        FileReport report = migrateFile(file, pipeline);
        recordReport(report);
        if (m_progress)
        {
            m_progress(report);
        }
        summary.add(std::move(report));
    }

    TelemetrySink::Payload finished;
    finished.emplace_back("migrated", std::to_string(summary.migrated));
    finished.emplace_back("skipped", std::to_string(summary.skipped));
    finished.emplace_back("failed", std::to_string(summary.failed));
    m_telemetry->recordEvent("migration.run.finished", finished);
    m_telemetry->flush();
    return summary;
}

void MigrationRunner::recordReport(const FileReport &report) const
{
    const std::string file = report.file.lexically_normal().string();
    for (const std::string &warning : report.warnings)
    {
        TelemetrySink::Payload payload;
        payload.emplace_back("file", file);
        payload.emplace_back("warning", warning);
        m_telemetry->recordEvent("migration.file.warning", payload);
    }

    TelemetrySink::Payload payload;
    payload.emplace_back("file", file);
    switch (report.status)
    {
    case FileStatus::Migrated:
        payload.emplace_back("steps", joinNames(report.changedSteps));
        m_telemetry->recordEvent("migration.file.migrated", payload);
        break;
    case FileStatus::Skipped:
        m_telemetry->recordEvent("migration.file.skipped", payload);
        break;
    case FileStatus::Failed:
        payload.emplace_back("errors", std::to_string(report.errors.size()));
        if (!report.errors.empty())
        {
            payload.emplace_back("kind", levelErrorKindToString(report.errors.front().kind));
            payload.emplace_back("error", report.errors.front().describe());
        }
        m_telemetry->recordEvent("migration.file.failed", payload);
        break;
    }
}

ValidationReport MigrationRunner::validateFile(const std::filesystem::path &file) const
{
    ValidationReport report;
    report.file = file;

    const auto bytes = readFileBytes(file, report.errors);
    if (!bytes)
    {
        return report;
    }
    const auto document = parseDocument(*bytes, report.errors);
    if (!document)
    {
        return report;
    }

    LevelValidationResult result = validateLevel(*document);
    report.valid = result.valid;
    report.errors = std::move(result.errors);
    return report;
}

ValidationSummary MigrationRunner::validate(const std::vector<std::filesystem::path> &files) const
{
    ValidationSummary summary;
    for (const fs::path &file : files)
    {
        ValidationReport report = validateFile(file);
        if (report.valid)
        {
            ++summary.valid;
        }
        else
        {
            ++summary.invalid;
            TelemetrySink::Payload payload;
            payload.emplace_back("file", file.lexically_normal().string());
            payload.emplace_back("errors", std::to_string(report.errors.size()));
            if (!report.errors.empty())
            {
                payload.emplace_back("error", report.errors.front().describe());
            }
            m_telemetry->recordEvent("validation.file.invalid", payload);
        }
        if (m_validationProgress)
        {
            m_validationProgress(report);
        }
        summary.reports.push_back(std::move(report));
    }
    m_telemetry->flush();
    return summary;
}

} // namespace level::runner
