#include "config/MigratorConfigLoader.h"

#include <fstream>
#include <optional>
#include <sstream>
#include <system_error>
#include <utility>

#include "json/JsonUtils.h"

namespace fs = std::filesystem;

namespace
{

constexpr int kMigratorSchemaVersion = 1;

MigratorConfigLoadError makeError(const fs::path &path, std::string message)
{
    MigratorConfigLoadError error;
    error.file = path.lexically_normal().string();
    error.message = std::move(message);
    return error;
}

std::optional<json::JsonValue> readLocalJson(const fs::path &path, std::vector<MigratorConfigLoadError> &errors)
{
    std::ifstream stream(path);
    if (!stream.is_open())
    {
        errors.push_back(makeError(path, "Failed to open JSON"));
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << stream.rdbuf();
    json::ParseFailure failure;
    auto parsed = json::parseJson(buffer.str(), failure);
    if (!parsed)
    {
        errors.push_back(makeError(path, "Failed to parse JSON at offset " + std::to_string(failure.offset) + ": " +
                                             failure.message));
        return std::nullopt;
    }
    return parsed;
}

bool validateSchema(const json::JsonValue &root, int expected, const fs::path &path,
                    std::vector<MigratorConfigLoadError> &errors)
{
    const json::JsonValue *schemaValue = json::getObjectField(root, "schema_version");
    if (!schemaValue || schemaValue->type != json::JsonValue::Type::Number)
    {
        errors.push_back(makeError(path, "Missing schema_version"));
        return false;
    }
    const int schema = static_cast<int>(schemaValue->number.value);
    if (schema != expected)
    {
        errors.push_back(makeError(path, "schema_version mismatch"));
        return false;
    }
    return true;
}

void parseLevels(const json::JsonValue &obj, LevelsOptions &levels, const fs::path &path,
                 std::vector<MigratorConfigLoadError> &errors)
{
    levels.root = json::getString(obj, "root", levels.root);
    levels.extension = json::getString(obj, "extension", levels.extension);
    levels.failWhenEmpty = json::getBool(obj, "fail_when_empty", levels.failWhenEmpty);
    if (levels.root.empty())
    {
        errors.push_back(makeError(path, "levels.root must not be empty"));
    }
    if (!levels.extension.empty() && levels.extension.front() != '.')
    {
        levels.extension.insert(levels.extension.begin(), '.');
    }
}

void parseOutput(const json::JsonValue &obj, OutputOptions &output, const fs::path &path,
                 std::vector<MigratorConfigLoadError> &errors)
{
    const int indent = json::getInt(obj, "indent", output.indent);
    if (indent < 0 || indent > 8)
    {
        errors.push_back(makeError(path, "output.indent must be between 0 and 8"));
    }
    else
    {
        output.indent = indent;
    }
    output.ensureAscii = json::getBool(obj, "ensure_ascii", output.ensureAscii);
    output.trailingNewline = json::getBool(obj, "trailing_newline", output.trailingNewline);
}

void parseTelemetry(const json::JsonValue &obj, TelemetryOptions &telemetry)
{
    telemetry.outputDirectory = json::getString(obj, "output_dir", telemetry.outputDirectory);

    const double rotationMb = json::getNumber(obj, "rotation_mb", 0.0);
    if (rotationMb > 0.0)
    {
        telemetry.rotationBytes = static_cast<std::uintmax_t>(rotationMb * 1024.0 * 1024.0);
    }

    const int maxFiles = json::getInt(obj, "max_files", static_cast<int>(telemetry.maxFiles));
    if (maxFiles > 0)
    {
        telemetry.maxFiles = static_cast<std::size_t>(maxFiles);
    }
    telemetry.console = json::getBool(obj, "console", telemetry.console);
}

} // namespace

MigratorConfigLoader::MigratorConfigLoader(std::filesystem::path configFile)
{
    if (!configFile.empty())
    {
        m_configFile = std::move(configFile);
    }
    else
    {
        m_configFile = defaultConfigFile();
    }
    m_configFile = m_configFile.lexically_normal();
}

std::filesystem::path MigratorConfigLoader::defaultConfigFile()
{
    return fs::path("config") / "levelmigrate.json";
}

MigratorConfig MigratorConfigLoader::loadFallback() const
{
    return MigratorConfig{};
}

MigratorConfigLoadResult MigratorConfigLoader::load(bool requireFile) const
{
    MigratorConfigLoadResult result;
    result.config = loadFallback();
    result.success = false;

    std::error_code ec;
    if (!requireFile && !fs::exists(m_configFile, ec))
    {
        result.usedDefaults = true;
        result.success = true;
        return result;
    }

    std::vector<MigratorConfigLoadError> errors;
    auto root = readLocalJson(m_configFile, errors);
    if (!root)
    {
        result.errors = std::move(errors);
        return result;
    }
    if (!validateSchema(*root, kMigratorSchemaVersion, m_configFile, errors))
    {
        result.errors = std::move(errors);
        return result;
    }

    MigratorConfig config = result.config;
    if (const json::JsonValue *levelsObj = json::getObjectField(*root, "levels"))
    {
        parseLevels(*levelsObj, config.levels, m_configFile, errors);
    }
    if (const json::JsonValue *outputObj = json::getObjectField(*root, "output"))
    {
        parseOutput(*outputObj, config.output, m_configFile, errors);
    }
    if (const json::JsonValue *telemetryObj = json::getObjectField(*root, "telemetry"))
    {
        parseTelemetry(*telemetryObj, config.telemetry);
    }

    if (!errors.empty())
    {
        result.errors = std::move(errors);
        return result;
    }

    result.config = std::move(config);
    result.success = true;
    return result;
}
