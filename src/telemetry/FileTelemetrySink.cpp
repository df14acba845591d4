#include "telemetry/FileTelemetrySink.h"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <system_error>
#include <utility>
#include <vector>

#include "json/JsonWriter.h"

namespace fs = std::filesystem;

namespace
{

constexpr const char *kLogPrefix = "migration_";
constexpr const char *kLogExtension = ".jsonl";

std::tm localNow()
{
    const std::time_t raw = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &raw);
#else
    localtime_r(&raw, &tm);
#endif
    return tm;
}

std::string formatNow(const char *pattern)
{
    const std::tm tm = localNow();
    std::ostringstream oss;
    oss << std::put_time(&tm, pattern);
    return oss.str();
}

std::string logFileName(std::uint64_t sequence)
{
    std::ostringstream oss;
    oss << kLogPrefix << formatNow("%Y%m%d_%H%M%S") << '_' << std::setw(6) << std::setfill('0') << sequence
        << kLogExtension;
    return oss.str();
}

bool isLogFile(const fs::path &path)
{
    return path.extension() == kLogExtension && path.filename().string().rfind(kLogPrefix, 0) == 0;
}

// {"event": ..., "time": ..., <payload in order>} on one line.
std::string formatEventLine(std::string_view eventName, const TelemetrySink::Payload &payload)
{
    json::JsonValue line = json::makeObject();
    json::setField(line, "event", json::makeString(std::string(eventName)));
    json::setField(line, "time", json::makeString(formatNow("%Y-%m-%dT%H:%M:%S")));
    for (const auto &entry : payload)
    {
        json::setField(line, entry.first, json::makeString(entry.second));
    }
    json::JsonWriteOptions options;
    options.indent = -1;
    options.ensureAscii = false;
    return json::writeJson(line, options);
}

} // namespace

FileTelemetrySink::FileTelemetrySink(std::shared_ptr<TelemetrySink> fallback) : m_fallback(std::move(fallback))
{
    TelemetrySink::setOutputDirectory(fs::path("logs"));
    TelemetrySink::setRotationThresholdBytes(4ull * 1024ull * 1024ull);
    TelemetrySink::setMaxRetentionFiles(16);
}

void FileTelemetrySink::recordEvent(std::string_view eventName, const Payload &payload)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!openLogLocked() || !writeLineLocked(eventName, payload))
    {
        if (m_fallback)
        {
            m_fallback->recordEvent(eventName, payload);
        }
        return;
    }
    if (rotationThresholdBytes() > 0 && m_bytesWritten >= rotationThresholdBytes())
    {
        rotateLocked();
    }
}

void FileTelemetrySink::flush()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_stream.is_open())
    {
        m_stream.flush();
    }
    if (m_fallback)
    {
        m_fallback->flush();
    }
}

void FileTelemetrySink::setOutputDirectory(const std::filesystem::path &path)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    closeLogLocked();
    TelemetrySink::setOutputDirectory(path.empty() ? fs::path("logs") : path);
}

void FileTelemetrySink::setMaxRetentionFiles(std::size_t count)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    TelemetrySink::setMaxRetentionFiles(count);
    pruneLogsLocked();
}

bool FileTelemetrySink::openLogLocked()
{
    if (m_stream.is_open())
    {
        return true;
    }

    const fs::path dir = outputDirectory();
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec || !fs::is_directory(dir, ec))
    {
        Payload payload;
        payload.emplace_back("path", dir.lexically_normal().string());
        payload.emplace_back("error", ec ? ec.message() : "not a directory");
        reportLocked("telemetry.directory_unavailable", payload);
        return false;
    }

    const fs::path path = dir / logFileName(++m_sequence);
    m_stream.open(path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!m_stream.is_open())
    {
        Payload payload;
        payload.emplace_back("path", path.lexically_normal().string());
        payload.emplace_back("error", "failed_to_open");
        reportLocked("telemetry.log_open_failed", payload);
        return false;
    }

    m_currentFile = path;
    m_bytesWritten = 0;

    Payload payload;
    payload.emplace_back("file", m_currentFile.lexically_normal().string());
    payload.emplace_back("rotation_bytes", std::to_string(rotationThresholdBytes()));
    writeLineLocked("telemetry.log.opened", payload);
    return true;
}

void FileTelemetrySink::closeLogLocked()
{
    if (m_stream.is_open())
    {
        m_stream.flush();
        m_stream.close();
    }
    m_currentFile.clear();
    m_bytesWritten = 0;
}

void FileTelemetrySink::rotateLocked()
{
    const fs::path previous = m_currentFile;
    closeLogLocked();
    pruneLogsLocked();
    if (!openLogLocked())
    {
        return;
    }

    Payload payload;
    payload.emplace_back("previous", previous.lexically_normal().string());
    payload.emplace_back("threshold", std::to_string(rotationThresholdBytes()));
    writeLineLocked("telemetry.log.rotated", payload);
}

// Names sort by timestamp then sequence, so the newest logs sort last.
void FileTelemetrySink::pruneLogsLocked()
{
    const std::size_t maxFiles = maxRetentionFiles();
    if (maxFiles == 0)
    {
        return;
    }

    std::error_code ec;
    fs::directory_iterator iter(outputDirectory(), ec);
    if (ec)
    {
        return;
    }
    std::vector<fs::path> logs;
    for (const auto &entry : iter)
    {
        std::error_code entryEc;
        if (entry.is_regular_file(entryEc) && isLogFile(entry.path()))
        {
            logs.push_back(entry.path());
        }
    }
    if (logs.size() <= maxFiles)
    {
        return;
    }

    std::sort(logs.begin(), logs.end());
    for (std::size_t i = 0; i + maxFiles < logs.size(); ++i)
    {
        std::error_code removeEc;
        fs::remove(logs[i], removeEc);
        if (removeEc)
        {
            Payload payload;
            payload.emplace_back("path", logs[i].lexically_normal().string());
            payload.emplace_back("error", removeEc.message());
            reportLocked("telemetry.prune_failed", payload);
        }
    }
}

bool FileTelemetrySink::writeLineLocked(std::string_view eventName, const Payload &payload)
{
    const std::string line = formatEventLine(eventName, payload);
    m_stream << line;
    if (!m_stream.good())
    {
        const fs::path failed = m_currentFile;
        closeLogLocked();
        Payload errorPayload;
        errorPayload.emplace_back("file", failed.lexically_normal().string());
        errorPayload.emplace_back("error", "write_failed");
        reportLocked("telemetry.write_failed", errorPayload);
        return false;
    }
    m_bytesWritten += static_cast<std::uintmax_t>(line.size());
    return true;
}

void FileTelemetrySink::reportLocked(std::string_view eventName, const Payload &payload)
{
    if (m_fallback)
    {
        m_fallback->recordEvent(eventName, payload);
    }
}
