#pragma once

#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include "telemetry/TelemetrySink.h"

// Appends events as JSON lines to migration_<timestamp>_<seq>.jsonl under the
// output directory. A file that reaches the rotation threshold is closed and a
// new one started; only the newest maxRetentionFiles logs are kept. Events go to
// the fallback sink while the directory cannot be written.
class FileTelemetrySink : public TelemetrySink
{
  public:
    explicit FileTelemetrySink(std::shared_ptr<TelemetrySink> fallback);

    void recordEvent(std::string_view eventName, const Payload &payload) override;
    void flush() override;

    void setOutputDirectory(const std::filesystem::path &path) override;
    void setMaxRetentionFiles(std::size_t count) override;

    // Log file currently being written; empty until the first event.
    const std::filesystem::path &currentFile() const { return m_currentFile; }

  private:
    bool openLogLocked();
    void closeLogLocked();
    void rotateLocked();
    void pruneLogsLocked();
    bool writeLineLocked(std::string_view eventName, const Payload &payload);
    void reportLocked(std::string_view eventName, const Payload &payload);

    std::mutex m_mutex;
    std::ofstream m_stream;
    std::shared_ptr<TelemetrySink> m_fallback;
    std::filesystem::path m_currentFile;
    std::uintmax_t m_bytesWritten = 0;
    std::uint64_t m_sequence = 0;
};
