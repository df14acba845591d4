#include "telemetry/TelemetrySink.h"

void TelemetrySink::setOutputDirectory(const std::filesystem::path &path)
{
    m_outputDirectory = path;
}

const std::filesystem::path &TelemetrySink::outputDirectory() const
{
    return m_outputDirectory;
}

void TelemetrySink::setRotationThresholdBytes(std::uintmax_t bytes)
{
    m_rotationThresholdBytes = bytes;
}

std::uintmax_t TelemetrySink::rotationThresholdBytes() const
{
    return m_rotationThresholdBytes;
}

void TelemetrySink::setMaxRetentionFiles(std::size_t count)
{
    m_maxRetentionFiles = count;
}

std::size_t TelemetrySink::maxRetentionFiles() const
{
    return m_maxRetentionFiles;
}

void FanoutTelemetrySink::addSink(std::shared_ptr<TelemetrySink> sink)
{
    if (sink)
    {
        m_sinks.push_back(std::move(sink));
    }
}

void FanoutTelemetrySink::recordEvent(std::string_view eventName, const Payload &payload)
{
    for (const auto &sink : m_sinks)
    {
        sink->recordEvent(eventName, payload);
    }
}

void FanoutTelemetrySink::flush()
{
    for (const auto &sink : m_sinks)
    {
        sink->flush();
    }
}
