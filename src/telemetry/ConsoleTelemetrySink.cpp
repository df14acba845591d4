#include "telemetry/ConsoleTelemetrySink.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace
{
std::string currentTimestamp()
{
    using clock = std::chrono::system_clock;
    const auto now = clock::now();
    const std::time_t time = clock::to_time_t(now);
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &time);
#else
    localtime_r(&time, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

// Values with spaces are quoted so a line still splits on whitespace.
std::string formatValue(const std::string &value)
{
    if (value.find(' ') == std::string::npos && !value.empty())
    {
        return value;
    }
    std::ostringstream oss;
    oss << std::quoted(value);
    return oss.str();
}
} // namespace

ConsoleTelemetrySink::ConsoleTelemetrySink() : m_stream(std::cerr) {}

ConsoleTelemetrySink::ConsoleTelemetrySink(std::ostream &stream) : m_stream(stream) {}

void ConsoleTelemetrySink::recordEvent(std::string_view eventName, const Payload &payload)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_stream << "[telemetry] time=" << currentTimestamp() << " event=" << eventName;
    for (const auto &entry : payload)
    {
        m_stream << ' ' << entry.first << '=' << formatValue(entry.second);
    }
    m_stream << '\n';
}

void ConsoleTelemetrySink::flush()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_stream.flush();
}
