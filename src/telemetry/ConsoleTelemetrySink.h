#pragma once

#include <iosfwd>
#include <mutex>

#include "telemetry/TelemetrySink.h"

// One "[telemetry] time=... event=... key=value" line per event. Writes to
// stderr unless another stream is given; stdout carries the run's progress.
class ConsoleTelemetrySink : public TelemetrySink
{
  public:
    ConsoleTelemetrySink();
    explicit ConsoleTelemetrySink(std::ostream &stream);

    void recordEvent(std::string_view eventName, const Payload &payload) override;
    void flush() override;

  private:
    std::mutex m_mutex;
    std::ostream &m_stream;
};
