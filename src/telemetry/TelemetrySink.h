#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

class TelemetrySink
{
  public:
    // Key/value pairs in the order they were added.
    using Payload = std::vector<std::pair<std::string, std::string>>;

    virtual ~TelemetrySink() = default;

    virtual void recordEvent(std::string_view eventName, const Payload &payload) = 0;
    virtual void flush() {}

    virtual void setOutputDirectory(const std::filesystem::path &path);
    [[nodiscard]] const std::filesystem::path &outputDirectory() const;

    virtual void setRotationThresholdBytes(std::uintmax_t bytes);
    [[nodiscard]] std::uintmax_t rotationThresholdBytes() const;

    virtual void setMaxRetentionFiles(std::size_t count);
    [[nodiscard]] std::size_t maxRetentionFiles() const;

  protected:
    std::filesystem::path m_outputDirectory{};
    std::uintmax_t m_rotationThresholdBytes = 0;
    std::size_t m_maxRetentionFiles = 0;
};

class NullTelemetrySink : public TelemetrySink
{
  public:
    void recordEvent(std::string_view, const Payload &) override {}
};

// Forwards every event to each attached sink.
class FanoutTelemetrySink : public TelemetrySink
{
  public:
    void addSink(std::shared_ptr<TelemetrySink> sink);
    [[nodiscard]] std::size_t sinkCount() const { return m_sinks.size(); }

    void recordEvent(std::string_view eventName, const Payload &payload) override;
    void flush() override;

  private:
    std::vector<std::shared_ptr<TelemetrySink>> m_sinks;
};
