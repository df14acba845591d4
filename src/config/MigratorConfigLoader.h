#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "config/MigratorConfig.h"

struct MigratorConfigLoadError
{
    std::string file;
    std::string message;
};

struct MigratorConfigLoadResult
{
    MigratorConfig config;
    bool success = false;
    // The file was absent and not required, so built-in defaults are in use.
    bool usedDefaults = false;
    std::vector<MigratorConfigLoadError> errors;
};

class MigratorConfigLoader
{
  public:
    explicit MigratorConfigLoader(std::filesystem::path configFile);

    const std::filesystem::path &configFile() const { return m_configFile; }

    // A missing file is an error only when requireFile is set.
    MigratorConfigLoadResult load(bool requireFile) const;

    static std::filesystem::path defaultConfigFile();

  private:
    MigratorConfig loadFallback() const;

    std::filesystem::path m_configFile;
};
