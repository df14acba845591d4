#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "level/LevelError.h"

namespace level::runner
{

struct DiscoveryResult
{
    std::vector<std::filesystem::path> files;
    bool rootExists = false;
    std::vector<LevelError> errors;
};

// Recursively lists regular files under root whose extension matches
// (".json"), sorted by path so runs are reproducible.
DiscoveryResult discoverLevelFiles(const std::filesystem::path &root, const std::string &extension);

} // namespace level::runner
