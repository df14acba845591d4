#include "runner/LevelDiscovery.h"

#include <algorithm>
#include <system_error>

namespace fs = std::filesystem;

namespace level::runner
{

DiscoveryResult discoverLevelFiles(const std::filesystem::path &root, const std::string &extension)
{
    DiscoveryResult result;

    std::error_code ec;
    if (!fs::is_directory(root, ec))
    {
        result.errors.push_back({LevelErrorKind::IoFailure, root.lexically_normal().string(),
                                 "levels directory not found"});
        return result;
    }
    result.rootExists = true;

    fs::recursive_directory_iterator iter(root, fs::directory_options::skip_permission_denied, ec);
    if (ec)
    {
        result.errors.push_back({LevelErrorKind::IoFailure, root.lexically_normal().string(), ec.message()});
        return result;
    }

    const fs::recursive_directory_iterator end;
    while (iter != end)
    {
        std::error_code entryEc;
        if (iter->is_regular_file(entryEc) && iter->path().extension() == extension)
        {
            result.files.push_back(iter->path());
        }
        iter.increment(ec);
        if (ec)
        {
            result.errors.push_back({LevelErrorKind::IoFailure, root.lexically_normal().string(), ec.message()});
            break;
        }
    }

    std::sort(result.files.begin(), result.files.end());
    return result;
}

} // namespace level::runner
