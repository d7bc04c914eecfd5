#include "directory_scanner.h"
#include "logger.h"
#include "temp_files.h"
#include "utils.h"

#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

std::vector<std::string> scan_directory(const std::string &root)
{
    std::vector<std::string> files;
    std::error_code ec;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec)
    {
        LOG_WARN("Cannot scan %s: %s", root.c_str(), ec.message().c_str());
        return files;
    }

    for (const fs::recursive_directory_iterator end{}; it != end; it.increment(ec))
    {
        if (ec)
        {
            LOG_WARN("Scan of %s stopped early: %s", root.c_str(), ec.message().c_str());
            break;
        }
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec))
            continue;
        if (startsWith(it->path().filename().string(), kTempFilePrefix))
            continue;
        files.push_back(it->path().string());
    }

    LOG_DEBUG("Scan of %s found %zu file(s)", root.c_str(), files.size());
    return files;
}
