#pragma once

#include <string>
#include <filesystem>

namespace signaldesk {
namespace utils {

class PathUtils {
public:
    // Directory holding the running executable (current directory as fallback)
    static std::filesystem::path getExecutableDir();

    // Absolute paths are returned as-is; relative ones are anchored at the
    // executable directory so the service behaves the same from any cwd.
    static std::filesystem::path resolve(const std::string& path);
};

} // namespace utils
} // namespace signaldesk
