#include "common/PathUtils.h"

#include <system_error>

namespace signaldesk {
namespace utils {

std::filesystem::path PathUtils::getExecutableDir() {
    std::error_code ec;
    const auto exe_path = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec || exe_path.empty()) {
        return std::filesystem::current_path();
    }
    return exe_path.parent_path();
}

std::filesystem::path PathUtils::resolve(const std::string& path) {
    std::filesystem::path p(path);
    if (p.empty() || p.is_absolute()) {
        return p;
    }
    return getExecutableDir() / p;
}

} // namespace utils
} // namespace signaldesk
