#include "common/PathUtils.h"
#include "common/Logger.h"

#include <system_error>
#include <vector>

namespace tradebrain {
namespace utils {

std::filesystem::path PathUtils::getExecutableDir() {
    std::error_code ec;
    const auto exe_path = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec || exe_path.empty()) {
        return std::filesystem::current_path();
    }
    return exe_path.parent_path();
}

std::filesystem::path PathUtils::resolveRelativePath(const std::string& relative_path) {
    return getExecutableDir() / relative_path;
}

std::filesystem::path PathUtils::resolveWritableDir(const std::string& configured,
                                                    const std::string& fallback) {
    std::vector<std::filesystem::path> candidates;
    for (const auto& raw : {configured, fallback}) {
        if (raw.empty()) {
            continue;
        }
        std::filesystem::path p(raw);
        candidates.push_back(p.is_absolute() ? p : resolveRelativePath(raw));
    }

    for (const auto& candidate : candidates) {
        std::error_code ec;
        std::filesystem::create_directories(candidate, ec);
        if (!ec && std::filesystem::is_directory(candidate, ec)) {
            return candidate;
        }
        LOG_WARN("State directory not writable: {} ({})", candidate.string(), ec.message());
    }

    std::error_code ec;
    auto tmp = std::filesystem::temp_directory_path(ec);
    if (ec) {
        tmp = "/tmp";
    }
    LOG_WARN("Falling back to temp directory for state: {}", tmp.string());
    return tmp;
}

} // namespace utils
} // namespace tradebrain
