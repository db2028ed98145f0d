#pragma once

#include <string>
#include <filesystem>

namespace tradebrain {
namespace utils {

class PathUtils {
public:
    // Directory containing the running executable (current directory if unknown)
    static std::filesystem::path getExecutableDir();

    // Executable-relative path to absolute path
    static std::filesystem::path resolveRelativePath(const std::string& relative_path);

    // First writable directory among configured, fallback and the system temp dir.
    // Relative candidates are resolved against the executable directory.
    static std::filesystem::path resolveWritableDir(const std::string& configured,
                                                    const std::string& fallback);
};

} // namespace utils
} // namespace tradebrain
