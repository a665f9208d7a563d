#pragma once

#include <string>
#include <filesystem>

namespace edgebook {
namespace utils {

class PathUtils {
public:
    // Directory holding the running executable (falls back to the working directory).
    static std::filesystem::path getExecutableDir();

    // Relative paths are resolved against the executable directory.
    static std::filesystem::path resolveRelativePath(const std::string& relative_path);
};

} // namespace utils
} // namespace edgebook
