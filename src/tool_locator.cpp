#include "tool_locator.hpp"
#include <cstdlib>
#include <filesystem>
#include <string_view>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

bool isExecutableFile(const fs::path& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec) && access(path.c_str(), X_OK) == 0;
}

} // namespace

std::optional<std::string> PathToolLocator::locate(const std::string& name) const {
    if (name.empty()) {
        return std::nullopt;
    }
    if (name.find('/') != std::string::npos) {
        return isExecutableFile(name) ? std::optional<std::string>(name) : std::nullopt;
    }

    const char* pathEnv = std::getenv("PATH");
    std::string_view searchPath = pathEnv ? pathEnv : "/usr/local/bin:/usr/bin:/bin";
    while (true) {
        auto sep = searchPath.find(':');
        std::string_view dir = searchPath.substr(0, sep);
        // An empty PATH element means the current directory.
        fs::path candidate = fs::path(dir.empty() ? "." : std::string(dir)) / name;
        if (isExecutableFile(candidate)) {
            return candidate.string();
        }
        if (sep == std::string_view::npos) {
            break;
        }
        searchPath.remove_prefix(sep + 1);
    }
    return std::nullopt;
}
