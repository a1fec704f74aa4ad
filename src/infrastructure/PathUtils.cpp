#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>

namespace wikiembed::infrastructure {

namespace fs = std::filesystem;

fs::path PathUtils::GetHome() {
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home);
    }
    return fs::current_path(); // Fallback
}

fs::path PathUtils::GetDataRoot() {
    const char* root = std::getenv("ADALFLOW_ROOT");
    if (root && *root) {
        return ExpandUser(root);
    }
    return GetHome() / ".adalflow";
}

// Not created here: the cache store creates it on first write.
fs::path PathUtils::GetWikiCacheDir() {
    return GetDataRoot() / "wikicache";
}

fs::path PathUtils::GetDatabasesDir() {
    return GetDataRoot() / "databases";
}

fs::path PathUtils::GetConfigDir() {
    const char* dir = std::getenv("WIKIEMBED_CONFIG_DIR");
    if (dir && *dir) {
        return ExpandUser(dir);
    }
    return fs::current_path() / "api" / "config";
}

fs::path PathUtils::ExpandUser(const std::string& path) {
    if (path == "~") {
        return GetHome();
    }
    if (path.rfind("~/", 0) == 0) {
        return GetHome() / path.substr(2);
    }
    return fs::path(path);
}

} // namespace wikiembed::infrastructure
