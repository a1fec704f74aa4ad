// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace wikiembed::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetHome();
    static std::filesystem::path GetDataRoot();
    static std::filesystem::path GetWikiCacheDir();
    static std::filesystem::path GetDatabasesDir();
    static std::filesystem::path GetConfigDir();
    static std::filesystem::path ExpandUser(const std::string& path);
};

} // namespace wikiembed::infrastructure
