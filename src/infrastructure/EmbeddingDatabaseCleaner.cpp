#include "infrastructure/EmbeddingDatabaseCleaner.hpp"
#include <iostream>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace wikiembed::infrastructure {

namespace {
bool IsDatabaseFile(const fs::path& p) {
    auto ext = p.extension().string();
    return ext == ".pkl" || ext == ".faiss" || ext == ".index";
}
}

EmbeddingDatabaseCleaner::EmbeddingDatabaseCleaner(fs::path databasesDir)
    : m_databasesDir(std::move(databasesDir)) {}

CleanupResult EmbeddingDatabaseCleaner::clear(const std::string& repoFilter) {
    CleanupResult result;
    std::error_code ec;
    if (!fs::exists(m_databasesDir, ec)) {
        std::cout << "[EmbeddingDatabaseCleaner] No database directory at " << m_databasesDir.string() << std::endl;
        return result;
    }

    for (fs::directory_iterator it(m_databasesDir, ec), end; !ec && it != end; it.increment(ec)) {
        const auto& entry = *it;
        std::error_code fileEc;
        if (!entry.is_regular_file(fileEc) || !IsDatabaseFile(entry.path())) continue;

        std::string filename = entry.path().filename().string();
        if (!repoFilter.empty() && filename.find(repoFilter) == std::string::npos) continue;

        if (fs::remove(entry.path(), fileEc)) {
            std::cout << "[EmbeddingDatabaseCleaner] Removed " << filename << std::endl;
            ++result.removed;
        } else {
            std::cerr << "[EmbeddingDatabaseCleaner] Could not remove " << filename << ": "
                      << (fileEc ? fileEc.message() : "file disappeared") << std::endl;
            result.failed.push_back(filename);
        }
    }
    if (ec) {
        std::cerr << "[EmbeddingDatabaseCleaner] Error scanning " << m_databasesDir.string() << ": " << ec.message() << std::endl;
        result.scanError = ec.message();
    }
    return result;
}

} // namespace wikiembed::infrastructure
