/**
 * @file EmbeddingDatabaseCleaner.hpp
 * @brief Removes vector databases built with a different embedding width.
 */

#pragma once
#include <filesystem>
#include <string>
#include <vector>

namespace wikiembed::infrastructure {

/**
 * @struct CleanupResult
 * @brief Files removed and files that could not be removed.
 */
struct CleanupResult {
    int removed = 0;
    std::vector<std::string> failed; ///< Names whose removal failed.
    std::string scanError;           ///< Set when the directory could not be read.

    bool ok() const { return failed.empty() && scanError.empty(); }
};

/**
 * @class EmbeddingDatabaseCleaner
 * @brief Deletes `*.pkl`, `*.faiss` and `*.index` files from the database directory.
 *
 * Never invoked implicitly; a model switch only advises running it.
 */
class EmbeddingDatabaseCleaner {
public:
    explicit EmbeddingDatabaseCleaner(std::filesystem::path databasesDir);

    /**
     * @brief Removes stale database files.
     * @param repoFilter When non-empty, only files whose name contains it are removed.
     * A missing directory is not an error: nothing was built yet.
     */
    CleanupResult clear(const std::string& repoFilter = "");

private:
    std::filesystem::path m_databasesDir;
};

} // namespace wikiembed::infrastructure
