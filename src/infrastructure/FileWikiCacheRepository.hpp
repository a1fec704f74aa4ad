/**
 * @file FileWikiCacheRepository.hpp
 * @brief Filesystem-based implementation of the WikiCacheRepository.
 */

#pragma once
#include "domain/WikiCacheRepository.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace wikiembed::infrastructure {

/**
 * @class FileWikiCacheRepository
 * @brief One JSON file per key: `deepwiki_cache_{repoType}_{owner}_{repo}_{language}.json`.
 *
 * The name is parsed back positionally (first token repoType, second owner,
 * last language, everything between is repo). That only works because keys
 * with '_' in repoType, owner or language are refused at write time.
 */
class FileWikiCacheRepository : public domain::WikiCacheRepository {
public:
    static constexpr const char* kFilePrefix = "deepwiki_cache_";
    static constexpr const char* kFileSuffix = ".json";

    /** @param cacheDir Directory holding the cache files; created on first write. */
    explicit FileWikiCacheRepository(std::filesystem::path cacheDir);

    /** @brief Deterministic file path for a key. */
    std::filesystem::path pathFor(const domain::WikiCacheKey& key) const;

    /** @brief Reads and parses a cache file. Missing or malformed files yield std::nullopt. @see domain::WikiCacheRepository::get */
    std::optional<domain::WikiCacheEntry> get(const domain::WikiCacheKey& key) const override;

    /** @brief Serializes and atomically replaces the file. @see domain::WikiCacheRepository::put */
    domain::OperationResult put(const domain::WikiCacheKey& key, const domain::WikiCacheEntry& entry) override;

    /** @see domain::WikiCacheRepository::remove */
    domain::OperationResult remove(const domain::WikiCacheKey& key) override;

    /** @brief Scans the cache directory, newest modification first. @see domain::WikiCacheRepository::listAll */
    std::vector<domain::ProcessedProject> listAll() const override;

    /**
     * @brief Same as listAll, also reporting cache files whose names could not be parsed.
     * @param skipped Receives the names excluded as CacheParseSkipped; may be null.
     */
    std::vector<domain::ProcessedProject> scan(std::vector<std::string>* skipped) const;

    /**
     * @brief Recovers a key from a cache file name.
     * @return std::nullopt if the name lacks the prefix/suffix or has fewer than four tokens.
     */
    static std::optional<domain::WikiCacheKey> parseFilename(const std::string& filename);

private:
    std::filesystem::path m_cacheDir; ///< Directory holding cache files.
};

} // namespace wikiembed::infrastructure
