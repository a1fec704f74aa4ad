/**
 * @file WikiCacheRepository.hpp
 * @brief Interface for persistence of generated wiki artifacts.
 */

#pragma once
#include "domain/Errors.hpp"
#include "domain/WikiCache.hpp"
#include <optional>
#include <vector>

namespace wikiembed::domain {

/**
 * @class WikiCacheRepository
 * @brief Key-value store of wiki snapshots addressed by WikiCacheKey.
 *
 * Operations on distinct keys are independent. Writes to the same key are
 * last-writer-wins with no versioning. Entries never expire on their own.
 */
class WikiCacheRepository {
public:
    virtual ~WikiCacheRepository() = default;

    /**
     * @brief Loads a cached wiki.
     * @return std::nullopt when nothing usable is stored under the key.
     */
    virtual std::optional<WikiCacheEntry> get(const WikiCacheKey& key) const = 0;

    /** @brief Stores an entry, replacing whatever was there. */
    virtual OperationResult put(const WikiCacheKey& key, const WikiCacheEntry& entry) = 0;

    /** @brief Deletes an entry. @return CacheEntryNotFound if absent. */
    virtual OperationResult remove(const WikiCacheKey& key) = 0;

    /** @brief Lists stored entries, most recently written first. */
    virtual std::vector<ProcessedProject> listAll() const = 0;
};

} // namespace wikiembed::domain
