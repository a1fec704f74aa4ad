/**
 * @file FileEmbeddingConfigStore.hpp
 * @brief JSON-file implementation of the EmbeddingConfigStore.
 */

#pragma once
#include "domain/EmbedderConfiguration.hpp"
#include <filesystem>

namespace wikiembed::infrastructure {

/**
 * @class FileEmbeddingConfigStore
 * @brief Keeps the active configuration in one JSON file and its previous version in `<file>.bak`.
 *
 * updateCurrent copies the old file verbatim to the backup, then replaces the
 * primary. A crash between the two steps leaves a valid backup and the old
 * primary, since the primary is replaced by rename. Overlapping updates from
 * different callers are not serialized: the backup may end up holding either
 * caller's predecessor.
 */
class FileEmbeddingConfigStore : public domain::EmbeddingConfigStore {
public:
    explicit FileEmbeddingConfigStore(std::filesystem::path configPath);

    /** @see domain::EmbeddingConfigStore::getCurrent */
    domain::ConfigReadResult getCurrent() const override;

    /** @see domain::EmbeddingConfigStore::updateCurrent */
    domain::OperationResult updateCurrent(const domain::EmbeddingConfigDocument& newConfig) override;

    const std::filesystem::path& configPath() const { return m_configPath; }
    std::filesystem::path backupPath() const;

private:
    std::filesystem::path m_configPath; ///< Primary configuration file.
};

} // namespace wikiembed::infrastructure
