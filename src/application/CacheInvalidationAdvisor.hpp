/**
 * @file CacheInvalidationAdvisor.hpp
 * @brief Tells the operator when a switch left stale vectors or wikis behind.
 */

#pragma once

#include "application/SwitchOutcome.hpp"
#include <filesystem>
#include <optional>
#include <string>

namespace wikiembed::application {

/**
 * @class CacheInvalidationAdvisor
 * @brief Stateless; produces text only and never deletes anything.
 */
class CacheInvalidationAdvisor {
public:
    CacheInvalidationAdvisor(std::filesystem::path databasesDir, std::filesystem::path wikiCacheDir);

    /**
     * @brief Guidance for a finished switch.
     * @return Text only when the switch was configured with a model of non-baseline width.
     */
    std::optional<std::string> advise(const SwitchOutcome& outcome) const;

private:
    std::filesystem::path m_databasesDir;
    std::filesystem::path m_wikiCacheDir;
};

} // namespace wikiembed::application
