/**
 * @file WikiCacheJson.hpp
 * @brief nlohmann::json mapping for the wiki cache file format.
 *
 * Field names follow the on-disk format (`wiki_structure`, `generated_pages`,
 * `filePaths`, ...). Absent optionals are omitted on write; missing or null
 * fields read back as std::nullopt.
 */

#pragma once
#include "domain/WikiCache.hpp"
#include <nlohmann/json.hpp>

namespace wikiembed::domain {

void to_json(nlohmann::json& j, const WikiPage& page);
void from_json(const nlohmann::json& j, WikiPage& page);

void to_json(nlohmann::json& j, const WikiSection& section);
void from_json(const nlohmann::json& j, WikiSection& section);

void to_json(nlohmann::json& j, const WikiStructure& structure);
void from_json(const nlohmann::json& j, WikiStructure& structure);

void to_json(nlohmann::json& j, const RepoInfo& repo);
void from_json(const nlohmann::json& j, RepoInfo& repo);

void to_json(nlohmann::json& j, const WikiCacheEntry& entry);
void from_json(const nlohmann::json& j, WikiCacheEntry& entry);

} // namespace wikiembed::domain
