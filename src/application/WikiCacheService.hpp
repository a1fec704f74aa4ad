/**
 * @file WikiCacheService.hpp
 * @brief Request-level access to the wiki cache: language rules, auth gate, listing.
 */

#pragma once

#include "domain/WikiCacheRepository.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace wikiembed::application {

/**
 * @struct WikiCacheRequest
 * @brief A freshly generated wiki handed over for caching.
 */
struct WikiCacheRequest {
    domain::RepoInfo repo;
    std::string language;
    domain::WikiStructure wikiStructure;
    std::map<std::string, domain::WikiPage> generatedPages;
    std::string provider;
    std::string model;
};

/**
 * @class WikiCacheService
 * @brief Wraps a WikiCacheRepository with the rules callers are held to.
 *
 * Reads and writes in an unsupported language fall back to the default
 * language. Deletes in an unsupported language are refused, and require the
 * authorization code when auth mode is on.
 */
class WikiCacheService {
public:
    WikiCacheService(domain::WikiCacheRepository& repository,
                     infrastructure::LanguageConfig languages,
                     infrastructure::AuthSettings auth);

    std::optional<domain::WikiCacheEntry> get(const std::string& owner, const std::string& repo,
                                              const std::string& repoType, const std::string& language) const;

    /** @brief Builds the cache entry from a generation request and stores it. */
    domain::OperationResult store(const WikiCacheRequest& request);

    /**
     * @brief Deletes one cached wiki.
     * @return UnsupportedLanguage, Unauthorized or CacheEntryNotFound on refusal.
     */
    domain::OperationResult remove(const std::string& owner, const std::string& repo,
                                   const std::string& repoType, const std::string& language,
                                   const std::optional<std::string>& authorizationCode);

    std::vector<domain::ProcessedProject> processedProjects() const;

    bool authRequired() const { return m_auth.enabled; }
    bool validateAuthCode(const std::string& code) const { return m_auth.code == code; }

    /** @brief The language actually used for reads and writes. */
    std::string normalizeLanguage(const std::string& language) const;

private:
    domain::WikiCacheRepository& m_repository;
    infrastructure::LanguageConfig m_languages;
    infrastructure::AuthSettings m_auth;
};

} // namespace wikiembed::application
