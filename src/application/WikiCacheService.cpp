#include "application/WikiCacheService.hpp"
#include <iostream>
#include <utility>

namespace wikiembed::application {

using domain::ErrorKind;
using domain::OperationResult;

WikiCacheService::WikiCacheService(domain::WikiCacheRepository& repository,
                                   infrastructure::LanguageConfig languages,
                                   infrastructure::AuthSettings auth)
    : m_repository(repository), m_languages(std::move(languages)), m_auth(std::move(auth)) {}

std::string WikiCacheService::normalizeLanguage(const std::string& language) const {
    if (m_languages.isSupported(language)) {
        return language;
    }
    return m_languages.defaultLanguage;
}

std::optional<domain::WikiCacheEntry> WikiCacheService::get(const std::string& owner, const std::string& repo,
                                                            const std::string& repoType, const std::string& language) const {
    domain::WikiCacheKey key{owner, repo, repoType, normalizeLanguage(language)};
    std::cout << "[WikiCacheService] Attempting to retrieve wiki cache for " << owner << "/" << repo
              << " (" << repoType << "), lang: " << key.language << std::endl;

    auto entry = m_repository.get(key);
    if (!entry) {
        std::cout << "[WikiCacheService] Wiki cache not found for " << owner << "/" << repo
                  << " (" << repoType << "), lang: " << key.language << std::endl;
    }
    return entry;
}

OperationResult WikiCacheService::store(const WikiCacheRequest& request) {
    domain::WikiCacheKey key{request.repo.owner, request.repo.repo, request.repo.type, normalizeLanguage(request.language)};

    domain::WikiCacheEntry entry;
    entry.wikiStructure = request.wikiStructure;
    entry.generatedPages = request.generatedPages;
    entry.repo = request.repo;
    entry.provider = request.provider;
    entry.model = request.model;

    std::cout << "[WikiCacheService] Attempting to save wiki cache for " << key.owner << "/" << key.repo
              << " (" << key.repoType << "), lang: " << key.language << std::endl;
    return m_repository.put(key, entry);
}

OperationResult WikiCacheService::remove(const std::string& owner, const std::string& repo,
                                         const std::string& repoType, const std::string& language,
                                         const std::optional<std::string>& authorizationCode) {
    if (!m_languages.isSupported(language)) {
        return OperationResult::Failure(ErrorKind::UnsupportedLanguage, "Language is not supported: " + language);
    }

    if (m_auth.enabled) {
        std::cout << "[WikiCacheService] Checking the authorization code" << std::endl;
        if (!authorizationCode || *authorizationCode != m_auth.code) {
            std::cerr << "[WikiCacheService] Authorization code is invalid" << std::endl;
            return OperationResult::Failure(ErrorKind::Unauthorized, "Authorization code is invalid");
        }
    }

    std::cout << "[WikiCacheService] Attempting to delete wiki cache for " << owner << "/" << repo
              << " (" << repoType << "), lang: " << language << std::endl;
    return m_repository.remove(domain::WikiCacheKey{owner, repo, repoType, language});
}

std::vector<domain::ProcessedProject> WikiCacheService::processedProjects() const {
    return m_repository.listAll();
}

} // namespace wikiembed::application
