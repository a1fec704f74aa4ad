/**
 * @file AppServices.hpp
 * @brief Container for application-level services to facilitate dependency injection.
 */

#pragma once

#include <memory>
#include "application/CacheInvalidationAdvisor.hpp"
#include "application/EmbeddingConfigService.hpp"
#include "application/ModelAvailabilityChecker.hpp"
#include "application/ModelInstaller.hpp"
#include "application/ModelSwitcher.hpp"
#include "application/WikiCacheService.hpp"
#include "domain/EmbedderConfiguration.hpp"
#include "domain/ProcessRunner.hpp"
#include "domain/WikiCacheRepository.hpp"

namespace wikiembed::application {

/**
 * @struct AppServices
 * @brief Owns the store handles and the services built on them.
 *
 * Members are declared in dependency order so that services are destroyed
 * before the stores and runner they reference.
 */
struct AppServices {
    std::unique_ptr<domain::ProcessRunner> processRunner;
    std::unique_ptr<domain::EmbeddingConfigStore> configStore;
    std::unique_ptr<domain::WikiCacheRepository> cacheRepository;
    std::unique_ptr<ModelAvailabilityChecker> availabilityChecker;
    std::unique_ptr<ModelInstaller> installer;
    std::unique_ptr<CacheInvalidationAdvisor> advisor;
    std::unique_ptr<ModelSwitcher> switcher;
    std::unique_ptr<EmbeddingConfigService> configService;
    std::unique_ptr<WikiCacheService> wikiCacheService;
};

} // namespace wikiembed::application
