/**
 * @file ModelSwitcher.hpp
 * @brief Orchestrates a guarded change of the active embedding model.
 */

#pragma once

#include "application/CacheInvalidationAdvisor.hpp"
#include "application/ModelAvailabilityChecker.hpp"
#include "application/ModelInstaller.hpp"
#include "application/SwitchOutcome.hpp"
#include "domain/EmbedderConfiguration.hpp"
#include <string>

namespace wikiembed::application {

/**
 * @class ModelSwitcher
 * @brief Resolve, gate on width, ensure availability, then commit.
 *
 * A rejected or failed switch never touches the stored configuration.
 * Switching to the model that is already active rewrites nothing.
 * Callers running switches concurrently must serialize them; the store has
 * no lock of its own.
 */
class ModelSwitcher {
public:
    ModelSwitcher(domain::EmbeddingConfigStore& store,
                  ModelAvailabilityChecker& checker,
                  ModelInstaller& installer,
                  const CacheInvalidationAdvisor& advisor);

    /**
     * @brief Switches the active embedding model.
     * @param modelId Catalog id, e.g. "ollama_nomic-embed-text".
     * @param force Accept a model whose width differs from the baseline.
     */
    SwitchOutcome switchTo(const std::string& modelId, bool force = false);

    /** @brief State reached by the most recent switchTo call. */
    SwitchState lastState() const { return m_state; }

    /** @brief Embedder section a descriptor is configured with. */
    static domain::EmbedderConfiguration BuildEmbedder(const domain::EmbeddingModelDescriptor& descriptor);

private:
    SwitchOutcome finish(SwitchOutcome outcome, SwitchState state, domain::ErrorKind error, const std::string& message);
    void transition(SwitchState next);

    domain::EmbeddingConfigStore& m_store;
    ModelAvailabilityChecker& m_checker;
    ModelInstaller& m_installer;
    const CacheInvalidationAdvisor& m_advisor;
    SwitchState m_state = SwitchState::Idle;
};

} // namespace wikiembed::application
