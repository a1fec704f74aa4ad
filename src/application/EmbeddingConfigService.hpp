/**
 * @file EmbeddingConfigService.hpp
 * @brief Read and patch access to the active embedding configuration.
 */

#pragma once

#include "domain/EmbedderConfiguration.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace wikiembed::application {

/**
 * @struct EmbeddingConfigSummary
 * @brief Flattened view of the active configuration.
 */
struct EmbeddingConfigSummary {
    std::string model;
    std::string provider;     ///< Inferred from the client class; "unknown" if no match.
    std::string clientClass;
    int dimensions = 0;       ///< model_kwargs.dimensions, else the baseline width.
    nlohmann::json document;  ///< The whole configuration as stored.
};

class EmbeddingConfigService {
public:
    explicit EmbeddingConfigService(domain::EmbeddingConfigStore& store);

    /** @brief Summary of the active configuration; defaults if nothing is stored yet. */
    std::optional<EmbeddingConfigSummary> currentSummary() const;

    /**
     * @brief Shallow-merges `patch["embedder"]` into the embedder section and persists it.
     *
     * Recognised keys are "client_class" (string) and "model_kwargs" (object,
     * replaces the previous one). Anything else in the patch is ignored.
     */
    domain::OperationResult patchEmbedder(const nlohmann::json& patch);

    /** @brief Maps a client class name to a provider name. */
    static std::string InferProvider(const std::string& clientClass);

private:
    domain::EmbeddingConfigStore& m_store;
};

} // namespace wikiembed::application
