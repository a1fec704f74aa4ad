/**
 * @file ModelCatalog.hpp
 * @brief Compiled-in registry of embedding models and migration presets.
 */

#pragma once
#include "domain/EmbeddingModel.hpp"
#include <optional>
#include <string>
#include <vector>

namespace wikiembed::domain {

/**
 * @class ModelCatalog
 * @brief Fixed, ordered list of known embedding models.
 *
 * Entries never change at runtime. Compatibility is derived from the declared
 * width, not from whether the model is usable on this machine.
 */
class ModelCatalog {
public:
    /** @brief All known models in catalog order. */
    static const std::vector<EmbeddingModelDescriptor>& listAll();

    /** @brief Looks up a model by id. @return std::nullopt if the id is unknown. */
    static std::optional<EmbeddingModelDescriptor> findById(const std::string& id);

    /** @brief Ids of the models whose width matches the baseline. */
    static std::vector<std::string> compatibleModelIds();

    /** @brief Recommended embedding/generation pairings. */
    static const std::vector<MigrationPreset>& migrationPresets();
};

} // namespace wikiembed::domain
