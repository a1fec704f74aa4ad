/**
 * @file EmbedderConfiguration.hpp
 * @brief The persisted embedding configuration and its store interface.
 */

#pragma once
#include "domain/Errors.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace wikiembed::domain {

/**
 * @struct EmbedderConfiguration
 * @brief The "embedder" section: client class plus free-form model parameters.
 *
 * Keys other than client_class and model_kwargs are carried in extraFields
 * and written back unchanged.
 */
struct EmbedderConfiguration {
    std::string clientKind;
    nlohmann::json modelParams = nlohmann::json::object(); ///< Requires "model"; "dimensions" optional.
    nlohmann::json extraFields = nlohmann::json::object(); ///< Any other embedder keys, e.g. "batch_size".

    std::string model() const;
    std::optional<int> dimensions() const;

    bool operator==(const EmbedderConfiguration& other) const {
        return clientKind == other.clientKind && modelParams == other.modelParams &&
               extraFields == other.extraFields;
    }
    bool operator!=(const EmbedderConfiguration& other) const { return !(*this == other); }
};

/**
 * @struct EmbeddingConfigDocument
 * @brief Whole configuration file: the embedder section plus untouched sibling sections.
 */
struct EmbeddingConfigDocument {
    EmbedderConfiguration embedder;
    nlohmann::json otherSections = nlohmann::json::object(); ///< "retriever", "text_splitter", ...

    /** @brief Configuration used when no file exists yet. */
    static EmbeddingConfigDocument Defaults();

    /**
     * @brief Builds a document from parsed JSON.
     * @throws std::exception if the embedder section has the wrong shape.
     */
    static EmbeddingConfigDocument FromJson(const nlohmann::json& j);

    nlohmann::json toJson() const;

    bool operator==(const EmbeddingConfigDocument& other) const {
        return embedder == other.embedder && otherSections == other.otherSections;
    }
    bool operator!=(const EmbeddingConfigDocument& other) const { return !(*this == other); }
};

/**
 * @struct ConfigReadResult
 * @brief Result of reading the active configuration.
 *
 * A missing file is not an error: `document` is empty and `error` is None.
 */
struct ConfigReadResult {
    std::optional<EmbeddingConfigDocument> document;
    ErrorKind error = ErrorKind::None;
    std::string message;

    bool ok() const { return error == ErrorKind::None; }
};

/**
 * @class EmbeddingConfigStore
 * @brief Owner of the single active embedding configuration.
 *
 * One instance is created by the hosting process and handed to every caller.
 * Implementations keep exactly one backup of the previous configuration.
 */
class EmbeddingConfigStore {
public:
    virtual ~EmbeddingConfigStore() = default;

    /** @brief Reads the active configuration. */
    virtual ConfigReadResult getCurrent() const = 0;

    /**
     * @brief Replaces the active configuration, backing up the previous one first.
     * @return ConfigWriteFailed on any failure; the previous configuration is kept.
     */
    virtual OperationResult updateCurrent(const EmbeddingConfigDocument& newConfig) = 0;
};

} // namespace wikiembed::domain
