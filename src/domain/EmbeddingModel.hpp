/**
 * @file EmbeddingModel.hpp
 * @brief Value objects describing embedding models known to the system.
 */

#pragma once
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace wikiembed::domain {

/** @brief Vector width the similarity index is built around. */
constexpr int kBaselineDimensions = 768;

/**
 * @enum ProviderKind
 * @brief Closed set of embedding providers.
 */
enum class ProviderKind {
    Ollama,       ///< Local runtime, models pulled by the runtime CLI.
    HuggingFace,  ///< Local library loaded by the hosting runtime.
    OpenAI,       ///< Cloud API, credential in the environment.
    Google        ///< Cloud API, credential in the environment.
};

inline std::string ProviderToString(ProviderKind kind) {
    switch (kind) {
        case ProviderKind::Ollama: return "ollama";
        case ProviderKind::HuggingFace: return "huggingface";
        case ProviderKind::OpenAI: return "openai";
        case ProviderKind::Google: return "google";
    }
    return "unknown";
}

/** @brief Model served by the local Ollama runtime. */
struct OllamaModel {
    std::string tag;
};

/** @brief Sentence-transformer model running in-process in the host runtime. */
struct HuggingFaceModel {
    std::string modelName;
    std::string pythonModule = "sentence_transformers";
};

struct OpenAIModel {
    std::string modelName;
    std::string credentialEnv = "OPENAI_API_KEY";
};

struct GoogleModel {
    std::string modelName;
    std::string credentialEnv = "GOOGLE_API_KEY";
    std::string taskType = "SEMANTIC_SIMILARITY";
};

using ProviderPayload = std::variant<OllamaModel, HuggingFaceModel, OpenAIModel, GoogleModel>;

/**
 * @struct EmbeddingModelDescriptor
 * @brief Catalog entry for one embedding model.
 *
 * `compatible` is fixed when the catalog is built: true iff the model's
 * width equals kBaselineDimensions.
 */
struct EmbeddingModelDescriptor {
    std::string id;            ///< "<provider>_<model-name>".
    std::string displayName;
    ProviderPayload payload;
    int dimensionality = 0;
    std::string costTier;      ///< "free", "low", "medium", "high".
    std::string privacyTier;   ///< "local" or "external".
    bool compatible = false;
    std::string description;
    std::optional<std::string> installDirective;

    ProviderKind provider() const {
        return std::visit([](auto&& p) {
            using T = std::decay_t<decltype(p)>;
            if constexpr (std::is_same_v<T, OllamaModel>) {
                return ProviderKind::Ollama;
            } else if constexpr (std::is_same_v<T, HuggingFaceModel>) {
                return ProviderKind::HuggingFace;
            } else if constexpr (std::is_same_v<T, OpenAIModel>) {
                return ProviderKind::OpenAI;
            } else {
                return ProviderKind::Google;
            }
        }, payload);
    }

    /** @brief Model name as the provider knows it (id without the provider prefix). */
    std::string modelName() const {
        auto pos = id.find('_');
        return pos == std::string::npos ? id : id.substr(pos + 1);
    }
};

/**
 * @struct MigrationPreset
 * @brief Recommended pairing of an embedding model with a generation model.
 */
struct MigrationPreset {
    std::string id;
    std::string name;
    std::string description;
    std::string embeddingModelId;
    std::string generationModelId;
    std::string generationProvider;
    std::vector<std::string> benefits;
    bool recommended = false;
};

} // namespace wikiembed::domain
