/**
 * @file ModelCatalog.cpp
 * @brief Implementation of ModelCatalog.
 */

#include "domain/ModelCatalog.hpp"

namespace wikiembed::domain {

namespace {

EmbeddingModelDescriptor MakeModel(std::string id,
                                   std::string displayName,
                                   ProviderPayload payload,
                                   int dimensions,
                                   std::string cost,
                                   std::string privacy,
                                   std::string description,
                                   std::optional<std::string> install = std::nullopt) {
    EmbeddingModelDescriptor d;
    d.id = std::move(id);
    d.displayName = std::move(displayName);
    d.payload = std::move(payload);
    d.dimensionality = dimensions;
    d.costTier = std::move(cost);
    d.privacyTier = std::move(privacy);
    d.compatible = (dimensions == kBaselineDimensions);
    d.description = std::move(description);
    d.installDirective = std::move(install);
    return d;
}

std::vector<EmbeddingModelDescriptor> BuildCatalog() {
    return {
        MakeModel("ollama_nomic-embed-text", "Nomic Embed Text",
                  OllamaModel{"nomic-embed-text"}, 768, "free", "local",
                  "High-quality embeddings running locally with Ollama",
                  std::string("ollama pull nomic-embed-text")),
        MakeModel("openai_text-embedding-3-small", "Text Embedding 3 Small",
                  OpenAIModel{"text-embedding-3-small"}, 768, "low", "external",
                  "OpenAI's efficient embedding model (768D for compatibility)"),
        MakeModel("openai_text-embedding-3-large", "Text Embedding 3 Large",
                  OpenAIModel{"text-embedding-3-large"}, 3072, "medium", "external",
                  "OpenAI's highest quality embedding model (requires migration)"),
        MakeModel("openai_text-embedding-ada-002", "Text Embedding Ada 002",
                  OpenAIModel{"text-embedding-ada-002"}, 1536, "low", "external",
                  "Legacy OpenAI embedding model (requires migration)"),
        MakeModel("google_text-embedding-004", "Text Embedding 004",
                  GoogleModel{"text-embedding-004"}, 768, "low", "external",
                  "Google's general-purpose embedding model (768D compatible)"),
        MakeModel("huggingface_all-mpnet-base-v2", "All-MPNet-Base-v2",
                  HuggingFaceModel{"all-mpnet-base-v2"}, 768, "free", "local",
                  "Popular sentence transformer model (768D compatible)",
                  std::string("pip install sentence-transformers")),
    };
}

std::vector<MigrationPreset> BuildPresets() {
    std::vector<MigrationPreset> presets;

    MigrationPreset optimal;
    optimal.id = "hybrid_optimal";
    optimal.name = "Hybrid Optimal (Recommended)";
    optimal.description = "Local embeddings with external generation: best balance of privacy, cost and quality";
    optimal.embeddingModelId = "ollama_nomic-embed-text";
    optimal.generationModelId = "openai_gpt-4o-mini";
    optimal.generationProvider = "openai";
    optimal.benefits = {"100% Privacy for Documents", "Zero Embedding Costs", "High-Quality Answers", "No API Limits for Embeddings"};
    optimal.recommended = true;
    presets.push_back(optimal);

    MigrationPreset openai;
    openai.id = "openai_compatible";
    openai.name = "OpenAI Compatible";
    openai.description = "OpenAI for both embeddings and generation with 768D compatibility";
    openai.embeddingModelId = "openai_text-embedding-3-small";
    openai.generationModelId = "openai_gpt-4o-mini";
    openai.generationProvider = "openai";
    openai.benefits = {"Single Provider", "Enterprise Support", "High Reliability", "Dimension Compatibility"};
    presets.push_back(openai);

    MigrationPreset google;
    google.id = "google_hybrid";
    google.name = "Google Gemini Hybrid";
    google.description = "Local embeddings with Google Gemini for generation";
    google.embeddingModelId = "ollama_nomic-embed-text";
    google.generationModelId = "google_gemini-2.5-flash";
    google.generationProvider = "google";
    google.benefits = {"Free Embeddings", "Fast Google Generation", "Cost Effective", "Privacy for Documents"};
    presets.push_back(google);

    MigrationPreset local;
    local.id = "fully_local";
    local.name = "Fully Local (Privacy First)";
    local.description = "Complete local processing using only Ollama models";
    local.embeddingModelId = "ollama_nomic-embed-text";
    local.generationModelId = "ollama_llama3.1";
    local.generationProvider = "ollama";
    local.benefits = {"100% Local", "Complete Privacy", "Zero API Costs", "No Internet Required"};
    presets.push_back(local);

    return presets;
}

} // namespace

const std::vector<EmbeddingModelDescriptor>& ModelCatalog::listAll() {
    static const std::vector<EmbeddingModelDescriptor> catalog = BuildCatalog();
    return catalog;
}

std::optional<EmbeddingModelDescriptor> ModelCatalog::findById(const std::string& id) {
    for (const auto& model : listAll()) {
        if (model.id == id) {
            return model;
        }
    }
    return std::nullopt;
}

std::vector<std::string> ModelCatalog::compatibleModelIds() {
    std::vector<std::string> ids;
    for (const auto& model : listAll()) {
        if (model.compatible) {
            ids.push_back(model.id);
        }
    }
    return ids;
}

const std::vector<MigrationPreset>& ModelCatalog::migrationPresets() {
    static const std::vector<MigrationPreset> presets = BuildPresets();
    return presets;
}

} // namespace wikiembed::domain
