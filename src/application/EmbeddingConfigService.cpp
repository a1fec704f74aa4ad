#include "application/EmbeddingConfigService.hpp"
#include "domain/EmbeddingModel.hpp"
#include <iostream>

namespace wikiembed::application {

using domain::ErrorKind;
using domain::OperationResult;
using json = nlohmann::json;

EmbeddingConfigService::EmbeddingConfigService(domain::EmbeddingConfigStore& store)
    : m_store(store) {}

std::string EmbeddingConfigService::InferProvider(const std::string& clientClass) {
    if (clientClass.find("Ollama") != std::string::npos) return "ollama";
    if (clientClass.find("OpenAI") != std::string::npos) return "openai";
    if (clientClass.find("HuggingFace") != std::string::npos) return "huggingface";
    if (clientClass.find("Google") != std::string::npos) return "google";
    return "unknown";
}

std::optional<EmbeddingConfigSummary> EmbeddingConfigService::currentSummary() const {
    auto current = m_store.getCurrent();
    if (!current.ok()) {
        std::cerr << "[EmbeddingConfigService] Error fetching current embedding config: " << current.message << std::endl;
        return std::nullopt;
    }

    auto doc = current.document ? *current.document : domain::EmbeddingConfigDocument::Defaults();
    EmbeddingConfigSummary summary;
    summary.model = doc.embedder.model();
    summary.clientClass = doc.embedder.clientKind.empty() ? "unknown" : doc.embedder.clientKind;
    summary.provider = InferProvider(summary.clientClass);
    summary.dimensions = doc.embedder.dimensions().value_or(domain::kBaselineDimensions);
    summary.document = doc.toJson();
    return summary;
}

OperationResult EmbeddingConfigService::patchEmbedder(const json& patch) {
    auto current = m_store.getCurrent();
    if (!current.ok()) {
        return OperationResult::Failure(current.error, current.message);
    }
    auto doc = current.document ? *current.document : domain::EmbeddingConfigDocument::Defaults();
    auto updated = doc;

    if (patch.is_object() && patch.contains("embedder") && patch["embedder"].is_object()) {
        const auto& embedder = patch["embedder"];
        for (auto it = embedder.begin(); it != embedder.end(); ++it) {
            if (it.key() == "client_class" && it.value().is_string()) {
                updated.embedder.clientKind = it.value().get<std::string>();
            } else if (it.key() == "model_kwargs" && it.value().is_object()) {
                updated.embedder.modelParams = it.value();
            } else if (it.key() == "client_class" || it.key() == "model_kwargs") {
                std::cerr << "[EmbeddingConfigService] Ignoring malformed embedder key: " << it.key() << std::endl;
            } else {
                updated.embedder.extraFields[it.key()] = it.value();
            }
        }
    }

    if (current.document && updated == doc) {
        std::cout << "[EmbeddingConfigService] Embedding configuration unchanged" << std::endl;
        return OperationResult::Success();
    }

    auto written = m_store.updateCurrent(updated);
    if (written.ok()) {
        std::cout << "[EmbeddingConfigService] Embedding configuration updated successfully" << std::endl;
    }
    return written;
}

} // namespace wikiembed::application
