/**
 * @file EmbedderConfiguration.cpp
 * @brief JSON mapping for the embedding configuration document.
 */

#include "domain/EmbedderConfiguration.hpp"
#include <stdexcept>

namespace wikiembed::domain {

using json = nlohmann::json;

std::string EmbedderConfiguration::model() const {
    if (modelParams.is_object() && modelParams.contains("model") && modelParams["model"].is_string()) {
        return modelParams["model"].get<std::string>();
    }
    return "unknown";
}

std::optional<int> EmbedderConfiguration::dimensions() const {
    if (modelParams.is_object() && modelParams.contains("dimensions") && modelParams["dimensions"].is_number_integer()) {
        return modelParams["dimensions"].get<int>();
    }
    return std::nullopt;
}

EmbeddingConfigDocument EmbeddingConfigDocument::Defaults() {
    EmbeddingConfigDocument doc;
    doc.embedder.clientKind = "OllamaClient";
    doc.embedder.modelParams = {{"model", "nomic-embed-text"}};
    return doc;
}

EmbeddingConfigDocument EmbeddingConfigDocument::FromJson(const json& j) {
    EmbeddingConfigDocument doc;
    if (!j.is_object()) {
        throw std::runtime_error("configuration root must be an object");
    }

    for (auto it = j.begin(); it != j.end(); ++it) {
        if (it.key() == "embedder") continue;
        doc.otherSections[it.key()] = it.value();
    }

    if (j.contains("embedder")) {
        const auto& e = j.at("embedder");
        if (!e.is_object()) {
            throw std::runtime_error("embedder must be an object");
        }
        doc.embedder.clientKind = e.value("client_class", "");
        for (auto it = e.begin(); it != e.end(); ++it) {
            if (it.key() == "client_class" || it.key() == "model_kwargs") continue;
            doc.embedder.extraFields[it.key()] = it.value();
        }
        if (e.contains("model_kwargs")) {
            doc.embedder.modelParams = e.at("model_kwargs");
            if (!doc.embedder.modelParams.is_object()) {
                throw std::runtime_error("model_kwargs must be an object");
            }
        }
    }
    return doc;
}

json EmbeddingConfigDocument::toJson() const {
    json j = otherSections.is_object() ? otherSections : json::object();
    json e = embedder.extraFields.is_object() ? embedder.extraFields : json::object();
    e["client_class"] = embedder.clientKind;
    e["model_kwargs"] = embedder.modelParams;
    j["embedder"] = e;
    return j;
}

} // namespace wikiembed::domain
