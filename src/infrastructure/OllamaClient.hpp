/**
 * @file OllamaClient.hpp
 * @brief Low-level HTTP client for the embedding endpoint of the Ollama REST API.
 */

#pragma once

#include "domain/EmbeddingSource.hpp"
#include <string>
#include <vector>

namespace wikiembed::infrastructure {

class OllamaClient : public domain::EmbeddingSource {
public:
    OllamaClient(const std::string& host = "localhost", int port = 11434);

    /** @brief Sends a POST request to /api/embeddings. Empty on any failure. */
    std::vector<float> getEmbedding(const std::string& model, const std::string& text) override;

private:
    std::string m_host;
    int m_port;
};

} // namespace wikiembed::infrastructure
