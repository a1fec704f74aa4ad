#include "infrastructure/EmbeddingDimensionProbe.hpp"
#include <iostream>
#include <variant>

namespace wikiembed::infrastructure {

namespace {
constexpr const char* kSampleText = "dimension probe";
}

EmbeddingDimensionProbe::EmbeddingDimensionProbe(domain::EmbeddingSource& source)
    : m_source(source) {}

std::optional<int> EmbeddingDimensionProbe::measure(const domain::EmbeddingModelDescriptor& descriptor) {
    const auto* ollama = std::get_if<domain::OllamaModel>(&descriptor.payload);
    if (!ollama) {
        std::cout << "[EmbeddingDimensionProbe] " << descriptor.id
                  << " is not served by the local runtime; nothing to measure." << std::endl;
        return std::nullopt;
    }

    auto vector = m_source.getEmbedding(ollama->tag, kSampleText);
    if (vector.empty()) {
        std::cerr << "[EmbeddingDimensionProbe] No embedding returned for " << ollama->tag << std::endl;
        return std::nullopt;
    }

    int measured = static_cast<int>(vector.size());
    if (measured != descriptor.dimensionality) {
        std::cerr << "[EmbeddingDimensionProbe] Warning: " << descriptor.id << " declares "
                  << descriptor.dimensionality << " dimensions but produced " << measured << std::endl;
    }
    return measured;
}

} // namespace wikiembed::infrastructure
