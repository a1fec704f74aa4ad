/**
 * @file EmbeddingSource.hpp
 * @brief Interface for anything that turns text into an embedding vector.
 */

#pragma once
#include <string>
#include <vector>

namespace wikiembed::domain {

/**
 * @class EmbeddingSource
 * @brief Produces the embedding of a text with a named model.
 */
class EmbeddingSource {
public:
    virtual ~EmbeddingSource() = default;

    /** @return The vector, or an empty vector on any failure. */
    virtual std::vector<float> getEmbedding(const std::string& model, const std::string& text) = 0;
};

} // namespace wikiembed::domain
