/**
 * @file EmbeddingDimensionProbe.hpp
 * @brief Measures the real vector width a local model produces.
 */

#pragma once
#include "domain/EmbeddingModel.hpp"
#include "domain/EmbeddingSource.hpp"
#include <optional>

namespace wikiembed::infrastructure {

/**
 * @class EmbeddingDimensionProbe
 * @brief Embeds a short sample text and reports the length of the vector.
 *
 * Only models served by the local runtime can be measured; cloud and library
 * models yield std::nullopt.
 */
class EmbeddingDimensionProbe {
public:
    /** @param source Usually the OllamaClient for the configured host. */
    explicit EmbeddingDimensionProbe(domain::EmbeddingSource& source);

    std::optional<int> measure(const domain::EmbeddingModelDescriptor& descriptor);

private:
    domain::EmbeddingSource& m_source;
};

} // namespace wikiembed::infrastructure
