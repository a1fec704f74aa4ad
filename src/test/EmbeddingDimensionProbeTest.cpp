#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "domain/EmbeddingSource.hpp"
#include "domain/ModelCatalog.hpp"
#include "infrastructure/EmbeddingDimensionProbe.hpp"

using namespace wikiembed;

namespace {

// Returns a vector of fixed width and records which models were asked for.
class FixedWidthSource : public domain::EmbeddingSource {
public:
    explicit FixedWidthSource(size_t width) : m_width(width) {}

    std::vector<float> getEmbedding(const std::string& model, const std::string& text) override {
        requestedModels.push_back(model);
        assert(!text.empty());
        return std::vector<float>(m_width, 0.25f);
    }

    void setWidth(size_t width) { m_width = width; }

    std::vector<std::string> requestedModels;

private:
    size_t m_width;
};

} // namespace

int main() {
    std::cout << "[Test] Starting EmbeddingDimensionProbe Test..." << std::endl;

    auto nomic = *domain::ModelCatalog::findById("ollama_nomic-embed-text");
    auto mpnet = *domain::ModelCatalog::findById("huggingface_all-mpnet-base-v2");
    auto large = *domain::ModelCatalog::findById("openai_text-embedding-3-large");

    FixedWidthSource source(768);
    infrastructure::EmbeddingDimensionProbe probe(source);

    auto measured = probe.measure(nomic);
    assert(measured && *measured == 768);
    assert(source.requestedModels == (std::vector<std::string>{"nomic-embed-text"}));
    std::cout << "[PASS] Local model measured." << std::endl;

    // A width that disagrees with the catalog is still reported as measured.
    source.setWidth(1024);
    measured = probe.measure(nomic);
    assert(measured && *measured == 1024);

    // Empty vector means the runtime failed.
    source.setWidth(0);
    assert(!probe.measure(nomic));
    std::cout << "[PASS] Mismatch and failure." << std::endl;

    // Models outside the local runtime are never sent to the source.
    source.requestedModels.clear();
    source.setWidth(768);
    assert(!probe.measure(mpnet));
    assert(!probe.measure(large));
    assert(source.requestedModels.empty());
    std::cout << "[PASS] Non-local models skipped." << std::endl;

    std::cout << "[PASS] EmbeddingDimensionProbe Test." << std::endl;
    return 0;
}
