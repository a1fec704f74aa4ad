#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

#include "infrastructure/FileEmbeddingConfigStore.hpp"

using namespace wikiembed;
namespace fs = std::filesystem;

namespace {

std::string ReadFile(const fs::path& p) {
    std::ifstream f(p, std::ios::binary);
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

void WriteFile(const fs::path& p, const std::string& content) {
    std::ofstream f(p, std::ios::binary);
    f << content;
}

domain::EmbeddingConfigDocument OpenAILarge() {
    domain::EmbeddingConfigDocument doc = domain::EmbeddingConfigDocument::Defaults();
    doc.embedder.clientKind = "OpenAIClient";
    doc.embedder.modelParams = {{"model", "text-embedding-3-large"}, {"dimensions", 3072}};
    return doc;
}

} // namespace

int main() {
    std::cout << "[Test] Starting EmbeddingConfigStore Test..." << std::endl;

    fs::path testRoot = "test_root_config_store";
    fs::remove_all(testRoot);
    fs::create_directories(testRoot);
    fs::path configPath = testRoot / "embedder.json";

    infrastructure::FileEmbeddingConfigStore store(configPath);
    assert(store.backupPath() == testRoot / "embedder.json.bak");

    // Missing file: no document, no error.
    auto missing = store.getCurrent();
    assert(missing.ok());
    assert(!missing.document);

    // First write creates the primary and no backup.
    auto first = store.updateCurrent(domain::EmbeddingConfigDocument::Defaults());
    assert(first.ok());
    assert(fs::exists(configPath));
    assert(!fs::exists(store.backupPath()));

    auto read = store.getCurrent();
    assert(read.ok() && read.document);
    assert(*read.document == domain::EmbeddingConfigDocument::Defaults());
    assert(read.document->embedder.model() == "nomic-embed-text");
    assert(!read.document->embedder.dimensions());

    // Hand-written file with sibling sections and its own formatting.
    const std::string original =
        "{\"embedder\": {\"client_class\": \"OllamaClient\", \"model_kwargs\": {\"model\": \"nomic-embed-text\"}},\n"
        " \"retriever\": {\"top_k\": 20},\n"
        " \"text_splitter\": {\"split_by\": \"word\", \"chunk_size\": 350}}\n";
    WriteFile(configPath, original);

    auto withSiblings = store.getCurrent();
    assert(withSiblings.ok() && withSiblings.document);
    assert(withSiblings.document->otherSections["retriever"]["top_k"] == 20);

    auto updated = *withSiblings.document;
    updated.embedder = OpenAILarge().embedder;
    assert(store.updateCurrent(updated).ok());

    // Exactly one backup, byte-identical to the previous primary.
    assert(ReadFile(store.backupPath()) == original);
    int backups = 0;
    for (const auto& entry : fs::directory_iterator(testRoot)) {
        if (entry.path().extension() == ".bak") ++backups;
        assert(entry.path().extension() != ".tmp" && "no temp files left behind");
    }
    assert(backups == 1);

    auto after = store.getCurrent();
    assert(after.ok() && after.document);
    assert(after.document->embedder.clientKind == "OpenAIClient");
    assert(after.document->embedder.dimensions() && *after.document->embedder.dimensions() == 3072);
    assert(after.document->otherSections["text_splitter"]["chunk_size"] == 350);

    // A second update overwrites the single backup with the previous primary.
    std::string beforeSecond = ReadFile(configPath);
    assert(store.updateCurrent(domain::EmbeddingConfigDocument::Defaults()).ok());
    assert(ReadFile(store.backupPath()) == beforeSecond);

    // Malformed JSON is a read failure, not a missing file.
    WriteFile(configPath, "{ not json");
    auto broken = store.getCurrent();
    assert(!broken.ok());
    assert(broken.error == domain::ErrorKind::ConfigReadFailed);
    assert(!broken.document);

    // model_kwargs of the wrong type is rejected as well.
    WriteFile(configPath, "{\"embedder\": {\"client_class\": \"OllamaClient\", \"model_kwargs\": 5}}");
    assert(store.getCurrent().error == domain::ErrorKind::ConfigReadFailed);

    // Writing into a path whose parent is a regular file fails cleanly.
    fs::path blocker = testRoot / "blocker";
    WriteFile(blocker, "x");
    infrastructure::FileEmbeddingConfigStore badStore(blocker / "embedder.json");
    auto failed = badStore.updateCurrent(domain::EmbeddingConfigDocument::Defaults());
    assert(!failed.ok());
    assert(failed.error == domain::ErrorKind::ConfigWriteFailed);
    assert(ReadFile(blocker) == "x");

    fs::remove_all(testRoot);
    std::cout << "[PASS] EmbeddingConfigStore Test." << std::endl;
    return 0;
}
