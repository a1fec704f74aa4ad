#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/EmbeddingDatabaseCleaner.hpp"
#include "infrastructure/PathUtils.hpp"

using namespace wikiembed::infrastructure;
namespace fs = std::filesystem;

int main() {
    std::cout << "[Test] Starting ConfigLoader Test..." << std::endl;

    fs::path testRoot = fs::absolute("test_root_config_loader");
    fs::remove_all(testRoot);
    fs::create_directories(testRoot);

    setenv("ADALFLOW_ROOT", (testRoot / "data").c_str(), 1);
    assert(PathUtils::GetDataRoot() == testRoot / "data");
    assert(PathUtils::GetWikiCacheDir() == testRoot / "data" / "wikicache");
    assert(PathUtils::GetDatabasesDir() == testRoot / "data" / "databases");

    setenv("WIKIEMBED_CONFIG_DIR", testRoot.c_str(), 1);
    assert(PathUtils::GetConfigDir() == testRoot);
    unsetenv("WIKIEMBED_CONFIG_DIR");
    assert(PathUtils::GetConfigDir() == fs::current_path() / "api" / "config");

    setenv("HOME", testRoot.c_str(), 1);
    assert(PathUtils::ExpandUser("~/x/y") == testRoot / "x" / "y");
    assert(PathUtils::ExpandUser("/abs/path") == fs::path("/abs/path"));

    // No settings file: defaults.
    auto defaults = ConfigLoader::LoadSettings(testRoot);
    assert(defaults.embedderConfigPath == testRoot / "embedder.json");
    assert(defaults.wikiCacheDir == testRoot / "data" / "wikicache");
    assert(defaults.ollamaPort == 11434);
    assert(defaults.processTimeoutSeconds == 120);

    {
        std::ofstream f(testRoot / "settings.json");
        f << R"({"embedder_config": "custom/embedder.json", "wiki_cache_dir": "~/cache",
                 "ollama_host": "gpu-box", "ollama_port": 11500, "process_timeout_seconds": 30})";
    }
    auto settings = ConfigLoader::LoadSettings(testRoot);
    assert(settings.embedderConfigPath == testRoot / "custom" / "embedder.json");
    assert(settings.wikiCacheDir == testRoot / "cache");
    assert(settings.databasesDir == testRoot / "data" / "databases");
    assert(settings.ollamaHost == "gpu-box");
    assert(settings.ollamaPort == 11500);
    assert(settings.pythonExecutable == "python3");
    assert(settings.processTimeoutSeconds == 30);

    {
        std::ofstream f(testRoot / "settings.json");
        f << "{ broken";
    }
    auto fallback = ConfigLoader::LoadSettings(testRoot);
    assert(fallback.ollamaHost == "localhost");
    std::cout << "[PASS] Settings." << std::endl;

    auto english = ConfigLoader::LoadLanguageConfig(testRoot);
    assert(english.isSupported("en") && english.defaultLanguage == "en");
    assert(!english.isSupported("ja"));
    {
        std::ofstream f(testRoot / "lang.json");
        f << R"({"supported_languages": {"en": "English", "ja": "Japanese", "zh": "Mandarin"}, "default": "ja"})";
    }
    auto languages = ConfigLoader::LoadLanguageConfig(testRoot);
    assert(languages.supportedLanguages.size() == 3);
    assert(languages.isSupported("zh"));
    assert(languages.defaultLanguage == "ja");

    unsetenv("WIKI_AUTH_MODE");
    unsetenv("WIKI_AUTH_CODE");
    assert(!ConfigLoader::LoadAuthSettings().enabled);
    setenv("WIKI_AUTH_MODE", "True", 1);
    setenv("WIKI_AUTH_CODE", "abc", 1);
    auto auth = ConfigLoader::LoadAuthSettings();
    assert(auth.enabled && auth.code == "abc");
    setenv("WIKI_AUTH_MODE", "no", 1);
    assert(!ConfigLoader::LoadAuthSettings().enabled);
    unsetenv("WIKI_AUTH_MODE");
    unsetenv("WIKI_AUTH_CODE");
    std::cout << "[PASS] Languages and auth." << std::endl;

    // Database cleaner only touches vector database files.
    fs::path dbDir = testRoot / "data" / "databases";
    EmbeddingDatabaseCleaner cleaner(dbDir);
    auto nothing = cleaner.clear();
    assert(nothing.ok() && nothing.removed == 0);
    fs::create_directories(dbDir);
    for (const char* name : {"deepwiki-open.pkl", "deepwiki-open.faiss", "other.pkl", "other.index", "notes.txt"}) {
        std::ofstream(dbDir / name) << "x";
    }
    auto forRepo = cleaner.clear("deepwiki-open");
    assert(forRepo.ok() && forRepo.removed == 2);
    assert(fs::exists(dbDir / "other.pkl"));
    auto all = cleaner.clear();
    assert(all.ok() && all.removed == 2);
    assert(fs::exists(dbDir / "notes.txt"));

    // A path that is not a directory cannot be scanned and is reported.
    EmbeddingDatabaseCleaner misconfigured(dbDir / "notes.txt");
    auto unreadable = misconfigured.clear();
    assert(!unreadable.ok());
    assert(!unreadable.scanError.empty());
    assert(unreadable.removed == 0);
    assert(fs::exists(dbDir / "notes.txt"));
    std::cout << "[PASS] Embedding database cleaner." << std::endl;

    unsetenv("ADALFLOW_ROOT");
    fs::remove_all(testRoot);
    std::cout << "[PASS] ConfigLoader Test." << std::endl;
    return 0;
}
