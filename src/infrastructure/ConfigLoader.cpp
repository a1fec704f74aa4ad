/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace wikiembed::infrastructure {

namespace fs = std::filesystem;
using json = nlohmann::json;

ServiceSettings ConfigLoader::LoadSettings(const fs::path& configDir) {
    ServiceSettings settings;
    settings.configDir = configDir;
    settings.embedderConfigPath = configDir / "embedder.json";
    settings.wikiCacheDir = PathUtils::GetWikiCacheDir();
    settings.databasesDir = PathUtils::GetDatabasesDir();

    fs::path configPath = configDir / "settings.json";
    if (!fs::exists(configPath)) {
        return settings;
    }

    try {
        std::ifstream f(configPath);
        json j;
        f >> j;

        if (j.contains("embedder_config")) {
            fs::path p = PathUtils::ExpandUser(j["embedder_config"].get<std::string>());
            settings.embedderConfigPath = p.is_absolute() ? p : configDir / p;
        }
        if (j.contains("wiki_cache_dir")) {
            settings.wikiCacheDir = PathUtils::ExpandUser(j["wiki_cache_dir"].get<std::string>());
        }
        if (j.contains("databases_dir")) {
            settings.databasesDir = PathUtils::ExpandUser(j["databases_dir"].get<std::string>());
        }
        settings.ollamaHost = j.value("ollama_host", settings.ollamaHost);
        settings.ollamaPort = j.value("ollama_port", settings.ollamaPort);
        settings.pythonExecutable = j.value("python_executable", settings.pythonExecutable);
        settings.processTimeoutSeconds = j.value("process_timeout_seconds", settings.processTimeoutSeconds);
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading settings.json: " << e.what() << std::endl;
    }

    return settings;
}

LanguageConfig ConfigLoader::LoadLanguageConfig(const fs::path& configDir) {
    LanguageConfig config;
    fs::path langPath = configDir / "lang.json";
    if (!fs::exists(langPath)) {
        return config;
    }

    try {
        std::ifstream f(langPath);
        json j;
        f >> j;

        if (j.contains("supported_languages") && j["supported_languages"].is_object()) {
            std::map<std::string, std::string> languages;
            for (auto it = j["supported_languages"].begin(); it != j["supported_languages"].end(); ++it) {
                languages[it.key()] = it.value().is_string() ? it.value().get<std::string>() : it.key();
            }
            if (!languages.empty()) {
                config.supportedLanguages = std::move(languages);
            }
        }
        config.defaultLanguage = j.value("default", config.defaultLanguage);
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading lang.json: " << e.what() << std::endl;
    }

    if (!config.isSupported(config.defaultLanguage)) {
        std::cerr << "[ConfigLoader] Default language '" << config.defaultLanguage
                  << "' is not in supported_languages" << std::endl;
    }
    return config;
}

AuthSettings ConfigLoader::LoadAuthSettings() {
    AuthSettings auth;
    const char* mode = std::getenv("WIKI_AUTH_MODE");
    if (mode) {
        std::string value(mode);
        std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c){ return std::tolower(c); });
        auth.enabled = (value == "true" || value == "1");
    }
    const char* code = std::getenv("WIKI_AUTH_CODE");
    if (code) {
        auth.code = code;
    }
    return auth;
}

} // namespace wikiembed::infrastructure
