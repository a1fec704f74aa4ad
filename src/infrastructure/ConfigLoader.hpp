/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading service settings (settings.json, lang.json).
 *
 * Provides a unified way to resolve paths, runtime endpoints and language
 * rules without scattering JSON parsing logic throughout the codebase.
 */

#pragma once

#include <filesystem>
#include <map>
#include <string>

namespace wikiembed::infrastructure {

/**
 * @struct ServiceSettings
 * @brief Resolved settings. Every field has a usable default.
 */
struct ServiceSettings {
    std::filesystem::path configDir;
    std::filesystem::path embedderConfigPath;   ///< Active embedding configuration file.
    std::filesystem::path wikiCacheDir;
    std::filesystem::path databasesDir;
    std::string ollamaHost = "localhost";
    int ollamaPort = 11434;
    std::string pythonExecutable = "python3";
    int processTimeoutSeconds = 120;
};

/**
 * @struct LanguageConfig
 * @brief Languages a wiki may be generated in.
 */
struct LanguageConfig {
    std::map<std::string, std::string> supportedLanguages{{"en", "English"}};
    std::string defaultLanguage = "en";

    bool isSupported(const std::string& code) const {
        return supportedLanguages.count(code) > 0;
    }
};

/**
 * @struct AuthSettings
 * @brief Opaque authorization code gate for destructive cache operations.
 */
struct AuthSettings {
    bool enabled = false;
    std::string code;
};

class ConfigLoader {
public:
    /**
     * @brief Reads settings.json from configDir, falling back to defaults per key.
     * @param configDir Directory holding settings.json, lang.json and embedder.json.
     */
    static ServiceSettings LoadSettings(const std::filesystem::path& configDir);

    /** @brief Reads lang.json from configDir; defaults to English only. */
    static LanguageConfig LoadLanguageConfig(const std::filesystem::path& configDir);

    /** @brief Reads WIKI_AUTH_MODE / WIKI_AUTH_CODE from the environment. */
    static AuthSettings LoadAuthSettings();
};

} // namespace wikiembed::infrastructure
