/**
 * @file EmbeddingManagerCli.hpp
 * @brief Command-line front end for embedding model management and the wiki cache.
 */

#pragma once

#include "application/AppServices.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace wikiembed::app {

/**
 * @class EmbeddingManagerCli
 * @brief Parses arguments, wires the services and dispatches one command.
 *
 * Exit codes: 0 success, 1 operation failed, 2 usage error.
 */
class EmbeddingManagerCli {
public:
    /**
     * @brief Runs a single command.
     * @return Process exit code.
     */
    int Run(int argc, char** argv);

    static void PrintUsage();

private:
    /**
     * @brief Composition root: loads settings and builds every service.
     * @param configDir Directory holding settings.json, lang.json and embedder.json.
     */
    void Init(const std::filesystem::path& configDir);

    int Dispatch(const std::vector<std::string>& args);

    int CmdList();
    int CmdInstall(const std::string& modelId);
    int CmdSwitch(const std::string& modelId, bool force);
    int CmdStatus();
    int CmdCheck(const std::string& modelId);
    int CmdProbe(const std::string& modelId);
    int CmdPresets();
    int CmdCacheList();
    int CmdCacheDelete(const std::vector<std::string>& args);
    int CmdClearEmbeddings(const std::string& repoFilter, bool assumeYes);

    infrastructure::ServiceSettings m_settings;
    application::AppServices m_services;
};

} // namespace wikiembed::app
