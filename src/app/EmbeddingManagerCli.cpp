/**
 * @file EmbeddingManagerCli.cpp
 * @brief Implementation of the EmbeddingManagerCli class.
 */

#include "app/EmbeddingManagerCli.hpp"
#include "domain/ModelCatalog.hpp"
#include "infrastructure/EmbeddingDatabaseCleaner.hpp"
#include "infrastructure/EmbeddingDimensionProbe.hpp"
#include "infrastructure/FileEmbeddingConfigStore.hpp"
#include "infrastructure/FileWikiCacheRepository.hpp"
#include "infrastructure/OllamaClient.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/ShellProcessRunner.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <memory>
#include <optional>

namespace wikiembed::app {

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailed = 1;
constexpr int kExitUsage = 2;

const std::string kRule(60, '=');

std::optional<domain::EmbeddingModelDescriptor> ResolveModel(const std::string& modelId) {
    auto descriptor = domain::ModelCatalog::findById(modelId);
    if (!descriptor) {
        std::cerr << "Model " << modelId << " not found. Run 'wikiembed list' to see known models." << std::endl;
    }
    return descriptor;
}

} // namespace

void EmbeddingManagerCli::PrintUsage() {
    std::cout << "Usage: wikiembed [--config-dir DIR] <command> [args]\n"
              << "\n"
              << "Embedding models:\n"
              << "  list                         List all known embedding models\n"
              << "  install <model_id>           Install a model's local prerequisite\n"
              << "  switch <model_id> [--force]  Switch the active embedding model\n"
              << "  status                       Show the current embedding configuration\n"
              << "  check <model_id>             Check whether a model is available\n"
              << "  probe <model_id>             Measure the vector width of a local model\n"
              << "  presets                      Show migration presets\n"
              << "\n"
              << "Wiki cache:\n"
              << "  cache list\n"
              << "  cache delete <repo_type> <owner> <repo> <language> [--code CODE]\n"
              << "  clear-embeddings [repo] [--yes]\n"
              << "                               Remove vector databases (all of them asks for confirmation)\n";
}

void EmbeddingManagerCli::Init(const std::filesystem::path& configDir) {
    m_settings = infrastructure::ConfigLoader::LoadSettings(configDir);
    auto languages = infrastructure::ConfigLoader::LoadLanguageConfig(configDir);
    auto auth = infrastructure::ConfigLoader::LoadAuthSettings();

    // Dependency Injection / Composition Root
    m_services.processRunner = std::make_unique<infrastructure::ShellProcessRunner>(m_settings.processTimeoutSeconds);
    m_services.configStore = std::make_unique<infrastructure::FileEmbeddingConfigStore>(m_settings.embedderConfigPath);
    m_services.cacheRepository = std::make_unique<infrastructure::FileWikiCacheRepository>(m_settings.wikiCacheDir);

    m_services.availabilityChecker = std::make_unique<application::ModelAvailabilityChecker>(
        *m_services.processRunner, m_settings.pythonExecutable);
    m_services.installer = std::make_unique<application::ModelInstaller>(*m_services.processRunner);
    m_services.advisor = std::make_unique<application::CacheInvalidationAdvisor>(
        m_settings.databasesDir, m_settings.wikiCacheDir);
    m_services.switcher = std::make_unique<application::ModelSwitcher>(
        *m_services.configStore, *m_services.availabilityChecker, *m_services.installer, *m_services.advisor);
    m_services.configService = std::make_unique<application::EmbeddingConfigService>(*m_services.configStore);
    m_services.wikiCacheService = std::make_unique<application::WikiCacheService>(
        *m_services.cacheRepository, std::move(languages), std::move(auth));
}

int EmbeddingManagerCli::Run(int argc, char** argv) {
    std::filesystem::path configDir = infrastructure::PathUtils::GetConfigDir();
    std::vector<std::string> args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config-dir") {
            if (i + 1 >= argc) {
                std::cerr << "--config-dir requires a directory" << std::endl;
                return kExitUsage;
            }
            configDir = infrastructure::PathUtils::ExpandUser(argv[++i]);
        } else if (arg == "-h" || arg == "--help") {
            PrintUsage();
            return kExitOk;
        } else {
            args.push_back(arg);
        }
    }

    if (args.empty()) {
        PrintUsage();
        return kExitUsage;
    }

    Init(configDir);
    return Dispatch(args);
}

int EmbeddingManagerCli::Dispatch(const std::vector<std::string>& args) {
    const std::string& command = args[0];

    if (command == "list" && args.size() == 1) return CmdList();
    if (command == "status" && args.size() == 1) return CmdStatus();
    if (command == "presets" && args.size() == 1) return CmdPresets();
    if (command == "install" && args.size() == 2) return CmdInstall(args[1]);
    if (command == "check" && args.size() == 2) return CmdCheck(args[1]);
    if (command == "probe" && args.size() == 2) return CmdProbe(args[1]);
    if (command == "switch" && (args.size() == 2 || args.size() == 3)) {
        bool force = false;
        std::string modelId;
        for (size_t i = 1; i < args.size(); ++i) {
            if (args[i] == "--force") {
                force = true;
            } else if (modelId.empty()) {
                modelId = args[i];
            } else {
                modelId.clear();
                break;
            }
        }
        if (!modelId.empty()) return CmdSwitch(modelId, force);
    }
    if (command == "cache" && args.size() >= 2) {
        if (args[1] == "list" && args.size() == 2) return CmdCacheList();
        if (args[1] == "delete") return CmdCacheDelete(args);
    }
    if (command == "clear-embeddings" && args.size() <= 3) {
        bool assumeYes = false;
        std::string repoFilter;
        bool valid = true;
        for (size_t i = 1; i < args.size(); ++i) {
            if (args[i] == "--yes" || args[i] == "-y") {
                assumeYes = true;
            } else if (repoFilter.empty()) {
                repoFilter = args[i];
            } else {
                valid = false;
            }
        }
        if (valid) return CmdClearEmbeddings(repoFilter, assumeYes);
    }

    std::cerr << "Invalid command line: " << command << std::endl;
    PrintUsage();
    return kExitUsage;
}

int EmbeddingManagerCli::CmdList() {
    std::string currentModel = "unknown";
    if (auto summary = m_services.configService->currentSummary()) {
        currentModel = summary->model;
    }

    std::cout << "\nAvailable Embedding Models:\n" << kRule << "\n";
    for (const auto& model : domain::ModelCatalog::listAll()) {
        std::string status;
        if (model.modelName() == currentModel) {
            status += "CURRENT | ";
        }
        status += m_services.availabilityChecker->checkAvailable(model) ? "INSTALLED" : "NOT INSTALLED";
        status += model.compatible ? " | COMPATIBLE" : " | MIGRATION REQUIRED";

        std::cout << "\n" << model.displayName << "\n"
                  << "   ID: " << model.id << "\n"
                  << "   Provider: " << domain::ProviderToString(model.provider()) << "\n"
                  << "   Dimensions: " << model.dimensionality << "\n"
                  << "   Cost: " << model.costTier << " | Privacy: " << model.privacyTier << "\n"
                  << "   Status: " << status << "\n"
                  << "   Description: " << model.description << "\n";
    }
    std::cout << "\n" << kRule << "\n"
              << "Use 'wikiembed switch <model_id>' to switch models\n"
              << "Compatible models share " << domain::kBaselineDimensions << " dimensions for seamless switching\n";
    return kExitOk;
}

int EmbeddingManagerCli::CmdInstall(const std::string& modelId) {
    auto descriptor = ResolveModel(modelId);
    if (!descriptor) return kExitFailed;

    auto result = m_services.installer->install(*descriptor);
    if (!result.ok()) {
        std::cerr << "Installation failed: " << result.message << std::endl;
        return kExitFailed;
    }
    std::cout << descriptor->displayName << " is ready" << std::endl;
    return kExitOk;
}

int EmbeddingManagerCli::CmdSwitch(const std::string& modelId, bool force) {
    auto outcome = m_services.switcher->switchTo(modelId, force);
    if (!outcome.ok()) {
        std::cerr << "Switch failed (" << domain::ErrorKindToString(outcome.error) << "): " << outcome.message << std::endl;
        return kExitFailed;
    }

    std::cout << outcome.message << std::endl;
    if (outcome.configChanged) {
        std::cout << "Previous model: " << outcome.previousModel << std::endl;
    }
    if (outcome.advisory) {
        std::cout << *outcome.advisory << std::endl;
    }
    return kExitOk;
}

int EmbeddingManagerCli::CmdStatus() {
    auto summary = m_services.configService->currentSummary();
    if (!summary) {
        std::cerr << "Could not read the embedding configuration at " << m_settings.embedderConfigPath.string() << std::endl;
        return kExitFailed;
    }

    std::cout << "\nCurrent Embedding Configuration:\n" << std::string(40, '=') << "\n"
              << "Client: " << summary->clientClass << "\n"
              << "Model: " << summary->model << "\n"
              << "Provider: " << summary->provider << "\n"
              << "Dimensions: " << summary->dimensions << "\n"
              << "Config file: " << m_settings.embedderConfigPath.string() << "\n\n"
              << summary->document.dump(2) << std::endl;
    return kExitOk;
}

int EmbeddingManagerCli::CmdCheck(const std::string& modelId) {
    auto descriptor = ResolveModel(modelId);
    if (!descriptor) return kExitFailed;

    auto result = m_services.availabilityChecker->ensureAvailable(*descriptor);
    if (!result.ok()) {
        std::cout << result.message << std::endl;
        return kExitFailed;
    }
    std::cout << "Model " << modelId << " is available" << std::endl;
    return kExitOk;
}

int EmbeddingManagerCli::CmdProbe(const std::string& modelId) {
    auto descriptor = ResolveModel(modelId);
    if (!descriptor) return kExitFailed;

    auto available = m_services.availabilityChecker->ensureAvailable(*descriptor);
    if (!available.ok()) {
        std::cerr << available.message << std::endl;
        return kExitFailed;
    }

    infrastructure::OllamaClient client(m_settings.ollamaHost, m_settings.ollamaPort);
    infrastructure::EmbeddingDimensionProbe probe(client);
    auto measured = probe.measure(*descriptor);
    if (!measured) {
        std::cerr << "Could not measure " << modelId << " (only local runtime models can be probed)" << std::endl;
        return kExitFailed;
    }

    std::cout << modelId << ": declared " << descriptor->dimensionality << ", measured " << *measured << std::endl;
    if (*measured != domain::kBaselineDimensions) {
        std::cout << "Warning: measured width differs from the index baseline of " << domain::kBaselineDimensions << std::endl;
    }
    return kExitOk;
}

int EmbeddingManagerCli::CmdPresets() {
    std::cout << "\nMigration Presets:\n" << kRule << "\n";
    for (const auto& preset : domain::ModelCatalog::migrationPresets()) {
        std::cout << "\n" << preset.name << (preset.recommended ? "  [recommended]" : "") << "\n"
                  << "   ID: " << preset.id << "\n"
                  << "   Embeddings: " << preset.embeddingModelId << "\n"
                  << "   Generation: " << preset.generationModelId << " (" << preset.generationProvider << ")\n"
                  << "   " << preset.description << "\n";
        for (const auto& benefit : preset.benefits) {
            std::cout << "   - " << benefit << "\n";
        }
    }
    std::cout << std::flush;
    return kExitOk;
}

int EmbeddingManagerCli::CmdCacheList() {
    auto projects = m_services.wikiCacheService->processedProjects();
    if (projects.empty()) {
        std::cout << "No cached wikis in " << m_settings.wikiCacheDir.string() << std::endl;
        return kExitOk;
    }
    for (const auto& project : projects) {
        std::cout << project.name << "  [" << project.key.repoType << ", " << project.key.language << "]  "
                  << project.id << std::endl;
    }
    return kExitOk;
}

int EmbeddingManagerCli::CmdCacheDelete(const std::vector<std::string>& args) {
    // cache delete <repo_type> <owner> <repo> <language> [--code CODE]
    std::vector<std::string> positional;
    std::optional<std::string> code;
    for (size_t i = 2; i < args.size(); ++i) {
        if (args[i] == "--code") {
            if (i + 1 >= args.size()) {
                std::cerr << "--code requires a value" << std::endl;
                return kExitUsage;
            }
            code = args[++i];
        } else {
            positional.push_back(args[i]);
        }
    }
    if (positional.size() != 4) {
        PrintUsage();
        return kExitUsage;
    }

    auto result = m_services.wikiCacheService->remove(positional[1], positional[2], positional[0], positional[3], code);
    if (!result.ok()) {
        std::cerr << "Delete failed (" << domain::ErrorKindToString(result.error) << "): " << result.message << std::endl;
        return kExitFailed;
    }
    std::cout << "Wiki cache for " << positional[1] << "/" << positional[2] << " (" << positional[3]
              << ") deleted successfully" << std::endl;
    return kExitOk;
}

int EmbeddingManagerCli::CmdClearEmbeddings(const std::string& repoFilter, bool assumeYes) {
    if (repoFilter.empty() && !assumeYes) {
        std::cout << "Clearing ALL embedding databases in " << m_settings.databasesDir.string() << "\n"
                  << "Are you sure you want to clear all embedding databases? (y/N): " << std::flush;
        std::string response;
        std::getline(std::cin, response);
        std::transform(response.begin(), response.end(), response.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (response != "y" && response != "yes") {
            std::cout << "Operation cancelled" << std::endl;
            return kExitOk;
        }
    }

    infrastructure::EmbeddingDatabaseCleaner cleaner(m_settings.databasesDir);
    auto result = cleaner.clear(repoFilter);
    std::cout << "Removed " << result.removed << " embedding database file(s)"
              << (repoFilter.empty() ? "" : " for " + repoFilter) << std::endl;
    if (!result.ok()) {
        if (!result.scanError.empty()) {
            std::cerr << "Could not read " << m_settings.databasesDir.string() << ": " << result.scanError << std::endl;
        }
        for (const auto& name : result.failed) {
            std::cerr << "Could not remove " << name << std::endl;
        }
        return kExitFailed;
    }
    std::cout << "Next time a wiki is generated, new embeddings will be created with the current model." << std::endl;
    return kExitOk;
}

} // namespace wikiembed::app
