/**
 * @file FileEmbeddingConfigStore.cpp
 * @brief Implementation of FileEmbeddingConfigStore.
 */

#include "infrastructure/FileEmbeddingConfigStore.hpp"
#include "infrastructure/AtomicFileWriter.hpp"
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <system_error>
#include <utility>

namespace wikiembed::infrastructure {

namespace fs = std::filesystem;
using json = nlohmann::json;
using domain::ErrorKind;
using domain::OperationResult;

FileEmbeddingConfigStore::FileEmbeddingConfigStore(fs::path configPath)
    : m_configPath(std::move(configPath)) {}

fs::path FileEmbeddingConfigStore::backupPath() const {
    fs::path backup = m_configPath;
    backup += ".bak";
    return backup;
}

domain::ConfigReadResult FileEmbeddingConfigStore::getCurrent() const {
    domain::ConfigReadResult result;
    std::error_code ec;
    if (!fs::exists(m_configPath, ec)) {
        return result;
    }

    std::ifstream f(m_configPath);
    if (!f.is_open()) {
        result.error = ErrorKind::ConfigReadFailed;
        result.message = "Cannot open configuration file: " + m_configPath.string();
        std::cerr << "[FileEmbeddingConfigStore] " << result.message << std::endl;
        return result;
    }

    try {
        json j = json::parse(f);
        result.document = domain::EmbeddingConfigDocument::FromJson(j);
    } catch (const std::exception& e) {
        result.error = ErrorKind::ConfigReadFailed;
        result.message = "Invalid configuration in " + m_configPath.string() + ": " + e.what();
        std::cerr << "[FileEmbeddingConfigStore] " << result.message << std::endl;
    }
    return result;
}

OperationResult FileEmbeddingConfigStore::updateCurrent(const domain::EmbeddingConfigDocument& newConfig) {
    std::error_code ec;
    if (fs::exists(m_configPath, ec)) {
        fs::copy_file(m_configPath, backupPath(), fs::copy_options::overwrite_existing, ec);
        if (ec) {
            std::string message = "Failed to back up configuration: " + ec.message();
            std::cerr << "[FileEmbeddingConfigStore] " << message << std::endl;
            return OperationResult::Failure(ErrorKind::ConfigWriteFailed, message);
        }
        std::cout << "[FileEmbeddingConfigStore] Backed up current config to " << backupPath().string() << std::endl;
    }

    std::string content;
    try {
        content = newConfig.toJson().dump(2) + "\n";
    } catch (const std::exception& e) {
        std::string message = std::string("Failed to serialize configuration: ") + e.what();
        std::cerr << "[FileEmbeddingConfigStore] " << message << std::endl;
        return OperationResult::Failure(ErrorKind::ConfigWriteFailed, message);
    }

    std::string error;
    if (!AtomicFileWriter::Write(m_configPath, content, &error)) {
        return OperationResult::Failure(ErrorKind::ConfigWriteFailed, "Failed to write configuration: " + error);
    }

    std::cout << "[FileEmbeddingConfigStore] Updated embedding configuration: " << m_configPath.string() << std::endl;
    return OperationResult::Success();
}

} // namespace wikiembed::infrastructure
