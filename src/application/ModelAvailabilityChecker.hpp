/**
 * @file ModelAvailabilityChecker.hpp
 * @brief Probes whether a catalog model's runtime prerequisite is satisfied.
 */

#pragma once

#include "domain/EmbeddingModel.hpp"
#include "domain/Errors.hpp"
#include "domain/ProcessRunner.hpp"
#include <string>

namespace wikiembed::application {

/**
 * @class ModelAvailabilityChecker
 * @brief Dispatches on the provider payload:
 * - Ollama: `ollama list` names the tag;
 * - HuggingFace: the Python module imports;
 * - OpenAI / Google: the credential variable is set and non-empty.
 *
 * Every probe failure reads as "not available"; nothing here throws.
 */
class ModelAvailabilityChecker {
public:
    ModelAvailabilityChecker(domain::ProcessRunner& runner, std::string pythonExecutable = "python3");

    bool checkAvailable(const domain::EmbeddingModelDescriptor& descriptor) const;

    /**
     * @brief checkAvailable as a typed result.
     * @return NotAvailable with a hint naming the missing credential or install command.
     */
    domain::OperationResult ensureAvailable(const domain::EmbeddingModelDescriptor& descriptor) const;

    /**
     * @brief True if a NAME column entry of an `ollama list` listing is `tag` or `tag:latest`.
     */
    static bool ListsOllamaModel(const std::string& listing, const std::string& tag);

private:
    bool checkOllama(const domain::OllamaModel& model) const;
    bool checkHuggingFace(const domain::HuggingFaceModel& model) const;
    static bool HasCredential(const std::string& envName);

    domain::ProcessRunner& m_runner;
    std::string m_pythonExecutable;
};

} // namespace wikiembed::application
